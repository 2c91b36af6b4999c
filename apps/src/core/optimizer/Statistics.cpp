#include "Statistics.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace DiceTune {
namespace Statistics {

double mean(const std::vector<double>& values)
{
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double sampleVariance(const std::vector<double>& values)
{
    if (values.size() < 2) {
        return 0.0;
    }

    const double m = mean(values);
    double sumSquares = 0.0;
    for (const double v : values) {
        const double diff = v - m;
        sumSquares += diff * diff;
    }
    return sumSquares / (values.size() - 1);
}

double percentile(const std::vector<double>& sortedValues, double p)
{
    if (sortedValues.empty()) {
        return 0.0;
    }

    const double position = (sortedValues.size() - 1) * p;
    const size_t lower = static_cast<size_t>(std::floor(position));
    const size_t upper = std::min(lower + 1, sortedValues.size() - 1);
    const double fraction = position - lower;
    return sortedValues[lower] + fraction * (sortedValues[upper] - sortedValues[lower]);
}

double standardError(const std::vector<double>& values)
{
    if (values.empty()) {
        return 0.0;
    }
    return std::sqrt(sampleVariance(values) / values.size());
}

double normalCdf(double x)
{
    const double t = 1.0 / (1.0 + 0.2316419 * std::abs(x));
    const double density = 0.3989423 * std::exp(-x * x / 2.0);
    const double tail = density * t
        * (0.3193815 + t * (-0.3565638 + t * (1.781478 + t * (-1.821256 + t * 1.330274))));
    return x > 0.0 ? 1.0 - tail : tail;
}

PairedTestResult pairedTest(const std::vector<double>& a, const std::vector<double>& b)
{
    if (a.size() != b.size()) {
        throw std::invalid_argument("pairedTest requires samples of equal length");
    }

    std::vector<double> differences(a.size());
    for (size_t i = 0; i < a.size(); ++i) {
        differences[i] = a[i] - b[i];
    }

    PairedTestResult result;
    result.meanDifference = mean(differences);
    result.standardErrorDifference = standardError(differences);

    if (result.standardErrorDifference == 0.0) {
        // Deterministic differences: any nonzero shift is certain, a zero shift is not.
        result.tStatistic = 0.0;
        result.pValue = result.meanDifference != 0.0 ? 0.0 : 1.0;
        return result;
    }

    result.tStatistic = result.meanDifference / result.standardErrorDifference;
    result.pValue = 2.0 * (1.0 - normalCdf(std::abs(result.tStatistic)));
    result.pValue = std::clamp(result.pValue, 0.0, 1.0);
    return result;
}

TrialStatistics summarize(std::vector<double> outcomes)
{
    TrialStatistics stats;
    stats.count = static_cast<int>(outcomes.size());
    stats.mean = mean(outcomes);
    stats.variance = sampleVariance(outcomes);
    stats.standardError = outcomes.empty() ? 0.0 : std::sqrt(stats.variance / outcomes.size());

    std::sort(outcomes.begin(), outcomes.end());
    stats.median = percentile(outcomes, 0.5);
    stats.q3 = percentile(outcomes, 0.75);
    return stats;
}

} // namespace Statistics
} // namespace DiceTune
