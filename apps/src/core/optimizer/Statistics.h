#pragma once

#include <cstddef>
#include <vector>

namespace DiceTune {

/**
 * Aggregate of one individual's trial outcomes over a seed batch.
 */
struct TrialStatistics {
    double mean = 0.0;
    double variance = 0.0; // Sample variance (n - 1 denominator).
    double median = 0.0;
    double q3 = 0.0;
    double standardError = 0.0;
    int count = 0;
};

/**
 * Result of a paired comparison d_i = a_i - b_i.
 */
struct PairedTestResult {
    double meanDifference = 0.0;
    double standardErrorDifference = 0.0;
    double tStatistic = 0.0;
    double pValue = 1.0; // Two-tailed, normal approximation.
};

namespace Statistics {

double mean(const std::vector<double>& values);

/** Sample variance; 0 for fewer than two values. */
double sampleVariance(const std::vector<double>& values);

/** Linear interpolation at position (n - 1) * p of an ascending list. */
double percentile(const std::vector<double>& sortedValues, double p);

double standardError(const std::vector<double>& values);

/** Standard normal CDF (Abramowitz and Stegun 26.2.17, |error| < 7.5e-8). */
double normalCdf(double x);

/**
 * Paired two-tailed test on matched samples. Zero standard error of the differences is
 * treated as infinitely significant when the means differ and not significant otherwise.
 */
PairedTestResult pairedTest(const std::vector<double>& a, const std::vector<double>& b);

TrialStatistics summarize(std::vector<double> outcomes);

} // namespace Statistics

} // namespace DiceTune
