#include "Individual.h"

#include <utility>

namespace DiceTune {

Individual Individual::withGenes(std::vector<double> genes)
{
    Individual individual;
    individual.genes = std::move(genes);
    return individual;
}

void Individual::applyStatistics(const TrialStatistics& stats, double compositeFitness)
{
    fitness = compositeFitness;
    meanOutcome = stats.mean;
    variance = stats.variance;
    median = stats.median;
    q3 = stats.q3;
    standardError = stats.standardError;
    evaluationCount = stats.count;
}

void Individual::markForReevaluation()
{
    fitness = std::numeric_limits<double>::infinity();
    meanOutcome = 0.0;
    variance = 0.0;
    median = 0.0;
    q3 = 0.0;
    standardError = 0.0;
    evaluationCount = 0;
    isConfirmed = false;
}

TrialStatistics Individual::statistics() const
{
    return TrialStatistics{
        .mean = meanOutcome,
        .variance = variance,
        .median = median,
        .q3 = q3,
        .standardError = standardError,
        .count = evaluationCount,
    };
}

} // namespace DiceTune
