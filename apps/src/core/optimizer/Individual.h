#pragma once

#include "Statistics.h"

#include <limits>
#include <vector>

namespace DiceTune {

/**
 * One candidate weight vector plus its cached fitness statistics.
 *
 * Individuals are plain values: copying one deep-copies its genes, so a mutation of one
 * population slot can never perturb another.
 */
struct Individual {
    std::vector<double> genes;

    double fitness = std::numeric_limits<double>::infinity(); // Composite, lower is better.
    double meanOutcome = 0.0;
    double variance = 0.0;
    double median = 0.0;
    double q3 = 0.0;
    double standardError = 0.0;
    int evaluationCount = 0;

    // Generation-transition flags.
    bool isElite = false;
    bool isConfirmed = false;

    static Individual withGenes(std::vector<double> genes);

    bool isEvaluated() const { return evaluationCount > 0; }

    void applyStatistics(const TrialStatistics& stats, double compositeFitness);

    /** Drop cached statistics after the genes changed. */
    void markForReevaluation();

    TrialStatistics statistics() const;
};

} // namespace DiceTune
