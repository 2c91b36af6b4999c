#pragma once

#include "FitnessEvaluator.h"
#include "Individual.h"
#include "OptimizerConfig.h"
#include "Population.h"
#include "SeedBatch.h"
#include "Statistics.h"

#include <functional>
#include <random>
#include <vector>

namespace DiceTune {

class WorkerPool;

/**
 * One head-to-head run of a candidate against the incumbent over matched seeds.
 */
struct PairedComparison {
    TrialStatistics candidate;
    TrialStatistics incumbent;
    double candidateComposite = 0.0;
    double incumbentComposite = 0.0; // Recomputed over the same seeds as the candidate.
    PairedTestResult test;
};

struct ConfirmationRound {
    int candidatesTested = 0;
    int candidatesSkipped = 0;
    int accepted = 0;
    uint64_t trials = 0;
};

/**
 * Decides whether screening leaders really beat the incumbent before the reported best
 * changes. Paired trials run in contiguous chunks on the worker pool; every chunk writes
 * its own slice of the outcome arrays.
 */
class ConfirmationEngine {
public:
    ConfirmationEngine(
        const FitnessEvaluator& evaluator, const ConfirmationConfig& config, WorkerPool& pool);

    /**
     * Simulate candidate and incumbent with each seed in turn. Both sides build their own
     * generator from the same seed, so pair i shares all of its randomness.
     */
    PairedComparison compare(
        const std::vector<double>& candidate,
        const std::vector<double>& incumbent,
        const SeedBatch& seeds,
        size_t candidateIndex) const;

    /** Unpaired measurement over a seed batch, chunked across the pool. */
    TrialStatistics measure(
        const std::vector<double>& genes, const SeedBatch& seeds, size_t individualIndex) const;

    /** Screening fitness no worse than incumbent fitness + competitiveSigmas * SE. */
    bool isCompetitive(const Individual& candidate, const Individual& incumbent) const;

    /**
     * Significantly lower paired mean, or strictly lower composite over the shared seeds.
     */
    bool accepts(const PairedComparison& comparison) const;

    /**
     * Test the top candidates of a ranked population in rank order. An accepted candidate
     * is flagged confirmed, takes its paired statistics, and becomes the incumbent that
     * later candidates must beat. The incumbent's recorded fitness never increases.
     */
    ConfirmationRound confirm(
        Population& ranked, Individual& incumbent, std::mt19937_64& master) const;

private:
    void runChunked(size_t trialCount, const std::function<void(size_t, size_t)>& chunk) const;

    const FitnessEvaluator& evaluator_;
    ConfirmationConfig config_;
    WorkerPool& pool_;
};

} // namespace DiceTune
