#pragma once

#include "Individual.h"
#include "OptimizerConfig.h"
#include "SeedBatch.h"
#include "Statistics.h"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace DiceTune {

class SimulationOracle;
class WorkerPool;

enum class EvaluationPhase { Screening, Confirmation };

const char* toString(EvaluationPhase phase);

/**
 * A trial failed (oracle threw or returned a non-finite outcome). The generation's
 * comparison is no longer fair, so the run is aborted rather than the trial dropped.
 */
class EvaluationError : public std::runtime_error {
public:
    EvaluationError(
        EvaluationPhase phase, size_t individualIndex, uint64_t seed, const std::string& cause);

    EvaluationPhase phase() const { return phase_; }
    size_t individualIndex() const { return individualIndex_; }
    uint64_t seed() const { return seed_; }

private:
    EvaluationPhase phase_;
    size_t individualIndex_;
    uint64_t seed_;
};

double computeCompositeFitness(const TrialStatistics& stats, const FitnessWeights& weights);

/**
 * Runs oracle trials for individuals and turns their outcomes into cached statistics.
 */
class FitnessEvaluator {
public:
    FitnessEvaluator(const SimulationOracle& oracle, const FitnessWeights& weights);

    /** One checked oracle call; throws EvaluationError on failure. */
    double simulate(
        const std::vector<double>& genes,
        uint64_t seed,
        EvaluationPhase phase,
        size_t individualIndex) const;

    /** Outcome of every seed, in seed order. */
    std::vector<double> runTrials(
        const std::vector<double>& genes,
        const SeedBatch& seeds,
        EvaluationPhase phase = EvaluationPhase::Screening,
        size_t individualIndex = 0) const;

    TrialStatistics evaluate(const std::vector<double>& genes, const SeedBatch& seeds) const;

    double composite(const TrialStatistics& stats) const;

    /**
     * Screen the listed population slots against one shared seed batch, one pool task per
     * individual. Each task writes only its own slot.
     * @return Number of oracle trials run.
     */
    uint64_t evaluatePopulation(
        std::vector<Individual>& population,
        const std::vector<size_t>& indices,
        const SeedBatch& seeds,
        WorkerPool& pool) const;

private:
    const SimulationOracle& oracle_;
    FitnessWeights weights_;
};

} // namespace DiceTune
