#include "FitnessEvaluator.h"
#include "SimulationOracle.h"
#include "core/LoggingChannels.h"
#include "core/WorkerPool.h"

#include <cmath>

namespace DiceTune {

const char* toString(EvaluationPhase phase)
{
    switch (phase) {
        case EvaluationPhase::Screening:
            return "screening";
        case EvaluationPhase::Confirmation:
            return "confirmation";
    }
    return "unknown";
}

EvaluationError::EvaluationError(
    EvaluationPhase phase, size_t individualIndex, uint64_t seed, const std::string& cause)
    : std::runtime_error(
        std::string(toString(phase)) + " evaluation failed for individual "
        + std::to_string(individualIndex) + " (seed " + std::to_string(seed) + "): " + cause),
      phase_(phase),
      individualIndex_(individualIndex),
      seed_(seed)
{}

double computeCompositeFitness(const TrialStatistics& stats, const FitnessWeights& weights)
{
    return weights.mean * stats.mean + weights.spread * std::sqrt(stats.variance)
        + weights.median * stats.median + weights.q3 * stats.q3;
}

FitnessEvaluator::FitnessEvaluator(const SimulationOracle& oracle, const FitnessWeights& weights)
    : oracle_(oracle), weights_(weights)
{}

double FitnessEvaluator::simulate(
    const std::vector<double>& genes,
    uint64_t seed,
    EvaluationPhase phase,
    size_t individualIndex) const
{
    double outcome = 0.0;
    try {
        outcome = oracle_.simulate(genes, seed);
    }
    catch (const std::exception& e) {
        throw EvaluationError(phase, individualIndex, seed, e.what());
    }

    if (!std::isfinite(outcome)) {
        throw EvaluationError(
            phase, individualIndex, seed, "non-finite outcome " + std::to_string(outcome));
    }
    return outcome;
}

std::vector<double> FitnessEvaluator::runTrials(
    const std::vector<double>& genes,
    const SeedBatch& seeds,
    EvaluationPhase phase,
    size_t individualIndex) const
{
    std::vector<double> outcomes;
    outcomes.reserve(seeds.size());
    for (const uint64_t seed : seeds) {
        outcomes.push_back(simulate(genes, seed, phase, individualIndex));
    }
    return outcomes;
}

TrialStatistics FitnessEvaluator::evaluate(
    const std::vector<double>& genes, const SeedBatch& seeds) const
{
    return Statistics::summarize(runTrials(genes, seeds));
}

double FitnessEvaluator::composite(const TrialStatistics& stats) const
{
    return computeCompositeFitness(stats, weights_);
}

uint64_t FitnessEvaluator::evaluatePopulation(
    std::vector<Individual>& population,
    const std::vector<size_t>& indices,
    const SeedBatch& seeds,
    WorkerPool& pool) const
{
    LOG_DEBUG(
        Evaluation,
        "Screening {} individuals over {} seeds on {} workers",
        indices.size(),
        seeds.size(),
        pool.workerCount());

    pool.run(indices.size(), [&](size_t task) {
        const size_t slot = indices[task];
        Individual& individual = population[slot];
        const auto stats = Statistics::summarize(
            runTrials(individual.genes, seeds, EvaluationPhase::Screening, slot));
        individual.applyStatistics(stats, composite(stats));
    });

    return static_cast<uint64_t>(indices.size()) * seeds.size();
}

} // namespace DiceTune
