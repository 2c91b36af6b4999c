#include "TuneRunner.h"
#include "core/LoggingChannels.h"
#include "core/WorkerPool.h"
#include "core/optimizer/FitnessEvaluator.h"
#include "core/optimizer/Population.h"
#include "core/optimizer/SeedBatch.h"

#include <random>

namespace DiceTune {
namespace Client {

void to_json(nlohmann::json& j, const TuneConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

void from_json(const nlohmann::json& j, TuneConfig& config)
{
    config = ReflectSerializer::from_json<TuneConfig>(j);
}

void to_json(nlohmann::json& j, const TuneResults& results)
{
    j = ReflectSerializer::to_json(results);
}

void from_json(const nlohmann::json& j, EvaluateRequest& request)
{
    request = ReflectSerializer::from_json<EvaluateRequest>(j);
}

void to_json(nlohmann::json& j, const EvaluateReport& report)
{
    j = ReflectSerializer::to_json(report);
}

Result<EvaluateReport, std::string> evaluateGenes(
    const TuneConfig& config, const EvaluateRequest& request)
{
    const auto& genome = config.optimizer.genome;
    if (request.genes.size() != static_cast<size_t>(genome.geneCount)) {
        return Result<EvaluateReport, std::string>::error(
            "Expected " + std::to_string(genome.geneCount) + " genes, got "
            + std::to_string(request.genes.size()));
    }
    const int trials = request.trials.value_or(config.optimizer.evolution.trialsPerGeneration);
    if (trials < 1) {
        return Result<EvaluateReport, std::string>::error("trials must be at least 1");
    }

    SyntheticTurnOracle oracle(config.oracle);
    FitnessEvaluator evaluator(oracle, config.optimizer.fitness);
    WorkerPool pool(resolveWorkerCount(
        config.optimizer.evolution.maxParallelEvaluations,
        config.optimizer.evolution.reservedCores));

    std::mt19937_64 master(request.seed);
    const SeedBatch seeds = generateSeedBatch(master, trials);

    Population single{ Individual::withGenes(request.genes) };
    try {
        evaluator.evaluatePopulation(single, { 0 }, seeds, pool);
    }
    catch (const EvaluationError& e) {
        return Result<EvaluateReport, std::string>::error(e.what());
    }

    const Individual& individual = single.front();
    return Result<EvaluateReport, std::string>::okay(EvaluateReport{
        .genes = individual.genes,
        .fitness = individual.fitness,
        .mean = individual.meanOutcome,
        .variance = individual.variance,
        .median = individual.median,
        .q3 = individual.q3,
        .standardError = individual.standardError,
        .trialCount = individual.evaluationCount,
    });
}

TuneResults TuneRunner::run(const TuneConfig& config)
{
    TuneResults results;

    const auto validation = validateConfig(config.optimizer);
    if (validation.isError()) {
        results.errorMessage = "Invalid config: " + validation.errorValue();
        SLOG_ERROR("{}", results.errorMessage);
        return results;
    }

    SyntheticTurnOracle oracle(config.oracle);
    GeneticOptimizer optimizer(config.optimizer, oracle);

    optimizer_ = &optimizer;
    if (stopRequested_) {
        optimizer.requestStop();
    }

    try {
        results.best = optimizer.run();
        results.completed = true;
    }
    catch (const EvaluationError& e) {
        results.errorMessage = e.what();
        results.failedPhase = toString(e.phase());
        results.failedIndividual = static_cast<int>(e.individualIndex());
        results.best = optimizer.result();
        spdlog::critical("Run aborted: {}", results.errorMessage);
    }

    optimizer_ = nullptr;
    return results;
}

void TuneRunner::requestStop()
{
    stopRequested_ = true;
    if (GeneticOptimizer* optimizer = optimizer_.load()) {
        optimizer->requestStop();
    }
}

} // namespace Client
} // namespace DiceTune
