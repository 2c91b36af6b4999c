#include "GeneticOptimizer.h"
#include "SeedBatch.h"
#include "core/LoggingChannels.h"
#include "core/Assert.h"
#include "core/ReflectSerializer.h"
#include "core/WorkerPool.h"

#include <algorithm>
#include <cmath>
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace DiceTune {

namespace {

const OptimizerConfig& requireValid(const OptimizerConfig& config)
{
    const auto validation = validateConfig(config);
    if (validation.isError()) {
        throw std::invalid_argument("Invalid optimizer config: " + validation.errorValue());
    }
    return config;
}

uint64_t resolveMasterSeed(uint64_t configured)
{
    if (configured != 0) {
        return configured;
    }
    std::random_device device;
    return (static_cast<uint64_t>(device()) << 32) ^ device();
}

std::string geneLabel(const GenomeConfig& genome, size_t index)
{
    if (index < genome.geneNames.size()) {
        return genome.geneNames[index];
    }
    return fmt::format("gene[{}]", index);
}

} // namespace

void to_json(nlohmann::json& j, const OptimizationResult& result)
{
    j = ReflectSerializer::to_json(result);
}

std::string formatDuration(double seconds)
{
    const long long total = std::max(0LL, static_cast<long long>(std::llround(seconds)));
    const long long hours = total / 3600;
    const long long minutes = (total % 3600) / 60;
    const long long secs = total % 60;

    if (hours > 0) {
        return fmt::format("{}h {}m {}s", hours, minutes, secs);
    }
    if (minutes > 0) {
        return fmt::format("{}m {}s", minutes, secs);
    }
    return fmt::format("{}s", secs);
}

GeneticOptimizer::GeneticOptimizer(const OptimizerConfig& config, const SimulationOracle& oracle)
    : config_(requireValid(config)),
      pool_(std::make_unique<WorkerPool>(resolveWorkerCount(
          config_.evolution.maxParallelEvaluations, config_.evolution.reservedCores))),
      evaluator_(oracle, config_.fitness),
      confirmation_(evaluator_, config_.confirmation, *pool_),
      stagnation_(config_.stagnation, config_.mutation),
      masterRng_(resolveMasterSeed(config_.evolution.randomSeed))
{
    variationRng_.seed(static_cast<std::mt19937::result_type>(masterRng_()));
}

GeneticOptimizer::~GeneticOptimizer() = default;

void GeneticOptimizer::requestStop()
{
    stopRequested_ = true;
}

void GeneticOptimizer::setProgressCallback(ProgressCallback callback)
{
    progressCallback_ = std::move(callback);
}

OptimizationResult GeneticOptimizer::run()
{
    const auto& evo = config_.evolution;
    LOG_INFO(
        Evolution,
        "Starting optimization: population {}, {} genes, {} screening trials, {} confirmation "
        "trials, {} workers",
        evo.populationSize,
        config_.genome.geneCount,
        evo.trialsPerGeneration,
        config_.confirmation.trials,
        pool_->workerCount());

    stopReason_ = StopReason::GenerationLimit;
    while (true) {
        if (stopRequested_) {
            stopReason_ = StopReason::StopRequested;
            LOG_INFO(Evolution, "Stop requested after generation {}", generation_);
            break;
        }
        if (evo.maxGenerations > 0 && generation_ >= evo.maxGenerations) {
            break;
        }
        step();
    }

    const auto finalResult = result();
    LOG_INFO(
        Evolution,
        "Finished after {} generations in {}: best composite {:.4f} ({} trials spent)",
        finalResult.generations,
        formatDuration(finalResult.durationSec),
        finalResult.fitness,
        finalResult.totalTrials);
    return finalResult;
}

GenerationProgress GeneticOptimizer::step()
{
    if (!started_) {
        startTime_ = std::chrono::steady_clock::now();
        started_ = true;
    }

    if (population_.empty()) {
        population_ = createInitialPopulation(config_, variationRng_);
    }
    else {
        breedNextGeneration();
    }

    // One seed batch for every individual screened this generation.
    const SeedBatch seeds = generateSeedBatch(masterRng_, config_.evolution.trialsPerGeneration);
    const auto indices = selectForScreening();
    totalTrials_ += evaluator_.evaluatePopulation(population_, indices, seeds, *pool_);
    sortByFitness(population_);

    const double screeningBest = population_.front().fitness;

    int tested = 0;
    const bool improved = globalBest_.has_value() ? confirmLeaders(tested) : establishIncumbent();

    // Confirmed individuals now carry their paired statistics.
    sortByFitness(population_);
    DICETUNE_ASSERT(
        static_cast<int>(population_.size()) == config_.evolution.populationSize,
        "Population size must stay constant");
    DICETUNE_ASSERT(isSortedByFitness(population_), "Population must be ranked after a generation");

    const StagnationEvent event = stagnation_.observe(improved);
    generation_++;

    const Individual& best = *globalBest_;
    GenerationProgress progress{
        .generation = generation_,
        .bestFitness = best.fitness,
        .bestStandardError = best.standardError,
        .bestMean = best.meanOutcome,
        .bestMedian = best.median,
        .bestQ3 = best.q3,
        .bestStdDev = std::sqrt(best.variance),
        .screeningBestFitness = screeningBest,
        .improved = improved,
        .stagnationEvent = event,
        .stagnationCount = stagnation_.stagnationCount(),
        .mutationStrength = stagnation_.mutationStrength(),
        .evaluatedCount = static_cast<int>(indices.size()),
        .confirmationsTested = tested,
        .incumbentTrials = incumbentTrials_,
        .totalTrials = totalTrials_,
        .elapsedSec =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime_).count(),
        .etaSec = std::nullopt,
    };
    const int maxGenerations = config_.evolution.maxGenerations;
    if (maxGenerations > 0) {
        progress.etaSec =
            progress.elapsedSec / generation_ * std::max(0, maxGenerations - generation_);
    }

    reportProgress(progress);
    if (progressCallback_) {
        progressCallback_(progress);
    }
    return progress;
}

std::vector<size_t> GeneticOptimizer::selectForScreening() const
{
    const int interval = config_.evolution.eliteReevaluationInterval;
    const bool reevaluateElites = interval > 0 && generation_ > 0 && generation_ % interval == 0;

    std::vector<size_t> indices;
    indices.reserve(population_.size());
    for (size_t i = 0; i < population_.size(); ++i) {
        const Individual& individual = population_[i];
        const bool carried = individual.isElite && individual.isEvaluated();
        // Confirmed statistics come from the much larger paired batch; keep them.
        if (!carried || (reevaluateElites && !individual.isConfirmed)) {
            indices.push_back(i);
        }
    }
    return indices;
}

bool GeneticOptimizer::establishIncumbent()
{
    Individual& leader = population_.front();
    const SeedBatch seeds = generateSeedBatch(masterRng_, config_.confirmation.trials);
    const auto stats = confirmation_.measure(leader.genes, seeds, 0);
    totalTrials_ += seeds.size();
    incumbentTrials_ = seeds.size();

    leader.applyStatistics(stats, evaluator_.composite(stats));
    leader.isConfirmed = true;
    globalBest_ = leader;
    acceptedFitness_.push_back(leader.fitness);

    logIncumbent(leader);
    return true;
}

bool GeneticOptimizer::confirmLeaders(int& tested)
{
    Individual incumbent = *globalBest_;
    const auto round = confirmation_.confirm(population_, incumbent, masterRng_);
    totalTrials_ += round.trials;
    tested = round.candidatesTested;

    if (round.accepted == 0) {
        return false;
    }

    incumbentTrials_ +=
        static_cast<uint64_t>(round.accepted) * static_cast<uint64_t>(config_.confirmation.trials);
    globalBest_ = incumbent;
    acceptedFitness_.push_back(incumbent.fitness);
    logIncumbent(incumbent);
    return true;
}

void GeneticOptimizer::breedNextGeneration()
{
    const bool restart = stagnation_.consumeRestart();
    const int diversity = restart
        ? std::max(diversityCount(config_.evolution),
                   restartInjectionCount(config_.evolution, config_.stagnation))
        : diversityCount(config_.evolution);

    const GenerationPlan plan{
        .eliteCount = config_.evolution.eliteCount,
        .diversityCount = diversity,
        .mutation = {
            .ratePerGene = config_.mutation.ratePerGene,
            .strength = stagnation_.mutationStrength(),
            .largeMutationRate = config_.mutation.largeMutationRate,
            .explorationMin = config_.genome.explorationMin,
            .explorationMax = config_.genome.explorationMax,
        },
    };

    AssemblyStats stats;
    population_ = buildNextGeneration(population_, plan, config_, variationRng_, &stats);

    if (restart) {
        LOG_INFO(Evolution, "Restart: {} fresh random individuals injected", stats.randomInjected);
    }
    LOG_DEBUG(
        Evolution,
        "Assembled generation {}: {} confirmed, {} elites, {} random, {} offspring ({} "
        "perturbations, {} resets)",
        generation_ + 1,
        stats.confirmedCarried,
        stats.elitesCarried,
        stats.randomInjected,
        stats.offspring,
        stats.mutation.perturbations,
        stats.mutation.resets);
}

void GeneticOptimizer::reportProgress(const GenerationProgress& progress) const
{
    const std::string eta =
        progress.etaSec.has_value() ? " - ETA " + formatDuration(*progress.etaSec) : "";

    LOG_INFO(
        Progress,
        "Gen {} - Best: {:.4f} (±{:.4f}) - mean {:.3f} median {:.3f} q3 {:.3f} sd {:.3f} - "
        "{} incumbent trials - mut {:.4f} - stag {} ({}) - elapsed {}{}",
        progress.generation,
        progress.bestFitness,
        1.96 * progress.bestStandardError,
        progress.bestMean,
        progress.bestMedian,
        progress.bestQ3,
        progress.bestStdDev,
        progress.incumbentTrials,
        progress.mutationStrength,
        progress.stagnationCount,
        toString(progress.stagnationEvent),
        formatDuration(progress.elapsedSec),
        eta);
    LOG_INFO(
        Evolution,
        "Screened {} (leader {:.4f}), tested {} candidates, {} trials so far",
        progress.evaluatedCount,
        progress.screeningBestFitness,
        progress.confirmationsTested,
        progress.totalTrials);
}

void GeneticOptimizer::logIncumbent(const Individual& best) const
{
    LOG_INFO(
        Evolution,
        "New best at generation {}: composite {:.4f}, mean {:.4f} ± {:.4f} over {} trials",
        generation_ + 1,
        best.fitness,
        best.meanOutcome,
        1.96 * best.standardError,
        best.evaluationCount);
    for (size_t i = 0; i < best.genes.size(); ++i) {
        LOG_INFO(Evolution, "  {} = {:.6f}", geneLabel(config_.genome, i), best.genes[i]);
    }
}

OptimizationResult GeneticOptimizer::result() const
{
    OptimizationResult out;
    out.geneNames = config_.genome.geneNames;
    out.generations = generation_;
    out.incumbentTrials = incumbentTrials_;
    out.totalTrials = totalTrials_;
    out.stopReason = stopReason_;
    if (started_) {
        out.durationSec =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime_).count();
    }

    if (globalBest_.has_value()) {
        const Individual& best = *globalBest_;
        out.bestGenes = best.genes;
        out.fitness = best.fitness;
        out.mean = best.meanOutcome;
        out.variance = best.variance;
        out.median = best.median;
        out.q3 = best.q3;
        out.standardError = best.standardError;
        out.trialCount = best.evaluationCount;
    }
    return out;
}

} // namespace DiceTune
