#pragma once

#include "Confirmation.h"
#include "FitnessEvaluator.h"
#include "Individual.h"
#include "OptimizerConfig.h"
#include "Population.h"
#include "Stagnation.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace DiceTune {

class SimulationOracle;
class WorkerPool;

/**
 * Snapshot of one finished generation, emitted on the progress stream.
 */
struct GenerationProgress {
    int generation = 0;
    double bestFitness = 0.0; // Incumbent composite.
    double bestStandardError = 0.0;
    double bestMean = 0.0;
    double bestMedian = 0.0;
    double bestQ3 = 0.0;
    double bestStdDev = 0.0;
    double screeningBestFitness = 0.0;
    bool improved = false;
    StagnationEvent stagnationEvent = StagnationEvent::Waiting;
    int stagnationCount = 0;
    double mutationStrength = 0.0;
    int evaluatedCount = 0;
    int confirmationsTested = 0;
    uint64_t incumbentTrials = 0; // Confirmation trials behind every accepted incumbent.
    uint64_t totalTrials = 0;     // Every oracle call, screening and paired runs included.
    double elapsedSec = 0.0;
    std::optional<double> etaSec; // Only known when the generation count is capped.
};

enum class StopReason { GenerationLimit, StopRequested };

/**
 * Best confirmed weights and their statistics at the end of a run.
 */
struct OptimizationResult {
    std::vector<double> bestGenes;
    std::vector<std::string> geneNames;
    double fitness = 0.0;
    double mean = 0.0;
    double variance = 0.0;
    double median = 0.0;
    double q3 = 0.0;
    double standardError = 0.0;
    int trialCount = 0;
    int generations = 0;
    uint64_t incumbentTrials = 0;
    uint64_t totalTrials = 0;
    double durationSec = 0.0;
    StopReason stopReason = StopReason::GenerationLimit;
};

void to_json(nlohmann::json& j, const OptimizationResult& result);

/** "1h 2m 3s", "4m 5s", "6s". */
std::string formatDuration(double seconds);

/**
 * Drives the generational loop: screen, rank, confirm, adapt, breed.
 *
 * The optimizer owns all mutable run state (master generator, population, incumbent,
 * stagnation state) and only touches the population between parallel batches.
 */
class GeneticOptimizer {
public:
    using ProgressCallback = std::function<void(const GenerationProgress&)>;

    /** @throws std::invalid_argument when the configuration fails validateConfig(). */
    GeneticOptimizer(const OptimizerConfig& config, const SimulationOracle& oracle);
    ~GeneticOptimizer();

    /**
     * Run generations until the configured cap or a stop request.
     * @throws EvaluationError when an oracle trial fails.
     */
    OptimizationResult run();

    /** Run exactly one generation. */
    GenerationProgress step();

    /** Thread-safe; honored between generations. */
    void requestStop();

    void setProgressCallback(ProgressCallback callback);

    OptimizationResult result() const;

    int generation() const { return generation_; }
    const Population& population() const { return population_; }
    const std::optional<Individual>& globalBest() const { return globalBest_; }
    const std::vector<double>& acceptedFitnessHistory() const { return acceptedFitness_; }
    const StagnationController& stagnation() const { return stagnation_; }
    uint64_t incumbentTrials() const { return incumbentTrials_; }
    uint64_t totalTrials() const { return totalTrials_; }

private:
    std::vector<size_t> selectForScreening() const;
    bool establishIncumbent();
    bool confirmLeaders(int& tested);
    void breedNextGeneration();
    void reportProgress(const GenerationProgress& progress) const;
    void logIncumbent(const Individual& best) const;

    OptimizerConfig config_;
    std::unique_ptr<WorkerPool> pool_;
    FitnessEvaluator evaluator_;
    ConfirmationEngine confirmation_;
    StagnationController stagnation_;

    std::mt19937_64 masterRng_;
    std::mt19937 variationRng_;

    Population population_;
    std::optional<Individual> globalBest_;
    std::vector<double> acceptedFitness_;

    int generation_ = 0;
    uint64_t incumbentTrials_ = 0;
    uint64_t totalTrials_ = 0;
    std::atomic<bool> stopRequested_{ false };
    std::chrono::steady_clock::time_point startTime_;
    bool started_ = false;
    StopReason stopReason_ = StopReason::GenerationLimit;
    ProgressCallback progressCallback_;
};

} // namespace DiceTune
