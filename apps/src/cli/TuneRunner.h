#pragma once

#include "core/ReflectSerializer.h"
#include "core/Result.h"
#include "core/optimizer/GeneticOptimizer.h"
#include "core/optimizer/OptimizerConfig.h"
#include "core/optimizer/SyntheticTurnOracle.h"

#include <atomic>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace DiceTune {
namespace Client {

/**
 * Everything a tuning run reads from dicetune.json.
 */
struct TuneConfig {
    OptimizerConfig optimizer;
    SyntheticOracleConfig oracle;
};

/**
 * Results from a finished (or aborted) tuning run.
 */
struct TuneResults {
    OptimizationResult best;
    bool completed = false;
    std::string errorMessage;
    std::string failedPhase; // "screening" or "confirmation" when an oracle trial failed.
    int failedIndividual = -1;
};

/**
 * Single gene vector to screen with the evaluate command.
 */
struct EvaluateRequest {
    std::vector<double> genes;
    std::optional<int> trials; // Defaults to evolution.trialsPerGeneration.
    uint64_t seed = 1;
};

struct EvaluateReport {
    std::vector<double> genes;
    double fitness = 0.0;
    double mean = 0.0;
    double variance = 0.0;
    double median = 0.0;
    double q3 = 0.0;
    double standardError = 0.0;
    int trialCount = 0;
};

void to_json(nlohmann::json& j, const TuneConfig& config);
void from_json(const nlohmann::json& j, TuneConfig& config);
void to_json(nlohmann::json& j, const TuneResults& results);
void from_json(const nlohmann::json& j, EvaluateRequest& request);
void to_json(nlohmann::json& j, const EvaluateReport& report);

/**
 * Screen one gene vector against the synthetic oracle.
 */
Result<EvaluateReport, std::string> evaluateGenes(
    const TuneConfig& config, const EvaluateRequest& request);

/**
 * Runs the optimizer against the synthetic oracle and collects the outcome.
 */
class TuneRunner {
public:
    TuneResults run(const TuneConfig& config);

    /**
     * Request stop of the current run (from signal handler).
     */
    void requestStop();

private:
    std::atomic<GeneticOptimizer*> optimizer_{ nullptr };
    std::atomic<bool> stopRequested_{ false };
};

} // namespace Client
} // namespace DiceTune
