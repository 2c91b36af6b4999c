#pragma once

#include "core/ReflectSerializer.h"
#include "core/Result.h"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <variant>
#include <vector>

namespace DiceTune {

/**
 * Population shape, trial counts and parallelism of the generational loop.
 */
struct EvolutionConfig {
    int populationSize = 1000;
    int eliteCount = 20;
    double diversityRatio = 0.15; // Fraction of every generation drawn fresh at random.
    int tournamentSize = 3;
    int maxGenerations = 0;         // 0 = run until stopped.
    int maxParallelEvaluations = 0; // 0 = auto (detected cores minus reservedCores).
    int reservedCores = 1;
    int trialsPerGeneration = 5000;     // K, screening seeds per generation.
    int eliteReevaluationInterval = 10; // 0 = elites keep their fitness until displaced.
    uint64_t randomSeed = 0;            // 0 = seed the master generator from std::random_device.
};

/**
 * Gaussian per-gene mutation plus the occasional single-gene reset.
 */
struct MutationConfig {
    double ratePerGene = 0.30;
    double initialStrength = 0.15; // Gaussian sigma after an accepted improvement.
    double maxStrength = 0.5;
    double largeMutationRate = 0.08; // Probability of resetting one gene per offspring.
};

/**
 * Paired head-to-head testing of screening leaders against the incumbent.
 */
struct ConfirmationConfig {
    int trials = 20000; // M, paired seeds per comparison.
    double significanceThreshold = 0.05;
    int topCandidates = 5;
    double competitiveSigmas = 2.0; // Skip candidates worse than incumbent + sigmas * SE.
};

struct StagnationConfig {
    int heatUpThreshold = 5;
    int restartThreshold = 20;
    double escalationFactor = 1.5;
    double restartFraction = 0.40;
    double restartMutationStrength = 0.3;
};

/**
 * Convex combination of the outcome statistics; must sum to 1.
 */
struct FitnessWeights {
    double mean = 0.5;
    double spread = 0.1; // Applied to sqrt(variance).
    double median = 0.2;
    double q3 = 0.2;
};

struct GenomeConfig {
    int geneCount = 8;
    double explorationMin = -1.0;
    double explorationMax = 2.0;
    std::vector<std::string> geneNames; // Optional, used in progress output.
    std::vector<double> seedGenes;      // Optional known-good starting point.
};

struct OptimizerConfig {
    EvolutionConfig evolution;
    MutationConfig mutation;
    ConfirmationConfig confirmation;
    StagnationConfig stagnation;
    FitnessWeights fitness;
    GenomeConfig genome;
};

/**
 * Check every cross-field constraint up front so a run never starts with a
 * configuration that would break the population or fitness invariants.
 */
Result<std::monostate, std::string> validateConfig(const OptimizerConfig& config);

int diversityCount(const EvolutionConfig& evolution);
int restartInjectionCount(const EvolutionConfig& evolution, const StagnationConfig& stagnation);

void to_json(nlohmann::json& j, const EvolutionConfig& config);
void from_json(const nlohmann::json& j, EvolutionConfig& config);
void to_json(nlohmann::json& j, const MutationConfig& config);
void from_json(const nlohmann::json& j, MutationConfig& config);
void to_json(nlohmann::json& j, const ConfirmationConfig& config);
void from_json(const nlohmann::json& j, ConfirmationConfig& config);
void to_json(nlohmann::json& j, const StagnationConfig& config);
void from_json(const nlohmann::json& j, StagnationConfig& config);
void to_json(nlohmann::json& j, const FitnessWeights& config);
void from_json(const nlohmann::json& j, FitnessWeights& config);
void to_json(nlohmann::json& j, const GenomeConfig& config);
void from_json(const nlohmann::json& j, GenomeConfig& config);
void to_json(nlohmann::json& j, const OptimizerConfig& config);
void from_json(const nlohmann::json& j, OptimizerConfig& config);

} // namespace DiceTune
