#include "OptimizerConfig.h"

#include <cmath>

namespace DiceTune {

namespace {

using ValidationResult = Result<std::monostate, std::string>;

bool isProbability(double value)
{
    return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

} // namespace

int diversityCount(const EvolutionConfig& evolution)
{
    return static_cast<int>(std::floor(evolution.populationSize * evolution.diversityRatio));
}

int restartInjectionCount(const EvolutionConfig& evolution, const StagnationConfig& stagnation)
{
    return static_cast<int>(std::floor(evolution.populationSize * stagnation.restartFraction));
}

ValidationResult validateConfig(const OptimizerConfig& config)
{
    const auto& evo = config.evolution;
    const auto& mut = config.mutation;
    const auto& conf = config.confirmation;
    const auto& stag = config.stagnation;
    const auto& w = config.fitness;
    const auto& genome = config.genome;

    if (evo.populationSize < 2) {
        return ValidationResult::error("evolution.populationSize must be at least 2");
    }
    if (evo.eliteCount < 1) {
        return ValidationResult::error("evolution.eliteCount must be at least 1");
    }
    if (!isProbability(evo.diversityRatio)) {
        return ValidationResult::error("evolution.diversityRatio must be within [0, 1]");
    }
    if (evo.eliteCount + diversityCount(evo) > evo.populationSize) {
        return ValidationResult::error(
            "evolution.eliteCount plus diversity injection exceeds populationSize");
    }
    if (evo.tournamentSize < 1) {
        return ValidationResult::error("evolution.tournamentSize must be at least 1");
    }
    if (evo.maxGenerations < 0) {
        return ValidationResult::error("evolution.maxGenerations must not be negative");
    }
    if (evo.trialsPerGeneration < 1) {
        return ValidationResult::error("evolution.trialsPerGeneration must be at least 1");
    }
    if (evo.eliteReevaluationInterval < 0) {
        return ValidationResult::error("evolution.eliteReevaluationInterval must not be negative");
    }
    if (evo.reservedCores < 0) {
        return ValidationResult::error("evolution.reservedCores must not be negative");
    }

    if (!isProbability(mut.ratePerGene) || !isProbability(mut.largeMutationRate)) {
        return ValidationResult::error("mutation rates must be within [0, 1]");
    }
    if (!(mut.initialStrength >= 0.0) || mut.initialStrength > mut.maxStrength) {
        return ValidationResult::error("mutation.initialStrength must be within [0, maxStrength]");
    }

    if (conf.trials < 2) {
        return ValidationResult::error("confirmation.trials must be at least 2");
    }
    if (!(conf.significanceThreshold > 0.0 && conf.significanceThreshold < 1.0)) {
        return ValidationResult::error("confirmation.significanceThreshold must be within (0, 1)");
    }
    if (conf.topCandidates < 1) {
        return ValidationResult::error("confirmation.topCandidates must be at least 1");
    }
    if (conf.competitiveSigmas < 0.0) {
        return ValidationResult::error("confirmation.competitiveSigmas must not be negative");
    }

    if (stag.heatUpThreshold < 0 || stag.restartThreshold <= stag.heatUpThreshold) {
        return ValidationResult::error(
            "stagnation.restartThreshold must be greater than heatUpThreshold");
    }
    if (stag.escalationFactor < 1.0) {
        return ValidationResult::error("stagnation.escalationFactor must be at least 1");
    }
    if (!isProbability(stag.restartFraction)) {
        return ValidationResult::error("stagnation.restartFraction must be within [0, 1]");
    }
    if (evo.eliteCount + restartInjectionCount(evo, stag) > evo.populationSize) {
        return ValidationResult::error(
            "evolution.eliteCount plus restart injection exceeds populationSize");
    }
    if (!(stag.restartMutationStrength >= 0.0) || stag.restartMutationStrength > mut.maxStrength) {
        return ValidationResult::error(
            "stagnation.restartMutationStrength must be within [0, mutation.maxStrength]");
    }
    if (!(stag.restartMutationStrength > mut.initialStrength)) {
        return ValidationResult::error(
            "stagnation.restartMutationStrength must exceed mutation.initialStrength");
    }

    if (!std::isfinite(w.mean) || !std::isfinite(w.spread) || !std::isfinite(w.median)
        || !std::isfinite(w.q3)) {
        return ValidationResult::error("fitness weights must be finite");
    }
    if (w.mean < 0.0 || w.spread < 0.0 || w.median < 0.0 || w.q3 < 0.0) {
        return ValidationResult::error("fitness weights must not be negative");
    }
    const double weightSum = w.mean + w.spread + w.median + w.q3;
    if (!(std::abs(weightSum - 1.0) <= 1e-9)) {
        return ValidationResult::error(
            "fitness weights must sum to 1 (got " + std::to_string(weightSum) + ")");
    }

    if (genome.geneCount < 1) {
        return ValidationResult::error("genome.geneCount must be at least 1");
    }
    if (!(genome.explorationMin < genome.explorationMax)) {
        return ValidationResult::error("genome.explorationMin must be below explorationMax");
    }
    if (!genome.geneNames.empty()
        && genome.geneNames.size() != static_cast<size_t>(genome.geneCount)) {
        return ValidationResult::error("genome.geneNames must name every gene");
    }
    if (!genome.seedGenes.empty()
        && genome.seedGenes.size() != static_cast<size_t>(genome.geneCount)) {
        return ValidationResult::error("genome.seedGenes must have geneCount values");
    }

    return ValidationResult::okay(std::monostate{});
}

void to_json(nlohmann::json& j, const EvolutionConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

void from_json(const nlohmann::json& j, EvolutionConfig& config)
{
    config = ReflectSerializer::from_json<EvolutionConfig>(j);
}

void to_json(nlohmann::json& j, const MutationConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

void from_json(const nlohmann::json& j, MutationConfig& config)
{
    config = ReflectSerializer::from_json<MutationConfig>(j);
}

void to_json(nlohmann::json& j, const ConfirmationConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

void from_json(const nlohmann::json& j, ConfirmationConfig& config)
{
    config = ReflectSerializer::from_json<ConfirmationConfig>(j);
}

void to_json(nlohmann::json& j, const StagnationConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

void from_json(const nlohmann::json& j, StagnationConfig& config)
{
    config = ReflectSerializer::from_json<StagnationConfig>(j);
}

void to_json(nlohmann::json& j, const FitnessWeights& config)
{
    j = ReflectSerializer::to_json(config);
}

void from_json(const nlohmann::json& j, FitnessWeights& config)
{
    config = ReflectSerializer::from_json<FitnessWeights>(j);
}

void to_json(nlohmann::json& j, const GenomeConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

void from_json(const nlohmann::json& j, GenomeConfig& config)
{
    config = ReflectSerializer::from_json<GenomeConfig>(j);
}

void to_json(nlohmann::json& j, const OptimizerConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

void from_json(const nlohmann::json& j, OptimizerConfig& config)
{
    config = ReflectSerializer::from_json<OptimizerConfig>(j);
}

} // namespace DiceTune
