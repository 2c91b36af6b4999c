#pragma once

#include "SimulationOracle.h"
#include "core/ReflectSerializer.h"

#include <nlohmann/json.hpp>
#include <vector>

namespace DiceTune {

/**
 * Parameters of the stand-in turn-count model.
 */
struct SyntheticOracleConfig {
    double baseTurns = 18.0;     // Turns needed with ideal weights.
    double curvature = 6.0;      // Extra turns per unit squared distance from the ideal.
    double noiseStdDev = 4.0;    // Per-game luck.
    double minimumTurns = 1.0;
    std::vector<double> targets; // Ideal weights; empty = 0.5 for every gene.
};

void to_json(nlohmann::json& j, const SyntheticOracleConfig& config);
void from_json(const nlohmann::json& j, SyntheticOracleConfig& config);

/**
 * Stand-in for the dice game: a whole number of turns that grows with the squared
 * distance of the weights from an ideal vector, plus seeded noise whose spread also
 * grows with that distance. Lets the optimizer run end to end without the game engine.
 */
class SyntheticTurnOracle : public SimulationOracle {
public:
    explicit SyntheticTurnOracle(SyntheticOracleConfig config);

    double simulate(const std::vector<double>& genes, uint64_t seed) const override;

private:
    SyntheticOracleConfig config_;
};

} // namespace DiceTune
