#include "SyntheticTurnOracle.h"

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>

namespace DiceTune {

void to_json(nlohmann::json& j, const SyntheticOracleConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

void from_json(const nlohmann::json& j, SyntheticOracleConfig& config)
{
    config = ReflectSerializer::from_json<SyntheticOracleConfig>(j);
}

SyntheticTurnOracle::SyntheticTurnOracle(SyntheticOracleConfig config) : config_(std::move(config))
{}

double SyntheticTurnOracle::simulate(const std::vector<double>& genes, uint64_t seed) const
{
    if (!config_.targets.empty() && config_.targets.size() != genes.size()) {
        throw std::invalid_argument(
            "oracle expects " + std::to_string(config_.targets.size()) + " genes, got "
            + std::to_string(genes.size()));
    }

    double distance = 0.0;
    for (size_t i = 0; i < genes.size(); ++i) {
        const double target = config_.targets.empty() ? 0.5 : config_.targets[i];
        const double diff = genes[i] - target;
        distance += diff * diff;
    }

    // Fresh generator per call: the outcome depends on (genes, seed) only.
    std::mt19937_64 rng(seed);
    double luck = 0.0;
    if (config_.noiseStdDev > 0.0) {
        std::normal_distribution<double> noise(0.0, config_.noiseStdDev * (1.0 + 0.25 * distance));
        luck = noise(rng);
    }

    const double turns = std::round(config_.baseTurns + config_.curvature * distance + luck);
    return std::max(config_.minimumTurns, turns);
}

} // namespace DiceTune
