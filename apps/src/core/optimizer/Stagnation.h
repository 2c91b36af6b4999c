#pragma once

#include "OptimizerConfig.h"

namespace DiceTune {

enum class StagnationEvent {
    Improved, // Acceptance this generation; strength back to initial.
    Waiting,  // No acceptance, below the heat-up threshold.
    HeatUp,   // Mutation strength escalated.
    Restart   // Diversity injection scheduled for the next generation.
};

const char* toString(StagnationEvent event);

/**
 * Tracks generations without an accepted improvement and adapts exploration.
 */
class StagnationController {
public:
    StagnationController(const StagnationConfig& config, const MutationConfig& mutation);

    StagnationEvent observe(bool improved);

    /** True once after a Restart event; the next generation injects restart diversity. */
    bool consumeRestart();

    int stagnationCount() const { return stagnationCount_; }
    double mutationStrength() const { return mutationStrength_; }
    bool restartPending() const { return restartPending_; }

private:
    StagnationConfig config_;
    double initialStrength_;
    double maxStrength_;

    int stagnationCount_ = 0;
    double mutationStrength_;
    bool restartPending_ = false;
};

} // namespace DiceTune
