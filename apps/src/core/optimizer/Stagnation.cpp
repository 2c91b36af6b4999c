#include "Stagnation.h"
#include "core/LoggingChannels.h"

#include <algorithm>

namespace DiceTune {

const char* toString(StagnationEvent event)
{
    switch (event) {
        case StagnationEvent::Improved:
            return "improved";
        case StagnationEvent::Waiting:
            return "waiting";
        case StagnationEvent::HeatUp:
            return "heat-up";
        case StagnationEvent::Restart:
            return "restart";
    }
    return "unknown";
}

StagnationController::StagnationController(
    const StagnationConfig& config, const MutationConfig& mutation)
    : config_(config),
      initialStrength_(mutation.initialStrength),
      maxStrength_(mutation.maxStrength),
      mutationStrength_(mutation.initialStrength)
{}

StagnationEvent StagnationController::observe(bool improved)
{
    if (improved) {
        stagnationCount_ = 0;
        mutationStrength_ = initialStrength_;
        return StagnationEvent::Improved;
    }

    stagnationCount_++;

    if (stagnationCount_ > config_.restartThreshold) {
        LOG_INFO(
            Stagnation,
            "No improvement for {} generations, scheduling restart ({:.0f}% fresh individuals)",
            stagnationCount_,
            config_.restartFraction * 100.0);
        stagnationCount_ = 0;
        mutationStrength_ = std::min(maxStrength_, config_.restartMutationStrength);
        restartPending_ = true;
        return StagnationEvent::Restart;
    }

    if (stagnationCount_ > config_.heatUpThreshold) {
        const double previous = mutationStrength_;
        mutationStrength_ = std::min(maxStrength_, mutationStrength_ * config_.escalationFactor);
        LOG_DEBUG(
            Stagnation,
            "Stagnation {}: mutation strength {:.4f} -> {:.4f}",
            stagnationCount_,
            previous,
            mutationStrength_);
        return StagnationEvent::HeatUp;
    }

    return StagnationEvent::Waiting;
}

bool StagnationController::consumeRestart()
{
    const bool pending = restartPending_;
    restartPending_ = false;
    return pending;
}

} // namespace DiceTune
