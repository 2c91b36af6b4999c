#pragma once

#include "Individual.h"

#include <random>
#include <vector>

namespace DiceTune {

/**
 * Tournament selection: draw k slots uniformly with replacement, return the index of the
 * lowest fitness among them (earliest draw wins ties). Larger k means more pressure.
 */
size_t tournamentSelectIndex(
    const std::vector<Individual>& population, int tournamentSize, std::mt19937& rng);

} // namespace DiceTune
