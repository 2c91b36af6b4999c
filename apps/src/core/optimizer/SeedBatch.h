#pragma once

#include <cstdint>
#include <random>
#include <vector>

namespace DiceTune {

/**
 * Ordered trial seeds shared seed-for-seed by every individual evaluated against it.
 */
using SeedBatch = std::vector<uint64_t>;

/**
 * Draw count seeds from the master generator, advancing its state.
 */
SeedBatch generateSeedBatch(std::mt19937_64& master, int count);

} // namespace DiceTune
