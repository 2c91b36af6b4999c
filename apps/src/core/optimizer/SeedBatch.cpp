#include "SeedBatch.h"

namespace DiceTune {

SeedBatch generateSeedBatch(std::mt19937_64& master, int count)
{
    SeedBatch seeds;
    if (count <= 0) {
        return seeds;
    }

    seeds.reserve(count);
    for (int i = 0; i < count; ++i) {
        seeds.push_back(master());
    }
    return seeds;
}

} // namespace DiceTune
