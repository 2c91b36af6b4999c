#include "Selection.h"
#include "core/Assert.h"

namespace DiceTune {

size_t tournamentSelectIndex(
    const std::vector<Individual>& population, int tournamentSize, std::mt19937& rng)
{
    DICETUNE_ASSERT(!population.empty(), "Cannot select from an empty population");
    DICETUNE_ASSERT(tournamentSize >= 1, "Tournament size must be at least 1");

    std::uniform_int_distribution<size_t> dist(0, population.size() - 1);

    size_t bestIdx = dist(rng);
    for (int i = 1; i < tournamentSize; ++i) {
        const size_t idx = dist(rng);
        if (population[idx].fitness < population[bestIdx].fitness) {
            bestIdx = idx;
        }
    }
    return bestIdx;
}

} // namespace DiceTune
