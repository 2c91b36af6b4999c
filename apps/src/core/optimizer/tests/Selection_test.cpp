#include "core/optimizer/Population.h"
#include "core/optimizer/Selection.h"

#include <gtest/gtest.h>
#include <set>

using namespace DiceTune;

class SelectionTest : public ::testing::Test {
protected:
    std::mt19937 rng{ 42 };

    Population createPopulation(const std::vector<double>& fitness)
    {
        Population pop;
        for (size_t i = 0; i < fitness.size(); i++) {
            Individual individual = Individual::withGenes({ static_cast<double>(i) });
            individual.fitness = fitness[i];
            pop.push_back(individual);
        }
        return pop;
    }
};

TEST_F(SelectionTest, TournamentSelectReturnsIndexInPopulation)
{
    const auto population = createPopulation({ 1, 2, 3, 4, 5, 6, 7, 8, 9, 10 });

    for (int i = 0; i < 100; ++i) {
        EXPECT_LT(tournamentSelectIndex(population, 3, rng), population.size());
    }
}

TEST_F(SelectionTest, LargeTournamentFindsLowestFitness)
{
    const auto population = createPopulation({ 4, 5, 1, 3, 2 }); // Best is index 2.

    EXPECT_EQ(tournamentSelectIndex(population, 200, rng), 2u);
}

TEST_F(SelectionTest, SingleEntrantTournamentReachesEveryIndividual)
{
    const auto population = createPopulation({ 1, 2, 3, 4 });

    std::set<size_t> seen;
    for (int i = 0; i < 200; ++i) {
        seen.insert(tournamentSelectIndex(population, 1, rng));
    }
    EXPECT_EQ(seen.size(), population.size());
}

TEST_F(SelectionTest, PressureFavorsBetterIndividuals)
{
    const auto population = createPopulation({ 1, 2, 3, 4, 5, 6, 7, 8, 9, 10 });

    int bestHalf = 0;
    for (int i = 0; i < 1000; ++i) {
        if (tournamentSelectIndex(population, 3, rng) < 5) {
            bestHalf++;
        }
    }
    // P(best of 3 in top half) = 1 - 0.5^3 = 0.875.
    EXPECT_GT(bestHalf, 800);
}
