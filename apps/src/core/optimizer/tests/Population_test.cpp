#include "core/optimizer/Population.h"

#include <gtest/gtest.h>

namespace DiceTune {

namespace {
OptimizerConfig makeConfig(int populationSize)
{
    OptimizerConfig config;
    config.evolution.populationSize = populationSize;
    config.evolution.eliteCount = 2;
    config.evolution.diversityRatio = 0.2;
    config.genome.geneCount = 3;
    return config;
}

Population rankedPopulation(int size)
{
    Population population;
    for (int i = 0; i < size; ++i) {
        Individual individual = Individual::withGenes({ double(i), double(i), double(i) });
        individual.applyStatistics(
            TrialStatistics{ .mean = double(i), .count = 10 }, static_cast<double>(i));
        population.push_back(individual);
    }
    return population;
}
} // namespace

TEST(PopulationTest, SortByFitnessIsStableAndAscending)
{
    Population population;
    for (const double fitness : { 3.0, 1.0, 2.0, 1.0 }) {
        Individual individual = Individual::withGenes({ fitness });
        individual.fitness = fitness;
        population.push_back(individual);
    }
    population[3].genes = { 99.0 }; // Second individual with fitness 1.

    sortByFitness(population);

    EXPECT_TRUE(isSortedByFitness(population));
    EXPECT_EQ(population[0].genes, (std::vector<double>{ 1.0 }));
    EXPECT_EQ(population[1].genes, (std::vector<double>{ 99.0 }));
}

TEST(PopulationTest, InitialPopulationStartsFromSeedGenes)
{
    OptimizerConfig config = makeConfig(10);
    config.genome.seedGenes = { 0.361, 0.724, 1.0 };
    std::mt19937 rng{ 42 };

    const Population population = createInitialPopulation(config, rng);

    ASSERT_EQ(population.size(), 10u);
    EXPECT_EQ(population[0].genes, config.genome.seedGenes);
    for (const auto& individual : population) {
        EXPECT_EQ(individual.genes.size(), 3u);
        EXPECT_FALSE(individual.isEvaluated());
    }
}

TEST(PopulationTest, NextGenerationHasExactlyNIndividuals)
{
    std::mt19937 rng{ 42 };
    for (const int size : { 2, 7, 10, 33 }) {
        const OptimizerConfig config = makeConfig(size);
        const GenerationPlan plan{
            .eliteCount = config.evolution.eliteCount,
            .diversityCount = diversityCount(config.evolution),
        };

        const Population next = buildNextGeneration(rankedPopulation(size), plan, config, rng);

        EXPECT_EQ(next.size(), static_cast<size_t>(size));
    }
}

TEST(PopulationTest, ConfirmedIndividualsAreCarriedFirst)
{
    const OptimizerConfig config = makeConfig(10);
    Population ranked = rankedPopulation(10);
    ranked[5].isConfirmed = true;
    std::mt19937 rng{ 42 };
    const GenerationPlan plan{ .eliteCount = 2, .diversityCount = 2 };

    AssemblyStats stats;
    const Population next = buildNextGeneration(ranked, plan, config, rng, &stats);

    EXPECT_EQ(next[0].genes, ranked[5].genes);
    EXPECT_TRUE(next[0].isConfirmed);
    EXPECT_TRUE(next[0].isElite);
    EXPECT_DOUBLE_EQ(next[0].fitness, 5.0);
    EXPECT_EQ(next[1].genes, ranked[0].genes);
    EXPECT_TRUE(next[1].isElite);
    EXPECT_EQ(stats.confirmedCarried, 1);
    EXPECT_EQ(stats.elitesCarried, 1);
    EXPECT_EQ(stats.randomInjected, 2);
    EXPECT_EQ(stats.offspring, 6);
}

TEST(PopulationTest, AllConfirmedAreCarriedBeyondEliteCount)
{
    const OptimizerConfig config = makeConfig(10);
    Population ranked = rankedPopulation(10);
    for (const int i : { 1, 3, 4, 6 }) {
        ranked[i].isConfirmed = true;
    }
    std::mt19937 rng{ 42 };
    const GenerationPlan plan{ .eliteCount = 2, .diversityCount = 2 };

    AssemblyStats stats;
    const Population next = buildNextGeneration(ranked, plan, config, rng, &stats);

    ASSERT_EQ(next.size(), 10u);
    for (size_t i = 0; i < 4; ++i) {
        EXPECT_TRUE(next[i].isConfirmed) << i;
    }
    EXPECT_EQ(next[0].genes, ranked[1].genes);
    EXPECT_EQ(next[3].genes, ranked[6].genes);
    EXPECT_EQ(stats.confirmedCarried, 4);
    EXPECT_EQ(stats.elitesCarried, 0);
    EXPECT_EQ(stats.randomInjected, 2);
    EXPECT_EQ(stats.offspring, 4);
}

TEST(PopulationTest, ConfirmedCarryNeverTakesDiversitySlots)
{
    const OptimizerConfig config = makeConfig(10);
    Population ranked = rankedPopulation(10);
    for (auto& individual : ranked) {
        individual.isConfirmed = true;
    }
    std::mt19937 rng{ 42 };
    const GenerationPlan plan{ .eliteCount = 2, .diversityCount = 3 };

    AssemblyStats stats;
    const Population next = buildNextGeneration(ranked, plan, config, rng, &stats);

    ASSERT_EQ(next.size(), 10u);
    EXPECT_EQ(stats.confirmedCarried, 7);
    EXPECT_EQ(stats.randomInjected, 3);
    EXPECT_EQ(stats.offspring, 0);
}

TEST(PopulationTest, NonEliteSlotsAreUnevaluated)
{
    const OptimizerConfig config = makeConfig(12);
    std::mt19937 rng{ 42 };
    const GenerationPlan plan{ .eliteCount = 3, .diversityCount = 4 };

    const Population next = buildNextGeneration(rankedPopulation(12), plan, config, rng);

    int evaluated = 0;
    for (const auto& individual : next) {
        if (individual.isEvaluated()) {
            evaluated++;
            EXPECT_TRUE(individual.isElite);
        }
        else {
            EXPECT_FALSE(individual.isElite);
        }
    }
    EXPECT_EQ(evaluated, 3);
}

TEST(PopulationTest, ElitesYieldSlotsToDiversityInjection)
{
    const OptimizerConfig config = makeConfig(10);
    std::mt19937 rng{ 42 };
    const GenerationPlan plan{ .eliteCount = 8, .diversityCount = 5 };

    AssemblyStats stats;
    const Population next = buildNextGeneration(rankedPopulation(10), plan, config, rng, &stats);

    EXPECT_EQ(next.size(), 10u);
    EXPECT_EQ(stats.elitesCarried, 5);
    EXPECT_EQ(stats.randomInjected, 5);
    EXPECT_EQ(stats.offspring, 0);
}

TEST(PopulationTest, CopiesDoNotShareGenes)
{
    const OptimizerConfig config = makeConfig(4);
    const Population ranked = rankedPopulation(4);
    std::mt19937 rng{ 42 };
    const GenerationPlan plan{ .eliteCount = 1, .diversityCount = 0 };

    Population next = buildNextGeneration(ranked, plan, config, rng);
    next[0].genes[0] = 123.0;

    EXPECT_EQ(ranked[0].genes[0], 0.0);
}

} // namespace DiceTune
