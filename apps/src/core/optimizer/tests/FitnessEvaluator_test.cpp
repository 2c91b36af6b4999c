#include "StubOracles.h"
#include "core/WorkerPool.h"
#include "core/optimizer/FitnessEvaluator.h"
#include "core/optimizer/Population.h"

#include <gtest/gtest.h>

using namespace DiceTune;

class FitnessEvaluatorTest : public ::testing::Test {
protected:
    Population examplePopulation() const
    {
        return {
            Individual::withGenes({ 3, 3 }),
            Individual::withGenes({ 1, 1 }),
            Individual::withGenes({ 0, 0 }),
            Individual::withGenes({ 2, 2 }),
        };
    }

    const SeedBatch seeds{ 7, 13, 21 };
    const std::vector<size_t> all{ 0, 1, 2, 3 };
    FitnessWeights weights;
    WorkerPool pool{ 3 };
};

TEST_F(FitnessEvaluatorTest, ExampleScenarioRanksZeroGenesBest)
{
    LookupNoiseOracle oracle;
    FitnessEvaluator evaluator(oracle, weights);
    Population population = examplePopulation();

    const uint64_t trials = evaluator.evaluatePopulation(population, all, seeds, pool);
    sortByFitness(population);

    EXPECT_EQ(trials, 12u);
    EXPECT_EQ(population.front().genes, (std::vector<double>{ 0, 0 }));
    EXPECT_NEAR(population.front().meanOutcome, (0.5 - 0.25 + 0.1) / 3.0, 1e-12);
    EXPECT_NEAR(population.front().median, 0.1, 1e-12);
    EXPECT_EQ(population.front().evaluationCount, 3);
    EXPECT_TRUE(isSortedByFitness(population));
    EXPECT_EQ(population.back().genes, (std::vector<double>{ 3, 3 }));
}

TEST_F(FitnessEvaluatorTest, ReevaluationReproducesIdenticalStatistics)
{
    LookupNoiseOracle oracle;
    FitnessEvaluator evaluator(oracle, weights);
    Population first = examplePopulation();
    Population second = examplePopulation();

    evaluator.evaluatePopulation(first, all, seeds, pool);
    evaluator.evaluatePopulation(second, all, seeds, pool);

    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].meanOutcome, second[i].meanOutcome);
        EXPECT_EQ(first[i].variance, second[i].variance);
        EXPECT_EQ(first[i].median, second[i].median);
        EXPECT_EQ(first[i].q3, second[i].q3);
        EXPECT_EQ(first[i].fitness, second[i].fitness);
    }
}

TEST_F(FitnessEvaluatorTest, EvaluateIsDeterministic)
{
    NoisyBowlOracle oracle;
    FitnessEvaluator evaluator(oracle, weights);
    const SeedBatch batch{ 1, 2, 3, 4, 5, 6, 7, 8 };

    const auto a = evaluator.evaluate({ 0.2, 0.9 }, batch);
    const auto b = evaluator.evaluate({ 0.2, 0.9 }, batch);

    EXPECT_EQ(a.mean, b.mean);
    EXPECT_EQ(a.variance, b.variance);
    EXPECT_EQ(a.median, b.median);
    EXPECT_EQ(a.q3, b.q3);
    EXPECT_EQ(a.standardError, b.standardError);
    EXPECT_EQ(a.count, 8);
}

TEST_F(FitnessEvaluatorTest, PerSeedOutcomesMatchIndependentSingleTrials)
{
    NoisyBowlOracle oracle;
    FitnessEvaluator evaluator(oracle, weights);
    const SeedBatch recorded{ 99, 5, 123456789, 42, 7 };

    for (const std::vector<double> genes : { std::vector<double>{ 0.0, 1.0 },
                                             std::vector<double>{ 1.5, -0.5 } }) {
        const auto outcomes = evaluator.runTrials(genes, recorded);
        ASSERT_EQ(outcomes.size(), recorded.size());
        for (size_t i = 0; i < recorded.size(); ++i) {
            EXPECT_EQ(outcomes[i], oracle.simulate(genes, recorded[i]));
        }
    }
}

TEST_F(FitnessEvaluatorTest, CompositeBlendsAllFourComponents)
{
    const TrialStatistics stats{
        .mean = 10.0, .variance = 4.0, .median = 9.0, .q3 = 12.0, .standardError = 0.5, .count = 16
    };

    EXPECT_NEAR(computeCompositeFitness(stats, weights), 5.0 + 0.2 + 1.8 + 2.4, 1e-12);

    const FitnessWeights meanOnly{ .mean = 1.0, .spread = 0.0, .median = 0.0, .q3 = 0.0 };
    EXPECT_DOUBLE_EQ(computeCompositeFitness(stats, meanOnly), 10.0);
}

TEST_F(FitnessEvaluatorTest, OnlyListedIndividualsAreEvaluated)
{
    LookupNoiseOracle oracle;
    FitnessEvaluator evaluator(oracle, weights);
    Population population = examplePopulation();

    const uint64_t trials = evaluator.evaluatePopulation(population, { 1, 3 }, seeds, pool);

    EXPECT_EQ(trials, 6u);
    EXPECT_FALSE(population[0].isEvaluated());
    EXPECT_TRUE(population[1].isEvaluated());
    EXPECT_FALSE(population[2].isEvaluated());
    EXPECT_TRUE(population[3].isEvaluated());
    EXPECT_EQ(population[1].genes, (std::vector<double>{ 1, 1 }));
}

TEST_F(FitnessEvaluatorTest, OracleExceptionIdentifiesScreeningAndIndividual)
{
    ThresholdFailingOracle oracle(1.5);
    FitnessEvaluator evaluator(oracle, weights);
    Population population = {
        Individual::withGenes({ 0, 0 }),
        Individual::withGenes({ 1, 1 }),
        Individual::withGenes({ 2, 2 }),
        Individual::withGenes({ 3, 3 }),
    };

    try {
        evaluator.evaluatePopulation(population, all, seeds, pool);
        FAIL() << "Expected EvaluationError";
    }
    catch (const EvaluationError& e) {
        EXPECT_EQ(e.phase(), EvaluationPhase::Screening);
        EXPECT_EQ(e.individualIndex(), 2u);
        EXPECT_NE(std::string(e.what()).find("screening"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("game engine crashed"), std::string::npos);
    }
}

TEST_F(FitnessEvaluatorTest, NonFiniteOutcomeIsFatal)
{
    NanOracle oracle;
    FitnessEvaluator evaluator(oracle, weights);

    EXPECT_THROW(evaluator.evaluate({ 0.0, 0.0 }, seeds), EvaluationError);
}
