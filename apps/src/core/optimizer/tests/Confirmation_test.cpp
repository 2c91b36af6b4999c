#include "StubOracles.h"
#include "core/WorkerPool.h"
#include "core/optimizer/Confirmation.h"

#include <gtest/gtest.h>
#include <numeric>

using namespace DiceTune;

class ConfirmationTest : public ::testing::Test {
protected:
    SeedBatch seedRange(uint64_t first, int count) const
    {
        SeedBatch seeds(count);
        std::iota(seeds.begin(), seeds.end(), first);
        return seeds;
    }

    Individual screened(const FitnessEvaluator& evaluator, std::vector<double> genes) const
    {
        Individual individual = Individual::withGenes(std::move(genes));
        const auto stats = evaluator.evaluate(individual.genes, seedRange(1, 50));
        individual.applyStatistics(stats, evaluator.composite(stats));
        return individual;
    }

    ConfirmationConfig config{
        .trials = 200,
        .significanceThreshold = 0.05,
        .topCandidates = 2,
        .competitiveSigmas = 2.0,
    };
    FitnessWeights weights;
    WorkerPool pool{ 4 };
    std::mt19937_64 master{ 42 };
};

TEST_F(ConfirmationTest, SelfComparisonIsNeverAccepted)
{
    NoisyBowlOracle oracle;
    FitnessEvaluator evaluator(oracle, weights);
    ConfirmationEngine engine(evaluator, config, pool);
    const std::vector<double> genes = { 0.3, 1.2 };

    const auto comparison = engine.compare(genes, genes, seedRange(100, 200), 0);

    EXPECT_DOUBLE_EQ(comparison.test.meanDifference, 0.0);
    EXPECT_DOUBLE_EQ(comparison.test.pValue, 1.0);
    EXPECT_DOUBLE_EQ(comparison.candidateComposite, comparison.incumbentComposite);
    EXPECT_FALSE(engine.accepts(comparison));
}

TEST_F(ConfirmationTest, PairedSeedsCancelSharedLuck)
{
    NoisyBowlOracle oracle(5.0);
    FitnessEvaluator evaluator(oracle, weights);
    ConfirmationEngine engine(evaluator, config, pool);

    const auto comparison = engine.compare({ 0.5, 0.5 }, { 1.0, 1.0 }, seedRange(1, 200), 0);

    // Both sides draw the same noise per seed, so only the 2.5-turn gap remains.
    EXPECT_NEAR(comparison.test.meanDifference, -2.5, 1e-9);
    EXPECT_LT(comparison.test.standardErrorDifference, 1e-9);
    EXPECT_LT(comparison.test.pValue, 0.05);
    EXPECT_TRUE(engine.accepts(comparison));
}

TEST_F(ConfirmationTest, ChunkedTrialsMatchSequentialEvaluation)
{
    NoisyBowlOracle oracle;
    FitnessEvaluator evaluator(oracle, weights);
    ConfirmationEngine engine(evaluator, config, pool);
    const SeedBatch seeds = seedRange(1000, 37);

    const auto comparison = engine.compare({ 0.1, 0.9 }, { 1.4, -0.2 }, seeds, 0);
    const auto candidate = evaluator.evaluate({ 0.1, 0.9 }, seeds);
    const auto incumbent = evaluator.evaluate({ 1.4, -0.2 }, seeds);
    const auto measured = engine.measure({ 0.1, 0.9 }, seeds, 0);

    EXPECT_EQ(comparison.candidate.mean, candidate.mean);
    EXPECT_EQ(comparison.candidate.q3, candidate.q3);
    EXPECT_EQ(comparison.incumbent.mean, incumbent.mean);
    EXPECT_EQ(comparison.incumbent.median, incumbent.median);
    EXPECT_EQ(measured.mean, candidate.mean);
    EXPECT_EQ(measured.count, 37);
}

TEST_F(ConfirmationTest, ConfirmPromotesBetterCandidate)
{
    NoisyBowlOracle oracle;
    FitnessEvaluator evaluator(oracle, weights);
    ConfirmationEngine engine(evaluator, config, pool);

    Population ranked = {
        screened(evaluator, { 0.5, 0.5 }),
        screened(evaluator, { 1.5, 1.5 }),
        screened(evaluator, { 3.0, 3.0 }),
    };
    Individual incumbent = screened(evaluator, { 2.0, 2.0 });
    incumbent.isConfirmed = true;

    const auto round = engine.confirm(ranked, incumbent, master);

    EXPECT_EQ(round.accepted, 1);
    EXPECT_EQ(round.candidatesTested, 1);
    EXPECT_EQ(round.candidatesSkipped, 1); // Second candidate cannot beat the new incumbent.
    EXPECT_EQ(round.trials, 400u);
    EXPECT_EQ(incumbent.genes, (std::vector<double>{ 0.5, 0.5 }));
    EXPECT_EQ(incumbent.evaluationCount, config.trials);
    EXPECT_TRUE(incumbent.isConfirmed);
    EXPECT_TRUE(ranked[0].isConfirmed);
    EXPECT_DOUBLE_EQ(ranked[0].fitness, incumbent.fitness);
}

TEST_F(ConfirmationTest, WorseCandidateLeavesIncumbentUnchanged)
{
    NoisyBowlOracle oracle;
    FitnessEvaluator evaluator(oracle, weights);
    config.competitiveSigmas = 1e9; // Force the head-to-head.
    ConfirmationEngine engine(evaluator, config, pool);

    Population ranked = { screened(evaluator, { 2.0, 2.0 }) };
    Individual incumbent = screened(evaluator, { 0.5, 0.5 });
    const Individual before = incumbent;

    const auto round = engine.confirm(ranked, incumbent, master);

    EXPECT_EQ(round.candidatesTested, 1);
    EXPECT_EQ(round.accepted, 0);
    EXPECT_EQ(incumbent.genes, before.genes);
    EXPECT_EQ(incumbent.fitness, before.fitness);
    EXPECT_FALSE(ranked[0].isConfirmed);
}

TEST_F(ConfirmationTest, IncumbentCopyInPopulationIsNotRetested)
{
    NoisyBowlOracle oracle;
    FitnessEvaluator evaluator(oracle, weights);
    ConfirmationEngine engine(evaluator, config, pool);

    Individual incumbent = screened(evaluator, { 0.5, 0.5 });
    Population ranked = { incumbent };

    const auto round = engine.confirm(ranked, incumbent, master);

    EXPECT_EQ(round.candidatesTested, 0);
    EXPECT_EQ(round.trials, 0u);
}

TEST_F(ConfirmationTest, RecordedBestFitnessNeverIncreases)
{
    SumOracle oracle;
    FitnessEvaluator evaluator(oracle, weights);
    ConfirmationEngine engine(evaluator, config, pool);

    Individual candidate = Individual::withGenes({ 1.0, 1.0 });
    candidate.applyStatistics(TrialStatistics{ .mean = 0.5, .count = 50 }, 0.5);
    Population ranked = { candidate };

    // Incumbent recorded with a luckier composite than its genes deliver now.
    Individual incumbent = Individual::withGenes({ 2.0, 2.0 });
    incumbent.applyStatistics(TrialStatistics{ .mean = 1.0, .count = 200 }, 1.0);

    const auto round = engine.confirm(ranked, incumbent, master);

    EXPECT_EQ(round.candidatesTested, 1);
    EXPECT_EQ(round.accepted, 0);
    EXPECT_EQ(incumbent.genes, (std::vector<double>{ 2.0, 2.0 }));
    EXPECT_DOUBLE_EQ(incumbent.fitness, 1.0);
}

TEST_F(ConfirmationTest, OracleFailureIdentifiesConfirmationPhase)
{
    ThresholdFailingOracle oracle(1.5);
    FitnessEvaluator evaluator(oracle, weights);
    ConfirmationEngine engine(evaluator, config, pool);

    try {
        engine.compare({ 2.0, 0.0 }, { 0.0, 0.0 }, seedRange(1, 20), 4);
        FAIL() << "Expected EvaluationError";
    }
    catch (const EvaluationError& e) {
        EXPECT_EQ(e.phase(), EvaluationPhase::Confirmation);
        EXPECT_EQ(e.individualIndex(), 4u);
    }
}
