#include "Confirmation.h"
#include "core/LoggingChannels.h"
#include "core/WorkerPool.h"

#include <algorithm>

namespace DiceTune {

ConfirmationEngine::ConfirmationEngine(
    const FitnessEvaluator& evaluator, const ConfirmationConfig& config, WorkerPool& pool)
    : evaluator_(evaluator), config_(config), pool_(pool)
{}

void ConfirmationEngine::runChunked(
    size_t trialCount, const std::function<void(size_t, size_t)>& chunk) const
{
    if (trialCount == 0) {
        return;
    }

    const size_t chunkCount =
        std::min(trialCount, static_cast<size_t>(std::max(1, pool_.workerCount())));
    const size_t chunkSize = (trialCount + chunkCount - 1) / chunkCount;

    pool_.run(chunkCount, [&](size_t index) {
        const size_t begin = index * chunkSize;
        const size_t end = std::min(trialCount, begin + chunkSize);
        if (begin < end) {
            chunk(begin, end);
        }
    });
}

PairedComparison ConfirmationEngine::compare(
    const std::vector<double>& candidate,
    const std::vector<double>& incumbent,
    const SeedBatch& seeds,
    size_t candidateIndex) const
{
    std::vector<double> candidateOutcomes(seeds.size());
    std::vector<double> incumbentOutcomes(seeds.size());

    runChunked(seeds.size(), [&](size_t begin, size_t end) {
        for (size_t i = begin; i < end; ++i) {
            candidateOutcomes[i] = evaluator_.simulate(
                candidate, seeds[i], EvaluationPhase::Confirmation, candidateIndex);
            incumbentOutcomes[i] = evaluator_.simulate(
                incumbent, seeds[i], EvaluationPhase::Confirmation, candidateIndex);
        }
    });

    PairedComparison comparison;
    comparison.test = Statistics::pairedTest(candidateOutcomes, incumbentOutcomes);
    comparison.candidate = Statistics::summarize(std::move(candidateOutcomes));
    comparison.incumbent = Statistics::summarize(std::move(incumbentOutcomes));
    comparison.candidateComposite = evaluator_.composite(comparison.candidate);
    comparison.incumbentComposite = evaluator_.composite(comparison.incumbent);
    return comparison;
}

TrialStatistics ConfirmationEngine::measure(
    const std::vector<double>& genes, const SeedBatch& seeds, size_t individualIndex) const
{
    std::vector<double> outcomes(seeds.size());
    runChunked(seeds.size(), [&](size_t begin, size_t end) {
        for (size_t i = begin; i < end; ++i) {
            outcomes[i] = evaluator_.simulate(
                genes, seeds[i], EvaluationPhase::Confirmation, individualIndex);
        }
    });
    return Statistics::summarize(std::move(outcomes));
}

bool ConfirmationEngine::isCompetitive(
    const Individual& candidate, const Individual& incumbent) const
{
    return candidate.fitness
        <= incumbent.fitness + config_.competitiveSigmas * incumbent.standardError;
}

bool ConfirmationEngine::accepts(const PairedComparison& comparison) const
{
    const bool significant = comparison.test.meanDifference < 0.0
        && comparison.test.pValue < config_.significanceThreshold;
    return significant || comparison.candidateComposite < comparison.incumbentComposite;
}

ConfirmationRound ConfirmationEngine::confirm(
    Population& ranked, Individual& incumbent, std::mt19937_64& master) const
{
    ConfirmationRound round;
    const size_t limit = std::min(ranked.size(), static_cast<size_t>(config_.topCandidates));

    for (size_t i = 0; i < limit; ++i) {
        Individual& candidate = ranked[i];
        if (candidate.genes == incumbent.genes) {
            continue;
        }
        if (!isCompetitive(candidate, incumbent)) {
            LOG_DEBUG(
                Confirm,
                "Candidate #{} skipped: screening {:.4f} vs incumbent {:.4f} (+{:.1f} SE)",
                i,
                candidate.fitness,
                incumbent.fitness,
                config_.competitiveSigmas);
            round.candidatesSkipped++;
            continue;
        }

        const SeedBatch seeds = generateSeedBatch(master, config_.trials);
        const PairedComparison comparison = compare(candidate.genes, incumbent.genes, seeds, i);
        round.candidatesTested++;
        round.trials += 2 * static_cast<uint64_t>(seeds.size());

        LOG_DEBUG(
            Confirm,
            "Candidate #{}: delta {:.4f} (SE {:.4f}, t {:.2f}, p {:.4f}), composite {:.4f} vs "
            "{:.4f}",
            i,
            comparison.test.meanDifference,
            comparison.test.standardErrorDifference,
            comparison.test.tStatistic,
            comparison.test.pValue,
            comparison.candidateComposite,
            comparison.incumbentComposite);

        if (!accepts(comparison)) {
            continue;
        }

        if (comparison.candidateComposite > incumbent.fitness) {
            LOG_INFO(
                Confirm,
                "Candidate #{} beat the incumbent head-to-head but its composite {:.4f} is above "
                "the recorded best {:.4f}; not accepted",
                i,
                comparison.candidateComposite,
                incumbent.fitness);
            continue;
        }

        LOG_INFO(
            Confirm,
            "Candidate #{} accepted: composite {:.4f} -> {:.4f}, delta {:.4f}, p {:.4f}",
            i,
            incumbent.fitness,
            comparison.candidateComposite,
            comparison.test.meanDifference,
            comparison.test.pValue);

        candidate.applyStatistics(comparison.candidate, comparison.candidateComposite);
        candidate.isConfirmed = true;
        incumbent = candidate;
        round.accepted++;
    }

    return round;
}

} // namespace DiceTune
