#include "Population.h"
#include "Selection.h"
#include "core/Assert.h"

#include <algorithm>

namespace DiceTune {

void sortByFitness(Population& population)
{
    std::stable_sort(
        population.begin(), population.end(), [](const Individual& a, const Individual& b) {
            return a.fitness < b.fitness;
        });
}

bool isSortedByFitness(const Population& population)
{
    return std::is_sorted(
        population.begin(), population.end(), [](const Individual& a, const Individual& b) {
            return a.fitness < b.fitness;
        });
}

Individual randomIndividual(const GenomeConfig& genome, std::mt19937& rng)
{
    return Individual::withGenes(
        randomGenes(genome.geneCount, genome.explorationMin, genome.explorationMax, rng));
}

Population createInitialPopulation(const OptimizerConfig& config, std::mt19937& rng)
{
    const int size = config.evolution.populationSize;

    Population population;
    population.reserve(size);
    if (!config.genome.seedGenes.empty()) {
        population.push_back(Individual::withGenes(config.genome.seedGenes));
    }
    while (static_cast<int>(population.size()) < size) {
        population.push_back(randomIndividual(config.genome, rng));
    }
    return population;
}

Population buildNextGeneration(
    const Population& ranked,
    const GenerationPlan& plan,
    const OptimizerConfig& config,
    std::mt19937& rng,
    AssemblyStats* stats)
{
    const int size = config.evolution.populationSize;
    const int diversity = std::clamp(plan.diversityCount, 0, size);
    const int carryLimit = size - diversity;
    const int eliteLimit = std::clamp(plan.eliteCount, 0, carryLimit);

    AssemblyStats local;
    Population next;
    next.reserve(size);

    const auto carry = [&next](const Individual& individual) {
        Individual copy = individual;
        copy.isElite = true;
        next.push_back(std::move(copy));
    };

    // Every confirmed individual is carried, even past eliteCount; only the diversity slots
    // bound them. Ordinary elites then top up to eliteCount.
    for (const auto& individual : ranked) {
        if (static_cast<int>(next.size()) >= carryLimit) break;
        if (individual.isConfirmed) {
            carry(individual);
            local.confirmedCarried++;
        }
    }
    for (const auto& individual : ranked) {
        if (static_cast<int>(next.size()) >= eliteLimit) break;
        if (!individual.isConfirmed && individual.isEvaluated()) {
            carry(individual);
            local.elitesCarried++;
        }
    }

    for (int i = 0; i < diversity; ++i) {
        next.push_back(randomIndividual(config.genome, rng));
        local.randomInjected++;
    }

    while (static_cast<int>(next.size()) < size) {
        const auto& p1 = ranked[tournamentSelectIndex(ranked, config.evolution.tournamentSize, rng)];
        const auto& p2 = ranked[tournamentSelectIndex(ranked, config.evolution.tournamentSize, rng)];

        Individual child =
            Individual::withGenes(crossover(randomCrossoverMethod(rng), p1.genes, p2.genes, rng));
        const auto mutation = mutate(child, plan.mutation, rng);
        local.mutation.perturbations += mutation.perturbations;
        local.mutation.resets += mutation.resets;

        next.push_back(std::move(child));
        local.offspring++;
    }

    DICETUNE_ASSERT(
        static_cast<int>(next.size()) == size, "Next generation must hold populationSize slots");

    if (stats) {
        *stats = local;
    }
    return next;
}

} // namespace DiceTune
