#pragma once

#include "Individual.h"
#include "OptimizerConfig.h"
#include "Variation.h"

#include <random>
#include <vector>

namespace DiceTune {

using Population = std::vector<Individual>;

/**
 * Slot allocation for assembling one generation.
 */
struct GenerationPlan {
    int eliteCount = 0;
    int diversityCount = 0;
    MutationParams mutation;
};

struct AssemblyStats {
    int confirmedCarried = 0;
    int elitesCarried = 0;
    int randomInjected = 0;
    int offspring = 0;
    MutationStats mutation;
};

/** Stable ascending sort; ties keep their previous order. */
void sortByFitness(Population& population);

bool isSortedByFitness(const Population& population);

Individual randomIndividual(const GenomeConfig& genome, std::mt19937& rng);

/**
 * Initial generation: the configured seed genes (if any) in slot 0, random genes elsewhere.
 */
Population createInitialPopulation(const OptimizerConfig& config, std::mt19937& rng);

/**
 * Assemble the next generation from a ranked population, in priority order: confirmed
 * individuals, further top-ranked elites, fresh random individuals, then offspring until
 * the population is full.
 */
Population buildNextGeneration(
    const Population& ranked,
    const GenerationPlan& plan,
    const OptimizerConfig& config,
    std::mt19937& rng,
    AssemblyStats* stats = nullptr);

} // namespace DiceTune
