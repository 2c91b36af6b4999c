#pragma once

#include "Individual.h"

#include <random>
#include <vector>

namespace DiceTune {

enum class CrossoverMethod { Blend, Average, Uniform };

const char* toString(CrossoverMethod method);

/** child = a + alpha * (b - a), one alpha ~ U(0, 1) shared by all genes. */
std::vector<double> blendCrossover(
    const std::vector<double>& a, const std::vector<double>& b, std::mt19937& rng);

std::vector<double> averageCrossover(
    const std::vector<double>& a, const std::vector<double>& b, std::mt19937& rng);

/** Each gene from a or b with probability 0.5. */
std::vector<double> uniformCrossover(
    const std::vector<double>& a, const std::vector<double>& b, std::mt19937& rng);

CrossoverMethod randomCrossoverMethod(std::mt19937& rng);

std::vector<double> crossover(
    CrossoverMethod method,
    const std::vector<double>& a,
    const std::vector<double>& b,
    std::mt19937& rng);

struct MutationParams {
    double ratePerGene = 0.30;
    double strength = 0.15; // Gaussian sigma, owned by the stagnation controller.
    double largeMutationRate = 0.08;
    double explorationMin = -1.0;
    double explorationMax = 2.0;
};

struct MutationStats {
    int perturbations = 0;
    int resets = 0;

    int totalChanges() const { return perturbations + resets; }
};

/**
 * Gaussian perturbation per gene, plus at most one gene reset to a fresh value from the
 * exploration range. Any change invalidates the individual's cached fitness.
 */
MutationStats mutate(Individual& individual, const MutationParams& params, std::mt19937& rng);

std::vector<double> randomGenes(int count, double min, double max, std::mt19937& rng);

} // namespace DiceTune
