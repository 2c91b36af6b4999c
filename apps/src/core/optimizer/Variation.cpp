#include "Variation.h"
#include "core/Assert.h"

namespace DiceTune {

const char* toString(CrossoverMethod method)
{
    switch (method) {
        case CrossoverMethod::Blend:
            return "blend";
        case CrossoverMethod::Average:
            return "average";
        case CrossoverMethod::Uniform:
            return "uniform";
    }
    return "unknown";
}

std::vector<double> blendCrossover(
    const std::vector<double>& a, const std::vector<double>& b, std::mt19937& rng)
{
    DICETUNE_ASSERT(a.size() == b.size(), "Parents must have the same gene count");

    std::uniform_real_distribution<double> unit(0.0, 1.0);
    const double alpha = unit(rng);

    std::vector<double> child(a.size());
    for (size_t i = 0; i < a.size(); ++i) {
        child[i] = a[i] + alpha * (b[i] - a[i]);
    }
    return child;
}

std::vector<double> averageCrossover(
    const std::vector<double>& a, const std::vector<double>& b, std::mt19937& /*rng*/)
{
    DICETUNE_ASSERT(a.size() == b.size(), "Parents must have the same gene count");

    std::vector<double> child(a.size());
    for (size_t i = 0; i < a.size(); ++i) {
        child[i] = (a[i] + b[i]) / 2.0;
    }
    return child;
}

std::vector<double> uniformCrossover(
    const std::vector<double>& a, const std::vector<double>& b, std::mt19937& rng)
{
    DICETUNE_ASSERT(a.size() == b.size(), "Parents must have the same gene count");

    std::bernoulli_distribution fromA(0.5);
    std::vector<double> child(a.size());
    for (size_t i = 0; i < a.size(); ++i) {
        child[i] = fromA(rng) ? a[i] : b[i];
    }
    return child;
}

CrossoverMethod randomCrossoverMethod(std::mt19937& rng)
{
    std::uniform_int_distribution<int> pick(0, 2);
    return static_cast<CrossoverMethod>(pick(rng));
}

std::vector<double> crossover(
    CrossoverMethod method,
    const std::vector<double>& a,
    const std::vector<double>& b,
    std::mt19937& rng)
{
    switch (method) {
        case CrossoverMethod::Blend:
            return blendCrossover(a, b, rng);
        case CrossoverMethod::Average:
            return averageCrossover(a, b, rng);
        case CrossoverMethod::Uniform:
            return uniformCrossover(a, b, rng);
    }
    return averageCrossover(a, b, rng);
}

MutationStats mutate(Individual& individual, const MutationParams& params, std::mt19937& rng)
{
    MutationStats stats;
    if (individual.genes.empty()) {
        return stats;
    }

    std::uniform_real_distribution<double> coin(0.0, 1.0);
    if (params.strength > 0.0) {
        std::normal_distribution<double> noise(0.0, params.strength);
        for (auto& gene : individual.genes) {
            if (coin(rng) < params.ratePerGene) {
                gene += noise(rng);
                stats.perturbations++;
            }
        }
    }

    if (coin(rng) < params.largeMutationRate) {
        // Full reset of one gene - helps escape local optima.
        std::uniform_int_distribution<size_t> pickGene(0, individual.genes.size() - 1);
        std::uniform_real_distribution<double> range(params.explorationMin, params.explorationMax);
        individual.genes[pickGene(rng)] = range(rng);
        stats.resets++;
    }

    if (stats.totalChanges() > 0) {
        individual.markForReevaluation();
    }
    return stats;
}

std::vector<double> randomGenes(int count, double min, double max, std::mt19937& rng)
{
    std::uniform_real_distribution<double> range(min, max);
    std::vector<double> genes(count > 0 ? count : 0);
    for (auto& gene : genes) {
        gene = range(rng);
    }
    return genes;
}

} // namespace DiceTune
