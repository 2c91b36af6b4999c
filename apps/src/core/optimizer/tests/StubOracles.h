#pragma once

#include "core/optimizer/SimulationOracle.h"

#include <cmath>
#include <limits>
#include <map>
#include <numeric>
#include <random>
#include <stdexcept>
#include <vector>

namespace DiceTune {

// genes[0] + genes[1] + a fixed noise value per known seed.
class LookupNoiseOracle : public SimulationOracle {
public:
    double simulate(const std::vector<double>& genes, uint64_t seed) const override
    {
        return genes.at(0) + genes.at(1) + noise_.at(seed);
    }

private:
    std::map<uint64_t, double> noise_{ { 7, 0.5 }, { 13, -0.25 }, { 21, 0.1 } };
};

// Sum of genes, no noise.
class SumOracle : public SimulationOracle {
public:
    double simulate(const std::vector<double>& genes, uint64_t /*seed*/) const override
    {
        return std::accumulate(genes.begin(), genes.end(), 0.0);
    }
};

// Squared distance from 0.5 plus seeded Gaussian noise.
class NoisyBowlOracle : public SimulationOracle {
public:
    explicit NoisyBowlOracle(double noise = 1.0) : noise_(noise) {}

    double simulate(const std::vector<double>& genes, uint64_t seed) const override
    {
        double distance = 0.0;
        for (const double g : genes) {
            distance += (g - 0.5) * (g - 0.5);
        }
        std::mt19937_64 rng(seed);
        std::normal_distribution<double> dist(0.0, noise_);
        return 10.0 + 5.0 * distance + dist(rng);
    }

private:
    double noise_;
};

class ConstantOracle : public SimulationOracle {
public:
    double simulate(const std::vector<double>& /*genes*/, uint64_t /*seed*/) const override
    {
        return 12.0;
    }
};

// Throws for any genome whose first gene exceeds the threshold.
class ThresholdFailingOracle : public SimulationOracle {
public:
    explicit ThresholdFailingOracle(double threshold) : threshold_(threshold) {}

    double simulate(const std::vector<double>& genes, uint64_t /*seed*/) const override
    {
        if (genes.at(0) > threshold_) {
            throw std::runtime_error("game engine crashed");
        }
        return genes.at(0);
    }

private:
    double threshold_;
};

class NanOracle : public SimulationOracle {
public:
    double simulate(const std::vector<double>& /*genes*/, uint64_t /*seed*/) const override
    {
        return std::numeric_limits<double>::quiet_NaN();
    }
};

} // namespace DiceTune
