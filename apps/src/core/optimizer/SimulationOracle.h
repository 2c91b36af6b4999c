#pragma once

#include <cstdint>
#include <vector>

namespace DiceTune {

/**
 * One simulated game of the agent driven by the given heuristic weights.
 *
 * simulate() must be a pure function of (genes, seed): the same pair always yields the
 * same outcome. Implementations are called concurrently from worker threads and must
 * build any random generator they need from the seed on every call. Failures are
 * reported by throwing.
 */
class SimulationOracle {
public:
    virtual ~SimulationOracle() = default;

    /** Returns the number of turns the agent needed to finish (lower is better). */
    virtual double simulate(const std::vector<double>& genes, uint64_t seed) const = 0;
};

} // namespace DiceTune
