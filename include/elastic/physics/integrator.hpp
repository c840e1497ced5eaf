/**
 * @file integrator.hpp
 * @brief Sub-stepped drift + relaxation integrator for the disk collection
 *
 * One macroscopic step of size dt is split into `substeps` slices. Each slice:
 * 1. Drift: position += velocity * dt_sub for every body (no external forces)
 * 2. Walls: clamp and reflect every body against the boundary
 * 3. Relaxation: `relaxationPasses` sweeps over all pairs (i < j)
 *
 * The pair sweep is sequential Gauss-Seidel: a pair resolved later in a pass
 * sees the positions and velocities written by earlier pairs of the same
 * pass. A single pass does not settle three or more mutually touching disks,
 * hence the repeated passes. Do not reorder or parallelise the sweep without
 * re-deriving its convergence.
 *
 * Cost is O(substeps * passes * n^2) per step, meant for tens of bodies.
 */

#pragma once

#include <cstddef>
#include <vector>

#include "elastic/physics/body.hpp"

namespace Physics {

/**
 * @struct IntegratorConfig
 * @brief Iteration counts for a macroscopic step
 */
struct IntegratorConfig {
    int substeps = 400;
    int relaxationPasses = 20;
};

/**
 * @struct StepStats
 * @brief Contact counters gathered during one macroscopic step
 */
struct StepStats {
    std::size_t pairContacts = 0;  ///< resolver calls that found a contact
    std::size_t wallContacts = 0;  ///< body/wall clamps
};

class Integrator {
public:
    /**
     * @brief Advances every body by dt in place
     *
     * Bodies keep their order; identity is the index in @p bodies.
     * A non-positive dt or fewer than one sub-step leaves the state unchanged.
     */
    static StepStats step(std::vector<Body>& bodies,
                          const Boundary& boundary,
                          double dt,
                          const IntegratorConfig& config = IntegratorConfig());

    /**
     * @brief Runs @p passes sequential sweeps of the pair resolver
     * @return number of pair contacts found over all passes
     */
    static std::size_t relax(std::vector<Body>& bodies, int passes);
};

} // namespace Physics
