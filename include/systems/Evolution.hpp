#ifndef EVOLUTION_HPP
#define EVOLUTION_HPP

#include "solvers/SolverConfig.hpp"
#include "systems/ContinuousSystem.hpp"
#include "systems/Trajectory.hpp"
#include <vector>

namespace dynsys {

    /**
     * @brief State of `system` after evolving its current state for time `T`.
     *
     * Builds the problem on [0, T], solves it with the configured algorithm
     * and returns the final state. `system` is not modified.
     *
     * @param system The system to evolve.
     * @param T Evolution time. Zero returns the current state; negative values integrate backwards.
     * @param config Algorithm and solver options.
     * @throws SolverException If the solve fails.
     */
    state_type evolve(const ContinuousSystem& system, double T = 1.0, const SolverConfig& config = {});

    /**
     * @brief Evolve `system` for time `T` and store the result as its new state.
     * @return The new state.
     */
    state_type evolveInPlace(ContinuousSystem& system, double T = 1.0, const SolverConfig& config = {});

    /**
     * @brief Sample the evolution of `system` on the grid 0, dt, 2dt, ... up to T.
     *
     * The grid has floor(T/dt) + 1 points; T itself is a grid point only when
     * it is a multiple of `dt` (up to rounding). The grid replaces any
     * `saveat` in `config`; the other options are used as given.
     *
     * @throws InvalidParameterException If `T <= 0` or `dt <= 0`. Nothing is integrated in that case.
     * @throws SolverException If the solve fails.
     */
    Trajectory computeTrajectory(const ContinuousSystem& system, double T, double dt = 0.05,
                                 const SolverConfig& config = {});

    /**
     * @brief Grid used by computeTrajectory.
     * @throws InvalidParameterException If `T <= 0`, `dt <= 0`, either is not finite, or the grid is too large.
     */
    std::vector<double> makeTimeGrid(double T, double dt);

} // namespace dynsys

#endif // EVOLUTION_HPP
