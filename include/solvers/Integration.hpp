#ifndef INTEGRATION_HPP
#define INTEGRATION_HPP

#include "solvers/OdeSolution.hpp"
#include "solvers/SolverConfig.hpp"
#include "solvers/interfaces/IOdeIntegrator.hpp"
#include "systems/ContinuousSystem.hpp"
#include "systems/OdeProblem.hpp"
#include <memory>
#include <vector>

namespace dynsys {

/**
 * @brief One-shot solve of `problem` with an already resolved algorithm.
 *
 * @throws SolverException If the algorithm is unknown, needs a Jacobian the
 *         problem lacks, or the library fails.
 */
OdeSolution solve(const OdeProblem& problem, const ResolvedSolver& resolved);

/**
 * @brief Solve `problem` and return the saved states.
 *
 * `save_everystep` is switched off, so the result holds the states at the
 * span end points, or exactly at the `saveat` times inside the span.
 */
std::vector<state_type> getSolution(const OdeProblem& problem, const SolverConfig& config = {});

/**
 * @brief Solve `problem` and return the state at its end time.
 */
state_type integrate(const OdeProblem& problem, const ResolvedSolver& resolved);

/**
 * @brief Create a stepping handle for `problem`.
 *
 * The handle saves neither the initial point nor intermediate steps; only
 * `saveat` points reached while stepping are recorded.
 */
std::unique_ptr<IOdeIntegrator> createIntegrator(const OdeProblem& problem, const SolverConfig& config = {});

/** @brief Create a stepping handle for `system` on [0, T]. */
std::unique_ptr<IOdeIntegrator> createIntegrator(const ContinuousSystem& system, double T,
                                                 const SolverConfig& config = {});

} // namespace dynsys

#endif // INTEGRATION_HPP
