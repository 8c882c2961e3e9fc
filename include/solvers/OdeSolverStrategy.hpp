#ifndef ODE_SOLVER_STRATEGY_HPP
#define ODE_SOLVER_STRATEGY_HPP

#include "solvers/interfaces/IOdeSolverStrategy.hpp"
#include "solvers/SavePlan.hpp"

namespace dynsys {

/**
 * @class OdeSolverStrategy
 * @brief Common base of the library-backed strategies.
 *
 * Handles what does not depend on the library: the Jacobian requirement,
 * empty spans and `save_everystep` (served by a stepping handle). Derived
 * classes integrate through the plan's stop times with the library's
 * one-shot routine and provide the stepping handle.
 */
class OdeSolverStrategy : public IOdeSolverStrategy {
public:
    OdeSolution solve(const OdeProblem& problem, const SolverOptions& options) const override;

    std::unique_ptr<IOdeIntegrator> init(const OdeProblem& problem, const SolverOptions& options) const override;

protected:
    OdeSolverStrategy() = default;

    /**
     * @brief Integrate from the first to the last stop, recording the flagged stops.
     *
     * Called only for non-empty spans without `save_everystep`.
     */
    virtual OdeSolution solveAtStops(const OdeProblem& problem,
                                     const SolverOptions& options,
                                     const SavePlan& plan) const = 0;

    virtual std::unique_ptr<IOdeIntegrator> createSteppingIntegrator(const OdeProblem& problem,
                                                                     const SolverOptions& options) const = 0;

private:
    void checkJacobianRequirement(const OdeProblem& problem, const std::string& source) const;
};

} // namespace dynsys

#endif // ODE_SOLVER_STRATEGY_HPP
