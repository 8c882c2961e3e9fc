#ifndef RUNGE_KUTTA4_SOLVER_STRATEGY_HPP
#define RUNGE_KUTTA4_SOLVER_STRATEGY_HPP

#include "solvers/OdeSolverStrategy.hpp"

namespace dynsys {

/**
 * @brief Classic fourth-order Runge-Kutta with a fixed step, from Boost.Odeint.
 *
 * Registered as "rk4". The step is `dt` (1/100 of the span when unset);
 * tolerances are ignored. Steps are shortened to land on stop times.
 */
class RungeKutta4SolverStrategy : public OdeSolverStrategy {
public:
    std::string getName() const override { return "rk4"; }
    bool requiresJacobian() const override { return false; }

protected:
    OdeSolution solveAtStops(const OdeProblem& problem,
                             const SolverOptions& options,
                             const SavePlan& plan) const override;

    std::unique_ptr<IOdeIntegrator> createSteppingIntegrator(const OdeProblem& problem,
                                                             const SolverOptions& options) const override;
};

} // namespace dynsys

#endif // RUNGE_KUTTA4_SOLVER_STRATEGY_HPP
