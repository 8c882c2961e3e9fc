#ifndef DOPRI5_SOLVER_STRATEGY_HPP
#define DOPRI5_SOLVER_STRATEGY_HPP

#include "solvers/OdeSolverStrategy.hpp"

namespace dynsys {

/**
 * @brief Boost.Odeint Dormand-Prince 5(4), the default explicit fifth-order adaptive method.
 *
 * Registered as "dopri5". Tolerances come from `abstol`/`reltol` and the
 * step size is capped by `dtmax` when set.
 */
class Dopri5SolverStrategy : public OdeSolverStrategy {
public:
    std::string getName() const override { return "dopri5"; }
    bool requiresJacobian() const override { return false; }

protected:
    OdeSolution solveAtStops(const OdeProblem& problem,
                             const SolverOptions& options,
                             const SavePlan& plan) const override;

    std::unique_ptr<IOdeIntegrator> createSteppingIntegrator(const OdeProblem& problem,
                                                             const SolverOptions& options) const override;
};

} // namespace dynsys

#endif // DOPRI5_SOLVER_STRATEGY_HPP
