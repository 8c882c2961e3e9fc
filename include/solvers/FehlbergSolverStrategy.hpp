#ifndef FEHLBERG_SOLVER_STRATEGY_HPP
#define FEHLBERG_SOLVER_STRATEGY_HPP

#include "solvers/OdeSolverStrategy.hpp"

namespace dynsys {

/**
 * @brief Boost.Odeint Runge-Kutta-Fehlberg 7(8), for problems needing high precision.
 *
 * Registered as "fehlberg78". Tolerances come from `abstol`/`reltol` and the
 * step size is capped by `dtmax` when set.
 */
class FehlbergSolverStrategy : public OdeSolverStrategy {
public:
    std::string getName() const override { return "fehlberg78"; }
    bool requiresJacobian() const override { return false; }

protected:
    OdeSolution solveAtStops(const OdeProblem& problem,
                             const SolverOptions& options,
                             const SavePlan& plan) const override;

    std::unique_ptr<IOdeIntegrator> createSteppingIntegrator(const OdeProblem& problem,
                                                             const SolverOptions& options) const override;
};

} // namespace dynsys

#endif // FEHLBERG_SOLVER_STRATEGY_HPP
