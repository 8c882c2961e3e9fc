#ifndef CASHKARP_SOLVER_STRATEGY_HPP
#define CASHKARP_SOLVER_STRATEGY_HPP

#include "solvers/OdeSolverStrategy.hpp"

namespace dynsys {

/**
 * @brief Boost.Odeint Cash-Karp 5(4) with adaptive step size control.
 *
 * Registered as "cash_karp54". Tolerances come from `abstol`/`reltol` and the
 * step size is capped by `dtmax` when set.
 */
class CashKarpSolverStrategy : public OdeSolverStrategy {
public:
    std::string getName() const override { return "cash_karp54"; }
    bool requiresJacobian() const override { return false; }

protected:
    OdeSolution solveAtStops(const OdeProblem& problem,
                             const SolverOptions& options,
                             const SavePlan& plan) const override;

    std::unique_ptr<IOdeIntegrator> createSteppingIntegrator(const OdeProblem& problem,
                                                             const SolverOptions& options) const override;
};

} // namespace dynsys

#endif // CASHKARP_SOLVER_STRATEGY_HPP
