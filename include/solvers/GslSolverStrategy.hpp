#ifndef GSL_SOLVER_STRATEGY_HPP
#define GSL_SOLVER_STRATEGY_HPP

#include "solvers/OdeSolverStrategy.hpp"
#include <gsl/gsl_odeiv2.h>
#include <string>

namespace dynsys {

/**
 * @brief ODE solver strategy using a GSL odeiv2 stepper.
 *
 * One class serves all GSL algorithms; SolverFactory registers:
 * - "rkf45": explicit embedded Runge-Kutta-Fehlberg 4(5),
 * - "rk8pd": explicit embedded Runge-Kutta Prince-Dormand 8(9),
 * - "msbdf": variable-order BDF for stiff problems (requires the Jacobian),
 * - "bsimp": implicit Bulirsch-Stoer of Bader and Deuflhard (requires the Jacobian).
 *
 * The one-shot solve drives gsl_odeiv2_driver_apply from stop to stop.
 */
class GslSolverStrategy : public OdeSolverStrategy {
public:
    /**
     * @param name Registered algorithm name.
     * @param step_type GSL stepper type.
     * @param requires_jacobian Whether the stepper needs the Jacobian.
     */
    GslSolverStrategy(std::string name, const gsl_odeiv2_step_type* step_type, bool requires_jacobian);

    std::string getName() const override { return name_; }
    bool requiresJacobian() const override { return requires_jacobian_; }

protected:
    OdeSolution solveAtStops(const OdeProblem& problem,
                             const SolverOptions& options,
                             const SavePlan& plan) const override;

    std::unique_ptr<IOdeIntegrator> createSteppingIntegrator(const OdeProblem& problem,
                                                             const SolverOptions& options) const override;

private:
    std::string name_;
    const gsl_odeiv2_step_type* step_type_;
    bool requires_jacobian_;
};

} // namespace dynsys

#endif // GSL_SOLVER_STRATEGY_HPP
