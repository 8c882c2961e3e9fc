#ifndef GSL_ODE_SYSTEM_HPP
#define GSL_ODE_SYSTEM_HPP

#include "systems/OdeProblem.hpp"
#include "solvers/SolverConfig.hpp"
#include <gsl/gsl_odeiv2.h>
#include <exception>
#include <string>

namespace dynsys {

/**
 * @class GslOdeSystem
 * @brief Owns a GSL odeiv2 system and driver for one OdeProblem.
 *
 * The C callbacks translate between GSL arrays and state_type. Exceptions
 * thrown by the problem's callbacks are captured instead of unwinding through
 * GSL and are rethrown once the GSL call returns. Non-copyable: GSL keeps a
 * pointer to this object.
 */
class GslOdeSystem {
public:
    /**
     * @param problem Problem to integrate; must outlive this object.
     * @param step_type GSL stepper, e.g. gsl_odeiv2_step_rkf45.
     * @param options Tolerances, `dtmax` and `maxiters` are applied to the driver.
     * @param initial_step Signed initial step.
     *
     * @throws SolverException If GSL cannot allocate the driver.
     */
    GslOdeSystem(const OdeProblem& problem,
                 const gsl_odeiv2_step_type* step_type,
                 const SolverOptions& options,
                 double initial_step);
    ~GslOdeSystem();

    GslOdeSystem(const GslOdeSystem&) = delete;
    GslOdeSystem& operator=(const GslOdeSystem&) = delete;

    /**
     * @brief Integrate from `t` to `t1` with gsl_odeiv2_driver_apply.
     * @throws SolverException On a GSL error status.
     */
    void driveTo(double& t, double t1, state_type& y);

    /**
     * @brief Take one adaptive step from `t` towards `t1` with gsl_odeiv2_evolve_apply.
     *
     * On return `t` is the new time (exactly `t1` when reached) and `h` the next step proposal.
     * @throws SolverException On a GSL error status.
     */
    void evolveStep(double& t, double t1, double& h, state_type& y);

private:
    static int rhsCallback(double t, const double y[], double dydt[], void* params);
    static int jacobianCallback(double t, const double y[], double* dfdy, double dfdt[], void* params);

    void checkStatus(int status, double t, const std::string& source);

    const OdeProblem& problem_;
    std::size_t dimension_;
    double max_step_;
    gsl_odeiv2_system system_;
    gsl_odeiv2_driver* driver_;
    state_type x_;
    state_type dxdt_;
    std::exception_ptr callback_error_;
};

} // namespace dynsys

#endif // GSL_ODE_SYSTEM_HPP
