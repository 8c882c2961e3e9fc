#ifndef I_ODE_INTEGRATOR_HPP
#define I_ODE_INTEGRATOR_HPP

#include "solvers/OdeSolution.hpp"
#include <string>

namespace dynsys {

/**
 * @brief Live, resumable integration session over a fixed time span.
 *
 * Obtained from IOdeSolverStrategy::init or createIntegrator. The caller
 * drives the integration step by step and may stop at any time.
 */
class IOdeIntegrator {
public:
    virtual ~IOdeIntegrator() = default;

    /**
     * @brief Take one accepted step. Steps never pass a stop time (tstops, saveat, end time).
     * @throws InvalidParameterException If the integration already reached the end time.
     * @throws SolverException If the solver fails or `maxiters` is exceeded.
     */
    virtual void step() = 0;

    /**
     * @brief Step until the integration time equals `t`.
     * @throws InvalidParameterException If `t` lies behind the current time or beyond the end time.
     * @throws SolverException If the solver fails or `maxiters` is exceeded.
     */
    virtual void advanceTo(double t) = 0;

    /** @brief Step until the end time. */
    virtual void solveToEnd() = 0;

    virtual double getTime() const = 0;
    virtual const state_type& getState() const = 0;
    virtual double getStartTime() const = 0;
    virtual double getEndTime() const = 0;
    virtual bool isFinished() const = 0;

    /** @brief Number of accepted steps so far. */
    virtual std::size_t getStepCount() const = 0;

    /** @brief States recorded according to the save options the session was created with. */
    virtual const OdeSolution& getSavedSolution() const = 0;

    virtual const std::string& getAlgorithmName() const = 0;
};

} // namespace dynsys

#endif // I_ODE_INTEGRATOR_HPP
