#ifndef ODEINT_INTEGRATOR_HPP
#define ODEINT_INTEGRATOR_HPP

#include "solvers/SteppingIntegrator.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <boost/numeric/odeint.hpp>
#include <cmath>
#include <exception>
#include <memory>
#include <string>
#include <utility>

namespace dynsys {

/**
 * @class OdeintIntegrator
 * @brief Stepping handle backed by a Boost.Odeint stepper.
 *
 * Controlled steppers retry rejected steps with the step size they propose
 * (giving up after odeint's failed_step_checker limit); simple steppers take
 * fixed steps of `dt`. Both shorten the last step to land on the stop time.
 *
 * @tparam Stepper A controlled stepper (make_controlled) or a simple stepper.
 */
template <class Stepper>
class OdeintIntegrator : public SteppingIntegrator {
public:
    OdeintIntegrator(const OdeProblem& problem, const SolverOptions& options, std::string algorithm_name, Stepper stepper)
        : SteppingIntegrator(problem, options, std::move(algorithm_name)),
          stepper_(std::move(stepper)) {}

protected:
    void performStep(double t_limit) override {
        try {
            doStep(t_limit, typename Stepper::stepper_category());
        } catch (const SystemException&) {
            throw;
        } catch (const std::exception& e) {
            std::string msg = "Boost.Odeint step failed at t = " + std::to_string(time_) + ": " + e.what();
            Logger::getInstance().error("OdeintIntegrator::performStep", getAlgorithmName() + ": " + msg);
            throw SolverException("OdeintIntegrator::performStep", msg);
        }
    }

private:
    void doStep(double t_limit, boost::numeric::odeint::controlled_stepper_tag) {
        boost::numeric::odeint::failed_step_checker fail_checker;
        while (true) {
            const double remaining = t_limit - time_;
            const bool clamped = std::abs(dt_) >= std::abs(remaining);
            double dt = clamped ? remaining : dt_;
            double t = time_;
            if (stepper_.try_step(problem_.getRhs(), state_, t, dt) == boost::numeric::odeint::success) {
                if (clamped) {
                    time_ = t_limit;
                    // keep the larger proposal so a short landing step does not shrink later steps
                    if (std::abs(dt) > std::abs(dt_)) dt_ = dt;
                } else {
                    time_ = t;
                    dt_ = dt;
                }
                return;
            }
            fail_checker();
            dt_ = dt;
        }
    }

    void doStep(double t_limit, boost::numeric::odeint::stepper_tag) {
        const double remaining = t_limit - time_;
        if (std::abs(dt_) >= std::abs(remaining)) {
            stepper_.do_step(problem_.getRhs(), state_, time_, remaining);
            time_ = t_limit;
        } else {
            stepper_.do_step(problem_.getRhs(), state_, time_, dt_);
            time_ += dt_;
        }
    }

    Stepper stepper_;
};

/** @brief Deduces the stepper type for OdeintIntegrator. */
template <class Stepper>
std::unique_ptr<IOdeIntegrator> makeOdeintIntegrator(const OdeProblem& problem,
                                                     const SolverOptions& options,
                                                     const std::string& algorithm_name,
                                                     Stepper stepper)
{
    return std::make_unique<OdeintIntegrator<Stepper>>(problem, options, algorithm_name, std::move(stepper));
}

} // namespace dynsys

#endif // ODEINT_INTEGRATOR_HPP
