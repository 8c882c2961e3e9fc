#ifndef ODE_PROBLEM_HPP
#define ODE_PROBLEM_HPP

#include "systems/ContinuousSystem.hpp"
#include <functional>
#include <optional>
#include <Eigen/Dense>

namespace dynsys {

/**
 * @class OdeProblem
 * @brief Immutable initial value problem du/dt = f(u, t), u(t0) = u0 on [t0, t1].
 *
 * The right-hand side follows the Boost.Odeint system signature
 * `rhs(x, dxdt, t)`. A problem owns copies of everything it needs and keeps
 * no reference to the system it was built from.
 */
class OdeProblem {
public:
    using RhsFunction = std::function<void(const state_type& x, state_type& dxdt, double t)>;
    using JacobianFunction = std::function<Eigen::MatrixXd(const state_type& x, double t)>;

    /**
     * @throws InvalidParameterException If the initial state is empty, `rhs` is empty
     *         or a bound of the time span is not finite.
     */
    OdeProblem(state_type initial_state,
               RhsFunction rhs,
               std::optional<JacobianFunction> jacobian,
               double start_time,
               double end_time);

    const state_type& getInitialState() const { return initial_state_; }
    const RhsFunction& getRhs() const { return rhs_; }
    const std::optional<JacobianFunction>& getJacobian() const { return jacobian_; }
    bool hasJacobian() const { return jacobian_.has_value(); }
    double getStartTime() const { return start_time_; }
    double getEndTime() const { return end_time_; }
    std::size_t getDimension() const { return initial_state_.size(); }

private:
    const state_type initial_state_;
    const RhsFunction rhs_;
    const std::optional<JacobianFunction> jacobian_;
    const double start_time_;
    const double end_time_;
};

/**
 * @brief Build the initial value problem of `system` on [0, end_time].
 *
 * The initial condition is a snapshot of the current state and the system is
 * not modified. The wrapped vector field ignores the time argument. The end
 * time is not validated beyond finiteness; a negative value describes
 * backward integration.
 */
OdeProblem buildProblem(const ContinuousSystem& system, double end_time);

} // namespace dynsys

#endif // ODE_PROBLEM_HPP
