#ifndef CONTINUOUS_SYSTEM_HPP
#define CONTINUOUS_SYSTEM_HPP

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <Eigen/Dense>

namespace dynsys {

/** @brief Phase-space point of a system, the state type used with Boost.Odeint and GSL. */
using state_type = std::vector<double>;

/**
 * @class ContinuousSystem
 * @brief Continuous dynamical system du/dt = f(u) with dimension D = state size.
 *
 * Holds the current state, the in-place equations of motion and, optionally,
 * the Jacobian of the vector field. The dimension is fixed at construction;
 * only the state values change afterwards (see `evolveInPlace`).
 *
 * The class provides no synchronisation. Concurrent reads through `evolve`
 * or `computeTrajectory` and writes through `evolveInPlace` on the same
 * instance must be serialized by the caller.
 */
class ContinuousSystem {
public:
    /**
     * @brief Equations of motion in the in-place convention `eom(du, u)`.
     *
     * `du` is pre-sized to the system dimension and must be fully overwritten.
     */
    using VectorField = std::function<void(state_type& du, const state_type& u)>;

    /** @brief Jacobian of the vector field, returns a D x D matrix evaluated at `u`. */
    using JacobianFunction = std::function<Eigen::MatrixXd(const state_type& u)>;

    /**
     * @brief Construct a system without a Jacobian.
     *
     * @param state Initial state; its size becomes the system dimension.
     * @param eom In-place vector field.
     * @param name Display label.
     *
     * @throws SystemConstructionException If `state` is empty or `eom` is empty.
     */
    ContinuousSystem(state_type state, VectorField eom, std::string name = "");

    /**
     * @brief Construct a system with a Jacobian, usable with implicit solvers.
     *
     * @throws SystemConstructionException If `state` is empty, `eom` is empty or `jacobian` is empty.
     */
    ContinuousSystem(state_type state, VectorField eom, JacobianFunction jacobian, std::string name = "");

    /** @brief Number of state variables. */
    std::size_t getDimension() const { return dimension_; }

    const state_type& getState() const { return state_; }

    /**
     * @brief Overwrite the state values.
     * @throws InvalidParameterException If `state.size()` differs from the dimension.
     */
    void setState(const state_type& state);

    const VectorField& getVectorField() const { return eom_; }

    bool hasJacobian() const { return jacobian_.has_value(); }

    const std::optional<JacobianFunction>& getJacobianFunction() const { return jacobian_; }

    const std::string& getName() const { return name_; }

    /**
     * @brief Evaluate the vector field at `u`.
     *
     * Resizes `du` to the dimension before delegating to the equations of motion.
     * @throws InvalidParameterException If `u` has the wrong dimension.
     */
    void computeDerivatives(const state_type& u, state_type& du) const;

    /**
     * @brief Evaluate the Jacobian at `u`.
     * @throws SystemException If the system has no Jacobian or the returned matrix is not D x D.
     * @throws InvalidParameterException If `u` has the wrong dimension.
     */
    Eigen::MatrixXd jacobian(const state_type& u) const;

    /** @brief Evaluate the Jacobian at the current state. */
    Eigen::MatrixXd jacobian() const;

private:
    void checkDimension(const state_type& u, const std::string& source) const;

    state_type state_;
    VectorField eom_;
    std::optional<JacobianFunction> jacobian_;
    std::string name_;
    std::size_t dimension_;
};

} // namespace dynsys

#endif // CONTINUOUS_SYSTEM_HPP
