#include "systems/ContinuousSystem.hpp"
#include "exceptions/Exceptions.hpp"
#include <utility>

namespace dynsys {

    ContinuousSystem::ContinuousSystem(state_type state, VectorField eom, std::string name)
        : state_(std::move(state)),
          eom_(std::move(eom)),
          jacobian_(std::nullopt),
          name_(std::move(name)),
          dimension_(state_.size())
    {
        if (state_.empty()) {
            throw SystemConstructionException("ContinuousSystem::ContinuousSystem", "Initial state cannot be empty.");
        }
        if (!eom_) {
            throw SystemConstructionException("ContinuousSystem::ContinuousSystem", "Vector field function cannot be empty.");
        }
    }

    ContinuousSystem::ContinuousSystem(state_type state, VectorField eom, JacobianFunction jacobian, std::string name)
        : ContinuousSystem(std::move(state), std::move(eom), std::move(name))
    {
        if (!jacobian) {
            throw SystemConstructionException("ContinuousSystem::ContinuousSystem", "Jacobian function cannot be empty when provided.");
        }
        jacobian_ = std::move(jacobian);
    }

    void ContinuousSystem::setState(const state_type& state) {
        checkDimension(state, "ContinuousSystem::setState");
        state_ = state;
    }

    void ContinuousSystem::computeDerivatives(const state_type& u, state_type& du) const {
        checkDimension(u, "ContinuousSystem::computeDerivatives");
        du.resize(dimension_);
        eom_(du, u);
    }

    Eigen::MatrixXd ContinuousSystem::jacobian(const state_type& u) const {
        if (!jacobian_) {
            DYNSYS_THROW_SYSTEM_EXCEPTION("ContinuousSystem::jacobian",
                                          "System '" + name_ + "' was constructed without a Jacobian.");
        }
        checkDimension(u, "ContinuousSystem::jacobian");
        Eigen::MatrixXd J = (*jacobian_)(u);
        const auto D = static_cast<Eigen::Index>(dimension_);
        if (J.rows() != D || J.cols() != D) {
            DYNSYS_THROW_SYSTEM_EXCEPTION("ContinuousSystem::jacobian",
                                          "Jacobian must be " + std::to_string(D) + "x" + std::to_string(D) +
                                          ", got " + std::to_string(J.rows()) + "x" + std::to_string(J.cols()) + ".");
        }
        return J;
    }

    Eigen::MatrixXd ContinuousSystem::jacobian() const {
        return jacobian(state_);
    }

    void ContinuousSystem::checkDimension(const state_type& u, const std::string& source) const {
        if (u.size() != dimension_) {
            DYNSYS_THROW_INVALID_PARAM(source,
                                       "State size (" + std::to_string(u.size()) +
                                       ") does not match system dimension (" + std::to_string(dimension_) + ").");
        }
    }

} // namespace dynsys
