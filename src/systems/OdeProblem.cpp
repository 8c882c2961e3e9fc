#include "systems/OdeProblem.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>
#include <utility>

namespace dynsys {

    OdeProblem::OdeProblem(state_type initial_state,
                           RhsFunction rhs,
                           std::optional<JacobianFunction> jacobian,
                           double start_time,
                           double end_time)
        : initial_state_(std::move(initial_state)),
          rhs_(std::move(rhs)),
          jacobian_(std::move(jacobian)),
          start_time_(start_time),
          end_time_(end_time)
    {
        if (initial_state_.empty()) {
            DYNSYS_THROW_INVALID_PARAM("OdeProblem::OdeProblem", "Initial state cannot be empty.");
        }
        if (!rhs_) {
            DYNSYS_THROW_INVALID_PARAM("OdeProblem::OdeProblem", "Right-hand side function cannot be empty.");
        }
        if (!std::isfinite(start_time_) || !std::isfinite(end_time_)) {
            DYNSYS_THROW_INVALID_PARAM("OdeProblem::OdeProblem",
                                       "Time span must be finite. Received: [" + std::to_string(start_time_) +
                                       ", " + std::to_string(end_time_) + "].");
        }
    }

    OdeProblem buildProblem(const ContinuousSystem& system, double end_time) {
        // Capture the field by value so the problem outlives the system.
        ContinuousSystem::VectorField eom = system.getVectorField();
        OdeProblem::RhsFunction rhs = [eom](const state_type& x, state_type& dxdt, double) {
            eom(dxdt, x);
        };

        std::optional<OdeProblem::JacobianFunction> jacobian;
        if (system.hasJacobian()) {
            ContinuousSystem::JacobianFunction jac = *system.getJacobianFunction();
            jacobian = [jac](const state_type& x, double) {
                return jac(x);
            };
        }

        return OdeProblem(system.getState(), std::move(rhs), std::move(jacobian), 0.0, end_time);
    }

} // namespace dynsys
