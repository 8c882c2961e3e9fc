#include "solvers/GslIntegrator.hpp"
#include <utility>

namespace dynsys {

    GslIntegrator::GslIntegrator(const OdeProblem& problem,
                                 const SolverOptions& options,
                                 std::string algorithm_name,
                                 const gsl_odeiv2_step_type* step_type)
        : SteppingIntegrator(problem, options, std::move(algorithm_name)),
          system_(std::make_unique<GslOdeSystem>(problem_, step_type, options_, dt_)) {}

    void GslIntegrator::performStep(double t_limit) {
        system_->evolveStep(time_, t_limit, dt_, state_);
    }

} // namespace dynsys
