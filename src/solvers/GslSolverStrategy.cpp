#include "solvers/GslSolverStrategy.hpp"
#include "solvers/GslIntegrator.hpp"
#include "solvers/GslOdeSystem.hpp"
#include "exceptions/Exceptions.hpp"
#include <utility>

namespace dynsys {

GslSolverStrategy::GslSolverStrategy(std::string name, const gsl_odeiv2_step_type* step_type, bool requires_jacobian)
    : name_(std::move(name)),
      step_type_(step_type),
      requires_jacobian_(requires_jacobian)
{
    if (!step_type_) {
        DYNSYS_THROW_INVALID_PARAM("GslSolverStrategy::GslSolverStrategy", "GSL step type cannot be null.");
    }
}

OdeSolution GslSolverStrategy::solveAtStops(const OdeProblem& problem,
                                            const SolverOptions& options,
                                            const SavePlan& plan) const
{
    GslOdeSystem system(problem, step_type_, options, plan.getInitialStep(options));

    const auto& stops = plan.getStops();
    double t = stops.front();
    state_type y = problem.getInitialState();

    OdeSolution solution;
    solution.t.reserve(plan.getSaveCount());
    solution.u.reserve(plan.getSaveCount());
    if (plan.isSaveStop(0)) {
        solution.t.push_back(t);
        solution.u.push_back(y);
    }
    for (std::size_t i = 1; i < stops.size(); ++i) {
        system.driveTo(t, stops[i], y);
        if (plan.isSaveStop(i)) {
            solution.t.push_back(stops[i]);
            solution.u.push_back(y);
        }
    }
    return solution;
}

std::unique_ptr<IOdeIntegrator> GslSolverStrategy::createSteppingIntegrator(const OdeProblem& problem,
                                                                            const SolverOptions& options) const
{
    return std::make_unique<GslIntegrator>(problem, options, name_, step_type_);
}

} // namespace dynsys
