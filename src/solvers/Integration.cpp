#include "solvers/Integration.hpp"
#include "solvers/SolverFactory.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"

namespace dynsys {

OdeSolution solve(const OdeProblem& problem, const ResolvedSolver& resolved) {
    auto strategy = SolverFactory::create(resolved.algorithm);
    Logger& logger = Logger::getInstance();
    if (logger.isEnabled(LogLevel::DEBUG)) {
        logger.debug("solve", "Solving with " + strategy->getName() +
                     " on [" + std::to_string(problem.getStartTime()) + ", " +
                     std::to_string(problem.getEndTime()) + "], dimension " +
                     std::to_string(problem.getDimension()));
    }
    return strategy->solve(problem, resolved.options);
}

std::vector<state_type> getSolution(const OdeProblem& problem, const SolverConfig& config) {
    ResolvedSolver resolved = resolveSolver(config);
    resolved.options.save_everystep = false;
    return solve(problem, resolved).u;
}

state_type integrate(const OdeProblem& problem, const ResolvedSolver& resolved) {
    ResolvedSolver final_only = resolved;
    final_only.options.save_everystep = false;
    final_only.options.saveat.clear();
    final_only.options.save_first = false;
    OdeSolution solution = solve(problem, final_only);
    if (solution.empty()) {
        throw InvalidResultException("integrate", "Solver returned no saved state.");
    }
    return solution.u.back();
}

std::unique_ptr<IOdeIntegrator> createIntegrator(const OdeProblem& problem, const SolverConfig& config) {
    ResolvedSolver resolved = resolveSolver(config);
    resolved.options.save_first = false;
    resolved.options.save_everystep = false;
    auto strategy = SolverFactory::create(resolved.algorithm);
    Logger::getInstance().debug("createIntegrator", "Initializing " + strategy->getName() + " stepping handle.");
    return strategy->init(problem, resolved.options);
}

std::unique_ptr<IOdeIntegrator> createIntegrator(const ContinuousSystem& system, double T,
                                                 const SolverConfig& config) {
    return createIntegrator(buildProblem(system, T), config);
}

} // namespace dynsys
