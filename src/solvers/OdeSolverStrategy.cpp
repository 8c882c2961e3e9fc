#include "solvers/OdeSolverStrategy.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"

namespace dynsys {

    OdeSolution OdeSolverStrategy::solve(const OdeProblem& problem, const SolverOptions& options) const {
        checkJacobianRequirement(problem, "OdeSolverStrategy::solve");

        SavePlan plan(problem, options);
        if (plan.isEmptySpan()) {
            Logger::getInstance().debug("OdeSolverStrategy::solve", getName() + ": empty time span, returning the initial state.");
            return plan.trivialSolution(problem.getInitialState());
        }

        if (options.save_everystep) {
            auto integrator = createSteppingIntegrator(problem, options);
            integrator->solveToEnd();
            return integrator->getSavedSolution();
        }

        return solveAtStops(problem, options, plan);
    }

    std::unique_ptr<IOdeIntegrator> OdeSolverStrategy::init(const OdeProblem& problem, const SolverOptions& options) const {
        checkJacobianRequirement(problem, "OdeSolverStrategy::init");
        return createSteppingIntegrator(problem, options);
    }

    void OdeSolverStrategy::checkJacobianRequirement(const OdeProblem& problem, const std::string& source) const {
        if (requiresJacobian() && !problem.hasJacobian()) {
            std::string msg = "Algorithm '" + getName() + "' requires a Jacobian but the problem provides none.";
            Logger::getInstance().error(source, msg);
            throw SolverException(source, msg);
        }
    }

} // namespace dynsys
