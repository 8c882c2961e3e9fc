#include "solvers/SolverConfig.hpp"
#include "utils/Logger.hpp"

namespace dynsys {

    ResolvedSolver resolveSolver(const SolverConfig& config) {
        ResolvedSolver resolved;
        if (config.solver && !config.solver->empty()) {
            resolved.algorithm = *config.solver;
        } else {
            resolved.algorithm = DEFAULT_SOLVER_ALGORITHM;
        }
        resolved.options = config.options;
        Logger::getInstance().debug("resolveSolver", "Using solver algorithm '" + resolved.algorithm + "'.");
        return resolved;
    }

} // namespace dynsys
