#ifndef I_ODE_SOLVER_STRATEGY_HPP
#define I_ODE_SOLVER_STRATEGY_HPP

#include "systems/OdeProblem.hpp"
#include "solvers/OdeSolution.hpp"
#include "solvers/SolverConfig.hpp"
#include "solvers/interfaces/IOdeIntegrator.hpp"
#include <memory>
#include <string>

namespace dynsys {

/**
 * @brief Interface for ODE integration strategies.
 *
 * Each strategy wraps one algorithm of an external solver library and is
 * created by name through SolverFactory.
 */
class IOdeSolverStrategy {
public:
    virtual ~IOdeSolverStrategy() = default;

    /**
     * @brief Solve the problem in one shot.
     *
     * @param problem The initial value problem.
     * @param options Forwarded options; the save options decide which states are returned.
     * @return The saved time points and states in integration order.
     *
     * @throws SolverException If integration fails or the algorithm cannot be used for the problem.
     */
    virtual OdeSolution solve(const OdeProblem& problem, const SolverOptions& options) const = 0;

    /**
     * @brief Create a stepping handle positioned at the start of the problem.
     * @throws SolverException If the algorithm cannot be used for the problem.
     */
    virtual std::unique_ptr<IOdeIntegrator> init(const OdeProblem& problem, const SolverOptions& options) const = 0;

    virtual std::string getName() const = 0;

    /** @brief True for algorithms that need the Jacobian of the vector field. */
    virtual bool requiresJacobian() const = 0;
};

} // namespace dynsys

#endif // I_ODE_SOLVER_STRATEGY_HPP
