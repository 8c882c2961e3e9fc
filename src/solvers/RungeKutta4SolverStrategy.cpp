#include "solvers/RungeKutta4SolverStrategy.hpp"
#include "solvers/OdeintIntegrator.hpp"
#include "solvers/OdeintSolve.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <boost/numeric/odeint/stepper/runge_kutta4.hpp>

namespace dynsys {

using rk4_stepper = boost::numeric::odeint::runge_kutta4<state_type>;

OdeSolution RungeKutta4SolverStrategy::solveAtStops(const OdeProblem& problem,
                                                    const SolverOptions& options,
                                                    const SavePlan& plan) const
{
    try {
        return odeintSolveAtStops(rk4_stepper(), problem, options, plan);
    } catch (const SystemException&) {
        throw;
    } catch (const std::exception& e) {
        std::string msg = "Boost.Odeint integration failed: " + std::string(e.what());
        Logger::getInstance().error("RungeKutta4SolverStrategy::solveAtStops", msg);
        throw SolverException("RungeKutta4SolverStrategy::solveAtStops", msg);
    }
}

std::unique_ptr<IOdeIntegrator> RungeKutta4SolverStrategy::createSteppingIntegrator(const OdeProblem& problem,
                                                                                    const SolverOptions& options) const
{
    return makeOdeintIntegrator(problem, options, getName(), rk4_stepper());
}

} // namespace dynsys
