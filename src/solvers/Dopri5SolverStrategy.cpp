#include "solvers/Dopri5SolverStrategy.hpp"
#include "solvers/OdeintIntegrator.hpp"
#include "solvers/OdeintSolve.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <boost/numeric/odeint/stepper/runge_kutta_dopri5.hpp>

namespace dynsys {

namespace {

    auto makeStepper(const SolverOptions& options, const SavePlan& plan) {
        return boost::numeric::odeint::make_controlled(
            options.getAbsTol(), options.getRelTol(), odeintMaxStep(options, plan),
            boost::numeric::odeint::runge_kutta_dopri5<state_type>());
    }

} // namespace

OdeSolution Dopri5SolverStrategy::solveAtStops(const OdeProblem& problem,
                                          const SolverOptions& options,
                                          const SavePlan& plan) const
{
    try {
        return odeintSolveAtStops(makeStepper(options, plan), problem, options, plan);
    } catch (const SystemException&) {
        throw;
    } catch (const std::exception& e) {
        std::string msg = "Boost.Odeint integration failed: " + std::string(e.what());
        Logger::getInstance().error("Dopri5SolverStrategy::solveAtStops", msg);
        throw SolverException("Dopri5SolverStrategy::solveAtStops", msg);
    }
}

std::unique_ptr<IOdeIntegrator> Dopri5SolverStrategy::createSteppingIntegrator(const OdeProblem& problem,
                                                                          const SolverOptions& options) const
{
    SavePlan plan(problem, options);
    return makeOdeintIntegrator(problem, options, getName(), makeStepper(options, plan));
}

} // namespace dynsys
