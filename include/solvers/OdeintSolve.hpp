#ifndef ODEINT_SOLVE_HPP
#define ODEINT_SOLVE_HPP

#include "solvers/OdeSolution.hpp"
#include "solvers/SavePlan.hpp"
#include "solvers/SolverConfig.hpp"
#include "systems/OdeProblem.hpp"
#include <boost/numeric/odeint.hpp>
#include <boost/numeric/odeint/integrate/integrate_times.hpp>
#include <boost/numeric/odeint/integrate/max_step_checker.hpp>
#include <algorithm>
#include <climits>
#include <cmath>

namespace dynsys {

    /**
     * @brief One-shot Boost.Odeint integration through the stop times of `plan`.
     *
     * Runs integrate_times over all stops, so the stepper lands exactly on every
     * `tstops` and `saveat` entry, and keeps the states at the flagged stops.
     * The number of steps between two stops is bounded by `options.maxiters`
     * through odeint's max_step_checker.
     *
     * Library exceptions are not caught here; strategies translate them.
     */
    template <class Stepper>
    OdeSolution odeintSolveAtStops(Stepper stepper,
                                   const OdeProblem& problem,
                                   const SolverOptions& options,
                                   const SavePlan& plan)
    {
        state_type x = problem.getInitialState();
        OdeSolution solution;
        solution.t.reserve(plan.getSaveCount());
        solution.u.reserve(plan.getSaveCount());

        std::size_t stop_index = 0;
        auto observer = [&solution, &plan, &stop_index](const state_type& state, double t) {
            if (plan.isSaveStop(stop_index)) {
                solution.t.push_back(t);
                solution.u.push_back(state);
            }
            ++stop_index;
        };

        const auto& stops = plan.getStops();
        boost::numeric::odeint::integrate_times(
            stepper,
            problem.getRhs(),
            x,
            stops.begin(), stops.end(),
            plan.getInitialStep(options),
            observer,
            boost::numeric::odeint::max_step_checker(
                static_cast<int>(std::min<std::size_t>(options.getMaxIters(), INT_MAX)))
        );
        return solution;
    }

    /** @brief Signed step limit for make_controlled; 0 disables the limit. */
    inline double odeintMaxStep(const SolverOptions& options, const SavePlan& plan) {
        if (!options.dtmax || *options.dtmax == 0.0) return 0.0;
        return plan.getDirection() * std::abs(*options.dtmax);
    }

} // namespace dynsys

#endif // ODEINT_SOLVE_HPP
