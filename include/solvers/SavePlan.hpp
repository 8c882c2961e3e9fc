#ifndef SAVE_PLAN_HPP
#define SAVE_PLAN_HPP

#include "systems/OdeProblem.hpp"
#include "solvers/OdeSolution.hpp"
#include "solvers/SolverConfig.hpp"
#include <vector>

namespace dynsys {

/**
 * @class SavePlan
 * @brief Ordered stop times of an integration and which of them are saved.
 *
 * Stops are the union of the span end points with the `saveat` and `tstops`
 * entries that lie inside the span, sorted in integration direction and
 * merged when they coincide. When `saveat` is empty the start point (if
 * `save_first`) and the end point are saved; otherwise exactly the `saveat`
 * points are saved (the start point only if `save_first`).
 */
class SavePlan {
public:
    SavePlan(const OdeProblem& problem, const SolverOptions& options);

    const std::vector<double>& getStops() const { return stops_; }
    bool isSaveStop(std::size_t index) const { return save_flags_.at(index); }
    std::size_t getSaveCount() const;

    /** @brief +1 for forward integration, -1 for backward. */
    double getDirection() const { return direction_; }

    /** @brief True when start and end time coincide. */
    bool isEmptySpan() const { return stops_.size() == 1; }

    /**
     * @brief Initial step with the sign of the integration direction.
     *
     * Uses `options.dt` when set and non-zero, otherwise 1/100 of the span.
     */
    double getInitialStep(const SolverOptions& options) const;

    /** @brief Solution of an empty span: the initial state once per saved stop. */
    OdeSolution trivialSolution(const state_type& initial_state) const;

private:
    std::vector<double> stops_;
    std::vector<bool> save_flags_;
    double direction_;
    double span_;
};

} // namespace dynsys

#endif // SAVE_PLAN_HPP
