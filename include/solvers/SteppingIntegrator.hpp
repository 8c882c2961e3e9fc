#ifndef STEPPING_INTEGRATOR_HPP
#define STEPPING_INTEGRATOR_HPP

#include "solvers/interfaces/IOdeIntegrator.hpp"
#include "solvers/SavePlan.hpp"
#include "solvers/SolverConfig.hpp"
#include "systems/OdeProblem.hpp"
#include <string>

namespace dynsys {

/**
 * @class SteppingIntegrator
 * @brief Library-independent part of a stepping handle.
 *
 * Keeps the current time and state, schedules stop times from the SavePlan,
 * records saved states and enforces `maxiters`. Backends implement
 * performStep, which advances `time_` and `state_` by one accepted step.
 */
class SteppingIntegrator : public IOdeIntegrator {
public:
    SteppingIntegrator(const OdeProblem& problem, const SolverOptions& options, std::string algorithm_name);

    void step() override;
    void advanceTo(double t) override;
    void solveToEnd() override;

    double getTime() const override { return time_; }
    const state_type& getState() const override { return state_; }
    double getStartTime() const override { return problem_.getStartTime(); }
    double getEndTime() const override { return problem_.getEndTime(); }
    bool isFinished() const override;
    std::size_t getStepCount() const override { return step_count_; }
    const OdeSolution& getSavedSolution() const override { return saved_; }
    const std::string& getAlgorithmName() const override { return algorithm_name_; }

protected:
    /**
     * @brief Advance by one accepted step that does not pass `t_limit`.
     *
     * A step that lands on `t_limit` must set `time_ = t_limit` exactly.
     * `dt_` holds the step proposal and may be updated.
     *
     * @throws SolverException If the library reports a failure.
     */
    virtual void performStep(double t_limit) = 0;

    const OdeProblem problem_;
    const SolverOptions options_;
    const SavePlan plan_;
    double time_;
    state_type state_;
    double dt_;

private:
    void advance(double t_limit);
    void record();

    std::string algorithm_name_;
    OdeSolution saved_;
    std::size_t next_stop_;
    std::size_t step_count_;
    std::size_t steps_since_stop_;
};

} // namespace dynsys

#endif // STEPPING_INTEGRATOR_HPP
