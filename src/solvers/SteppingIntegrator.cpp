#include "solvers/SteppingIntegrator.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <utility>

namespace dynsys {

    SteppingIntegrator::SteppingIntegrator(const OdeProblem& problem,
                                           const SolverOptions& options,
                                           std::string algorithm_name)
        : problem_(problem),
          options_(options),
          plan_(problem, options),
          time_(problem.getStartTime()),
          state_(problem.getInitialState()),
          dt_(plan_.getInitialStep(options)),
          algorithm_name_(std::move(algorithm_name)),
          next_stop_(1),
          step_count_(0),
          steps_since_stop_(0)
    {
        if (plan_.isSaveStop(0)) {
            record();
        }
    }

    bool SteppingIntegrator::isFinished() const {
        return next_stop_ >= plan_.getStops().size();
    }

    void SteppingIntegrator::step() {
        if (isFinished()) {
            DYNSYS_THROW_INVALID_PARAM("SteppingIntegrator::step",
                                       "Integration already reached the end time " + std::to_string(getEndTime()) + ".");
        }
        advance(plan_.getStops()[next_stop_]);
    }

    void SteppingIntegrator::advanceTo(double t) {
        const double direction = plan_.getDirection();
        if (direction * (t - time_) < 0.0 || direction * (t - getEndTime()) > 0.0) {
            DYNSYS_THROW_INVALID_PARAM("SteppingIntegrator::advanceTo",
                                       "Target time " + std::to_string(t) + " is outside [" +
                                       std::to_string(time_) + ", " + std::to_string(getEndTime()) + "].");
        }
        while (direction * (t - time_) > 0.0) {
            const double stop = plan_.getStops()[next_stop_];
            advance(direction * (t - stop) < 0.0 ? t : stop);
        }
    }

    void SteppingIntegrator::solveToEnd() {
        while (!isFinished()) {
            step();
        }
    }

    void SteppingIntegrator::advance(double t_limit) {
        performStep(t_limit);
        ++step_count_;

        if (++steps_since_stop_ > options_.getMaxIters()) {
            std::string msg = "Maximum number of iterations (" + std::to_string(options_.getMaxIters()) +
                              ") exceeded at t = " + std::to_string(time_) + ".";
            Logger::getInstance().error("SteppingIntegrator::advance", algorithm_name_ + ": " + msg);
            throw SolverException("SteppingIntegrator::advance", msg);
        }

        bool recorded = false;
        const double stop = plan_.getStops()[next_stop_];
        if (time_ == stop) {
            if (plan_.isSaveStop(next_stop_)) {
                record();
                recorded = true;
            }
            ++next_stop_;
            steps_since_stop_ = 0;
        }
        if (options_.save_everystep && !recorded) {
            record();
        }
    }

    void SteppingIntegrator::record() {
        saved_.t.push_back(time_);
        saved_.u.push_back(state_);
    }

} // namespace dynsys
