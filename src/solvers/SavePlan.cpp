#include "solvers/SavePlan.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace dynsys {

    namespace {

        bool coincide(double a, double b) {
            const double scale = std::max({1.0, std::abs(a), std::abs(b)});
            return std::abs(a - b) <= 1.0e-12 * scale;
        }

    } // namespace

    SavePlan::SavePlan(const OdeProblem& problem, const SolverOptions& options)
        : direction_(problem.getEndTime() >= problem.getStartTime() ? 1.0 : -1.0),
          span_(problem.getEndTime() - problem.getStartTime())
    {
        const double t0 = problem.getStartTime();
        const double t1 = problem.getEndTime();
        auto inside = [&](double t) {
            return direction_ * (t - t0) >= 0.0 && direction_ * (t1 - t) >= 0.0;
        };

        const bool explicit_saves = !options.saveat.empty();
        std::vector<std::pair<double, bool>> candidates;
        candidates.emplace_back(t0, !explicit_saves && options.save_first);
        candidates.emplace_back(t1, !explicit_saves);
        for (double t : options.saveat) {
            if (inside(t)) candidates.emplace_back(t, true);
        }
        for (double t : options.tstops) {
            if (inside(t)) candidates.emplace_back(t, false);
        }

        std::stable_sort(candidates.begin(), candidates.end(),
                         [this](const std::pair<double, bool>& a, const std::pair<double, bool>& b) {
                             return direction_ * a.first < direction_ * b.first;
                         });

        for (const auto& candidate : candidates) {
            if (!stops_.empty() && coincide(stops_.back(), candidate.first)) {
                // Exact end points win over nearby user-supplied times.
                if (candidate.first == t0 || candidate.first == t1) stops_.back() = candidate.first;
                save_flags_.back() = save_flags_.back() || candidate.second;
                continue;
            }
            stops_.push_back(candidate.first);
            save_flags_.push_back(candidate.second);
        }

        if (explicit_saves && !options.save_first && stops_.size() > 1) {
            save_flags_.front() = false;
        }
    }

    std::size_t SavePlan::getSaveCount() const {
        return static_cast<std::size_t>(std::count(save_flags_.begin(), save_flags_.end(), true));
    }

    double SavePlan::getInitialStep(const SolverOptions& options) const {
        if (options.dt && *options.dt != 0.0) {
            return direction_ * std::abs(*options.dt);
        }
        if (span_ == 0.0) {
            return direction_ * 1.0e-3;
        }
        return span_ / 100.0;
    }

    OdeSolution SavePlan::trivialSolution(const state_type& initial_state) const {
        OdeSolution solution;
        for (std::size_t i = 0; i < stops_.size(); ++i) {
            if (save_flags_[i]) {
                solution.t.push_back(stops_[i]);
                solution.u.push_back(initial_state);
            }
        }
        return solution;
    }

} // namespace dynsys
