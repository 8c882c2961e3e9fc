#ifndef TRAJECTORY_HPP
#define TRAJECTORY_HPP

#include "systems/ContinuousSystem.hpp"
#include "exceptions/Exceptions.hpp"
#include <string>
#include <utility>
#include <vector>
#include <Eigen/Dense>

namespace dynsys {

    /**
     * @brief Ordered sequence of states sampled on a time grid.
     *
     * Row i is the state at `time_points[i]`. A trajectory is a plain value
     * and keeps no link to the system it was computed from.
     */
    struct Trajectory {
        /** @brief Grid times in increasing order. */
        std::vector<double> time_points;

        /** @brief One state vector per grid time. */
        std::vector<state_type> solution;

        Trajectory() = default;

        Trajectory(std::vector<double> times, std::vector<state_type> states)
            : time_points(std::move(times)), solution(std::move(states)) {}

        /**
         * @brief Checks if the trajectory contains data.
         * @return true if both vectors are non-empty, have matching sizes and all rows share one dimension.
         */
        bool isValid() const {
            if (time_points.empty() || solution.empty() || time_points.size() != solution.size()) {
                return false;
            }
            for (const auto& row : solution) {
                if (row.size() != solution.front().size()) return false;
            }
            return true;
        }

        std::size_t size() const { return solution.size(); }

        /** @brief State dimension, 0 for an empty trajectory. */
        std::size_t dimension() const { return solution.empty() ? 0 : solution.front().size(); }

        const state_type& operator[](std::size_t i) const { return solution[i]; }

        /**
         * @brief Row access with bounds checking.
         * @throws OutOfRangeException If `i >= size()`.
         */
        const state_type& row(std::size_t i) const {
            if (i >= solution.size()) {
                DYNSYS_THROW_OUT_OF_RANGE("Trajectory::row",
                    "Row index " + std::to_string(i) + " out of range for trajectory with " +
                    std::to_string(solution.size()) + " rows.");
            }
            return solution[i];
        }
    };

} // namespace dynsys

#endif // TRAJECTORY_HPP
