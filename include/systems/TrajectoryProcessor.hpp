#ifndef TRAJECTORY_PROCESSOR_HPP
#define TRAJECTORY_PROCESSOR_HPP

#include "systems/Trajectory.hpp"
#include <string>
#include <vector>
#include <Eigen/Dense>

namespace dynsys {

    /**
     * @class TrajectoryProcessor
     * @brief Utility functions to process and export Trajectory data.
     */
    class TrajectoryProcessor {
    public:
        /** @brief Deleted default constructor to enforce static utility class behavior. */
        TrajectoryProcessor() = delete;

        /**
         * @brief Trajectory as a matrix, one row per time point and one column per state variable.
         *
         * @throws InvalidResultException If the trajectory is invalid or empty.
         */
        static Eigen::MatrixXd toMatrix(const Trajectory& trajectory);

        /**
         * @brief Time series of a single state variable.
         *
         * @param trajectory The trajectory to read.
         * @param index Zero-based index of the state variable.
         * @return Eigen::VectorXd One entry per time point.
         *
         * @throws InvalidResultException If the trajectory is invalid or empty.
         * @throws InvalidParameterException If `index` is not below the state dimension.
         */
        static Eigen::VectorXd getComponent(const Trajectory& trajectory, std::size_t index);

        /** @brief The grid times as an Eigen vector. */
        static Eigen::VectorXd getTimes(const Trajectory& trajectory);

        /**
         * @brief Save the trajectory to a CSV file.
         *
         * The first column is "Time", followed by one column per state
         * variable. When `names` does not match the state dimension, a warning
         * is logged and generic headers ("x0", "x1", ...) are used.
         *
         * @throws InvalidResultException If the trajectory is invalid or empty.
         * @throws FileIOException If the file cannot be opened for writing.
         */
        static void saveToCSV(const Trajectory& trajectory,
                              const std::vector<std::string>& names,
                              const std::string& filename);
    };

} // namespace dynsys

#endif // TRAJECTORY_PROCESSOR_HPP
