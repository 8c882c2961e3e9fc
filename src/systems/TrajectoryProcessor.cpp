#include "systems/TrajectoryProcessor.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <fstream>
#include <iomanip>
#include <limits>

namespace dynsys {

    namespace {

        void requireValid(const Trajectory& trajectory, const std::string& source) {
            if (!trajectory.isValid()) {
                throw InvalidResultException(source, "Trajectory is invalid or empty.");
            }
        }

    } // namespace

    Eigen::MatrixXd TrajectoryProcessor::toMatrix(const Trajectory& trajectory) {
        requireValid(trajectory, "TrajectoryProcessor::toMatrix");

        const auto rows = static_cast<Eigen::Index>(trajectory.size());
        const auto cols = static_cast<Eigen::Index>(trajectory.dimension());
        Eigen::MatrixXd matrix(rows, cols);
        for (Eigen::Index i = 0; i < rows; ++i) {
            matrix.row(i) = Eigen::Map<const Eigen::RowVectorXd>(trajectory.solution[i].data(), cols);
        }
        return matrix;
    }

    Eigen::VectorXd TrajectoryProcessor::getComponent(const Trajectory& trajectory, std::size_t index) {
        requireValid(trajectory, "TrajectoryProcessor::getComponent");
        if (index >= trajectory.dimension()) {
            DYNSYS_THROW_INVALID_PARAM("TrajectoryProcessor::getComponent",
                                       "Component index " + std::to_string(index) +
                                       " out of range for dimension " + std::to_string(trajectory.dimension()) + ".");
        }

        Eigen::VectorXd component(static_cast<Eigen::Index>(trajectory.size()));
        for (std::size_t t = 0; t < trajectory.size(); ++t) {
            component(static_cast<Eigen::Index>(t)) = trajectory.solution[t][index];
        }
        return component;
    }

    Eigen::VectorXd TrajectoryProcessor::getTimes(const Trajectory& trajectory) {
        requireValid(trajectory, "TrajectoryProcessor::getTimes");
        return Eigen::Map<const Eigen::VectorXd>(trajectory.time_points.data(),
                                                 static_cast<Eigen::Index>(trajectory.time_points.size()));
    }

    void TrajectoryProcessor::saveToCSV(const Trajectory& trajectory,
                                        const std::vector<std::string>& names,
                                        const std::string& filename)
    {
        requireValid(trajectory, "TrajectoryProcessor::saveToCSV");

        std::ofstream file(filename);
        if (!file.is_open()) {
            throw FileIOException("TrajectoryProcessor::saveToCSV", "Could not open file for writing: " + filename);
        }
        Logger& logger = Logger::getInstance();
        logger.info("TrajectoryProcessor::saveToCSV", "Saving trajectory to: " + filename);

        file << "Time";
        if (names.size() != trajectory.dimension()) {
            if (!names.empty()) {
                logger.warning("TrajectoryProcessor::saveToCSV",
                               "Got " + std::to_string(names.size()) + " column names for dimension " +
                               std::to_string(trajectory.dimension()) + ". Using generic headers.");
            }
            for (std::size_t j = 0; j < trajectory.dimension(); ++j) {
                file << ",x" << j;
            }
        } else {
            for (const auto& name : names) {
                file << "," << name;
            }
        }
        file << "\n";

        file << std::setprecision(std::numeric_limits<double>::max_digits10);
        for (std::size_t i = 0; i < trajectory.size(); ++i) {
            file << trajectory.time_points[i];
            for (double value : trajectory.solution[i]) {
                file << "," << value;
            }
            file << "\n";
        }

        if (!file) {
            throw FileIOException("TrajectoryProcessor::saveToCSV", "Error while writing to: " + filename);
        }
        logger.info("TrajectoryProcessor::saveToCSV", "Trajectory saved successfully.");
    }

} // namespace dynsys
