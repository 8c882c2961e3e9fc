#include <iostream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <Eigen/Dense>

#include "systems/ContinuousSystem.hpp"
#include "systems/Evolution.hpp"
#include "systems/TrajectoryProcessor.hpp"
#include "solvers/Integration.hpp"
#include "solvers/SolverConfig.hpp"
#include "utils/FileUtils.hpp"
#include "utils/ReadSolverConfiguration.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"

using namespace dynsys;

namespace {

    std::string formatState(const state_type& state) {
        std::ostringstream oss;
        oss << std::setprecision(6) << "[";
        for (std::size_t i = 0; i < state.size(); ++i) {
            oss << (i ? ", " : "") << state[i];
        }
        oss << "]";
        return oss.str();
    }

    // Lorenz-63 with the classic parameters.
    ContinuousSystem makeLorenz(double sigma = 10.0, double rho = 28.0, double beta = 8.0 / 3.0) {
        auto eom = [=](state_type& du, const state_type& u) {
            du[0] = sigma * (u[1] - u[0]);
            du[1] = u[0] * (rho - u[2]) - u[1];
            du[2] = u[0] * u[1] - beta * u[2];
        };
        auto jacobian = [=](const state_type& u) {
            Eigen::MatrixXd J(3, 3);
            J << -sigma, sigma, 0.0,
                 rho - u[2], -1.0, -u[0],
                 u[1], u[0], -beta;
            return J;
        };
        return ContinuousSystem({0.0, 10.0, 0.0}, eom, jacobian, "Lorenz63");
    }

} // namespace

int main(int argc, char* argv[]) {
    Logger& logger = Logger::getInstance();
    // Usage: dynsys_demo [solver_settings_file] [log_level]
    logger.setLogLevel(argc > 2 ? parseLogLevel(argv[2]) : LogLevel::INFO);
    logger.info("main", "Starting continuous system demo...");

    try {
        SolverConfig config;
        if (argc > 1) {
            logger.info("main", "Loading solver settings from: " + std::string(argv[1]));
            config = readSolverConfiguration(argv[1]);
        }
        const std::string algorithm = resolveSolver(config).algorithm;
        logger.info("main", "Using solver: " + algorithm);

        ContinuousSystem lorenz = makeLorenz();
        logger.info("main", lorenz.getName() + " initial state: " + formatState(lorenz.getState()));

        // --- One-shot evolution ---
        state_type final_state = evolve(lorenz, 10.0, config);
        logger.info("main", "State after T = 10: " + formatState(final_state));

        // --- Stepping handle ---
        auto integrator = createIntegrator(lorenz, 1.0, config);
        while (!integrator->isFinished()) {
            integrator->step();
        }
        logger.info("main", integrator->getAlgorithmName() + " took " +
                    std::to_string(integrator->getStepCount()) + " steps to reach t = 1: " +
                    formatState(integrator->getState()));

        // --- Trajectory output ---
        const double T = 20.0;
        const double dt = 0.01;
        Trajectory trajectory = computeTrajectory(lorenz, T, dt, config);
        logger.info("main", "Trajectory computed with " + std::to_string(trajectory.size()) + " points.");

        Eigen::VectorXd x = TrajectoryProcessor::getComponent(trajectory, 0);
        logger.info("main", "x range over trajectory: [" + std::to_string(x.minCoeff()) + ", " +
                    std::to_string(x.maxCoeff()) + "]");

        const std::string output_file = FileUtils::getOutputPath("lorenz_trajectory.csv");
        TrajectoryProcessor::saveToCSV(trajectory, {"x", "y", "z"}, output_file);

        // --- In-place evolution ---
        evolveInPlace(lorenz, 1.0, config);
        logger.info("main", "State after evolveInPlace(1.0): " + formatState(lorenz.getState()));

        logger.info("main", "Demo finished successfully.");
        return 0;
    }
    catch (const FileIOException& e) {
        logger.fatal("main", "File I/O Error: " + std::string(e.what()));
        std::cerr << "Critical Error: Could not read or write a file. " << e.what() << std::endl;
        return 1;
    }
    catch (const DataFormatException& e) {
        logger.fatal("main", "Data Format Error: " + std::string(e.what()));
        std::cerr << "Critical Error: Invalid solver settings. " << e.what() << std::endl;
        return 1;
    }
    catch (const InvalidParameterException& e) {
        logger.fatal("main", "Invalid Parameter Error: " + std::string(e.what()));
        std::cerr << "Critical Error: Invalid parameter provided. " << e.what() << std::endl;
        return 1;
    }
    catch (const SolverException& e) {
        logger.fatal("main", "Solver Error: " + std::string(e.what()));
        std::cerr << "Critical Error: Integration failed. " << e.what() << std::endl;
        return 1;
    }
    catch (const SystemException& e) {
        logger.fatal("main", "System Error: " + std::string(e.what()));
        std::cerr << "Critical Error: " << e.what() << std::endl;
        return 1;
    }
    catch (const std::exception& e) {
        logger.fatal("main", "Standard Exception: " + std::string(e.what()));
        std::cerr << "Error: An unexpected error occurred: " << e.what() << std::endl;
        return 1;
    }
}
