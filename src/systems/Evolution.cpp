#include "systems/Evolution.hpp"
#include "solvers/Integration.hpp"
#include "systems/OdeProblem.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <cmath>
#include <string>
#include <utility>

namespace dynsys {

    namespace {
        // Upper bound on saved trajectory rows.
        constexpr std::size_t kMaxGridPoints = 100000000;
    }

    state_type evolve(const ContinuousSystem& system, double T, const SolverConfig& config) {
        OdeProblem problem = buildProblem(system, T);
        std::vector<state_type> states = getSolution(problem, config);
        if (states.empty()) {
            throw InvalidResultException("evolve", "Solver returned no saved state.");
        }
        return states.back();
    }

    state_type evolveInPlace(ContinuousSystem& system, double T, const SolverConfig& config) {
        state_type state = evolve(system, T, config);
        system.setState(state);
        return state;
    }

    std::vector<double> makeTimeGrid(double T, double dt) {
        if (!(T > 0.0)) {
            DYNSYS_THROW_INVALID_PARAM("computeTrajectory", "Total time must be positive.");
        }
        if (!(dt > 0.0)) {
            DYNSYS_THROW_INVALID_PARAM("computeTrajectory", "Time step must be positive.");
        }
        if (!std::isfinite(T) || !std::isfinite(dt)) {
            DYNSYS_THROW_INVALID_PARAM("computeTrajectory", "Total time and time step must be finite.");
        }

        const double steps = std::floor(T / dt + 1.0e-9);
        if (!(steps < static_cast<double>(kMaxGridPoints))) {
            DYNSYS_THROW_INVALID_PARAM("computeTrajectory",
                                       "Time grid for T = " + std::to_string(T) + ", dt = " + std::to_string(dt) +
                                       " exceeds " + std::to_string(kMaxGridPoints) + " points.");
        }
        const auto last = static_cast<std::size_t>(steps);
        std::vector<double> grid;
        grid.reserve(last + 1);
        for (std::size_t i = 0; i <= last; ++i) {
            grid.push_back(static_cast<double>(i) * dt);
        }
        if (std::abs(grid.back() - T) <= 1.0e-9 * T) {
            grid.back() = T;
        }
        return grid;
    }

    Trajectory computeTrajectory(const ContinuousSystem& system, double T, double dt, const SolverConfig& config) {
        std::vector<double> grid = makeTimeGrid(T, dt);

        SolverConfig grid_config = config;
        grid_config.options.saveat = grid;
        grid_config.options.save_first = true;

        Logger::getInstance().debug("computeTrajectory",
                                    "Sampling " + std::to_string(grid.size()) + " points up to T = " + std::to_string(T));

        std::vector<state_type> states = getSolution(buildProblem(system, T), grid_config);
        if (states.size() != grid.size()) {
            throw InvalidResultException("computeTrajectory",
                                         "Expected " + std::to_string(grid.size()) + " states, solver returned " +
                                         std::to_string(states.size()) + ".");
        }
        return Trajectory(std::move(grid), std::move(states));
    }

} // namespace dynsys
