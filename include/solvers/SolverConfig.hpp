#ifndef SOLVER_CONFIG_HPP
#define SOLVER_CONFIG_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace dynsys {

/** @brief Algorithm used when a configuration does not name one (Dormand-Prince 5(4)). */
inline const std::string DEFAULT_SOLVER_ALGORITHM = "dopri5";

constexpr double DEFAULT_ABSTOL = 1.0e-8;
constexpr double DEFAULT_RELTOL = 1.0e-8;
constexpr std::size_t DEFAULT_MAXITERS = 100000;

/**
 * @brief Options forwarded to the solver library.
 *
 * Unset optionals fall back to the defaults above; `dt` defaults to one
 * hundredth of the integration span.
 */
struct SolverOptions {
    std::optional<double> abstol;          ///< Absolute error tolerance.
    std::optional<double> reltol;          ///< Relative error tolerance.
    std::optional<double> dt;              ///< Initial step (fixed step for non-adaptive methods).
    std::optional<double> dtmax;           ///< Largest allowed step magnitude, unbounded when unset.
    std::vector<double> saveat;            ///< Explicit save times; empty saves the span end points.
    std::vector<double> tstops;            ///< Times the integrator must step onto exactly.
    bool save_everystep = false;           ///< Additionally save after every accepted step.
    bool save_first = true;                ///< Save the initial point.
    std::optional<std::size_t> maxiters;   ///< Accepted steps allowed between two stop times.

    double getAbsTol() const { return abstol.value_or(DEFAULT_ABSTOL); }
    double getRelTol() const { return reltol.value_or(DEFAULT_RELTOL); }
    std::size_t getMaxIters() const { return maxiters.value_or(DEFAULT_MAXITERS); }
};

/**
 * @brief Caller-facing solver configuration: an optional algorithm name plus forwarded options.
 */
struct SolverConfig {
    std::optional<std::string> solver;
    SolverOptions options;
};

/**
 * @brief Solver choice split from the options that go to the solve call.
 */
struct ResolvedSolver {
    std::string algorithm;
    SolverOptions options;
};

/**
 * @brief Split a configuration into the algorithm name and the forwarded options.
 *
 * An unset or empty `solver` selects DEFAULT_SOLVER_ALGORITHM. The options
 * are copied unchanged and `config` is left untouched. Algorithm names are
 * not validated here; see SolverFactory::create.
 */
ResolvedSolver resolveSolver(const SolverConfig& config);

} // namespace dynsys

#endif // SOLVER_CONFIG_HPP
