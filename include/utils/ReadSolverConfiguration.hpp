#ifndef READ_SOLVER_CONFIGURATION_HPP
#define READ_SOLVER_CONFIGURATION_HPP

#include "solvers/SolverConfig.hpp"
#include <string>

namespace dynsys {

/**
 * @brief Reads solver settings from a text file.
 *
 * Each non-empty line in the file should contain:
 * <setting_name> <value...>
 * Everything after a '#' is ignored.
 *
 * Recognized settings: `solver` (algorithm name), `abstol`, `reltol`, `dt`,
 * `dtmax` (positive numbers), `saveat`, `tstops` (one or more numbers),
 * `save_everystep`, `save_first` (true/false/1/0) and `maxiters` (positive
 * integer). Unknown settings are logged as warnings and skipped. A setting
 * given twice keeps the last value.
 *
 * @param filename Path to the solver settings file.
 * @return SolverConfig The configuration; settings absent from the file keep their defaults.
 *
 * @throws FileIOException If the file cannot be opened.
 * @throws DataFormatException If a value is missing, malformed, out of range, or followed by extra values.
 */
SolverConfig readSolverConfiguration(const std::string& filename);

} // namespace dynsys

#endif // READ_SOLVER_CONFIGURATION_HPP
