#ifndef SOLVER_FACTORY_HPP
#define SOLVER_FACTORY_HPP

#include "solvers/interfaces/IOdeSolverStrategy.hpp"
#include <memory>
#include <string>
#include <vector>

namespace dynsys {
    /**
     * @class SolverFactory
     * @brief Creates solver strategies by algorithm name.
     *
     * Boost.Odeint: "dopri5", "cash_karp54", "fehlberg78", "rk4".
     * GSL odeiv2: "rkf45", "rk8pd", "msbdf", "bsimp".
     */
    class SolverFactory {
        public:
            SolverFactory() = delete;

            /**
             * @brief Create the strategy registered under `name` (case-insensitive).
             * @throws SolverException If no algorithm has that name.
             */
            static std::shared_ptr<IOdeSolverStrategy> create(const std::string& name);

            /** @brief Registered algorithm names. */
            static std::vector<std::string> availableSolvers();

            static bool isAvailable(const std::string& name);
    };
} // namespace dynsys

#endif // SOLVER_FACTORY_HPP
