#ifndef ODE_SOLUTION_HPP
#define ODE_SOLUTION_HPP

#include "systems/ContinuousSystem.hpp"
#include <vector>

namespace dynsys {

    /**
     * @brief Saved output of a solve: time points and the state at each of them, in solver order.
     */
    struct OdeSolution {
        std::vector<double> t;
        std::vector<state_type> u;

        bool empty() const { return u.empty(); }
        std::size_t size() const { return u.size(); }
    };

} // namespace dynsys

#endif // ODE_SOLUTION_HPP
