#ifndef GSL_INTEGRATOR_HPP
#define GSL_INTEGRATOR_HPP

#include "solvers/SteppingIntegrator.hpp"
#include "solvers/GslOdeSystem.hpp"
#include <memory>

namespace dynsys {

/**
 * @class GslIntegrator
 * @brief Stepping handle backed by a GSL odeiv2 stepper; one evolve_apply call per step.
 */
class GslIntegrator : public SteppingIntegrator {
public:
    GslIntegrator(const OdeProblem& problem,
                  const SolverOptions& options,
                  std::string algorithm_name,
                  const gsl_odeiv2_step_type* step_type);

protected:
    void performStep(double t_limit) override;

private:
    std::unique_ptr<GslOdeSystem> system_;
};

} // namespace dynsys

#endif // GSL_INTEGRATOR_HPP
