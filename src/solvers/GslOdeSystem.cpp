#include "solvers/GslOdeSystem.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <gsl/gsl_errno.h>
#include <algorithm>
#include <cmath>

namespace dynsys {

    GslOdeSystem::GslOdeSystem(const OdeProblem& problem,
                               const gsl_odeiv2_step_type* step_type,
                               const SolverOptions& options,
                               double initial_step)
        : problem_(problem),
          dimension_(problem.getDimension()),
          max_step_(options.dtmax ? std::abs(*options.dtmax) : 0.0),
          driver_(nullptr),
          x_(problem.getDimension()),
          dxdt_(problem.getDimension())
    {
        // Report errors through status codes instead of aborting.
        gsl_set_error_handler_off();

        system_.function = &GslOdeSystem::rhsCallback;
        system_.jacobian = problem_.hasJacobian() ? &GslOdeSystem::jacobianCallback : nullptr;
        system_.dimension = dimension_;
        system_.params = this;

        driver_ = gsl_odeiv2_driver_alloc_y_new(&system_, step_type, initial_step,
                                                options.getAbsTol(), options.getRelTol());
        if (!driver_) {
            throw SolverException("GslOdeSystem::GslOdeSystem", "Failed to allocate GSL driver.");
        }
        if (max_step_ > 0.0) {
            gsl_odeiv2_driver_set_hmax(driver_, max_step_);
        }
        gsl_odeiv2_driver_set_nmax(driver_, static_cast<unsigned long>(options.getMaxIters()));
    }

    GslOdeSystem::~GslOdeSystem() {
        if (driver_) gsl_odeiv2_driver_free(driver_);
    }

    void GslOdeSystem::driveTo(double& t, double t1, state_type& y) {
        int status = gsl_odeiv2_driver_apply(driver_, &t, t1, y.data());
        checkStatus(status, t, "GslOdeSystem::driveTo");
    }

    void GslOdeSystem::evolveStep(double& t, double t1, double& h, state_type& y) {
        if (max_step_ > 0.0 && std::abs(h) > max_step_) {
            h = std::copysign(max_step_, h);
        }
        int status = gsl_odeiv2_evolve_apply(driver_->e, driver_->c, driver_->s, &system_, &t, t1, &h, y.data());
        checkStatus(status, t, "GslOdeSystem::evolveStep");
    }

    void GslOdeSystem::checkStatus(int status, double t, const std::string& source) {
        if (callback_error_) {
            std::exception_ptr error = callback_error_;
            callback_error_ = nullptr;
            std::rethrow_exception(error);
        }
        if (status != GSL_SUCCESS) {
            std::string msg = "GSL solver failed with code " + std::to_string(status) + " (" +
                              gsl_strerror(status) + ") at t = " + std::to_string(t) + ".";
            Logger::getInstance().error(source, msg);
            throw SolverException(source, msg);
        }
    }

    int GslOdeSystem::rhsCallback(double t, const double y[], double dydt[], void* params) {
        auto* self = static_cast<GslOdeSystem*>(params);
        try {
            std::copy(y, y + self->dimension_, self->x_.begin());
            self->problem_.getRhs()(self->x_, self->dxdt_, t);
            if (self->dxdt_.size() != self->dimension_) {
                throw SolverException("GslOdeSystem::rhsCallback", "Vector field changed the derivative size.");
            }
            std::copy(self->dxdt_.begin(), self->dxdt_.end(), dydt);
        } catch (...) {
            self->callback_error_ = std::current_exception();
            return GSL_EBADFUNC;
        }
        return GSL_SUCCESS;
    }

    int GslOdeSystem::jacobianCallback(double t, const double y[], double* dfdy, double dfdt[], void* params) {
        auto* self = static_cast<GslOdeSystem*>(params);
        try {
            const std::size_t n = self->dimension_;
            std::copy(y, y + n, self->x_.begin());
            Eigen::MatrixXd J = (*self->problem_.getJacobian())(self->x_, t);
            if (J.rows() != static_cast<Eigen::Index>(n) || J.cols() != static_cast<Eigen::Index>(n)) {
                throw SolverException("GslOdeSystem::jacobianCallback",
                                      "Jacobian must be " + std::to_string(n) + "x" + std::to_string(n) +
                                      ", got " + std::to_string(J.rows()) + "x" + std::to_string(J.cols()) + ".");
            }
            // GSL expects row-major storage; the vector field is autonomous so df/dt = 0.
            for (std::size_t i = 0; i < n; ++i) {
                for (std::size_t j = 0; j < n; ++j) {
                    dfdy[i * n + j] = J(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j));
                }
                dfdt[i] = 0.0;
            }
        } catch (...) {
            self->callback_error_ = std::current_exception();
            return GSL_EBADFUNC;
        }
        return GSL_SUCCESS;
    }

} // namespace dynsys
