#include "gtest/gtest.h"
#include "solvers/SolverFactory.hpp"
#include "solvers/interfaces/IOdeIntegrator.hpp"
#include "systems/OdeProblem.hpp"
#include "exceptions/Exceptions.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <memory>
#include <string>

using namespace dynsys;

// Test fixture for the stepping handles of all backends
class SteppingIntegratorTest : public ::testing::TestWithParam<std::string> {
protected:
    OdeProblem decay(double t1) const {
        return OdeProblem({1.0},
                          [](const state_type& x, state_type& dxdt, double) { dxdt[0] = -x[0]; },
                          [](const state_type&, double) {
                              Eigen::MatrixXd J(1, 1);
                              J(0, 0) = -1.0;
                              return J;
                          },
                          0.0, t1);
    }

    std::unique_ptr<IOdeIntegrator> init(const OdeProblem& problem, const SolverOptions& options = {}) const {
        return SolverFactory::create(GetParam())->init(problem, options);
    }
};

TEST_P(SteppingIntegratorTest, StepsReachEndTimeExactly) {
    auto integrator = init(decay(1.0));
    EXPECT_EQ(integrator->getAlgorithmName(), GetParam());
    ASSERT_EQ(integrator->getSavedSolution().size(), 1u);

    double previous = integrator->getTime();
    while (!integrator->isFinished()) {
        integrator->step();
        EXPECT_GT(integrator->getTime(), previous);
        EXPECT_LE(integrator->getTime(), 1.0);
        previous = integrator->getTime();
    }
    EXPECT_EQ(integrator->getTime(), 1.0);
    EXPECT_NEAR(integrator->getState()[0], std::exp(-1.0), 1e-5);
    EXPECT_GT(integrator->getStepCount(), 0u);

    const OdeSolution& saved = integrator->getSavedSolution();
    ASSERT_EQ(saved.size(), 2u);
    EXPECT_EQ(saved.t[1], 1.0);
}

TEST_P(SteppingIntegratorTest, StepAfterFinishThrows) {
    auto integrator = init(decay(0.5));
    integrator->solveToEnd();
    EXPECT_TRUE(integrator->isFinished());
    EXPECT_THROW(integrator->step(), InvalidParameterException);
}

TEST_P(SteppingIntegratorTest, StepsLandOnStopTimes) {
    SolverOptions options;
    options.tstops = {0.3};
    options.saveat = {0.7};
    auto integrator = init(decay(1.0), options);

    bool hit_tstop = false;
    bool hit_saveat = false;
    while (!integrator->isFinished()) {
        integrator->step();
        hit_tstop = hit_tstop || integrator->getTime() == 0.3;
        hit_saveat = hit_saveat || integrator->getTime() == 0.7;
    }
    EXPECT_TRUE(hit_tstop);
    EXPECT_TRUE(hit_saveat);

    const OdeSolution& saved = integrator->getSavedSolution();
    ASSERT_EQ(saved.size(), 1u);
    EXPECT_EQ(saved.t[0], 0.7);
    EXPECT_NEAR(saved.u[0][0], std::exp(-0.7), 1e-5);
}

TEST_P(SteppingIntegratorTest, AdvanceTo) {
    auto integrator = init(decay(2.0));
    integrator->advanceTo(0.8);
    EXPECT_EQ(integrator->getTime(), 0.8);
    EXPECT_NEAR(integrator->getState()[0], std::exp(-0.8), 1e-5);
    EXPECT_FALSE(integrator->isFinished());

    integrator->advanceTo(0.8);
    EXPECT_EQ(integrator->getTime(), 0.8);

    integrator->advanceTo(2.0);
    EXPECT_TRUE(integrator->isFinished());
    EXPECT_NEAR(integrator->getState()[0], std::exp(-2.0), 1e-5);
}

TEST_P(SteppingIntegratorTest, AdvanceToOutsideSpanThrows) {
    auto integrator = init(decay(1.0));
    integrator->advanceTo(0.5);
    EXPECT_THROW(integrator->advanceTo(0.25), InvalidParameterException);
    EXPECT_THROW(integrator->advanceTo(1.5), InvalidParameterException);
    EXPECT_EQ(integrator->getTime(), 0.5);
}

TEST_P(SteppingIntegratorTest, BackwardIntegration) {
    auto integrator = init(decay(-1.0));
    integrator->solveToEnd();
    EXPECT_EQ(integrator->getTime(), -1.0);
    EXPECT_NEAR(integrator->getState()[0], std::exp(1.0), 1e-4);
}

TEST_P(SteppingIntegratorTest, MaxItersExceededThrows) {
    SolverOptions options;
    options.maxiters = 3;
    options.dt = 1e-3;
    options.dtmax = 1e-3;
    auto integrator = init(decay(1.0), options);
    EXPECT_THROW(integrator->solveToEnd(), SolverException);
}

INSTANTIATE_TEST_SUITE_P(AllAlgorithms, SteppingIntegratorTest,
                         ::testing::Values("dopri5", "cash_karp54", "fehlberg78", "rk4",
                                           "rkf45", "rk8pd", "msbdf", "bsimp"));

TEST(FixedStepIntegratorTest, RungeKutta4UsesConfiguredStep) {
    OdeProblem problem({1.0}, [](const state_type& x, state_type& dxdt, double) { dxdt[0] = -x[0]; },
                       std::nullopt, 0.0, 1.0);
    SolverOptions options;
    options.dt = 0.1;
    auto integrator = SolverFactory::create("rk4")->init(problem, options);
    integrator->step();
    EXPECT_DOUBLE_EQ(integrator->getTime(), 0.1);
    integrator->solveToEnd();
    EXPECT_EQ(integrator->getTime(), 1.0);
    EXPECT_GE(integrator->getStepCount(), 10u);
    EXPECT_LE(integrator->getStepCount(), 11u);
}
