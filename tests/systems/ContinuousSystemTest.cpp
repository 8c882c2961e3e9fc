#include "gtest/gtest.h"
#include "systems/ContinuousSystem.hpp"
#include "systems/OdeProblem.hpp"
#include "exceptions/Exceptions.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <vector>

using namespace dynsys;

// Test fixture for ContinuousSystem tests
class ContinuousSystemTest : public ::testing::Test {
protected:
    // Damped oscillator x'' = -x - 0.1 x'
    ContinuousSystem::VectorField oscillator = [](state_type& du, const state_type& u) {
        du[0] = u[1];
        du[1] = -u[0] - 0.1 * u[1];
    };
    ContinuousSystem::JacobianFunction oscillatorJacobian = [](const state_type&) {
        Eigen::MatrixXd J(2, 2);
        J << 0.0, 1.0,
             -1.0, -0.1;
        return J;
    };
    state_type u0 = {1.0, 0.0};
};

TEST_F(ContinuousSystemTest, ConstructionWithoutJacobian) {
    ContinuousSystem system(u0, oscillator, "oscillator");
    EXPECT_EQ(system.getDimension(), 2u);
    EXPECT_EQ(system.getState(), u0);
    EXPECT_EQ(system.getName(), "oscillator");
    EXPECT_FALSE(system.hasJacobian());
    EXPECT_FALSE(system.getJacobianFunction().has_value());
}

TEST_F(ContinuousSystemTest, ConstructionWithJacobian) {
    ContinuousSystem system(u0, oscillator, oscillatorJacobian);
    EXPECT_TRUE(system.hasJacobian());
    EXPECT_EQ(system.getName(), "");

    Eigen::MatrixXd J = system.jacobian();
    ASSERT_EQ(J.rows(), 2);
    ASSERT_EQ(J.cols(), 2);
    EXPECT_DOUBLE_EQ(J(1, 0), -1.0);
    EXPECT_DOUBLE_EQ(J(1, 1), -0.1);
}

TEST_F(ContinuousSystemTest, ConstructionFailures) {
    EXPECT_THROW(ContinuousSystem(state_type{}, oscillator), SystemConstructionException);
    EXPECT_THROW(ContinuousSystem(u0, ContinuousSystem::VectorField{}), SystemConstructionException);
    EXPECT_THROW(ContinuousSystem(u0, oscillator, ContinuousSystem::JacobianFunction{}), SystemConstructionException);
}

TEST_F(ContinuousSystemTest, SetStateKeepsDimension) {
    ContinuousSystem system(u0, oscillator);
    system.setState({0.5, -0.5});
    EXPECT_EQ(system.getState(), (state_type{0.5, -0.5}));

    EXPECT_THROW(system.setState({1.0}), InvalidParameterException);
    EXPECT_THROW(system.setState({1.0, 2.0, 3.0}), InvalidParameterException);
    EXPECT_EQ(system.getDimension(), 2u);
    EXPECT_EQ(system.getState(), (state_type{0.5, -0.5}));
}

TEST_F(ContinuousSystemTest, ComputeDerivatives) {
    ContinuousSystem system(u0, oscillator);
    state_type du;
    system.computeDerivatives({1.0, 2.0}, du);
    ASSERT_EQ(du.size(), 2u);
    EXPECT_DOUBLE_EQ(du[0], 2.0);
    EXPECT_DOUBLE_EQ(du[1], -1.2);

    EXPECT_THROW(system.computeDerivatives({1.0}, du), InvalidParameterException);
}

TEST_F(ContinuousSystemTest, JacobianFailures) {
    ContinuousSystem without(u0, oscillator);
    EXPECT_THROW(without.jacobian(), SystemException);

    ContinuousSystem wrongShape(u0, oscillator, [](const state_type&) {
        return Eigen::MatrixXd::Zero(3, 2).eval();
    });
    EXPECT_THROW(wrongShape.jacobian(), SystemException);
}

TEST_F(ContinuousSystemTest, BuildProblemSnapshotsState) {
    ContinuousSystem system(u0, oscillator, oscillatorJacobian);
    OdeProblem problem = buildProblem(system, 5.0);

    EXPECT_DOUBLE_EQ(problem.getStartTime(), 0.0);
    EXPECT_DOUBLE_EQ(problem.getEndTime(), 5.0);
    EXPECT_EQ(problem.getInitialState(), u0);
    EXPECT_EQ(problem.getDimension(), 2u);
    EXPECT_TRUE(problem.hasJacobian());

    // Later changes to the system do not leak into the problem.
    system.setState({3.0, 3.0});
    EXPECT_EQ(problem.getInitialState(), u0);
    EXPECT_EQ(system.getState(), (state_type{3.0, 3.0}));
}

TEST_F(ContinuousSystemTest, BuildProblemWrapsVectorField) {
    ContinuousSystem system(u0, oscillator);
    OdeProblem problem = buildProblem(system, 1.0);
    EXPECT_FALSE(problem.hasJacobian());

    state_type dxdt(2);
    problem.getRhs()({1.0, 2.0}, dxdt, 123.0);
    EXPECT_DOUBLE_EQ(dxdt[0], 2.0);
    EXPECT_DOUBLE_EQ(dxdt[1], -1.2);
}

TEST_F(ContinuousSystemTest, BuildProblemAcceptsNegativeTime) {
    ContinuousSystem system(u0, oscillator);
    OdeProblem problem = buildProblem(system, -2.0);
    EXPECT_DOUBLE_EQ(problem.getEndTime(), -2.0);
}

TEST_F(ContinuousSystemTest, OdeProblemValidation) {
    auto rhs = [](const state_type& x, state_type& dxdt, double) { dxdt = x; };
    EXPECT_THROW(OdeProblem(state_type{}, rhs, std::nullopt, 0.0, 1.0), InvalidParameterException);
    EXPECT_THROW(OdeProblem(u0, OdeProblem::RhsFunction{}, std::nullopt, 0.0, 1.0), InvalidParameterException);
    EXPECT_THROW(OdeProblem(u0, rhs, std::nullopt, 0.0, std::numeric_limits<double>::infinity()),
                 InvalidParameterException);
    EXPECT_THROW(OdeProblem(u0, rhs, std::nullopt, std::nan(""), 1.0), InvalidParameterException);
}
