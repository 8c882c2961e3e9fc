#include "gtest/gtest.h"
#include "systems/TrajectoryProcessor.hpp"
#include "systems/Trajectory.hpp"
#include "exceptions/Exceptions.hpp"
#include <Eigen/Dense>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace dynsys;
namespace fs = std::filesystem;

// Test fixture for TrajectoryProcessor tests
class TrajectoryProcessorTest : public ::testing::Test {
protected:
    Trajectory trajectory;
    std::string csvFile = "temp_trajectory_test.csv";

    void SetUp() override {
        trajectory.time_points = {0.0, 0.5, 1.0};
        trajectory.solution = {
            {1.0, 10.0},
            {2.0, 20.0},
            {3.0, 30.0}
        };
    }

    void TearDown() override {
        fs::remove(csvFile);
    }

    std::vector<std::string> readLines(const std::string& filename) {
        std::ifstream file(filename);
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(file, line)) {
            lines.push_back(line);
        }
        return lines;
    }
};

TEST_F(TrajectoryProcessorTest, TrajectoryValidity) {
    EXPECT_TRUE(trajectory.isValid());
    EXPECT_EQ(trajectory.size(), 3u);
    EXPECT_EQ(trajectory.dimension(), 2u);

    Trajectory empty;
    EXPECT_FALSE(empty.isValid());
    EXPECT_EQ(empty.dimension(), 0u);

    Trajectory mismatched({0.0, 1.0}, {{1.0}});
    EXPECT_FALSE(mismatched.isValid());

    Trajectory ragged({0.0, 1.0}, {{1.0, 2.0}, {1.0}});
    EXPECT_FALSE(ragged.isValid());
}

TEST_F(TrajectoryProcessorTest, RowAccess) {
    EXPECT_EQ(trajectory.row(1), (state_type{2.0, 20.0}));
    EXPECT_THROW(trajectory.row(3), OutOfRangeException);
}

TEST_F(TrajectoryProcessorTest, ToMatrix) {
    Eigen::MatrixXd matrix = TrajectoryProcessor::toMatrix(trajectory);
    ASSERT_EQ(matrix.rows(), 3);
    ASSERT_EQ(matrix.cols(), 2);
    EXPECT_DOUBLE_EQ(matrix(0, 0), 1.0);
    EXPECT_DOUBLE_EQ(matrix(2, 1), 30.0);
    EXPECT_DOUBLE_EQ(matrix(1, 1), 20.0);
}

TEST_F(TrajectoryProcessorTest, GetComponent) {
    Eigen::VectorXd second = TrajectoryProcessor::getComponent(trajectory, 1);
    ASSERT_EQ(second.size(), 3);
    EXPECT_DOUBLE_EQ(second(0), 10.0);
    EXPECT_DOUBLE_EQ(second(2), 30.0);

    EXPECT_THROW(TrajectoryProcessor::getComponent(trajectory, 2), InvalidParameterException);
}

TEST_F(TrajectoryProcessorTest, GetTimes) {
    Eigen::VectorXd times = TrajectoryProcessor::getTimes(trajectory);
    ASSERT_EQ(times.size(), 3);
    EXPECT_DOUBLE_EQ(times(1), 0.5);
}

TEST_F(TrajectoryProcessorTest, InvalidTrajectoryThrows) {
    Trajectory empty;
    EXPECT_THROW(TrajectoryProcessor::toMatrix(empty), InvalidResultException);
    EXPECT_THROW(TrajectoryProcessor::getComponent(empty, 0), InvalidResultException);
    EXPECT_THROW(TrajectoryProcessor::saveToCSV(empty, {}, csvFile), InvalidResultException);
    EXPECT_FALSE(fs::exists(csvFile));
}

TEST_F(TrajectoryProcessorTest, SaveToCSVWithNames) {
    TrajectoryProcessor::saveToCSV(trajectory, {"x", "y"}, csvFile);

    std::vector<std::string> lines = readLines(csvFile);
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "Time,x,y");
    EXPECT_EQ(lines[1], "0,1,10");
    EXPECT_EQ(lines[2], "0.5,2,20");
    EXPECT_EQ(lines[3], "1,3,30");
}

TEST_F(TrajectoryProcessorTest, SaveToCSVGenericHeaders) {
    TrajectoryProcessor::saveToCSV(trajectory, {"only_one"}, csvFile);

    std::vector<std::string> lines = readLines(csvFile);
    ASSERT_FALSE(lines.empty());
    EXPECT_EQ(lines[0], "Time,x0,x1");
}

TEST_F(TrajectoryProcessorTest, SaveToCSVUnwritablePath) {
    EXPECT_THROW(TrajectoryProcessor::saveToCSV(trajectory, {"x", "y"}, "no_such_dir/sub/out.csv"),
                 FileIOException);
}
