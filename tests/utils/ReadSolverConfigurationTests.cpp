#include "utils/ReadSolverConfiguration.hpp"
#include "solvers/SolverConfig.hpp"
#include "exceptions/Exceptions.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace dynsys;

// Test fixture writing settings files into a scratch directory
class ReadSolverConfigurationTest : public ::testing::Test {
protected:
    std::string baseTestDir = "temp_solver_config_test_dir";

    void SetUp() override {
        fs::remove_all(baseTestDir);
        fs::create_directories(baseTestDir);
    }

    void TearDown() override {
        fs::remove_all(baseTestDir);
    }

    std::string writeFile(const std::string& name, const std::string& contents) {
        std::string path = (fs::path(baseTestDir) / name).string();
        std::ofstream file(path);
        file << contents;
        return path;
    }

    void expectFormatError(const std::string& contents, const std::string& fragment) {
        std::string path = writeFile("bad.txt", contents);
        EXPECT_THROW({
            try {
                readSolverConfiguration(path);
            } catch (const DataFormatException& e) {
                EXPECT_NE(std::string(e.what()).find(fragment), std::string::npos) << e.what();
                throw;
            }
        }, DataFormatException);
    }
};

TEST_F(ReadSolverConfigurationTest, ValidFile) {
    std::string path = writeFile("settings.txt",
        "# Solver settings\n"
        "solver rk8pd\n"
        "abstol 1e-10   # tight\n"
        "reltol 1e-9\n"
        "\n"
        "dt 0.01\n"
        "dtmax 0.5\n"
        "saveat 0.5 1.0 1.5\n"
        "tstops 0.25\n"
        "save_everystep false\n"
        "save_first 0\n"
        "maxiters 5000\n");

    SolverConfig config = readSolverConfiguration(path);
    ASSERT_TRUE(config.solver.has_value());
    EXPECT_EQ(*config.solver, "rk8pd");
    EXPECT_DOUBLE_EQ(config.options.getAbsTol(), 1e-10);
    EXPECT_DOUBLE_EQ(config.options.getRelTol(), 1e-9);
    ASSERT_TRUE(config.options.dt.has_value());
    EXPECT_DOUBLE_EQ(*config.options.dt, 0.01);
    ASSERT_TRUE(config.options.dtmax.has_value());
    EXPECT_DOUBLE_EQ(*config.options.dtmax, 0.5);
    EXPECT_EQ(config.options.saveat, (std::vector<double>{0.5, 1.0, 1.5}));
    EXPECT_EQ(config.options.tstops, (std::vector<double>{0.25}));
    EXPECT_FALSE(config.options.save_everystep);
    EXPECT_FALSE(config.options.save_first);
    EXPECT_EQ(config.options.getMaxIters(), 5000u);
}

TEST_F(ReadSolverConfigurationTest, EmptyFileKeepsDefaults) {
    std::string path = writeFile("empty.txt", "# nothing here\n\n");
    SolverConfig config = readSolverConfiguration(path);
    EXPECT_FALSE(config.solver.has_value());
    EXPECT_FALSE(config.options.abstol.has_value());
    EXPECT_TRUE(config.options.save_first);
    EXPECT_EQ(resolveSolver(config).algorithm, DEFAULT_SOLVER_ALGORITHM);
}

TEST_F(ReadSolverConfigurationTest, WhitespaceAndRepeatedKeys) {
    std::string path = writeFile("whitespace.txt",
        "   abstol    1e-6   # Comment with spaces   \n"
        "\tabstol\t1e-7\t#\tComment with tabs\t\n"
        "save_everystep\ttrue\r\n");
    SolverConfig config = readSolverConfiguration(path);
    EXPECT_DOUBLE_EQ(config.options.getAbsTol(), 1e-7);
    EXPECT_TRUE(config.options.save_everystep);
}

TEST_F(ReadSolverConfigurationTest, UnknownKeysAreIgnored) {
    std::string path = writeFile("unknown.txt", "solver dopri5\nstiffness_detection on\n");
    SolverConfig config;
    ASSERT_NO_THROW(config = readSolverConfiguration(path));
    EXPECT_EQ(*config.solver, "dopri5");
}

TEST_F(ReadSolverConfigurationTest, FileOpenError) {
    EXPECT_THROW(readSolverConfiguration((fs::path(baseTestDir) / "does_not_exist.txt").string()),
                 FileIOException);
}

TEST_F(ReadSolverConfigurationTest, InvalidNumber) {
    expectFormatError("abstol not_a_number\n", "Invalid numeric value");
    expectFormatError("saveat 0.5 x 1.0\n", "Invalid numeric value");
    expectFormatError("dt 0.1abc\n", "Invalid numeric value");
}

TEST_F(ReadSolverConfigurationTest, NonPositiveValues) {
    expectFormatError("reltol -1e-6\n", "must be positive");
    expectFormatError("dtmax 0\n", "must be positive");
    expectFormatError("maxiters 0\n", "must be positive");
}

TEST_F(ReadSolverConfigurationTest, MissingAndExtraValues) {
    expectFormatError("abstol\n", "Missing value");
    expectFormatError("tstops\n", "Missing value");
    expectFormatError("abstol 1e-6 1e-7\n", "Too many values provided");
    expectFormatError("solver dopri5 rk4\n", "Too many values provided");
}

TEST_F(ReadSolverConfigurationTest, InvalidBooleanAndInteger) {
    expectFormatError("save_first yes\n", "Invalid boolean value");
    expectFormatError("maxiters 1.5\n", "Invalid integer value");
    expectFormatError("maxiters -3\n", "Invalid integer value");
}
