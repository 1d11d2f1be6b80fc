#include <gtest/gtest.h>

#include "Verifier.hpp"

#include <string>

/*
 * verifier_test.cpp
 *
 * Tests for verifySolution(...).
 */

static LinearSystem diagonalSystem()
{
  LinearSystem system;
  system.G = Eigen::MatrixXd::Identity(2, 2) * 2.0;
  system.I = Eigen::VectorXd::Constant(2, 4.0);
  system.columnNodes = {1, 2};
  system.rows.resize(2);
  return system;
}

TEST(Verifier, ExactSolutionVerifies)
{
  LinearSystem system = diagonalSystem();
  Eigen::VectorXd x = Eigen::VectorXd::Constant(2, 2.0);

  testing::internal::CaptureStderr();
  Verification v = verifySolution(system, x);
  std::string err = testing::internal::GetCapturedStderr();

  EXPECT_TRUE(v.verified);
  EXPECT_DOUBLE_EQ(v.maxError, 0.0);
  ASSERT_EQ(v.residual.size(), 2);
  EXPECT_TRUE(err.empty());
}

TEST(Verifier, ResidualAboveToleranceWarns)
{
  LinearSystem system = diagonalSystem();
  Eigen::VectorXd x(2);
  x << 2.0, 2.001;

  testing::internal::CaptureStderr();
  Verification v = verifySolution(system, x);
  std::string err = testing::internal::GetCapturedStderr();

  EXPECT_FALSE(v.verified);
  EXPECT_NEAR(v.maxError, 0.002, 1e-12);
  EXPECT_NE(err.find("Warning: Solution residual"), std::string::npos);

  // A looser tolerance accepts the same vector
  SolverOptions options;
  options.residualTolerance = 1e-2;
  EXPECT_TRUE(verifySolution(system, x, options).verified);
}

TEST(Verifier, EmptySystemIsVerified)
{
  LinearSystem system;
  system.G.resize(0, 0);
  system.I.resize(0);
  Verification v = verifySolution(system, Eigen::VectorXd());
  EXPECT_TRUE(v.verified);
  EXPECT_EQ(v.residual.size(), 0);
}
