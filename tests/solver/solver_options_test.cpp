#include <gtest/gtest.h>

#include "SolverOptions.hpp"

#include <limits>
#include <stdexcept>

/*
 * solver_options_test.cpp
 *
 * Tests for SolverOptions defaults and SolverOptions::validate().
 */

TEST(SolverOptions, DefaultsAreValid)
{
  SolverOptions options;
  EXPECT_DOUBLE_EQ(options.residualTolerance, 1e-9);
  EXPECT_DOUBLE_EQ(options.powerTolerance, 1e-9);
  EXPECT_DOUBLE_EQ(options.sourceTolerance, 1e-9);
  EXPECT_DOUBLE_EQ(options.minReciprocalCondition, 1e-13);
  EXPECT_EQ(options.diagFile, "diagnostics.log");
  EXPECT_FALSE(options.diagVerbose);
  EXPECT_EQ(options.outputFormat, OutputFormat::Json);
  EXPECT_NO_THROW(options.validate());
}

TEST(SolverOptions, RejectsBadTolerances)
{
  SolverOptions options;
  options.residualTolerance = 0.0;
  EXPECT_THROW(options.validate(), std::invalid_argument);

  options = SolverOptions();
  options.powerTolerance = -1.0;
  EXPECT_THROW(options.validate(), std::invalid_argument);

  options = SolverOptions();
  options.sourceTolerance = std::numeric_limits<double>::quiet_NaN();
  EXPECT_THROW(options.validate(), std::invalid_argument);

  options = SolverOptions();
  options.minReciprocalCondition = 1.0;
  EXPECT_THROW(options.validate(), std::invalid_argument);
}

TEST(SolverOptions, VerboseDiagnosticsNeedAFile)
{
  SolverOptions options;
  options.diagVerbose = true;
  options.diagFile.clear();
  try {
    options.validate();
    FAIL() << "empty diagnostics file accepted";
  } catch (const std::invalid_argument &e) {
    EXPECT_STREQ(e.what(), "diagFile must be set when diagVerbose is enabled");
  }
}
