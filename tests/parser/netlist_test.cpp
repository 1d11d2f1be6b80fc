#include <gtest/gtest.h>

#include "Parser.hpp"
#include "Solver.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

/*
 * netlist_test.cpp
 *
 * Tests for Parser::parse(...) on small netlists written to temporary files.
 */

namespace {

std::string writeNetlist(const std::string &name, const std::string &text)
{
  std::string path = testing::TempDir() + name;
  std::ofstream out(path);
  out << text;
  return path;
}

}  // namespace

TEST(NetlistParse, DividerWithDirectiveAndComments)
{
  std::string path = writeNetlist("divider.cir",
                                  "* voltage divider\n"
                                  "V1 n1 0 12\n"
                                  "R1 n1 n2 1k ; top\n"
                                  "R2 n2 gnd 2k\n"
                                  "\n"
                                  ".op\n"
                                  ".end\n"
                                  "R3 n2 0 1k\n");
  Parser parser;
  SolverDirectiveType directive = SolverDirectiveType::NONE;
  int errors = parser.parse(path, directive);

  EXPECT_EQ(errors, 0);
  EXPECT_EQ(directive, SolverDirectiveType::OPERATING_POINT);
  ASSERT_EQ(parser.circuitElements.size(), 3u);  // R3 after .END is ignored
  EXPECT_EQ(parser.circuitElements[0]->getName(), "V1");
  EXPECT_EQ(parser.circuitElements[1]->getNodeA(), "N1");
  EXPECT_DOUBLE_EQ(parser.circuitElements[2]->getValue(), 2000.0);
  EXPECT_EQ(parser.getElementCounts().resistorCount, 2);
  EXPECT_EQ(parser.getElementCounts().voltageSourceCount, 1);

  CircuitSolution solution = solveCircuit(parser.circuitElements);
  EXPECT_NEAR(solution.voltage("N2"), 8.0, 1e-9);
  std::remove(path.c_str());
}

TEST(NetlistParse, DirectiveIsOptional)
{
  std::string path = writeNetlist("nodirective.cir", "I1 0 N1 1m\nR1 N1 0 1k\n");
  Parser parser;
  SolverDirectiveType directive = SolverDirectiveType::NONE;
  EXPECT_EQ(parser.parse(path, directive), 0);
  EXPECT_EQ(directive, SolverDirectiveType::NONE);
  EXPECT_EQ(parser.circuitElements.size(), 2u);
  std::remove(path.c_str());
}

TEST(NetlistParse, ErrorsAreCounted)
{
  std::string path = writeNetlist("broken.cir",
                                  "V1 N1 0 5\n"
                                  "R1 N1 0 0\n"   // illegal resistance
                                  "C1 N1 0 1U\n"  // unsupported element
                                  "V1 N1 0 3\n"   // duplicate name
                                  ".TRAN 1 10\n");
  Parser parser;
  SolverDirectiveType directive = SolverDirectiveType::NONE;
  testing::internal::CaptureStderr();
  int errors = parser.parse(path, directive);
  std::string err = testing::internal::GetCapturedStderr();

  EXPECT_EQ(errors, 4);
  EXPECT_NE(err.find("Illegal argument for resistor value at line 2"),
            std::string::npos);
  EXPECT_NE(err.find("Unknown element 'C1' at line 3"), std::string::npos);
  EXPECT_NE(err.find("Duplicate element name 'V1' at line 4"),
            std::string::npos);
  EXPECT_NE(err.find("Unsupported directive '.TRAN'"), std::string::npos);
  std::remove(path.c_str());
}

TEST(NetlistParse, MissingGround)
{
  std::string path = writeNetlist("floating.cir", "R1 A B 1k\nR2 B A 2k\n");
  Parser parser;
  SolverDirectiveType directive = SolverDirectiveType::NONE;
  testing::internal::CaptureStderr();
  int errors = parser.parse(path, directive);
  std::string err = testing::internal::GetCapturedStderr();

  EXPECT_EQ(errors, 1);
  EXPECT_NE(err.find("Circuit must contain ground (0)"), std::string::npos);
  std::remove(path.c_str());
}

TEST(NetlistParse, MissingFile)
{
  Parser parser;
  SolverDirectiveType directive = SolverDirectiveType::NONE;
  testing::internal::CaptureStderr();
  int errors = parser.parse(testing::TempDir() + "no_such_file.cir", directive);
  std::string err = testing::internal::GetCapturedStderr();

  EXPECT_EQ(errors, 1);
  EXPECT_NE(err.find("could not be opened"), std::string::npos);
}

TEST(NetlistParse, ElementCountSummary)
{
  std::string path = writeNetlist("counts.cir", "V1 1 0 5\nR1 1 0 10\n");
  Parser parser;
  SolverDirectiveType directive = SolverDirectiveType::NONE;
  ASSERT_EQ(parser.parse(path, directive), 0);

  std::ostringstream os;
  parser.printElementCounts(os);
  EXPECT_NE(os.str().find("Total Resistors: 1"), std::string::npos);
  EXPECT_NE(os.str().find("Total Voltage Sources: 1"), std::string::npos);
  EXPECT_NE(os.str().find("Total Current Sources: 0"), std::string::npos);
  std::remove(path.c_str());
}
