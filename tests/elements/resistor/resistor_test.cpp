#include <gtest/gtest.h>

#include "Resistor.hpp"
#include "Parser.hpp"

#include <string>
#include <vector>

#include <Eigen/Dense>

/*
 * resistor_test.cpp
 *
 * Unit tests for Resistor::parse(...), Resistor::stampKCL(...) and the
 * narrated KCL terms.
 *
 * These tests exercise:
 *  - successful parsing of a resistor to ground
 *  - parsing rejection when both nodes are the same
 *  - parsing rejection when the resistor value is illegal (zero, negative)
 *  - KCL stamping against an unknown, a known and the reference node
 *  - current and term formatting
 */

static NodeBinding unknownNode(const std::string &label, int column)
{
  NodeBinding b;
  b.kind = BindingKind::Unknown;
  b.column = column;
  b.label = label;
  return b;
}

static NodeBinding knownNode(const std::string &label, double value)
{
  NodeBinding b;
  b.kind = BindingKind::Known;
  b.value = value;
  b.label = label;
  return b;
}

static NodeBinding referenceNode()
{
  NodeBinding b;
  b.kind = BindingKind::Reference;
  b.label = "0";
  return b;
}

TEST(ResistorParse, ValidResistorToGround)
{
  Parser parser;
  std::vector<std::string> tokens = {"R1", "1", "0", "1K"};
  auto el = Resistor::parse(parser, tokens, /*lineNumber=*/1);
  ASSERT_NE(el, nullptr);
  EXPECT_EQ(el->getName(), "R1");
  EXPECT_EQ(el->getNodeA(), "1");
  EXPECT_EQ(el->getNodeB(), "0");
  EXPECT_DOUBLE_EQ(el->getValue(), 1000.0);
  EXPECT_EQ(el->getType(), ElementType::R);
  // Resistor current follows from the terminal voltages
  EXPECT_EQ(el->getGroup(), Group::G1);
}

TEST(ResistorParse, InvalidSameNodes)
{
  Parser parser;
  std::vector<std::string> tokens = {"RBAD", "N1", "N1", "10"};
  testing::internal::CaptureStderr();
  auto el = Resistor::parse(parser, tokens, /*lineNumber=*/2);
  std::string err = testing::internal::GetCapturedStderr();
  EXPECT_EQ(el, nullptr);
  EXPECT_NE(err.find("NodeA and NodeB cannot be the same"), std::string::npos);
  EXPECT_NE(err.find("Resistor nodes cannot be the same"), std::string::npos);
}

TEST(ResistorParse, IllegalZeroValue)
{
  Parser parser;
  std::vector<std::string> tokens = {"RZ", "N1", "N2", "0"};
  testing::internal::CaptureStderr();
  auto el = Resistor::parse(parser, tokens, /*lineNumber=*/3);
  std::string err = testing::internal::GetCapturedStderr();
  EXPECT_EQ(el, nullptr);
  EXPECT_NE(err.find("Illegal argument for resistor value"), std::string::npos);
}

TEST(ResistorParse, IllegalNegativeValue)
{
  Parser parser;
  std::vector<std::string> tokens = {"RN", "N1", "N2", "-10"};
  testing::internal::CaptureStderr();
  auto el = Resistor::parse(parser, tokens, /*lineNumber=*/4);
  std::string err = testing::internal::GetCapturedStderr();
  EXPECT_EQ(el, nullptr);
  EXPECT_NE(err.find("line 4"), std::string::npos);
}

TEST(ResistorParse, InvalidTokenCount)
{
  Parser parser;
  std::vector<std::string> tokens = {"R1", "N1", "N2"};
  testing::internal::CaptureStderr();
  auto el = Resistor::parse(parser, tokens, /*lineNumber=*/5);
  std::string err = testing::internal::GetCapturedStderr();
  EXPECT_EQ(el, nullptr);
  EXPECT_NE(err.find("Invalid resistor definition"), std::string::npos);
}

TEST(ResistorStamp, BetweenUnknownNodes)
{
  Resistor r("R2", "N1", "N2", 2.0);
  Eigen::MatrixXd G = Eigen::MatrixXd::Zero(2, 2);
  Eigen::VectorXd I = Eigen::VectorXd::Zero(2);

  NodeBinding n1 = unknownNode("N1", 0);
  NodeBinding n2 = unknownNode("N2", 1);

  // Row of N1 then row of N2
  r.stampKCL(G, I, 0, n1, n2, /*selfIsNodeA=*/true);
  r.stampKCL(G, I, 1, n2, n1, /*selfIsNodeA=*/false);

  EXPECT_DOUBLE_EQ(G(0, 0), 0.5);
  EXPECT_DOUBLE_EQ(G(0, 1), -0.5);
  EXPECT_DOUBLE_EQ(G(1, 0), -0.5);
  EXPECT_DOUBLE_EQ(G(1, 1), 0.5);
  EXPECT_DOUBLE_EQ(I(0), 0.0);
  EXPECT_DOUBLE_EQ(I(1), 0.0);
}

TEST(ResistorStamp, ToReference)
{
  Resistor r("R1", "N1", "0", 1000.0);
  Eigen::MatrixXd G = Eigen::MatrixXd::Zero(1, 1);
  Eigen::VectorXd I = Eigen::VectorXd::Zero(1);

  r.stampKCL(G, I, 0, unknownNode("N1", 0), referenceNode(), true);

  EXPECT_DOUBLE_EQ(G(0, 0), 1e-3);
  EXPECT_DOUBLE_EQ(I(0), 0.0);
}

TEST(ResistorStamp, KnownNeighbourMovesToRhs)
{
  Resistor r("R1", "N1", "N2", 1000.0);
  Eigen::MatrixXd G = Eigen::MatrixXd::Zero(1, 1);
  Eigen::VectorXd I = Eigen::VectorXd::Zero(1);

  // N2 is fixed at 12 V by a grounded source
  r.stampKCL(G, I, 0, unknownNode("N2", 0), knownNode("N1", 12.0), false);

  EXPECT_DOUBLE_EQ(G(0, 0), 1e-3);
  EXPECT_DOUBLE_EQ(I(0), 0.012);
}

TEST(ResistorTerm, Formatting)
{
  Resistor r("R1", "A", "B", 1000.0);
  EXPECT_EQ(r.kclTerm(unknownNode("A", 0), unknownNode("B", 1), true),
            "(V(A) - V(B))/1000");
  EXPECT_EQ(r.kclTerm(unknownNode("A", 0), knownNode("B", 12.0), true),
            "(V(A) - 12)/1000");
  EXPECT_EQ(r.kclTerm(unknownNode("A", 0), knownNode("B", -5.0), true),
            "(V(A) + 5)/1000");
  EXPECT_EQ(r.kclTerm(unknownNode("A", 0), referenceNode(), true),
            "V(A)/1000");
}

TEST(ResistorCurrent, FlowsFromNodeAToNodeB)
{
  Resistor r("R1", "A", "B", 1000.0);
  EXPECT_DOUBLE_EQ(r.branchCurrent(12.0, 0.0), 0.012);
  EXPECT_DOUBLE_EQ(r.branchCurrent(0.0, 12.0), -0.012);
  EXPECT_EQ(r.typeName(), "Resistor");
  EXPECT_EQ(r.unit(), "ohm");
}
