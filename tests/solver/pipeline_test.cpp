#include <gtest/gtest.h>

#include "CircuitErrors.hpp"
#include "CurrentSource.hpp"
#include "Resistor.hpp"
#include "Solver.hpp"
#include "VoltageSource.hpp"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <future>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

/*
 * pipeline_test.cpp
 *
 * End-to-end tests for solveCircuit(...) and the text report helpers.
 */

using Elements = std::vector<std::shared_ptr<CircuitElement>>;

static Elements singleLoop()
{
  // VS 12 V with + at node1 and - at ground, 1 kOhm load
  return {std::make_shared<VoltageSource>("VS1", "node1", "GND", 12.0),
          std::make_shared<Resistor>("R1", "node1", "GND", 1000.0)};
}

static Elements divider()
{
  return {std::make_shared<VoltageSource>("V1", "n1", "0", 12.0),
          std::make_shared<Resistor>("R1", "n1", "n2", 1000.0),
          std::make_shared<Resistor>("R2", "n2", "0", 2000.0)};
}

TEST(Pipeline, SingleLoop)
{
  CircuitSolution solution = solveCircuit(singleLoop());

  EXPECT_EQ(solution.voltage("0"), 0.0);
  EXPECT_EQ(solution.voltage("gnd"), 0.0);
  EXPECT_NEAR(solution.voltage("node1"), 12.0, 1e-12);

  const ComponentResult &r = solution.component("R1");
  EXPECT_NEAR(r.current, 0.012, 1e-12);
  EXPECT_NEAR(r.power, 0.144, 1e-12);
  EXPECT_EQ(r.description, "Resistor R1: absorbing 0.144 W");

  const ComponentResult &vs = solution.component("VS1");
  EXPECT_EQ(vs.node1, "node1");
  EXPECT_EQ(vs.node2, "0");
  EXPECT_NEAR(vs.current, -0.012, 1e-12);
  EXPECT_NEAR(vs.power, -0.144, 1e-12);
  EXPECT_EQ(vs.description, "Voltage Source VS1: supplying 0.144 W");

  EXPECT_LT(std::fabs(solution.totalPower), 1e-9);
  EXPECT_TRUE(solution.powerBalance);
  EXPECT_TRUE(solution.verification.verified);
  EXPECT_EQ(solution.system.size(), 0);
  EXPECT_TRUE(solution.steps.empty());
}

TEST(Pipeline, Divider)
{
  CircuitSolution solution = solveCircuit(divider());

  EXPECT_NEAR(solution.voltage("n1"), 12.0, 1e-12);
  EXPECT_NEAR(solution.voltage("n2"), 8.0, 1e-9);
  EXPECT_NEAR(solution.component("R1").current, 0.004, 1e-12);
  EXPECT_NEAR(solution.component("V1").power, -0.048, 1e-12);
  EXPECT_LT(std::fabs(solution.totalPower), 1e-9);

  ASSERT_EQ(solution.steps.size(), 1u);
  EXPECT_EQ(solution.steps[0].title, "Step 1: KCL at Node n2");

  EXPECT_EQ(solution.analysis.referenceNode, "0");
  EXPECT_EQ(solution.analysis.knownNodes, (std::vector<std::string>{"n1"}));
  EXPECT_EQ(solution.analysis.regularNodes, (std::vector<std::string>{"n2"}));
  EXPECT_EQ(solution.analysis.groundedSupernodes.size(), 1u);
  EXPECT_EQ(solution.analysis.numKclEquations, 1);
  EXPECT_EQ(solution.analysis.numConstraintEquations, 0);
  EXPECT_EQ(solution.analysis.resistors, 2);
  EXPECT_EQ(solution.analysis.voltageSources, 1);
  EXPECT_EQ(solution.analysis.conventions.count("Resistor"), 1u);
  EXPECT_EQ(solution.analysis.conventions.count("VoltageSource"), 1u);
}

TEST(Pipeline, FloatingSupernodeWithResistivePath)
{
  Elements elements = {
      std::make_shared<CurrentSource>("I1", "0", "a", 1.0),
      std::make_shared<Resistor>("R1", "a", "0", 10.0),
      std::make_shared<VoltageSource>("V1", "a", "b", 5.0),
      std::make_shared<Resistor>("R2", "b", "0", 10.0)};
  CircuitSolution solution = solveCircuit(elements);

  // KCL over {a, b}: V(a)/10 + V(b)/10 = 1, V(a) - V(b) = 5
  EXPECT_NEAR(solution.voltage("a"), 7.5, 1e-9);
  EXPECT_NEAR(solution.voltage("b"), 2.5, 1e-9);
  EXPECT_NEAR(solution.component("V1").current, 0.25, 1e-9);
  EXPECT_TRUE(solution.powerBalance);
  EXPECT_EQ(solution.analysis.ungroundedSupernodes.size(), 1u);
  EXPECT_EQ(solution.analysis.numConstraintEquations, 1);

  ASSERT_EQ(solution.steps.size(), 2u);
  EXPECT_EQ(solution.steps[0].type, StepType::SupernodeKcl);
  EXPECT_EQ(solution.steps[1].type, StepType::Constraint);
}

TEST(Pipeline, FloatingSupernodeWithoutResistivePath)
{
  Elements elements = {
      std::make_shared<VoltageSource>("V1", "n1", "n2", 5.0),
      std::make_shared<Resistor>("R1", "n1", "n2", 100.0),
      std::make_shared<CurrentSource>("I1", "n2", "0", 1e-3)};
  EXPECT_THROW(solveCircuit(elements), UnderconstrainedCircuitError);
}

TEST(Pipeline, ConflictingSources)
{
  Elements elements = {
      std::make_shared<VoltageSource>("V1", "a", "0", 5.0),
      std::make_shared<VoltageSource>("V2", "a", "0", 7.0),
      std::make_shared<Resistor>("R1", "a", "0", 10.0)};
  EXPECT_THROW(solveCircuit(elements), InconsistentSourceError);
}

TEST(Pipeline, DisconnectedNode)
{
  Elements elements = divider();
  elements.push_back(std::make_shared<Resistor>("R9", "x", "y", 10.0));
  EXPECT_THROW(solveCircuit(elements), ValidationError);
}

TEST(Pipeline, MappingAgainReproducesCurrents)
{
  CircuitSolution solution = solveCircuit(divider());
  std::vector<ComponentResult> again =
      mapComponents(solution.circuit, solution.nodeVoltages);
  ASSERT_EQ(again.size(), solution.components.size());
  for (size_t i = 0; i < again.size(); ++i)
    EXPECT_DOUBLE_EQ(again[i].current, solution.components[i].current);
}

TEST(Pipeline, LookupsThrowForUnknownNames)
{
  CircuitSolution solution = solveCircuit(divider());
  EXPECT_THROW(solution.voltage("n9"), std::out_of_range);
  EXPECT_THROW(solution.component("R9"), std::out_of_range);
}

TEST(Pipeline, InputIsNotModified)
{
  Elements elements = divider();
  solveCircuit(elements);
  EXPECT_EQ(elements.size(), 3u);
  EXPECT_EQ(elements[1]->getNodeA(), "n1");
  EXPECT_DOUBLE_EQ(elements[2]->getValue(), 2000.0);
}

TEST(Pipeline, IndependentSolvesRunConcurrently)
{
  std::vector<std::future<double>> results;
  for (int i = 1; i <= 8; ++i) {
    results.push_back(std::async(std::launch::async, [i]() {
      Elements elements = {
          std::make_shared<VoltageSource>("V1", "n1", "0", 3.0 * i),
          std::make_shared<Resistor>("R1", "n1", "n2", 1000.0),
          std::make_shared<Resistor>("R2", "n2", "0", 2000.0)};
      return solveCircuit(elements).voltage("n2");
    }));
  }
  for (int i = 1; i <= 8; ++i)
    EXPECT_NEAR(results[i - 1].get(), 2.0 * i, 1e-9);
}

TEST(Pipeline, DiagnosticsSnapshot)
{
  SolverOptions options;
  options.diagVerbose = true;
  options.diagFile = testing::TempDir() + "cktnodal_diag.log";
  std::remove(options.diagFile.c_str());

  solveCircuit(divider(), options);

  std::ifstream in(options.diagFile);
  ASSERT_TRUE(in.good());
  std::stringstream content;
  content << in.rdbuf();
  EXPECT_NE(content.str().find("--- Diagnostic snapshot"), std::string::npos);
  EXPECT_NE(content.str().find("V(n2)"), std::string::npos);
  std::remove(options.diagFile.c_str());
}

TEST(Pipeline, TextReport)
{
  CircuitSolution solution = solveCircuit(divider());

  std::ostringstream voltages;
  printVoltages(solution, voltages);
  EXPECT_NE(voltages.str().find("n2\t\t8.00000"), std::string::npos);

  std::ostringstream components;
  printComponents(solution, components);
  EXPECT_NE(components.str().find("R2\t\tn2-0"), std::string::npos);
  EXPECT_NE(components.str().find("Power balance\t\tyes"), std::string::npos);

  std::ostringstream system;
  printSystem(solution.system, solution.circuit, system);
  EXPECT_NE(system.str().find("V(n2)"), std::string::npos);
}
