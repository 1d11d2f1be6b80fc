#include <gtest/gtest.h>

#include "CircuitErrors.hpp"
#include "CurrentSource.hpp"
#include "Resistor.hpp"
#include "Topology.hpp"
#include "VoltageSource.hpp"

#include <memory>
#include <string>
#include <vector>

/*
 * topology_test.cpp
 *
 * Tests for buildCircuit(...): canonical node numbering, incidence lists and
 * the validation failures raised before any equation is written.
 */

using Elements = std::vector<std::shared_ptr<CircuitElement>>;

TEST(Topology, CanonicalNodeOrder)
{
  Elements elements = {
      std::make_shared<VoltageSource>("V1", "n1", "GND", 12.0),
      std::make_shared<Resistor>("R1", "n1", "n2", 1000.0),
      std::make_shared<Resistor>("R2", "n2", "gnd", 2000.0)};

  Circuit circuit = buildCircuit(elements);

  ASSERT_EQ(circuit.nodeCount(), 3);
  EXPECT_EQ(circuit.label(0), "0");
  EXPECT_EQ(circuit.label(1), "n1");
  EXPECT_EQ(circuit.label(2), "n2");
  EXPECT_EQ(circuit.indexOf("GND"), 0);
  EXPECT_EQ(circuit.indexOf("n2"), 2);
  EXPECT_EQ(circuit.indexOf("n9"), -1);

  ASSERT_EQ(circuit.branches.size(), 3u);
  EXPECT_EQ(circuit.branches[0].a, 1);
  EXPECT_EQ(circuit.branches[0].b, 0);

  // n2 sees R1 (as nodeB) and R2 (as nodeA)
  const Node &n2 = circuit.nodes[2];
  ASSERT_EQ(n2.edges.size(), 2u);
  EXPECT_EQ(n2.edges[0].element, 1);
  EXPECT_FALSE(n2.edges[0].fromNodeA);
  EXPECT_EQ(n2.edges[0].target, 1);
  EXPECT_EQ(n2.edges[1].element, 2);
  EXPECT_TRUE(n2.edges[1].fromNodeA);
  EXPECT_EQ(n2.edges[1].target, 0);
}

TEST(Topology, GroundSpellings)
{
  EXPECT_TRUE(isGroundLabel("0"));
  EXPECT_TRUE(isGroundLabel("GND"));
  EXPECT_TRUE(isGroundLabel("gnd"));
  EXPECT_TRUE(isGroundLabel("Gnd"));
  EXPECT_FALSE(isGroundLabel("00"));
  EXPECT_FALSE(isGroundLabel("GROUND"));
  EXPECT_EQ(normalizeNodeLabel("gnd"), "0");
  EXPECT_EQ(normalizeNodeLabel("N1"), "N1");
}

TEST(Topology, NonAsciiNodeLabels)
{
  // Three-byte UTF-8 labels have the length of "GND" and high-bit bytes.
  const std::string euro = "\xE2\x82\xAC";
  const std::string omega = "\xCE\xA9x";
  EXPECT_FALSE(isGroundLabel(euro));
  EXPECT_FALSE(isGroundLabel(omega));
  EXPECT_EQ(normalizeNodeLabel(euro), euro);

  Elements elements = {
      std::make_shared<VoltageSource>("V1", euro, "gnd", 5.0),
      std::make_shared<Resistor>("R1", euro, omega, 1000.0),
      std::make_shared<Resistor>("R2", omega, "0", 1000.0)};
  Circuit circuit = buildCircuit(elements);

  ASSERT_EQ(circuit.nodeCount(), 3);
  EXPECT_EQ(circuit.indexOf(euro), 1);
  EXPECT_EQ(circuit.indexOf(omega), 2);
}

TEST(Topology, ReachabilityFollowsFilter)
{
  Elements elements = {
      std::make_shared<VoltageSource>("V1", "a", "0", 5.0),
      std::make_shared<Resistor>("R1", "a", "b", 10.0)};
  Circuit circuit = buildCircuit(elements);

  auto viaSources = circuit.reachableFrom(0, [](const Branch &branch) {
    return branch.element->getType() == ElementType::V;
  });
  EXPECT_TRUE(viaSources[0]);
  EXPECT_TRUE(viaSources[circuit.indexOf("a")]);
  EXPECT_FALSE(viaSources[circuit.indexOf("b")]);
}

TEST(Topology, EmptyCircuit)
{
  EXPECT_THROW(buildCircuit({}), ValidationError);
}

TEST(Topology, NoGround)
{
  Elements elements = {std::make_shared<Resistor>("R1", "a", "b", 10.0)};
  try {
    buildCircuit(elements);
    FAIL() << "circuit without ground accepted";
  } catch (const ValidationError &e) {
    EXPECT_NE(std::string(e.what()).find("ground"), std::string::npos);
  }
}

TEST(Topology, SelfConnection)
{
  Elements elements = {
      std::make_shared<Resistor>("R1", "a", "0", 10.0),
      std::make_shared<Resistor>("R2", "gnd", "0", 10.0)};
  EXPECT_THROW(buildCircuit(elements), ValidationError);
}

TEST(Topology, DuplicateNames)
{
  Elements elements = {
      std::make_shared<Resistor>("R1", "a", "0", 10.0),
      std::make_shared<Resistor>("R1", "a", "0", 20.0)};
  EXPECT_THROW(buildCircuit(elements), ValidationError);
}

TEST(Topology, NonPositiveResistance)
{
  Elements elements = {std::make_shared<Resistor>("R1", "a", "0", -1.0)};
  EXPECT_THROW(buildCircuit(elements), ValidationError);
}

TEST(Topology, NullElement)
{
  Elements elements = {std::make_shared<Resistor>("R1", "a", "0", 1.0),
                       nullptr};
  EXPECT_THROW(buildCircuit(elements), ValidationError);
}

TEST(Topology, DisconnectedNodesAreListed)
{
  Elements elements = {
      std::make_shared<Resistor>("R1", "a", "0", 10.0),
      std::make_shared<Resistor>("R2", "x", "y", 10.0),
      std::make_shared<CurrentSource>("I1", "y", "x", 1.0)};
  try {
    buildCircuit(elements);
    FAIL() << "disconnected island accepted";
  } catch (const ValidationError &e) {
    std::vector<std::string> expected = {"x", "y"};
    EXPECT_EQ(e.getNodes(), expected);
    EXPECT_NE(std::string(e.what()).find("Disconnected"), std::string::npos);
  }
}
