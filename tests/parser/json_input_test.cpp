#include <gtest/gtest.h>

#include "CircuitErrors.hpp"
#include "Parser.hpp"

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

/*
 * json_input_test.cpp
 *
 * Tests for Parser::parseJson(...) and Parser::parseJsonFile(...).
 */

using json = nlohmann::json;

TEST(JsonInput, ComponentsObject)
{
  json doc = json::parse(R"({
    "components": [
      {"type": "Voltage Source", "value": 12, "nodeA": "n1", "nodeB": "GND"},
      {"type": "resistor", "value": "1k", "nodeA": "n1", "nodeB": 0,
       "name": "RLOAD"}
    ]
  })");

  Parser parser;
  parser.parseJson(doc);

  ASSERT_EQ(parser.circuitElements.size(), 2u);
  const auto &vs = parser.circuitElements[0];
  EXPECT_EQ(vs->getName(), "V1");
  EXPECT_EQ(vs->getType(), ElementType::V);
  EXPECT_EQ(vs->getNodeA(), "n1");
  EXPECT_EQ(vs->getNodeB(), "GND");
  EXPECT_DOUBLE_EQ(vs->getValue(), 12.0);

  const auto &r = parser.circuitElements[1];
  EXPECT_EQ(r->getName(), "RLOAD");
  EXPECT_EQ(r->getNodeB(), "0");
  EXPECT_DOUBLE_EQ(r->getValue(), 1000.0);
}

TEST(JsonInput, BareArrayAndTypeAliases)
{
  json doc = json::parse(R"([
    {"type": " VS ", "value": 5, "nodeA": "a", "nodeB": "0"},
    {"type": "R", "value": 10, "nodeA": "a", "nodeB": "b"},
    {"type": "r", "value": 20, "nodeA": "b", "nodeB": "0"},
    {"type": "CurrentSource", "value": "2m", "nodeA": "0", "nodeB": "b"},
    {"type": "Current", "value": 1, "nodeA": "0", "nodeB": "b"}
  ])");

  Parser parser;
  parser.parseJson(doc);

  ASSERT_EQ(parser.circuitElements.size(), 5u);
  EXPECT_EQ(parser.circuitElements[0]->getName(), "V1");
  EXPECT_EQ(parser.circuitElements[1]->getName(), "R1");
  EXPECT_EQ(parser.circuitElements[2]->getName(), "R2");
  EXPECT_EQ(parser.circuitElements[3]->getName(), "I1");
  EXPECT_EQ(parser.circuitElements[4]->getName(), "I2");
  EXPECT_DOUBLE_EQ(parser.circuitElements[3]->getValue(), 2e-3);
  EXPECT_EQ(parser.getElementCounts().resistorCount, 2);
  EXPECT_EQ(parser.getElementCounts().currentSourceCount, 2);
}

TEST(JsonInput, MalformedComponentsNameTheIndex)
{
  Parser parser;

  EXPECT_THROW(parser.parseJson(json::object()), ValidationError);

  try {
    parser.parseJson(json::parse(R"([
      {"type": "R", "value": 10, "nodeA": "a", "nodeB": "0"},
      {"type": "Capacitor", "value": 1, "nodeA": "a", "nodeB": "0"}
    ])"));
    FAIL() << "unknown type accepted";
  } catch (const ValidationError &e) {
    EXPECT_NE(std::string(e.what()).find("Component #2"), std::string::npos);
    EXPECT_NE(std::string(e.what()).find("Capacitor"), std::string::npos);
    EXPECT_EQ(e.getKind(), ErrorKind::Validation);
  }

  EXPECT_THROW(parser.parseJson(json::parse(
                   R"([{"type": "R", "nodeA": "a", "nodeB": "0"}])")),
               ValidationError);
  EXPECT_THROW(parser.parseJson(json::parse(
                   R"([{"type": "R", "value": 1, "nodeA": "a"}])")),
               ValidationError);
  EXPECT_THROW(parser.parseJson(json::parse(
                   R"([{"type": "R", "value": true, "nodeA": "a", "nodeB": "0"}])")),
               ValidationError);
  EXPECT_THROW(parser.parseJson(json::parse(R"([42])")), ValidationError);
}

TEST(JsonInput, BadValueString)
{
  Parser parser;
  testing::internal::CaptureStderr();
  EXPECT_THROW(parser.parseJson(json::parse(
                   R"([{"type": "R", "value": "1.2.3", "nodeA": "a", "nodeB": "0"}])")),
               ValidationError);
  testing::internal::GetCapturedStderr();
}

TEST(JsonInput, FileErrors)
{
  Parser parser;
  EXPECT_THROW(parser.parseJsonFile(testing::TempDir() + "missing.json"),
               std::runtime_error);

  std::string path = testing::TempDir() + "broken.json";
  {
    std::ofstream out(path);
    out << "{ \"components\": [ ";
  }
  EXPECT_THROW(parser.parseJsonFile(path), ValidationError);
  std::remove(path.c_str());
}

TEST(JsonInput, FileRoundTrip)
{
  std::string path = testing::TempDir() + "circuit.json";
  {
    std::ofstream out(path);
    out << R"({"components": [
      {"type": "Voltage Source", "value": 12, "nodeA": "node1", "nodeB": "GND"},
      {"type": "Resistor", "value": 1000, "nodeA": "node1", "nodeB": "GND"}
    ]})";
  }
  Parser parser;
  parser.parseJsonFile(path);
  EXPECT_EQ(parser.circuitElements.size(), 2u);
  std::remove(path.c_str());
}
