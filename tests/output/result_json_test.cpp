#include <gtest/gtest.h>

#include "CircuitErrors.hpp"
#include "Resistor.hpp"
#include "ResultJson.hpp"
#include "VoltageSource.hpp"

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

/*
 * result_json_test.cpp
 *
 * Tests for the JSON success and error payloads.
 */

using json = nlohmann::json;
using Elements = std::vector<std::shared_ptr<CircuitElement>>;

TEST(ResultJson, SuccessPayload)
{
  Elements elements = {
      std::make_shared<VoltageSource>("V1", "n1", "0", 12.0),
      std::make_shared<Resistor>("R1", "n1", "n2", 1000.0),
      std::make_shared<Resistor>("R2", "n2", "0", 2000.0)};
  CircuitSolution solution = solveCircuit(elements);
  json out = toJson(solution);

  EXPECT_EQ(out["status"], "success");
  EXPECT_EQ(out["voltages"]["0"].get<double>(), 0.0);
  EXPECT_NEAR(out["voltages"]["n2"].get<double>(), 8.0, 1e-9);

  ASSERT_EQ(out["components"].size(), 3u);
  const json &r1 = out["components"][1];
  EXPECT_EQ(r1["name"], "R1");
  EXPECT_EQ(r1["type"], "Resistor");
  EXPECT_EQ(r1["unit"], "ohm");
  EXPECT_EQ(r1["node1"], "n1");
  EXPECT_EQ(r1["node2"], "n2");
  EXPECT_NEAR(r1["current"].get<double>(), 0.004, 1e-12);
  EXPECT_TRUE(r1.contains("description"));

  const json &matrix = out["matrix_solution"];
  EXPECT_EQ(matrix["matrix_equation"], "[G][V] = [I]");
  EXPECT_EQ(matrix["unknowns"], json::array({"V(n2)"}));
  ASSERT_EQ(matrix["conductance_matrix"].size(), 1u);
  EXPECT_NEAR(matrix["conductance_matrix"][0][0].get<double>(), 1.5e-3, 1e-15);
  EXPECT_NEAR(matrix["current_vector"][0].get<double>(), 0.012, 1e-15);
  EXPECT_NEAR(matrix["voltage_solution"][0].get<double>(), 8.0, 1e-9);
  EXPECT_TRUE(matrix["verification"]["verified"].get<bool>());

  ASSERT_EQ(matrix["steps"].size(), 1u);
  const json &step = matrix["steps"][0];
  EXPECT_EQ(step["type"], "kcl");
  EXPECT_EQ(step["stepNumber"], 1);
  EXPECT_EQ(step["title"], "Step 1: KCL at Node n2");
  EXPECT_TRUE(step.contains("keyPoint"));

  EXPECT_EQ(out["summary"]["total_components"], 3);
  EXPECT_EQ(out["summary"]["solved_nodes"], 3);
  EXPECT_TRUE(out["summary"]["power_balance"].get<bool>());

  const json &analysis = out["analysis"];
  EXPECT_EQ(analysis["reference_node"], "0");
  EXPECT_EQ(analysis["known_nodes"], json::array({"n1"}));
  EXPECT_EQ(analysis["component_counts"]["resistors"], 2);
  EXPECT_EQ(analysis["component_counts"]["total"], 3);
  EXPECT_TRUE(analysis["conventions"].contains("VoltageSource"));
  EXPECT_TRUE(analysis["conventions"].contains("Resistor"));
  EXPECT_FALSE(analysis["conventions"].contains("Voltage Source"));
}

TEST(ResultJson, ErrorPayload)
{
  UnderconstrainedCircuitError error("no path", {"n1", "n2"});
  json out = errorToJson(error);

  EXPECT_EQ(out["status"], "error");
  EXPECT_EQ(out["kind"], "UnderconstrainedCircuitError");
  EXPECT_EQ(out["message"], "no path");
  EXPECT_FALSE(out["suggestion"].get<std::string>().empty());
  EXPECT_EQ(out["nodes"], json::array({"n1", "n2"}));

  json validation = errorToJson(ValidationError("Circuit has no components"));
  EXPECT_EQ(validation["kind"], "ValidationError");
  EXPECT_EQ(validation["suggestion"],
            "Check circuit connectivity and component values");
  EXPECT_FALSE(validation.contains("nodes"));
}
