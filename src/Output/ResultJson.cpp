/*
 * Copyright (c) 2022, Shiv Nadar University, Delhi NCR, India. All Rights
 * Reserved. Permission to use, copy, modify and distribute this software for
 * educational, research, and not-for-profit purposes, without fee and without a
 * signed license agreement, is hereby granted, provided that this paragraph and
 * the following two paragraphs appear in all copies, modifications, and
 * distributions.
 *
 * IN NO EVENT SHALL SHIV NADAR UNIVERSITY BE LIABLE TO ANY PARTY FOR DIRECT,
 * INDIRECT, SPECIAL, INCIDENTAL, OR CONSEQUENTIAL DAMAGES, INCLUDING LOST
 * PROFITS, ARISING OUT OF THE USE OF THIS SOFTWARE.
 *
 * SHIV NADAR UNIVERSITY SPECIFICALLY DISCLAIMS ANY WARRANTIES, INCLUDING, BUT
 * NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE. THE SOFTWARE PROVIDED HEREUNDER IS PROVIDED "AS IS". SHIV
 * NADAR UNIVERSITY HAS NO OBLIGATION TO PROVIDE MAINTENANCE, SUPPORT, UPDATES,
 * ENHANCEMENTS, OR MODIFICATIONS.
 */

/**
 * @file ResultJson.cpp
 * @brief Implementation of the JSON result and error payloads.
 */

#include "ResultJson.hpp"

#include <sstream>

using json = nlohmann::json;

static std::string kindName(ErrorKind kind)
{
    std::ostringstream os;
    os << kind;
    return os.str();
}

json stepToJson(const DerivationStep &step)
{
    return json{{"type", stepTypeName(step.type)},
                {"stepNumber", step.stepNumber},
                {"row", step.row},
                {"title", step.title},
                {"description", step.description},
                {"equation", step.equation},
                {"explanation", step.explanation},
                {"keyPoint", step.keyPoint}};
}

static json analysisToJson(const AnalysisSummary &analysis,
                           int totalComponents)
{
    json supernodes = json::array();
    for (const auto &group : analysis.groundedSupernodes)
        supernodes.push_back(group);
    for (const auto &group : analysis.ungroundedSupernodes)
        supernodes.push_back(group);

    return json{
        {"reference_node", analysis.referenceNode},
        {"non_reference_nodes", analysis.nonReferenceNodes},
        {"regular_nodes", analysis.regularNodes},
        {"known_nodes", analysis.knownNodes},
        {"supernodes", supernodes},
        {"grounded_supernodes", analysis.groundedSupernodes},
        {"ungrounded_supernodes", analysis.ungroundedSupernodes},
        {"num_kcl_equations", analysis.numKclEquations},
        {"num_constraint_equations", analysis.numConstraintEquations},
        {"component_counts",
         {{"resistors", analysis.resistors},
          {"voltage_sources", analysis.voltageSources},
          {"current_sources", analysis.currentSources},
          {"total", totalComponents}}},
        {"conventions", analysis.conventions}};
}

json toJson(const CircuitSolution &solution)
{
    json result;
    result["status"] = "success";

    json voltages = json::object();
    for (const auto &entry : solution.voltages)
        voltages[entry.first] = entry.second;
    result["voltages"] = voltages;

    json components = json::array();
    for (const auto &component : solution.components) {
        components.push_back({{"name", component.name},
                              {"type", component.type},
                              {"value", component.value},
                              {"unit", component.unit},
                              {"node1", component.node1},
                              {"node2", component.node2},
                              {"voltage", component.voltage},
                              {"current", component.current},
                              {"power", component.power},
                              {"description", component.description}});
    }
    result["components"] = components;
    result["total_power"] = solution.totalPower;

    const LinearSystem &system = solution.system;
    const int n = system.size();
    json matrix = json::array();
    json currentVector = json::array();
    json voltageSolution = json::array();
    json unknowns = json::array();
    json residual = json::array();
    for (int i = 0; i < n; ++i) {
        json row = json::array();
        for (int j = 0; j < n; ++j) row.push_back(system.G(i, j));
        matrix.push_back(row);
        currentVector.push_back(system.I(i));
        voltageSolution.push_back(solution.linear.x(i));
        unknowns.push_back(
            "V(" + solution.circuit.label(system.columnNodes[i]) + ")");
        residual.push_back(solution.verification.residual(i));
    }

    json steps = json::array();
    for (const auto &step : solution.steps) steps.push_back(stepToJson(step));

    result["matrix_solution"] = {
        {"conductance_matrix", matrix},
        {"current_vector", currentVector},
        {"voltage_solution", voltageSolution},
        {"unknowns", unknowns},
        {"matrix_equation", "[G][V] = [I]"},
        {"solution_method", solution.linear.method},
        {"rcond", solution.linear.rcond},
        {"steps", steps},
        {"verification",
         {{"residual", residual},
          {"max_error", solution.verification.maxError},
          {"verified", solution.verification.verified}}}};

    result["summary"] = {
        {"total_components", solution.components.size()},
        {"solved_nodes", solution.voltages.size()},
        {"power_balance", solution.powerBalance}};

    result["analysis"] = analysisToJson(
        solution.analysis, static_cast<int>(solution.components.size()));
    return result;
}

json errorToJson(const CircuitError &error)
{
    json result = {{"status", "error"},
                   {"kind", kindName(error.getKind())},
                   {"message", error.what()},
                   {"suggestion", error.getSuggestion()}};
    if (!error.getNodes().empty()) result["nodes"] = error.getNodes();
    return result;
}
