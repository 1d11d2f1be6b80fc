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
 * @file ResultMapper.cpp
 * @brief Implementation of the result mapper declared in ResultMapper.hpp.
 */

#include "ResultMapper.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

static bool isVoltageSource(const Branch &branch)
{
    return branch.element->getGroup() == Group::G2;
}

// Solves the currents of one connected group of voltage sources from KCL at
// the group's nodes. `currents` already holds every Group::G1 current.
static void solveSourceGroup(const Circuit &circuit,
                             const std::vector<int> &members,
                             const std::vector<int> &sources,
                             std::vector<double> &currents)
{
    const int rows = static_cast<int>(members.size());
    const int cols = static_cast<int>(sources.size());

    Eigen::MatrixXd incidence = Eigen::MatrixXd::Zero(rows, cols);
    Eigen::VectorXd leaving = Eigen::VectorXd::Zero(rows);

    for (int r = 0; r < rows; ++r) {
        for (const auto &edge : circuit.nodes[members[r]].edges) {
            const Branch &branch = circuit.branches[edge.element];
            double out = edge.fromNodeA ? 1.0 : -1.0;
            if (isVoltageSource(branch)) {
                auto it = std::find(sources.begin(), sources.end(),
                                    edge.element);
                incidence(r, it - sources.begin()) += out;
            } else {
                leaving(r) += out * currents[edge.element];
            }
        }
    }

    // incidence * i_source + leaving = 0 at every member node
    Eigen::CompleteOrthogonalDecomposition<Eigen::MatrixXd> cod(incidence);
    Eigen::VectorXd sourceCurrents = cod.solve(-leaving);

    if (cod.rank() < cols) {
        std::ostringstream names;
        for (int c = 0; c < cols; ++c) {
            if (c) names << ", ";
            names << circuit.branches[sources[c]].element->getName();
        }
        std::cerr << "Warning: Voltage sources " << names.str()
                  << " form a loop; their currents are not unique and are "
                     "split with the minimum-norm solution"
                  << std::endl;
    }

    for (int c = 0; c < cols; ++c) currents[sources[c]] = sourceCurrents(c);
}

std::vector<ComponentResult> mapComponents(const Circuit &circuit,
                                           const Eigen::VectorXd &nodeVoltages)
{
    const int branchCount = static_cast<int>(circuit.branches.size());
    std::vector<double> currents(branchCount, 0.0);

    for (int i = 0; i < branchCount; ++i) {
        const Branch &branch = circuit.branches[i];
        if (isVoltageSource(branch)) continue;
        currents[i] = branch.element->branchCurrent(nodeVoltages(branch.a),
                                                    nodeVoltages(branch.b));
    }

    // Voltage source groups: connected components over source branches
    std::vector<bool> grouped(circuit.nodeCount(), false);
    for (int i = 0; i < branchCount; ++i) {
        const Branch &start = circuit.branches[i];
        if (!isVoltageSource(start) || grouped[start.a]) continue;

        std::vector<bool> reached =
            circuit.reachableFrom(start.a, isVoltageSource);
        std::vector<int> members;
        for (int node = 0; node < circuit.nodeCount(); ++node) {
            if (reached[node]) {
                members.push_back(node);
                grouped[node] = true;
            }
        }
        std::vector<int> sources;
        for (int j = 0; j < branchCount; ++j) {
            const Branch &branch = circuit.branches[j];
            if (isVoltageSource(branch) && reached[branch.a])
                sources.push_back(j);
        }
        solveSourceGroup(circuit, members, sources, currents);
    }

    std::vector<ComponentResult> results;
    results.reserve(branchCount);
    for (int i = 0; i < branchCount; ++i) {
        const Branch &branch = circuit.branches[i];
        const auto &element = branch.element;

        ComponentResult result;
        result.name = element->getName();
        result.type = element->typeName();
        result.value = element->getValue();
        result.unit = element->unit();
        result.node1 = circuit.label(branch.a);
        result.node2 = circuit.label(branch.b);
        result.voltage = nodeVoltages(branch.a) - nodeVoltages(branch.b);
        result.current = currents[i];
        result.power = result.voltage * result.current;
        result.description =
            describePower(result.type, result.name, result.power);
        results.push_back(result);
    }
    return results;
}

double totalPower(const std::vector<ComponentResult> &components)
{
    double total = 0.0;
    for (const auto &component : components) total += component.power;
    return total;
}

bool powerBalances(const std::vector<ComponentResult> &components,
                   const SolverOptions &options)
{
    double total = totalPower(components);
    return std::isfinite(total) && std::fabs(total) < options.powerTolerance;
}

std::string describePower(const std::string &type, const std::string &name,
                          double power)
{
    std::string prefix = type + " " + name + ": ";
    if (std::fabs(power) <= POWER_DISPLAY_THRESHOLD) return prefix + "no power";
    if (power > 0)
        return prefix + "absorbing " + CircuitElement::formatValue(power) +
               " W";
    return prefix + "supplying " + CircuitElement::formatValue(-power) + " W";
}
