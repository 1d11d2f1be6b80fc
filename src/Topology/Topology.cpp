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
 * @file Topology.cpp
 * @brief Implementation of the topology builder declared in Topology.hpp.
 *
 * Adapted from the node/edge graph construction of the netlist solver: nodes
 * are created on first sight while scanning elements, and every element adds
 * one edge to the incidence list of each terminal. Nodes live in a flat table
 * and edges store indices into it.
 */

#include "Topology.hpp"

#include <cctype>
#include <cmath>
#include <set>
#include <sstream>

#include "CircuitErrors.hpp"

bool isGroundLabel(const std::string &label)
{
    if (label == "0") return true;
    if (label.size() != 3) return false;
    std::string up = label;
    for (auto &c : up) c = (char)std::toupper((unsigned char)c);
    return up == "GND";
}

std::string normalizeNodeLabel(const std::string &label)
{
    return isGroundLabel(label) ? std::string(GROUND_LABEL) : label;
}

int Circuit::indexOf(const std::string &label) const
{
    auto it = nodeIndex.find(normalizeNodeLabel(label));
    return it == nodeIndex.end() ? -1 : it->second;
}

std::vector<bool> Circuit::reachableFrom(
    int start, const std::function<bool(const Branch &)> &follow) const
{
    std::vector<bool> visited(nodes.size(), false);
    nodes[start].traverse(nodes, visited, [&](const Edge &edge) {
        return follow(branches[edge.element]);
    });
    return visited;
}

// Creates/retrieves the node for a label and returns its canonical index.
static int internNode(Circuit &circuit, const std::string &label)
{
    auto it = circuit.nodeIndex.find(label);
    if (it != circuit.nodeIndex.end()) return it->second;

    Node node;
    node.name = label;
    node.index = circuit.nodeCount();
    circuit.nodes.push_back(node);
    circuit.nodeIndex[label] = node.index;
    return node.index;
}

static void validateElement(const std::shared_ptr<CircuitElement> &element,
                            size_t position, std::set<std::string> &names)
{
    if (!element) {
        throw ValidationError("Component #" + std::to_string(position + 1) +
                              " is missing");
    }

    const std::string &name = element->getName();
    if (name.empty()) {
        throw ValidationError("Component #" + std::to_string(position + 1) +
                              " has no name");
    }
    if (!names.insert(name).second) {
        throw ValidationError("Duplicate component name '" + name + "'");
    }

    if (element->getNodeA().empty() || element->getNodeB().empty()) {
        throw ValidationError("Component " + name + " has an empty node label");
    }

    double value = element->getValue();
    if (!std::isfinite(value)) {
        throw ValidationError("Component " + name + " has a non-finite value");
    }
    if (element->getType() == ElementType::R && value <= 0) {
        throw ValidationError("Resistor " + name +
                              " must have a positive resistance (got " +
                              CircuitElement::formatValue(value) + ")");
    }
}

Circuit buildCircuit(const std::vector<std::shared_ptr<CircuitElement>> &elements)
{
    if (elements.empty()) {
        throw ValidationError("Circuit has no components");
    }

    Circuit circuit;
    // Reserve index 0 for the reference node
    internNode(circuit, GROUND_LABEL);

    bool hasGround = false;
    std::set<std::string> names;

    for (size_t i = 0; i < elements.size(); ++i) {
        const auto &element = elements[i];
        validateElement(element, i, names);

        std::string labelA = normalizeNodeLabel(element->getNodeA());
        std::string labelB = normalizeNodeLabel(element->getNodeB());
        if (labelA == labelB) {
            throw ValidationError("Component " + element->getName() +
                                      " connects node " + labelA +
                                      " to itself",
                                  {labelA});
        }
        if (labelA == GROUND_LABEL || labelB == GROUND_LABEL) hasGround = true;

        Branch branch;
        branch.element = element;
        branch.a = internNode(circuit, labelA);
        branch.b = internNode(circuit, labelB);
        int branchIndex = static_cast<int>(circuit.branches.size());
        circuit.branches.push_back(branch);

        // Edge from nodeA to nodeB for nodeA, and the reverse for nodeB
        Edge forward;
        forward.element = branchIndex;
        forward.target = branch.b;
        forward.fromNodeA = true;
        circuit.nodes[branch.a].edges.push_back(forward);

        Edge backward;
        backward.element = branchIndex;
        backward.target = branch.a;
        backward.fromNodeA = false;
        circuit.nodes[branch.b].edges.push_back(backward);
    }

    if (!hasGround) {
        throw ValidationError(
            "Circuit must contain a ground node (label 0 or GND)");
    }

    std::vector<bool> reached =
        circuit.reachableFrom(0, [](const Branch &) { return true; });
    std::vector<std::string> disconnected;
    for (const auto &node : circuit.nodes) {
        if (!reached[node.index]) disconnected.push_back(node.name);
    }
    if (!disconnected.empty()) {
        std::ostringstream msg;
        msg << "Disconnected node(s) with no connection to ground:";
        for (const auto &label : disconnected) msg << " " << label;
        throw ValidationError(msg.str(), disconnected);
    }

    return circuit;
}
