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
 * @file Supernode.cpp
 * @brief Implementation of the supernode resolver declared in Supernode.hpp.
 *
 * Two passes over the voltage source branches:
 *  1. union-find with potential offsets, to find groups and to reject loops
 *     whose sources disagree;
 *  2. a breadth-first walk of each group from its lowest-index member, to
 *     compute member potentials and the chain of sources that fixes them.
 */

#include "Supernode.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <queue>
#include <sstream>

#include "CircuitErrors.hpp"

PotentialUnionFind::PotentialUnionFind(int size)
    : parent(size), rank(size, 0), offsets(size, 0.0)
{
    for (int i = 0; i < size; ++i) parent[i] = i;
}

int PotentialUnionFind::find(int x)
{
    if (parent[x] == x) return x;
    int p = parent[x];
    int root = find(p);
    // offsets[p] is now relative to root
    offsets[x] += offsets[p];
    parent[x] = root;
    return root;
}

double PotentialUnionFind::offset(int x)
{
    find(x);
    return offsets[x];
}

bool PotentialUnionFind::unite(int a, int b, double difference,
                               double tolerance, double &existing)
{
    int rootA = find(a);
    int rootB = find(b);

    if (rootA == rootB) {
        existing = offsets[a] - offsets[b];
        double scale = std::max(
            {1.0, std::fabs(difference), std::fabs(existing)});
        return std::fabs(existing - difference) <= tolerance * scale;
    }

    // V(rootA) - V(rootB) implied by V(a) - V(b) = difference
    double rootDifference = difference - offsets[a] + offsets[b];
    if (rank[rootA] < rank[rootB]) {
        parent[rootA] = rootB;
        offsets[rootA] = rootDifference;
    } else {
        parent[rootB] = rootA;
        offsets[rootB] = -rootDifference;
        if (rank[rootA] == rank[rootB]) ++rank[rootA];
    }
    return true;
}

static bool isVoltageSource(const Branch &branch)
{
    return branch.element->getGroup() == Group::G2;
}

SupernodeMap resolveSupernodes(const Circuit &circuit,
                               const SolverOptions &options)
{
    const int n = circuit.nodeCount();
    SupernodeMap map;
    PotentialUnionFind sets(n);

    // Pass 1: merge source terminals, checking loop consistency
    std::vector<bool> touchesSource(n, false);
    for (size_t i = 0; i < circuit.branches.size(); ++i) {
        const Branch &branch = circuit.branches[i];
        if (!isVoltageSource(branch)) continue;

        touchesSource[branch.a] = true;
        touchesSource[branch.b] = true;

        bool alreadyJoined = sets.connected(branch.a, branch.b);
        double existing = 0.0;
        double value = branch.element->getValue();
        if (!sets.unite(branch.a, branch.b, value, options.sourceTolerance,
                        existing)) {
            const std::string &labelA = circuit.label(branch.a);
            const std::string &labelB = circuit.label(branch.b);
            std::ostringstream msg;
            msg << "Voltage source " << branch.element->getName()
                << " requires V(" << labelA << ") - V(" << labelB
                << ") = " << CircuitElement::formatValue(value)
                << " V but other voltage sources already fix it to "
                << CircuitElement::formatValue(existing) << " V";
            throw InconsistentSourceError(msg.str(), {labelA, labelB});
        }
        if (alreadyJoined) map.redundantSources.push_back(static_cast<int>(i));
    }

    // Groups ordered by lowest member; members come out ascending
    std::vector<int> groupOf(n, -1);
    std::map<int, int> groupOfRoot;
    for (int node = 0; node < n; ++node) {
        if (!touchesSource[node]) continue;
        int root = sets.find(node);
        auto it = groupOfRoot.find(root);
        if (it == groupOfRoot.end()) {
            it = groupOfRoot
                     .emplace(root, static_cast<int>(map.groups.size()))
                     .first;
            map.groups.emplace_back();
        }
        groupOf[node] = it->second;
        map.groups[it->second].members.push_back(node);
        if (node == 0) map.groups[it->second].grounded = true;
    }
    for (size_t i = 0; i < circuit.branches.size(); ++i) {
        const Branch &branch = circuit.branches[i];
        if (isVoltageSource(branch))
            map.groups[groupOf[branch.a]].branches.push_back(
                static_cast<int>(i));
    }

    // Pass 2: potentials relative to each group's lowest member (ground for
    // grounded groups) along a spanning tree of source branches
    std::vector<double> potential(n, 0.0);
    map.sourcePaths.assign(n, {});
    std::vector<bool> seen(n, false);
    for (const auto &group : map.groups) {
        int start = group.members.front();
        std::queue<int> pending;
        pending.push(start);
        seen[start] = true;
        while (!pending.empty()) {
            int u = pending.front();
            pending.pop();
            for (const auto &edge : circuit.nodes[u].edges) {
                const Branch &branch = circuit.branches[edge.element];
                if (!isVoltageSource(branch) || seen[edge.target]) continue;
                int v = edge.target;
                double value = branch.element->getValue();
                // V(a) - V(b) = value
                potential[v] =
                    edge.fromNodeA ? potential[u] - value : potential[u] + value;
                map.sourcePaths[v] = map.sourcePaths[u];
                map.sourcePaths[v].push_back(branch.element->getName());
                seen[v] = true;
                pending.push(v);
            }
        }
    }

    // Bindings and columns in canonical order
    map.bindings.resize(n);
    for (int node = 0; node < n; ++node) {
        NodeBinding &binding = map.bindings[node];
        binding.label = circuit.label(node);
        binding.group = groupOf[node];
        if (node == 0) {
            binding.kind = BindingKind::Reference;
            binding.value = 0.0;
        } else if (binding.group >= 0 && map.groups[binding.group].grounded) {
            binding.kind = BindingKind::Known;
            binding.value = potential[node];
        } else {
            binding.kind = BindingKind::Unknown;
            binding.column = map.columnCount++;
        }
    }

    for (int node = 1; node < n; ++node) {
        const NodeBinding &binding = map.bindings[node];
        if (binding.kind != BindingKind::Unknown) continue;
        if (binding.group < 0) {
            NodeUnknown unknown;
            unknown.node = node;
            map.unknowns.emplace_back(unknown);
            continue;
        }
        const SupernodeGroup &group = map.groups[binding.group];
        if (group.members.front() != node) continue;

        SupernodeRepresentative representative;
        representative.representative = node;
        representative.members = group.members;
        representative.group = binding.group;
        for (int member : group.members)
            representative.offsets.push_back(potential[member]);
        map.unknowns.emplace_back(representative);
    }

    for (const auto &group : map.groups) {
        if (group.grounded) continue;
        int representative = group.members.front();
        for (size_t i = 1; i < group.members.size(); ++i) {
            int member = group.members[i];
            SourceConstraint constraint;
            constraint.member = member;
            constraint.representative = representative;
            constraint.offset = potential[member];
            constraint.sources = map.sourcePaths[member];
            map.constraints.push_back(constraint);
        }
    }

    return map;
}

Eigen::VectorXd expandNodeVoltages(const SupernodeMap &supernodes,
                                   const Eigen::VectorXd &x)
{
    const int n = static_cast<int>(supernodes.bindings.size());
    Eigen::VectorXd voltages = Eigen::VectorXd::Zero(n);
    for (int node = 0; node < n; ++node) {
        const NodeBinding &binding = supernodes.bindings[node];
        if (binding.kind == BindingKind::Unknown)
            voltages(node) = x(binding.column);
        else
            voltages(node) = binding.value;
    }
    return voltages;
}
