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
 * @file Assembler.cpp
 * @brief Implementation of the nodal equation assembler.
 *
 * Every KCL row walks the incidence lists of the node(s) it covers and lets
 * each element stamp itself. Elements with both terminals inside the same
 * supernode are skipped, since their contributions to the merged row cancel.
 */

#include "Assembler.hpp"

#include <algorithm>
#include <type_traits>
#include <variant>

// Emits the KCL row for `members` (one node, or all nodes of a supernode).
static void emitKclRow(const Circuit &circuit, const SupernodeMap &supernodes,
                       const std::vector<int> &members, int row,
                       StepType kind, LinearSystem &system,
                       StepNarrator *narrator)
{
    std::vector<std::string> terms;
    std::vector<std::string> substitutions;
    std::vector<std::string> internal;
    std::vector<int> substituted;

    for (int member : members) {
        const NodeBinding &self = supernodes.bindings[member];
        for (const auto &edge : circuit.nodes[member].edges) {
            const Branch &branch = circuit.branches[edge.element];
            const NodeBinding &other = supernodes.bindings[edge.target];

            if (self.group >= 0 && other.group == self.group) {
                const std::string &name = branch.element->getName();
                if (std::find(internal.begin(), internal.end(), name) ==
                    internal.end())
                    internal.push_back(name);
                continue;
            }

            branch.element->stampKCL(system.G, system.I, row, self, other,
                                     edge.fromNodeA);

            if (!narrator) continue;
            std::string term =
                branch.element->kclTerm(self, other, edge.fromNodeA);
            if (!term.empty()) terms.push_back(term);
            if (other.kind == BindingKind::Known &&
                std::find(substituted.begin(), substituted.end(),
                          edge.target) == substituted.end()) {
                substituted.push_back(edge.target);
                std::string text = "V(" + other.label +
                                   ") = " + CircuitElement::formatValue(
                                                other.value) +
                                   " V";
                const auto &path = supernodes.sourcePaths[edge.target];
                if (!path.empty()) {
                    text += " (fixed by";
                    for (const auto &source : path) text += " " + source;
                    text += ")";
                }
                substitutions.push_back(text);
            }
        }
    }

    system.rows[row].kind = kind;
    system.rows[row].node = members.front();

    if (!narrator) return;
    if (kind == StepType::Kcl) {
        narrator->recordKcl(row, circuit.label(members.front()), terms,
                            substitutions);
    } else {
        std::vector<std::string> labels;
        for (int member : members) labels.push_back(circuit.label(member));
        narrator->recordSupernodeKcl(row, labels, terms, substitutions,
                                     internal);
    }
}

LinearSystem assembleSystem(const Circuit &circuit,
                            const SupernodeMap &supernodes,
                            StepNarrator *narrator)
{
    const int n = supernodes.columnCount;

    LinearSystem system;
    system.G = Eigen::MatrixXd::Zero(n, n);
    system.I = Eigen::VectorXd::Zero(n);
    system.columnNodes.assign(n, -1);
    system.rows.resize(n);

    for (int node = 0; node < circuit.nodeCount(); ++node) {
        const NodeBinding &binding = supernodes.bindings[node];
        if (binding.kind == BindingKind::Unknown)
            system.columnNodes[binding.column] = node;
    }

    // Pass 1: one KCL row per reduced unknown
    for (const auto &unknown : supernodes.unknowns) {
        std::visit(
            [&](const auto &variable) {
                using T = std::decay_t<decltype(variable)>;
                if constexpr (std::is_same_v<T, NodeUnknown>) {
                    int row = supernodes.bindings[variable.node].column;
                    emitKclRow(circuit, supernodes, {variable.node}, row,
                               StepType::Kcl, system, narrator);
                } else {
                    int row =
                        supernodes.bindings[variable.representative].column;
                    emitKclRow(circuit, supernodes, variable.members, row,
                               StepType::SupernodeKcl, system, narrator);
                }
            },
            unknown);
    }

    // Pass 2: constraint rows at the members' own columns
    for (const auto &constraint : supernodes.constraints) {
        int row = supernodes.bindings[constraint.member].column;
        int repColumn = supernodes.bindings[constraint.representative].column;
        system.G(row, row) = 1.0;
        system.G(row, repColumn) = -1.0;
        system.I(row) = constraint.offset;
        system.rows[row].kind = StepType::Constraint;
        system.rows[row].node = constraint.member;

        if (narrator)
            narrator->recordConstraint(row,
                                       circuit.label(constraint.member),
                                       circuit.label(constraint.representative),
                                       constraint.offset, constraint.sources);
    }

    return system;
}
