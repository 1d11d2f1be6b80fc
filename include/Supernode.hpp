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
 * @file Supernode.hpp
 * @brief Supernode resolver: groups of nodes tied together by voltage sources.
 *
 * Ideal voltage sources fix the potential difference between their terminals,
 * so every connected set of nodes joined by voltage sources (a supernode) has
 * a single degree of freedom. The resolver:
 *
 *  - merges source terminals in a weighted union-find that tracks each
 *    node's potential offset to its set root, and rejects loops whose
 *    sources disagree (`InconsistentSourceError`);
 *  - turns every group containing ground into known node voltages;
 *  - keeps every other group as one representative (lowest canonical index)
 *    plus one constraint `V(member) - V(rep) = offset` per other member;
 *  - binds every node (reference / known / unknown column) and lists the
 *    unknown variables in column order.
 *
 * Columns are given to every unknown node in canonical order, so a
 * supernode's members keep their own columns; the member columns carry the
 * constraint rows and the representative's column carries the merged KCL row.
 */

#pragma once

#include <string>
#include <variant>
#include <vector>

#include <Eigen/Dense>

#include "NodeBinding.hpp"
#include "SolverOptions.hpp"
#include "Topology.hpp"

/**
 * @struct NodeUnknown
 * @brief A plain node whose voltage is a column of the system.
 */
struct NodeUnknown
{
    int node = -1;
};

/**
 * @struct SupernodeRepresentative
 * @brief An ungrounded supernode represented by its lowest-index member.
 */
struct SupernodeRepresentative
{
    int representative = -1;
    std::vector<int> members;    /**< All members, ascending, rep included */
    std::vector<double> offsets; /**< V(member) - V(rep), aligned to members */
    int group = -1;              /**< Index into SupernodeMap::groups */
};

/** @brief One reduced unknown of the nodal system. */
using UnknownVariable = std::variant<NodeUnknown, SupernodeRepresentative>;

/**
 * @struct SourceConstraint
 * @brief V(member) - V(representative) = offset.
 */
struct SourceConstraint
{
    int member = -1;
    int representative = -1;
    double offset = 0.0;

    /** @brief Sources on the path from the representative to the member. */
    std::vector<std::string> sources;
};

/**
 * @struct SupernodeGroup
 * @brief Connected set of nodes joined by voltage sources (size >= 2).
 */
struct SupernodeGroup
{
    std::vector<int> members;  /**< Ascending canonical indices */
    std::vector<int> branches; /**< Voltage source branches of the group */
    bool grounded = false;     /**< Contains the reference node */
};

/**
 * @struct SupernodeMap
 * @brief Result of supernode resolution.
 */
struct SupernodeMap
{
    /** @brief One binding per canonical node. */
    std::vector<NodeBinding> bindings;

    /** @brief Reduced unknowns, ordered by column. */
    std::vector<UnknownVariable> unknowns;

    /** @brief Constraint rows, group by group, members ascending. */
    std::vector<SourceConstraint> constraints;

    /** @brief All supernode groups, ordered by lowest member. */
    std::vector<SupernodeGroup> groups;

    /**
     * @brief Source names from the group root to each node (ground for
     * grounded groups, the representative otherwise). Empty for nodes that
     * are not in a group.
     */
    std::vector<std::vector<std::string>> sourcePaths;

    /** @brief Sources closing a consistent loop (redundant constraints). */
    std::vector<int> redundantSources;

    /** @brief Number of matrix columns (unknown node voltages). */
    int columnCount = 0;
};

/**
 * @class PotentialUnionFind
 * @brief Union-find over node indices that also tracks potential offsets.
 *
 * For every node x the structure keeps offset(x) = V(x) - V(find(x)).
 * Union by rank with path compression.
 */
class PotentialUnionFind
{
   public:
    explicit PotentialUnionFind(int size);

    /** @brief Root of the set containing x (compresses the path). */
    int find(int x);

    /** @brief V(x) - V(find(x)). */
    double offset(int x);

    /**
     * @brief Record the relation V(a) - V(b) = difference.
     *
     * @param[out] existing The difference already implied when a and b were
     *             in the same set (unchanged otherwise).
     * @return false when a and b were already joined with a difference that
     *         disagrees by more than
     *         `tolerance * max(1, |difference|, |existing|)`.
     */
    bool unite(int a, int b, double difference, double tolerance,
               double &existing);

    /** @brief True if a and b are in the same set. */
    bool connected(int a, int b) { return find(a) == find(b); }

   private:
    std::vector<int> parent;
    std::vector<int> rank;
    std::vector<double> offsets;
};

/**
 * @brief Resolve supernodes and bind every node of the circuit.
 *
 * @param circuit Circuit produced by `buildCircuit`.
 * @param options Provides `sourceTolerance` for loop consistency checks.
 * @return SupernodeMap describing bindings, unknowns and constraints.
 * @throws InconsistentSourceError when voltage sources conflict.
 */
SupernodeMap resolveSupernodes(const Circuit &circuit,
                               const SolverOptions &options = SolverOptions());

/**
 * @brief Full vector of node voltages (indexed by canonical node) from the
 * solved column vector.
 *
 * Reference and known nodes take their bound value; unknown nodes read their
 * column of `x`.
 */
Eigen::VectorXd expandNodeVoltages(const SupernodeMap &supernodes,
                                   const Eigen::VectorXd &x);
