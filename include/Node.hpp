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
 * @file Node.hpp
 * @brief Node representation used by the circuit connectivity graph.
 *
 * This header declares the `Node` class used to build the circuit topology
 * graph. Nodes hold incidence lists of `Edge` objects and provide a filtered
 * depth-first traversal used for connectivity checks (every node must reach
 * ground) and for diagnosing singular systems (which nodes reach ground only
 * through current sources).
 */

#pragma once

#include <functional>
#include <string>
#include <vector>

#include "Edge.hpp"

/**
 * @class Node
 * @brief Graph node representing an electrical node in the circuit.
 */
class Node
{
   public:
    /** @brief Node label (unique identifier, "0" for ground). */
    std::string name;

    /** @brief Canonical index (0 is always the reference node). */
    int index = -1;

    /** @brief Incidence list of edges attached to this node. */
    std::vector<Edge> edges;

    /**
     * @brief Traverse the connectivity graph starting from this node.
     *
     * Depth-first walk that marks every node reachable from this one in
     * `visited`, following only the edges for which `follow` returns true.
     *
     * @param nodes Node table indexed by canonical index.
     * @param visited Visit flags, one per node (updated in-place).
     * @param follow Edge filter.
     */
    void traverse(const std::vector<Node> &nodes, std::vector<bool> &visited,
                  const std::function<bool(const Edge &)> &follow) const;
};
