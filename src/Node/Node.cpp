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
 * @file Node.cpp
 * @brief Implementation of Node traversal used for connectivity analysis.
 *
 * The traversal is depth-first and uses the `visited` vector to avoid
 * revisiting nodes.
 */

#include "Node.hpp"

void Node::traverse(const std::vector<Node> &nodes, std::vector<bool> &visited,
                    const std::function<bool(const Edge &)> &follow) const
{
    if (visited[index]) return;
    visited[index] = true;

    // Recurse to adjacent nodes (depth-first).
    for (const auto &edge : edges) {
        if (!visited[edge.target] && follow(edge)) {
            nodes[edge.target].traverse(nodes, visited, follow);
        }
    }
}
