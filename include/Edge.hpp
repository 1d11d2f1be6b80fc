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
 * @file Edge.hpp
 * @brief Graph edge representing a connection between two circuit nodes.
 *
 * An `Edge` is one entry of a node's incidence list. It refers to a branch of
 * the circuit (by index into `Circuit::branches`) and to the node at the
 * other end of that branch (by canonical node index). Every branch appears
 * twice, once in the incidence list of each of its terminals.
 *
 * Edges hold indices only; the node table owns the storage and edges never
 * point back into it.
 */

#pragma once

/**
 * @class Edge
 * @brief Represents a connection between two nodes in the circuit graph.
 */
class Edge
{
   public:
    /**
     * @brief Index of the branch (and element) carried by this edge.
     */
    int element = -1;

    /**
     * @brief Canonical index of the node at the other end of the branch.
     */
    int target = -1;

    /**
     * @brief True when the owning node is the element's nodeA, i.e. the edge
     *        is oriented along the element's reference current direction.
     */
    bool fromNodeA = true;
};
