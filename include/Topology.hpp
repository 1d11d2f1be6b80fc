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
 * @file Topology.hpp
 * @brief Topology builder: component list -> indexed node/branch graph.
 *
 * `buildCircuit` turns the ordered element list into a `Circuit`: a node
 * table with canonical integer indices and per-node incidence lists, plus a
 * branch list mapping every element onto its two canonical endpoints.
 *
 * Canonical indexing:
 *  - the reference node (labels "0" or "GND", case-insensitive) is always
 *    index 0 and is labelled "0";
 *  - every other label gets the next index in first-seen order, scanning
 *    elements in order and nodeA before nodeB.
 *
 * The builder validates the topology and throws `ValidationError` for an
 * empty list, a zero-length branch, a missing ground, a bad element value,
 * duplicate element names, or nodes that are not connected to ground.
 */

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "CircuitElement.hpp"
#include "Node.hpp"

/** @brief Label used for the reference node in every result. */
constexpr const char *GROUND_LABEL = "0";

/**
 * @struct Branch
 * @brief One element mapped onto canonical node indices.
 */
struct Branch
{
    std::shared_ptr<CircuitElement> element;
    int a = -1; /**< Canonical index of the element's nodeA */
    int b = -1; /**< Canonical index of the element's nodeB */
};

/**
 * @class Circuit
 * @brief Indexed circuit graph produced by `buildCircuit`.
 */
class Circuit
{
   public:
    /** @brief Node table; `nodes[i].index == i`. */
    std::vector<Node> nodes;

    /** @brief Branches in input order (index = element index). */
    std::vector<Branch> branches;

    /** @brief Label -> canonical index. */
    std::map<std::string, int> nodeIndex;

    int nodeCount() const { return static_cast<int>(nodes.size()); }

    const std::string &label(int index) const { return nodes[index].name; }

    /**
     * @brief Canonical index of a node label, -1 if absent. Ground spellings
     * are normalized.
     */
    int indexOf(const std::string &label) const;

    /**
     * @brief Flags of the nodes reachable from `start` through branches
     * accepted by `follow`.
     */
    std::vector<bool> reachableFrom(
        int start, const std::function<bool(const Branch &)> &follow) const;
};

/** @brief True for "0" and "GND" in any letter case. */
bool isGroundLabel(const std::string &label);

/**
 * @brief Map ground spellings onto GROUND_LABEL, leave other labels as-is.
 */
std::string normalizeNodeLabel(const std::string &label);

/**
 * @brief Build and validate the circuit graph.
 *
 * @param elements Ordered element list (not modified).
 * @return Circuit with canonical indices and incidence lists.
 * @throws ValidationError for malformed topologies.
 */
Circuit buildCircuit(
    const std::vector<std::shared_ptr<CircuitElement>> &elements);
