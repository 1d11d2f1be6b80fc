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
 * @file NodeBinding.hpp
 * @brief How a circuit node's voltage enters the nodal equations.
 *
 * After supernode resolution every canonical node is bound in exactly one
 * way: it is the reference (0 V), its voltage is known because a chain of
 * voltage sources ties it to the reference, or it owns a column of the
 * conductance matrix. Element stamping rules only ever look at bindings, never
 * at the supernode structures themselves.
 */

#pragma once

#include <string>

/**
 * @enum BindingKind
 * @brief Role of a node voltage in the linear system.
 */
enum class BindingKind
{
    Reference, /**< Ground node, fixed at 0 V */
    Known,     /**< Fixed by voltage sources connected to ground */
    Unknown    /**< Solved for; owns a matrix column */
};

/**
 * @struct NodeBinding
 * @brief Per-node binding produced by the supernode resolver.
 */
struct NodeBinding
{
    BindingKind kind = BindingKind::Reference;

    /** @brief Matrix column for Unknown nodes, -1 otherwise. */
    int column = -1;

    /** @brief Voltage of Reference/Known nodes. */
    double value = 0.0;

    /** @brief Node label, used for narration. */
    std::string label;

    /** @brief Index of the supernode group containing the node, or -1. */
    int group = -1;
};
