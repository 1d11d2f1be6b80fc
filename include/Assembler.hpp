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
 * @file Assembler.hpp
 * @brief Equation assembler: KCL and constraint rows of G*V = I.
 *
 * The assembled system is square and index-aligned with the unknown columns:
 *  - the row at a plain node's column is that node's KCL row;
 *  - the row at a supernode representative's column is the merged KCL row of
 *    the whole supernode;
 *  - the row at any other supernode member's column is the constraint
 *    V(member) - V(representative) = offset.
 *
 * Rows are emitted in two passes, first every KCL row in unknown order, then
 * every constraint row. The optional `StepNarrator` sees each row as it is
 * emitted. The system is built once and never modified afterwards.
 */

#pragma once

#include <vector>

#include <Eigen/Dense>

#include "StepNarrator.hpp"
#include "Supernode.hpp"
#include "Topology.hpp"

/**
 * @struct SystemRow
 * @brief What a row of the system encodes.
 */
struct SystemRow
{
    StepType kind = StepType::Kcl;
    int node = -1; /**< Node (or representative) owning the row */
};

/**
 * @struct LinearSystem
 * @brief Square nodal system G*V = I.
 */
struct LinearSystem
{
    Eigen::MatrixXd G;
    Eigen::VectorXd I;

    /** @brief Canonical node of each column. */
    std::vector<int> columnNodes;

    /** @brief Kind and owner of each row. */
    std::vector<SystemRow> rows;

    int size() const { return static_cast<int>(I.size()); }
};

/**
 * @brief Assemble the nodal system of a resolved circuit.
 *
 * @param circuit Circuit graph.
 * @param supernodes Bindings, unknowns and constraints.
 * @param narrator Optional observer receiving one step per row.
 * @return The assembled system.
 */
LinearSystem assembleSystem(const Circuit &circuit,
                            const SupernodeMap &supernodes,
                            StepNarrator *narrator = nullptr);
