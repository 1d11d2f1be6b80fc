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
 * @file LinearSolver.hpp
 * @brief Dense direct solve of the nodal system with singularity diagnosis.
 *
 * The system is factorized with Eigen's full-pivoting LU. When the matrix is
 * singular (or its reciprocal condition number falls below
 * `SolverOptions::minReciprocalCondition`) the solver inspects the circuit
 * graph to explain why:
 *
 *  - unknown nodes with no path to ground through resistors or voltage
 *    sources make the circuit underconstrained
 *    (`UnderconstrainedCircuitError`, "missing reference path");
 *  - otherwise the system is reported as singular / ill-conditioned
 *    (`SingularSystemError`).
 */

#pragma once

#include <string>

#include <Eigen/Dense>

#include "Assembler.hpp"
#include "SolverOptions.hpp"
#include "Supernode.hpp"
#include "Topology.hpp"

/**
 * @struct LinearSolution
 * @brief Solved unknown vector plus factorization diagnostics.
 */
struct LinearSolution
{
    Eigen::VectorXd x;
    double rcond = 1.0; /**< Reciprocal condition estimate (1 if empty) */
    int rank = 0;
    std::string method = "Eigen FullPivLU (full pivoting LU decomposition)";
};

/**
 * @brief Solve G*x = I.
 *
 * An empty system (every node voltage fixed) yields an empty vector.
 *
 * @throws UnderconstrainedCircuitError, SingularSystemError
 */
LinearSolution solveLinearSystem(const LinearSystem &system,
                                 const Circuit &circuit,
                                 const SupernodeMap &supernodes,
                                 const SolverOptions &options = SolverOptions());
