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
 * @file LinearSolver.cpp
 * @brief FullPivLU solve and singularity diagnosis.
 */

#include "LinearSolver.hpp"

#include <sstream>

#include "CircuitErrors.hpp"

// Raises the error explaining why the assembled system has no unique
// solution.
[[noreturn]] static void diagnoseSingularity(const Circuit &circuit,
                                             const SupernodeMap &supernodes,
                                             double rcond, int rank, int size)
{
    // Nodes reachable from ground through branches that constrain voltage
    std::vector<bool> anchored =
        circuit.reachableFrom(0, [](const Branch &branch) {
            return branch.element->getType() != ElementType::I;
        });

    std::vector<std::string> floating;
    for (int node = 1; node < circuit.nodeCount(); ++node) {
        if (supernodes.bindings[node].kind == BindingKind::Unknown &&
            !anchored[node])
            floating.push_back(circuit.label(node));
    }

    if (!floating.empty()) {
        std::ostringstream msg;
        msg << "Circuit is underconstrained: missing reference path for node(s)";
        for (const auto &label : floating) msg << " " << label;
        msg << " (connected to ground only through current sources)";
        throw UnderconstrainedCircuitError(msg.str(), floating);
    }

    std::ostringstream msg;
    msg << "Conductance matrix is singular or ill-conditioned (rank " << rank
        << " of " << size << ", rcond " << rcond
        << "); check for floating subcircuits or extreme component values";
    throw SingularSystemError(msg.str());
}

LinearSolution solveLinearSystem(const LinearSystem &system,
                                 const Circuit &circuit,
                                 const SupernodeMap &supernodes,
                                 const SolverOptions &options)
{
    LinearSolution solution;
    const int n = system.size();
    if (n == 0) {
        solution.x.resize(0);
        return solution;
    }

    Eigen::FullPivLU<Eigen::MatrixXd> lu(system.G);
    solution.rank = static_cast<int>(lu.rank());
    solution.rcond = lu.isInvertible() ? lu.rcond() : 0.0;

    if (!lu.isInvertible() ||
        !(solution.rcond >= options.minReciprocalCondition)) {
        diagnoseSingularity(circuit, supernodes, solution.rcond,
                            solution.rank, n);
    }

    solution.x = lu.solve(system.I);
    if (!solution.x.allFinite()) {
        throw SingularSystemError(
            "Linear solve produced non-finite node voltages");
    }
    return solution;
}
