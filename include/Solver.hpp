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
 * @file Solver.hpp
 * @brief High-level solver API: the nodal analysis pipeline and its driver.
 *
 * This header exposes the primary entrypoints used by clients and tests:
 *  - `solveCircuit` runs topology building, supernode resolution, equation
 *    assembly (narrated), the linear solve, verification and result mapping
 *    for one element list, and returns everything by value;
 *  - `runSolver` is the command-line workflow (read a circuit file, solve,
 *    print a JSON or text report);
 *  - small printing helpers for the text report.
 *
 * A solve has no side effects apart from the optional diagnostics file, so
 * independent circuits can be solved concurrently.
 */

#pragma once

#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "Assembler.hpp"
#include "CircuitElement.hpp"
#include "LinearSolver.hpp"
#include "Parser.hpp"
#include "ResultMapper.hpp"
#include "SolverOptions.hpp"
#include "StepNarrator.hpp"
#include "Supernode.hpp"
#include "Topology.hpp"
#include "Verifier.hpp"

/**
 * @enum SolverDirectiveType
 * @brief Describes the analysis requested in a parsed netlist.
 *
 * Parser::parse inspects the netlist for directives and sets the directive
 * accordingly. A netlist without a directive is solved as an operating
 * point.
 */
enum class SolverDirectiveType
{
    NONE,           /**< No directive found in the netlist. */
    OPERATING_POINT /**< Compute DC operating point (.OP). */
};

/**
 * @struct AnalysisSummary
 * @brief Circuit statistics reported alongside a solution.
 */
struct AnalysisSummary
{
    std::string referenceNode = GROUND_LABEL;
    std::vector<std::string> nonReferenceNodes;
    std::vector<std::string> regularNodes; /**< Unknown, not in a supernode */
    std::vector<std::string> knownNodes;   /**< Fixed through sources */
    std::vector<std::vector<std::string>> groundedSupernodes;
    std::vector<std::vector<std::string>> ungroundedSupernodes;
    int numKclEquations = 0;
    int numConstraintEquations = 0;
    int resistors = 0;
    int voltageSources = 0;
    int currentSources = 0;

    /** @brief Element type key -> sign convention statement. */
    std::map<std::string, std::string> conventions;
};

/**
 * @struct CircuitSolution
 * @brief Everything produced by one solve.
 */
struct CircuitSolution
{
    Circuit circuit;
    SupernodeMap supernodes;
    LinearSystem system;
    LinearSolution linear;
    Verification verification;
    AnalysisSummary analysis;

    /** @brief Voltage of every canonical node (index 0 is exactly 0). */
    Eigen::VectorXd nodeVoltages;

    /** @brief Node label -> voltage, reference included. */
    std::map<std::string, double> voltages;

    std::vector<ComponentResult> components;
    std::vector<DerivationStep> steps;
    double totalPower = 0.0;
    bool powerBalance = false;

    /**
     * @brief Voltage of a node by label (ground spellings accepted).
     * @throws std::out_of_range for unknown labels.
     */
    double voltage(const std::string &label) const;

    /**
     * @brief Result of a component by name.
     * @throws std::out_of_range for unknown names.
     */
    const ComponentResult &component(const std::string &name) const;
};

/**
 * @brief Build the circuit statistics for a resolved circuit.
 */
AnalysisSummary summarizeAnalysis(const Circuit &circuit,
                                  const SupernodeMap &supernodes);

/**
 * @brief Solve a DC circuit by nodal analysis.
 *
 * Pipeline: buildCircuit -> resolveSupernodes -> assembleSystem (narrated)
 * -> solveLinearSystem -> verifySolution -> mapComponents.
 *
 * @param elements Ordered element list (not modified).
 * @param options Tolerances and diagnostics settings.
 * @return Full solution. A residual above tolerance is reported through
 *         `verification.verified` rather than an exception.
 * @throws ValidationError, InconsistentSourceError, SingularSystemError,
 *         UnderconstrainedCircuitError
 */
CircuitSolution solveCircuit(
    const std::vector<std::shared_ptr<CircuitElement>> &elements,
    const SolverOptions &options = SolverOptions());

/**
 * @brief Print the nodal system [G | I] with the unknown of each column.
 */
void printSystem(const LinearSystem &system, const Circuit &circuit,
                 std::ostream &os = std::cout);

/**
 * @brief Print node voltages, one "label<TAB>value" line per node.
 */
void printVoltages(const CircuitSolution &solution,
                   std::ostream &os = std::cout);

/**
 * @brief Print the per-component voltage/current/power table and totals.
 */
void printComponents(const CircuitSolution &solution,
                     std::ostream &os = std::cout);

/**
 * @brief Run the top-level solver workflow for a circuit file.
 *
 * This convenience entrypoint performs the overall workflow used by the
 * command-line driver:
 *  - Determine the input filename (from argv or default "circuit.json").
 *  - Read it as a JSON component list (".json" extension) or as a netlist.
 *  - Solve and print the report in `options.outputFormat`.
 *
 * @param[in] argc Count of command-line arguments.
 * @param[in] argv Null-terminated array of argument strings (argv[0] unused).
 * @param[in] options Optional SolverOptions controlling solver behavior.
 * @return 0 on success, 1 when the input cannot be read or parsed, 2 when
 *         the circuit cannot be solved.
 */
int runSolver(int argc, char *argv[],
              const SolverOptions &options = SolverOptions());

/* End of Solver.hpp */
