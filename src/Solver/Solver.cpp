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
 * @file Solver.cpp
 * @brief Implementation of the nodal analysis pipeline and its driver.
 *
 * API-level documentation lives in `Solver.hpp`. The pipeline stages each
 * live in their own translation unit; this file wires them together, builds
 * the circuit statistics and prints the text report.
 */

#include "Solver.hpp"

#include <cctype>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>

#include "CircuitErrors.hpp"
#include "ResultJson.hpp"

double CircuitSolution::voltage(const std::string &label) const
{
    auto it = voltages.find(normalizeNodeLabel(label));
    if (it == voltages.end())
        throw std::out_of_range("Unknown node '" + label + "'");
    return it->second;
}

const ComponentResult &CircuitSolution::component(const std::string &name) const
{
    for (const auto &result : components) {
        if (result.name == name) return result;
    }
    throw std::out_of_range("Unknown component '" + name + "'");
}

AnalysisSummary summarizeAnalysis(const Circuit &circuit,
                                  const SupernodeMap &supernodes)
{
    AnalysisSummary analysis;

    for (int i = 1; i < circuit.nodeCount(); ++i) {
        const NodeBinding &binding = supernodes.bindings[i];
        analysis.nonReferenceNodes.push_back(circuit.label(i));
        if (binding.kind == BindingKind::Known)
            analysis.knownNodes.push_back(circuit.label(i));
        else if (binding.kind == BindingKind::Unknown && binding.group < 0)
            analysis.regularNodes.push_back(circuit.label(i));
    }

    for (const auto &group : supernodes.groups) {
        std::vector<std::string> labels;
        for (int member : group.members) labels.push_back(circuit.label(member));
        if (group.grounded)
            analysis.groundedSupernodes.push_back(labels);
        else
            analysis.ungroundedSupernodes.push_back(labels);
    }

    analysis.numKclEquations = static_cast<int>(supernodes.unknowns.size());
    analysis.numConstraintEquations =
        static_cast<int>(supernodes.constraints.size());

    for (const auto &branch : circuit.branches) {
        const auto &element = branch.element;
        switch (element->getType()) {
            case ElementType::R:
                analysis.resistors++;
                break;
            case ElementType::V:
                analysis.voltageSources++;
                break;
            case ElementType::I:
                analysis.currentSources++;
                break;
        }
        analysis.conventions[elementTypeKey(element->getType())] =
            element->convention();
    }
    return analysis;
}

// Appends a snapshot of the assembled system and its solution to the
// diagnostics file.
static void writeDiagnostics(const CircuitSolution &solution,
                             const SolverOptions &options)
{
    std::ofstream diag(options.diagFile, std::ios::app);
    if (!diag) {
        std::cerr << "Warning: Could not open diagnostics file "
                  << options.diagFile << std::endl;
        return;
    }

    diag.setf(std::ios::fixed);
    diag << std::setprecision(8);
    diag << "--- Diagnostic snapshot: nodes=" << solution.circuit.nodeCount()
         << " unknowns=" << solution.system.size()
         << " rcond=" << solution.linear.rcond
         << " rank=" << solution.linear.rank << " ---\n";
    printSystem(solution.system, solution.circuit, diag);
    diag << "max residual=" << solution.verification.maxError
         << " verified=" << (solution.verification.verified ? "yes" : "no")
         << " total power=" << solution.totalPower << "\n";
}

CircuitSolution solveCircuit(
    const std::vector<std::shared_ptr<CircuitElement>> &elements,
    const SolverOptions &options)
{
    options.validate();

    CircuitSolution solution;
    solution.circuit = buildCircuit(elements);
    solution.supernodes = resolveSupernodes(solution.circuit, options);

    StepNarrator narrator;
    solution.system =
        assembleSystem(solution.circuit, solution.supernodes, &narrator);
    solution.steps = narrator.getSteps();

    solution.linear = solveLinearSystem(solution.system, solution.circuit,
                                        solution.supernodes, options);
    solution.verification =
        verifySolution(solution.system, solution.linear.x, options);

    solution.nodeVoltages =
        expandNodeVoltages(solution.supernodes, solution.linear.x);
    for (int i = 0; i < solution.circuit.nodeCount(); ++i)
        solution.voltages[solution.circuit.label(i)] = solution.nodeVoltages(i);

    solution.components =
        mapComponents(solution.circuit, solution.nodeVoltages);
    solution.totalPower = totalPower(solution.components);
    solution.powerBalance = solution.verification.verified &&
                            powerBalances(solution.components, options);
    if (!solution.powerBalance) {
        std::cerr << "Warning: Power does not balance (total "
                  << solution.totalPower << " W)" << std::endl;
    }

    solution.analysis =
        summarizeAnalysis(solution.circuit, solution.supernodes);

    if (options.diagVerbose) writeDiagnostics(solution, options);
    return solution;
}

void printSystem(const LinearSystem &system, const Circuit &circuit,
                 std::ostream &os)
{
    os << std::fixed;
    os << std::setprecision(5);

    for (int i = 0; i < system.size(); i++) {
        for (int j = 0; j < system.size(); j++) {
            os << system.G(i, j) << "\t\t";
        }
        os << "\t\tV(" << circuit.label(system.columnNodes[i]) << ")\t\t"
           << system.I(i) << std::endl;
    }
}

void printVoltages(const CircuitSolution &solution, std::ostream &os)
{
    os << std::fixed;
    os << std::setprecision(5);

    os << "\n";
    for (int i = 0; i < solution.circuit.nodeCount(); i++)
        os << solution.circuit.label(i) << "\t\t" << solution.nodeVoltages(i)
           << std::endl;
}

void printComponents(const CircuitSolution &solution, std::ostream &os)
{
    os << std::fixed;
    os << std::setprecision(5);

    os << "\nName\t\tNodes\t\tVoltage\t\tCurrent\t\tPower" << std::endl;
    for (const auto &component : solution.components) {
        os << component.name << "\t\t" << component.node1 << "-"
           << component.node2 << "\t\t" << component.voltage << "\t\t"
           << component.current << "\t\t" << component.power << std::endl;
    }
    os << "\nTotal power\t\t" << solution.totalPower << std::endl;
    os << "Power balance\t\t" << (solution.powerBalance ? "yes" : "no")
       << std::endl;

    os << "\n";
    for (const auto &component : solution.components)
        os << component.description << std::endl;
}

static bool hasJsonExtension(const std::string &filename)
{
    const std::string ext = ".json";
    if (filename.size() < ext.size()) return false;
    std::string tail = filename.substr(filename.size() - ext.size());
    for (auto &c : tail)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return tail == ext;
}

static void printTextReport(const CircuitSolution &solution)
{
    std::cout << "DC Nodal Analysis Results:" << std::endl;
    if (solution.system.size() > 0) {
        std::cout << "\nNodal system [G | I]:" << std::endl;
        printSystem(solution.system, solution.circuit);
    } else {
        std::cout << "No unknowns found in nodal analysis." << std::endl;
    }

    std::cout << "\nDerivation:" << std::endl;
    for (const auto &step : solution.steps) {
        std::cout << step.title << "\n    " << step.equation << std::endl;
    }

    printVoltages(solution);
    printComponents(solution);
    if (!solution.verification.verified) {
        std::cout << "\nSolution residual " << solution.verification.maxError
                  << " exceeds tolerance" << std::endl;
    }
}

int runSolver(int argc, char *argv[], const SolverOptions &options)
{
    // Default filename if not provided as command line argument.
    std::string filename = "circuit.json";
    if (argc > 1) {
        filename = argv[1];
    }

    Parser parser;
    if (hasJsonExtension(filename)) {
        try {
            parser.parseJsonFile(filename);
        } catch (const CircuitError &e) {
            std::cerr << "Error: " << e.what() << std::endl;
            if (options.outputFormat == OutputFormat::Json)
                std::cout << errorToJson(e).dump(4) << std::endl;
            return 2;
        } catch (const std::runtime_error &e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }
    } else {
        SolverDirectiveType directive = SolverDirectiveType::NONE;
        if (parser.parse(filename, directive) != 0) {
            std::cerr << "Error: Failed to parse file: " << filename
                      << std::endl;
            return 1;
        }
        if (directive == SolverDirectiveType::NONE) {
            std::cerr << "Warning: No analysis directive in " << filename
                      << ", running DC operating point (.OP)" << std::endl;
        }
    }

    if (options.outputFormat == OutputFormat::Text) {
        std::cout << "Total elements in the circuit: "
                  << parser.circuitElements.size() << std::endl;
        parser.printElementCounts();
        std::cout << std::endl;
    }

    try {
        CircuitSolution solution =
            solveCircuit(parser.circuitElements, options);
        if (options.outputFormat == OutputFormat::Json)
            std::cout << toJson(solution).dump(4) << std::endl;
        else
            printTextReport(solution);
    } catch (const CircuitError &e) {
        std::cerr << "Error: " << e.getKind() << ": " << e.what() << std::endl;
        std::cerr << "Suggestion: " << e.getSuggestion() << std::endl;
        if (options.outputFormat == OutputFormat::Json)
            std::cout << errorToJson(e).dump(4) << std::endl;
        return 2;
    } catch (const std::runtime_error &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
