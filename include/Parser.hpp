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
 * @file Parser.hpp
 * @brief Readers for SPICE-like netlists and JSON component lists.
 *
 * This header defines the `Parser` class which turns circuit descriptions
 * into a collection of element objects ready for nodal analysis.
 *
 * Two input forms are supported:
 *  - A textual netlist, one element per line (`Rname nodeA nodeB value`,
 *    `Vname ...`, `Iname ...`). Lines are uppercased before tokenizing so
 *    keywords, element names and node names compare case-insensitively.
 *    `*` and `;` start comments, `.OP` requests the operating point and
 *    `.END` stops reading.
 *  - A JSON document `{ "components": [ {type, value, nodeA, nodeB, name?} ] }`
 *    or a bare array of such objects (nlohmann::json).
 *
 * Numeric literals are parsed in a strict SPICE-like manner: optional
 * suffix multipliers (T, G, MEG, K, M, U, N, P, F) are supported and the
 * mantissa must be a well-formed floating-point literal with no trailing
 * garbage.
 *
 * Example usage:
 * @code
 * Parser p;
 * SolverDirectiveType directive = SolverDirectiveType::NONE;
 * int errors = p.parse("divider.cir", directive);
 * if (errors == 0) {
 *   CircuitSolution solution = solveCircuit(p.circuitElements);
 * }
 * @endcode
 */

#pragma once

#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "CircuitElement.hpp"

// Forward Declaration
class CircuitElement;
enum class SolverDirectiveType;

/**
 * @struct ElementCounts
 * @brief Simple counters for diagnostics and summary reporting.
 */
struct ElementCounts
{
    int resistorCount = 0;      /**< Number of resistors parsed */
    int voltageSourceCount = 0; /**< Number of voltage sources parsed */
    int currentSourceCount = 0; /**< Number of current sources parsed */
};

/**
 * @class Parser
 * @brief Reads a netlist or a JSON component list into element objects.
 *
 * Netlist problems are reported to `std::cerr` and counted; `parse()`
 * returns the count. JSON problems throw `ValidationError`.
 */
class Parser
{
   public:
    /**
     * @brief Parsed circuit element list, in input order.
     */
    std::vector<std::shared_ptr<CircuitElement>> circuitElements;

    /**
     * @brief Parses a netlist file and populates `circuitElements`.
     *
     * @param file Path to the netlist file to parse.
     * @param directive Set to `SolverDirectiveType::OPERATING_POINT` when a
     *                  `.OP` line is present, left unchanged otherwise.
     * @return Number of errors encountered while parsing. Zero indicates a
     *         clean parse.
     */
    int parse(const std::string& file, SolverDirectiveType& directive);

    /**
     * @brief Populate `circuitElements` from a JSON component list.
     *
     * Accepts `{ "components": [...] }` or a bare array. Each entry holds
     * `type`, `value`, `nodeA`, `nodeB` and optionally `name`. `type` is
     * case-insensitive ("Resistor"/"R", "Voltage Source"/"VS"/"V",
     * "Current Source"/"CS"/"I", ...). `value` is a number or a string with
     * a SPICE suffix. Nodes are strings or integers. Unnamed components are
     * numbered per type (R1, R2, V1, ...).
     *
     * @throws ValidationError naming the offending component index.
     */
    void parseJson(const nlohmann::json& document);

    /**
     * @brief Read a JSON file and hand it to `parseJson`.
     *
     * @throws std::runtime_error when the file cannot be opened.
     * @throws ValidationError for malformed JSON or components.
     */
    void parseJsonFile(const std::string& file);

    /**
     * @brief Validate the number of tokens in a line.
     *
     * @param tokens Tokenized line.
     * @param expectedSize Expected token count.
     * @param lineNumber Associated line number (for error messages).
     * @return True if token count matches `expectedSize`, false otherwise.
     */
    bool validateTokens(const std::vector<std::string>& tokens,
                        int expectedSize, int lineNumber);

    /**
     * @brief Parse a numeric value string into a double.
     *
     * Accepts optional suffix multipliers (T, G, MEG, K, M, U, N, P, F). The
     * mantissa must be a well-formed numeric literal (std::stod must consume
     * the entire mantissa). The parser is strict and will set `valid` to false
     * for malformed inputs.
     *
     * @param valueStr Uppercased value token (e.g., \"10K\", \"3.3U\").
     * @param lineNumber Line number in the netlist (used for diagnostics).
     * @param valid Output parameter set to true when parsing succeeds.
     * @return Parsed numeric value (undefined if `valid` is false).
     */
    double parseValue(const std::string& valueStr, int lineNumber, bool& valid);

    /**
     * @brief Validate node names for a two-terminal element.
     *
     * Ensures the two node identifiers are not identical (a common netlist
     * error).
     *
     * @param nodeA Name of terminal A.
     * @param nodeB Name of terminal B.
     * @param lineNumber Line number for diagnostic messages.
     * @return True if nodes are valid (different), false otherwise.
     */
    bool validateNodes(const std::string& nodeA, const std::string& nodeB,
                       int lineNumber);

    /**
     * @brief Print a summary of element counts collected during parsing.
     */
    void printElementCounts(std::ostream& os = std::cout) const;

    const ElementCounts& getElementCounts() const { return elementCounts; }

   private:
    /**
     * @brief Map of element name -> element pointer, used to reject
     * duplicate names.
     */
    std::map<std::string, std::shared_ptr<CircuitElement>> elementMap;

    /**
     * @brief Counters for parsed element types.
     */
    ElementCounts elementCounts;

    void clear();
    void countElement(const CircuitElement& element);
};
