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

#pragma once

/**
 * @file Resistor.hpp
 * @brief Declaration of the Resistor element used in nodal analysis.
 *
 * This header declares the `Resistor` concrete element class which models an
 * ideal two-terminal linear resistor. The class derives from `CircuitElement`
 * and provides:
 *
 *  - A constructor to create a resistor instance programmatically.
 *  - A static `parse()` helper used by `Parser` to construct a resistor from
 *    tokenized netlist input.
 *  - A `stampKCL()` method which inserts the resistor's conductance into the
 *    KCL row of one of its terminals.
 *
 * Usage example:
 * @code
 * // Programmatic construction
 * Resistor r("R1", "1", "0", 1000.0); // 1k between node 1 and ground
 *
 * // Parsing (inside Parser.cpp)
 * auto elem = Resistor::parse(parser, tokens, lineNumber);
 * if (elem) {  // returns shared_ptr<CircuitElement>
 *   parser.circuitElements.push_back(elem);
 * }
 * @endcode
 */

#include <memory>
#include <string>
#include <vector>

#include "CircuitElement.hpp"
#include "Parser.hpp"

/**
 * @class Resistor
 * @brief Concrete resistor element implementing a two-terminal resistor.
 *
 * Parsing:
 *  - The static `parse()` method expects tokenized, uppercased netlist tokens
 *    arranged in the SPICE convention:
 *
 *      R<name> <nodeA> <nodeB> <value>
 *
 *  - The resistance must be strictly positive.
 *
 * Stamping details (row of terminal `self`, opposite terminal `other`,
 * conductance g = 1/R):
 *  - `+g` on the diagonal entry of `self`'s column;
 *  - `other` unknown: `-g` in `other`'s column;
 *  - `other` known at voltage Vk: `+g*Vk` moved into the current vector;
 *  - `other` is the reference: nothing else.
 */
class Resistor : public CircuitElement
{
   public:
    /**
     * @brief Construct a resistor element.
     *
     * @param name Unique element name (e.g., "R1").
     * @param nodeA First terminal node name.
     * @param nodeB Second terminal node name.
     * @param value Resistance value in ohms.
     */
    Resistor(const std::string& name, const std::string& nodeA,
             const std::string& nodeB, double value)
        : CircuitElement(name, nodeA, nodeB, value)
    {
        type = ElementType::R;
        group = Group::G1;
    }

    void stampKCL(Eigen::MatrixXd& G, Eigen::VectorXd& I, int row,
                  const NodeBinding& self, const NodeBinding& other,
                  bool selfIsNodeA) const override;

    std::string kclTerm(const NodeBinding& self, const NodeBinding& other,
                        bool selfIsNodeA) const override;

    /** @brief Ohm's law: (vA - vB) / R. */
    double branchCurrent(double vA, double vB) const override;

    std::string typeName() const override { return "Resistor"; }
    std::string unit() const override { return "ohm"; }
    std::string convention() const override;

    /**
     * @brief Parse a resistor from tokenized netlist input.
     *
     * The function performs:
     *  - Token count validation via `parser.validateTokens`.
     *  - Node name validation via `parser.validateNodes`.
     *  - Numeric value parsing via `parser.parseValue`.
     *
     * On success returns a `shared_ptr` owning the constructed `Resistor`
     * instance. On failure it prints diagnostic messages to stderr and
     * returns `nullptr`.
     *
     * @param parser Reference to the calling `Parser` instance.
     * @param tokens Tokenized, uppercased tokens for the current line.
     * @param lineNumber Original line number in the netlist (for diagnostics).
     * @return shared_ptr<CircuitElement> owning the created resistor or
     *         `nullptr` on error.
     */
    static std::shared_ptr<CircuitElement> parse(
        Parser& parser, const std::vector<std::string>& tokens, int lineNumber);
};
