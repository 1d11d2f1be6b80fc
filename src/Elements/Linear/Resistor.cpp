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
 * @file Resistor.cpp
 * @brief Implementation of the `Resistor` element declared in Resistor.hpp.
 *
 * Implementation notes:
 *  - `parse()` validates token count, node names and numeric values using the
 *    `Parser` helpers. On parse error it emits diagnostics to `stderr` and
 *    returns `nullptr`.
 *  - `stampKCL()` writes the conductance of the resistor into one KCL row.
 *    Known terminal voltages are substituted into the current vector so the
 *    matrix only couples unknown nodes.
 */

#include "Resistor.hpp"

#include <cmath>
#include <memory>
#include <string>
#include <vector>

#include "CircuitElement.hpp"
#include "Parser.hpp"

std::shared_ptr<CircuitElement> Resistor::parse(
    Parser& parser, const std::vector<std::string>& tokens, int lineNumber)
{
    // Rname nodeA nodeB value
    if (!parser.validateTokens(tokens, 4, lineNumber)) {
        std::cerr << "Error: Invalid resistor definition at line " << lineNumber
                  << std::endl;
        return nullptr;
    }

    // Ensure the two terminals are distinct
    if (!parser.validateNodes(tokens[1], tokens[2], lineNumber)) {
        std::cerr << "Error: Resistor nodes cannot be the same at line "
                  << lineNumber << std::endl;
        return nullptr;
    }

    // Parse resistance value using the parser's strict SPICE-style parser
    bool validValue = false;
    double value = parser.parseValue(tokens[3], lineNumber, validValue);
    if (!validValue || !(value > 0) || !std::isfinite(value)) {
        std::cerr << "Error: Illegal argument for resistor value at line "
                  << lineNumber << std::endl;
        return nullptr;
    }

    return std::make_shared<Resistor>(tokens[0], tokens[1], tokens[2], value);
}

void Resistor::stampKCL(Eigen::MatrixXd& G, Eigen::VectorXd& I, int row,
                        const NodeBinding& self, const NodeBinding& other,
                        [[maybe_unused]] bool selfIsNodeA) const
{
    double conductance = 1.0 / value;
    G(row, self.column) += conductance;

    switch (other.kind) {
        case BindingKind::Unknown:
            G(row, other.column) -= conductance;
            break;
        case BindingKind::Known:
            // g * (V_self - V_known) = ... -> constant part moves right
            I(row) += conductance * other.value;
            break;
        case BindingKind::Reference:
            break;
    }
}

std::string Resistor::kclTerm(const NodeBinding& self,
                              const NodeBinding& other,
                              [[maybe_unused]] bool selfIsNodeA) const
{
    std::string ohms = formatValue(value);
    std::string vSelf = "V(" + self.label + ")";

    switch (other.kind) {
        case BindingKind::Unknown:
            return "(" + vSelf + " - V(" + other.label + "))/" + ohms;
        case BindingKind::Known:
            if (other.value < 0)
                return "(" + vSelf + " + " + formatValue(-other.value) + ")/" +
                       ohms;
            return "(" + vSelf + " - " + formatValue(other.value) + ")/" +
                   ohms;
        case BindingKind::Reference:
        default:
            return vSelf + "/" + ohms;
    }
}

double Resistor::branchCurrent(double vA, double vB) const
{
    return (vA - vB) / value;
}

std::string Resistor::convention() const
{
    return "Current flows from nodeA to nodeB: I = (V(nodeA) - V(nodeB)) / R";
}
