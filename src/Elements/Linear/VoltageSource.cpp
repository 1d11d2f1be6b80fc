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
 * @file VoltageSource.cpp
 * @brief Implementation of the `VoltageSource` element.
 *
 * Voltage sources are handled structurally (supernodes and constraint rows)
 * rather than by stamping, so apart from parsing this file is mostly about
 * refusing operations that do not apply to an ideal source.
 */

#include "VoltageSource.hpp"

#include <cmath>
#include <memory>
#include <stdexcept>

#include "Parser.hpp"

/**
 * @brief Parse a voltage source definition from tokenized netlist input.
 *
 * The expected form is:
 *   Vname nodeA nodeB value
 *
 * A value of zero is accepted and models an ideal short between the nodes.
 */
std::shared_ptr<CircuitElement> VoltageSource::parse(
    Parser& parser, const std::vector<std::string>& tokens, int lineNumber)
{
    if (!parser.validateTokens(tokens, 4, lineNumber)) {
        std::cerr << "Error: Invalid voltage source definition at line "
                  << lineNumber << std::endl;
        return nullptr;
    }

    if (!parser.validateNodes(tokens[1], tokens[2], lineNumber)) {
        std::cerr << "Error: Voltage source nodes cannot be the same at line "
                  << lineNumber << std::endl;
        return nullptr;
    }

    bool validValue = false;
    double value = parser.parseValue(tokens[3], lineNumber, validValue);
    if (!validValue || !std::isfinite(value)) {
        std::cerr << "Error: Illegal argument for voltage source value at line "
                  << lineNumber << std::endl;
        return nullptr;
    }

    return std::make_shared<VoltageSource>(tokens[0], tokens[1], tokens[2],
                                           value);
}

void VoltageSource::stampKCL([[maybe_unused]] Eigen::MatrixXd& G,
                             [[maybe_unused]] Eigen::VectorXd& I,
                             [[maybe_unused]] int row,
                             [[maybe_unused]] const NodeBinding& self,
                             [[maybe_unused]] const NodeBinding& other,
                             [[maybe_unused]] bool selfIsNodeA) const
{
}

std::string VoltageSource::kclTerm(
    [[maybe_unused]] const NodeBinding& self,
    [[maybe_unused]] const NodeBinding& other,
    [[maybe_unused]] bool selfIsNodeA) const
{
    return std::string();
}

double VoltageSource::branchCurrent([[maybe_unused]] double vA,
                                    [[maybe_unused]] double vB) const
{
    throw std::logic_error("Voltage source " + name +
                           " current is not a function of node voltages");
}

std::string VoltageSource::convention() const
{
    return "nodeA is the positive terminal: V(nodeA) - V(nodeB) = V";
}
