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
 * @file CurrentSource.cpp
 * @brief Implementation of the `CurrentSource` class declared in
 * CurrentSource.hpp.
 *
 * Provides the parsing factory and KCL stamping behavior for an independent
 * current source element. An ideal current source contributes only to the
 * current vector.
 */

#include "CurrentSource.hpp"

#include <cmath>

#include "Parser.hpp"

std::shared_ptr<CircuitElement> CurrentSource::parse(
    Parser& parser, const std::vector<std::string>& tokens, int lineNumber)
{
    // Iname nodeA nodeB value
    if (!parser.validateTokens(tokens, 4, lineNumber)) {
        std::cerr << "Error: Invalid current source definition at line "
                  << lineNumber << std::endl;
        return nullptr;
    }

    if (!parser.validateNodes(tokens[1], tokens[2], lineNumber)) {
        std::cerr << "Error: Current source nodes cannot be the same at line "
                  << lineNumber << std::endl;
        return nullptr;
    }

    bool validValue = false;
    double value = parser.parseValue(tokens[3], lineNumber, validValue);
    if (!validValue || !std::isfinite(value)) {
        std::cerr << "Error: Illegal argument for current source value at line "
                  << lineNumber << std::endl;
        return nullptr;
    }

    return std::make_shared<CurrentSource>(tokens[0], tokens[1], tokens[2],
                                           value);
}

void CurrentSource::stampKCL([[maybe_unused]] Eigen::MatrixXd& G,
                             Eigen::VectorXd& I, int row,
                             [[maybe_unused]] const NodeBinding& self,
                             [[maybe_unused]] const NodeBinding& other,
                             bool selfIsNodeA) const
{
    if (selfIsNodeA)
        I(row) -= value;
    else
        I(row) += value;
}

std::string CurrentSource::kclTerm([[maybe_unused]] const NodeBinding& self,
                                   [[maybe_unused]] const NodeBinding& other,
                                   bool selfIsNodeA) const
{
    return formatValue(selfIsNodeA ? value : -value);
}

double CurrentSource::branchCurrent([[maybe_unused]] double vA,
                                    [[maybe_unused]] double vB) const
{
    return value;
}

std::string CurrentSource::convention() const
{
    return "Current flows from nodeA to nodeB through the source: I = value";
}
