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
 * @file CircuitElement.cpp
 * @brief Shared helpers for circuit elements.
 *
 * Implements the element factory used by the netlist parser, which selects
 * the concrete element from the first letter of the element name, and the
 * numeric formatting used in narrated equations and power descriptions.
 */

#include "CircuitElement.hpp"

#include <iomanip>
#include <sstream>

#include "CurrentSource.hpp"
#include "Parser.hpp"
#include "Resistor.hpp"
#include "VoltageSource.hpp"

std::shared_ptr<CircuitElement> CircuitElement::parse(
    Parser& parser, const std::vector<std::string>& tokens, int lineNumber)
{
    if (tokens.empty() || tokens[0].empty()) return nullptr;

    switch (tokens[0][0]) {
        case 'R':
            return Resistor::parse(parser, tokens, lineNumber);
        case 'V':
            return VoltageSource::parse(parser, tokens, lineNumber);
        case 'I':
            return CurrentSource::parse(parser, tokens, lineNumber);
        default:
            std::cerr << "Error: Unknown element '" << tokens[0]
                      << "' at line " << lineNumber << std::endl;
            return nullptr;
    }
}

std::string CircuitElement::formatValue(double value)
{
    // Print negative zero as "0"
    if (value == 0.0) value = 0.0;
    std::ostringstream os;
    os << std::setprecision(6) << value;
    return os.str();
}
