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
 * @file VoltageSource.hpp
 * @brief Declaration of the independent ideal voltage source element.
 *
 * The `VoltageSource` enforces V(nodeA) - V(nodeB) = value (nodeA is the
 * positive terminal). It never appears in a KCL row: the supernode resolver
 * turns each source into a fixed node voltage or a constraint row, and the
 * source current cancels inside the merged supernode KCL row. Its current is
 * recovered after the solve from KCL at its terminals (Group::G2).
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "CircuitElement.hpp"
#include "Parser.hpp"

/**
 * @class VoltageSource
 * @brief Independent DC voltage source element.
 *
 * Example netlist line:
 *
 *   V1 N1 0 12
 *
 * creates a 12 V source with its positive terminal on N1.
 */
class VoltageSource : public CircuitElement
{
   public:
    /**
     * @brief Construct a voltage source.
     *
     * @param name Element name (e.g., "V1").
     * @param nodeA Positive terminal node name.
     * @param nodeB Negative terminal node name.
     * @param value Source voltage in volts (0 allowed: ideal short).
     */
    VoltageSource(const std::string& name, const std::string& nodeA,
                  const std::string& nodeB, double value)
        : CircuitElement(name, nodeA, nodeB, value)
    {
        type = ElementType::V;
        group = Group::G2;
    }

    /** @brief No-op: the source current cancels inside its supernode. */
    void stampKCL(Eigen::MatrixXd& G, Eigen::VectorXd& I, int row,
                  const NodeBinding& self, const NodeBinding& other,
                  bool selfIsNodeA) const override;

    std::string kclTerm(const NodeBinding& self, const NodeBinding& other,
                        bool selfIsNodeA) const override;

    /**
     * @brief Not defined for an ideal voltage source.
     * @throws std::logic_error always.
     */
    double branchCurrent(double vA, double vB) const override;

    std::string typeName() const override { return "Voltage Source"; }
    std::string unit() const override { return "V"; }
    std::string convention() const override;

    /**
     * @brief Parse a voltage source from tokens.
     *
     * Expected tokens: [name, nodeA, nodeB, value]
     *
     * Validates tokens and nodes, parses the numeric value (with suffixes).
     * Returns nullptr and prints an error on failure.
     */
    static std::shared_ptr<CircuitElement> parse(
        Parser& parser, const std::vector<std::string>& tokens, int lineNumber);
};
