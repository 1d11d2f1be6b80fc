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
 * @file CurrentSource.hpp
 * @brief Independent DC current source element.
 *
 * A `CurrentSource` pushes `value` amperes from nodeA to nodeB through
 * itself: the current leaves nodeA and enters nodeB. In a KCL row it only
 * contributes a constant, which the assembler moves to the current vector.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "CircuitElement.hpp"

class Parser;

/**
 * @class CurrentSource
 * @brief Ideal independent current source.
 */
class CurrentSource : public CircuitElement
{
   public:
    /**
     * @brief Construct a current source.
     * @param name Element name (e.g. "I1")
     * @param nodeA Node the current leaves
     * @param nodeB Node the current enters
     * @param value Current in amperes (0 allowed: open circuit)
     */
    CurrentSource(const std::string& name, const std::string& nodeA,
                  const std::string& nodeB, double value)
        : CircuitElement(name, nodeA, nodeB, value)
    {
        type = ElementType::I;
        group = Group::G1;
    }

    /**
     * @brief Add the source to a KCL row.
     *
     * Leaving current at nodeA is +value, so `I(row) -= value`; at nodeB the
     * current enters, so `I(row) += value`.
     */
    void stampKCL(Eigen::MatrixXd& G, Eigen::VectorXd& I, int row,
                  const NodeBinding& self, const NodeBinding& other,
                  bool selfIsNodeA) const override;

    std::string kclTerm(const NodeBinding& self, const NodeBinding& other,
                        bool selfIsNodeA) const override;

    /** @brief Always the source value. */
    double branchCurrent(double vA, double vB) const override;

    std::string typeName() const override { return "Current Source"; }
    std::string unit() const override { return "A"; }
    std::string convention() const override;

    /**
     * @brief Parse a current source from tokens.
     * @param parser Parser instance for helpers
     * @param tokens Tokenized line
     * @param lineNumber Line number for diagnostics
     * @return Shared pointer to CurrentSource or nullptr on error
     */
    static std::shared_ptr<CircuitElement> parse(
        Parser& parser, const std::vector<std::string>& tokens, int lineNumber);
};
