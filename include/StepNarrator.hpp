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
 * @file StepNarrator.hpp
 * @brief Human-checkable derivation trail of the nodal equations.
 *
 * The `StepNarrator` observes the equation assembler: for every row the
 * assembler emits it records one `DerivationStep` holding the equation as
 * plain text and a short explanation. It never touches the matrices, so a
 * solve with or without a narrator produces the same system.
 *
 * Equations follow the "sum of currents leaving = 0" convention, e.g.
 *
 *   (V(N1) - V(N2))/1000 + V(N1)/2000 + 0.002 = 0
 *
 * and constraint rows read `V(N3) - V(N2) = 5`.
 */

#pragma once

#include <string>
#include <vector>

/**
 * @enum StepType
 * @brief Kind of row a derivation step describes.
 */
enum class StepType
{
    Kcl,          /**< KCL at a single node */
    SupernodeKcl, /**< Merged KCL over a supernode boundary */
    Constraint    /**< Voltage source constraint between supernode members */
};

/** @brief Wire name of a step type ("kcl", "supernode_kcl", "constraint"). */
std::string stepTypeName(StepType type);

/**
 * @struct DerivationStep
 * @brief One narrated row of the system.
 */
struct DerivationStep
{
    StepType type = StepType::Kcl;
    int stepNumber = 0; /**< 1-based position in the trail */
    int row = -1;       /**< Matrix row this step describes */
    std::string title;
    std::string description;
    std::string equation;
    std::string explanation;
    std::string keyPoint;
};

/**
 * @class StepNarrator
 * @brief Collects derivation steps in row emission order.
 */
class StepNarrator
{
   public:
    /**
     * @brief Record the KCL row of a plain node.
     *
     * @param row Matrix row.
     * @param node Node label.
     * @param terms Currents leaving the node, one term per element.
     * @param substitutions Known neighbour voltages substituted into terms.
     */
    void recordKcl(int row, const std::string& node,
                   const std::vector<std::string>& terms,
                   const std::vector<std::string>& substitutions);

    /**
     * @brief Record the merged KCL row of a supernode.
     *
     * @param internal Elements with both terminals inside the supernode,
     *        which cancel and are left out of the equation.
     */
    void recordSupernodeKcl(int row, const std::vector<std::string>& members,
                            const std::vector<std::string>& terms,
                            const std::vector<std::string>& substitutions,
                            const std::vector<std::string>& internal);

    /**
     * @brief Record a constraint row V(member) - V(representative) = offset.
     *
     * @param sources Source chain fixing the difference.
     */
    void recordConstraint(int row, const std::string& member,
                          const std::string& representative, double offset,
                          const std::vector<std::string>& sources);

    const std::vector<DerivationStep>& getSteps() const { return steps; }

   private:
    std::vector<DerivationStep> steps;
    int kclCount = 0;

    void push(DerivationStep step);
};

/**
 * @brief Join current terms into "a + b - c = 0".
 *
 * Terms starting with '-' are joined with " - ". An empty term list gives
 * "0 = 0".
 */
std::string joinKclTerms(const std::vector<std::string>& terms);
