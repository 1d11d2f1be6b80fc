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
 * @file StepNarrator.cpp
 * @brief Text formatting of the derivation steps.
 */

#include "StepNarrator.hpp"

#include <sstream>

#include "CircuitElement.hpp"

static std::string joinList(const std::vector<std::string>& items,
                            const std::string& separator)
{
    std::ostringstream os;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) os << separator;
        os << items[i];
    }
    return os.str();
}

std::string stepTypeName(StepType type)
{
    switch (type) {
        case StepType::Kcl:
            return "kcl";
        case StepType::SupernodeKcl:
            return "supernode_kcl";
        case StepType::Constraint:
            return "constraint";
    }
    return "unknown";
}

std::string joinKclTerms(const std::vector<std::string>& terms)
{
    if (terms.empty()) return "0 = 0";

    std::string equation = terms.front();
    for (size_t i = 1; i < terms.size(); ++i) {
        const std::string& term = terms[i];
        if (!term.empty() && term[0] == '-')
            equation += " - " + term.substr(1);
        else
            equation += " + " + term;
    }
    return equation + " = 0";
}

void StepNarrator::push(DerivationStep step)
{
    step.stepNumber = static_cast<int>(steps.size()) + 1;
    steps.push_back(step);
}

void StepNarrator::recordKcl(int row, const std::string& node,
                             const std::vector<std::string>& terms,
                             const std::vector<std::string>& substitutions)
{
    DerivationStep step;
    step.type = StepType::Kcl;
    step.row = row;
    step.title =
        "Step " + std::to_string(++kclCount) + ": KCL at Node " + node;
    step.description = "Applying Kirchhoff's Current Law at Node " + node +
                       ": the sum of all currents leaving the node equals "
                       "zero.";
    step.equation = joinKclTerms(terms);
    step.explanation = "Current conservation at Node " + node +
                       ". Each term is the current leaving through one "
                       "element.";
    if (!substitutions.empty())
        step.explanation += " Known voltages substituted: " +
                            joinList(substitutions, ", ") + ".";
    step.keyPoint =
        "Currents leaving the node are positive, currents entering are "
        "negative.";
    push(step);
}

void StepNarrator::recordSupernodeKcl(
    int row, const std::vector<std::string>& members,
    const std::vector<std::string>& terms,
    const std::vector<std::string>& substitutions,
    const std::vector<std::string>& internal)
{
    std::string group = "{" + joinList(members, ", ") + "}";

    DerivationStep step;
    step.type = StepType::SupernodeKcl;
    step.row = row;
    step.title =
        "Step " + std::to_string(++kclCount) + ": KCL for Supernode " + group;
    step.description = "Applying KCL to the entire supernode " + group +
                       ": the sum of currents leaving the supernode boundary "
                       "equals zero.";
    step.equation = joinKclTerms(terms);
    step.explanation =
        "Nodes joined by voltage sources are treated as a single region; "
        "voltage source currents stay inside it and cancel.";
    if (!internal.empty())
        step.explanation += " Elements inside the supernode omitted: " +
                            joinList(internal, ", ") + ".";
    if (!substitutions.empty())
        step.explanation += " Known voltages substituted: " +
                            joinList(substitutions, ", ") + ".";
    step.keyPoint =
        "Only currents flowing from a node inside the supernode to a node "
        "outside it are summed.";
    push(step);
}

void StepNarrator::recordConstraint(int row, const std::string& member,
                                    const std::string& representative,
                                    double offset,
                                    const std::vector<std::string>& sources)
{
    DerivationStep step;
    step.type = StepType::Constraint;
    step.row = row;
    step.title = "Voltage Source Constraint: V(" + member + ")";
    step.description = "The voltage source chain " + joinList(sources, ", ") +
                       " fixes the difference between V(" + member +
                       ") and V(" + representative + ").";
    step.equation = "V(" + member + ") - V(" + representative +
                    ") = " + CircuitElement::formatValue(offset);
    step.explanation =
        "Voltage sources define fixed potential differences between nodes, "
        "so V(" +
        member + ") is expressed through the supernode reference V(" +
        representative + ").";
    step.keyPoint = "Each extra supernode member adds one constraint equation.";
    push(step);
}
