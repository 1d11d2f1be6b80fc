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
 * @file CircuitElement.hpp
 * @brief Defines the CircuitElement base class and related enums
 *
 * This file contains the definition of the CircuitElement base class, which
 * represents a two-terminal element in a DC circuit. It also defines enums
 * for element type and grouping, and the interface used by the equation
 * assembler (KCL stamping), the step narrator (equation terms) and the result
 * mapper (branch currents).
 *
 * Reference polarity used by every element:
 *  - the element voltage is V(nodeA) - V(nodeB);
 *  - the element current is positive when it flows from nodeA to nodeB
 *    through the element.
 */

#pragma once

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "NodeBinding.hpp"

// Forward Declaration
class Parser;

/**
 * @enum ElementType
 * @brief Enumerates supported circuit element categories.
 */
enum class ElementType
{
    V, /**< Independent voltage source */
    I, /**< Independent current source */
    R  /**< Resistor */
};

inline std::ostream& operator<<(std::ostream& os, ElementType et)
{
    switch (et) {
        case ElementType::V:
            os << "V";
            break;
        case ElementType::I:
            os << "I";
            break;
        case ElementType::R:
            os << "R";
            break;
        default:
            os << "UnknownElementType";
            break;
    }
    return os;
}

/**
 * @brief Type key used in the analysis summary ("Resistor",
 * "VoltageSource", "CurrentSource").
 */
inline std::string elementTypeKey(ElementType et)
{
    switch (et) {
        case ElementType::V:
            return "VoltageSource";
        case ElementType::I:
            return "CurrentSource";
        case ElementType::R:
            return "Resistor";
    }
    return "UnknownElementType";
}

/**
 * @enum Group
 * @brief How the branch current of an element is obtained.
 *
 *  - G1: the current is a function of the terminal voltages (resistors,
 *        current sources) and is computed directly by the result mapper.
 *  - G2: the element fixes a voltage instead (ideal voltage sources). Its
 *        current is not a function of node voltages and is recovered from KCL
 *        at its terminals after the solve.
 */
enum class Group
{
    G1, /**< Group 1: current follows from terminal voltages */
    G2  /**< Group 2: current recovered from KCL after the solve */
};

inline std::ostream& operator<<(std::ostream& os, Group group)
{
    switch (group) {
        case Group::G1:
            os << "G1";
            break;
        case Group::G2:
            os << "G2";
            break;
        default:
            os << "UnknownGroup";
            break;
    }
    return os;
}

/**
 * @class CircuitElement
 * @brief Base class representing a generic element in an electrical circuit.
 *
 * Elements are immutable once constructed; all analysis hooks are const so a
 * single element list can be solved from several threads at once. Adding a
 * new element kind (for example a dependent source) means adding a subclass
 * with its own stamping rule; the graph, supernode and solve stages do not
 * change.
 */
class CircuitElement
{
   protected:
    /**
     * @brief Name of the element (unique identifier)
     */
    std::string name;

    /**
     * @brief Name of the starting node
     */
    std::string nodeA;

    /**
     * @brief Name of the ending node
     */
    std::string nodeB;

    /**
     * @brief Group classification for the element (G1 or G2)
     */
    Group group = Group::G1;

    /**
     * @brief Value of the element (ohms, volts or amperes)
     */
    double value;

    /**
     * @brief Type of the element (enum)
     */
    ElementType type;

   public:
    /**
     * @brief Construct a CircuitElement
     * @param name Name of the element
     * @param nodeA Starting node name
     * @param nodeB Ending node name
     * @param value Value of the element
     */
    CircuitElement(const std::string& name, const std::string& nodeA,
                   const std::string& nodeB, double value)
        : name(name), nodeA(nodeA), nodeB(nodeB), value(value)
    {
    }

    /**
     * @brief Virtual destructor
     */
    virtual ~CircuitElement() = default;

    /**
     * @brief Stamp the element into the KCL row of one of its terminals.
     *
     * The row expresses "sum of currents leaving the node = 0" with unknown
     * node voltages on the left (`G`) and constants moved to the right
     * (`I`). The assembler calls this once per terminal that owns a row.
     *
     * @param G Conductance matrix (mutated in row `row`).
     * @param I Current vector (mutated at `row`).
     * @param row Row being assembled.
     * @param self Binding of the terminal the row belongs to.
     * @param other Binding of the opposite terminal.
     * @param selfIsNodeA True when `self` is the element's nodeA.
     */
    virtual void stampKCL(Eigen::MatrixXd& G, Eigen::VectorXd& I, int row,
                          const NodeBinding& self, const NodeBinding& other,
                          bool selfIsNodeA) const = 0;

    /**
     * @brief Text of the current leaving `self` through this element.
     *
     * Used by the step narrator. Returns an empty string when the element
     * contributes nothing to the KCL row.
     */
    virtual std::string kclTerm(const NodeBinding& self,
                                const NodeBinding& other,
                                bool selfIsNodeA) const = 0;

    /**
     * @brief Branch current (nodeA -> nodeB) given the terminal voltages.
     *
     * Only meaningful for Group::G1 elements.
     */
    virtual double branchCurrent(double vA, double vB) const = 0;

    /** @brief Display name of the element kind, e.g. "Resistor". */
    virtual std::string typeName() const = 0;

    /** @brief Unit symbol of `value`. */
    virtual std::string unit() const = 0;

    /** @brief Sign convention statement used in the analysis summary. */
    virtual std::string convention() const = 0;

    /**
     * @brief Parses a circuit element from tokens
     *
     * Dispatches on the first letter of the element name (R, V, I) to the
     * concrete element factory.
     *
     * @param parser Reference to the parser
     * @param tokens Tokenized line from netlist
     * @param lineNumber Line number in netlist
     * @return Shared pointer to created CircuitElement, nullptr on error
     */
    static std::shared_ptr<CircuitElement> parse(
        Parser& parser, const std::vector<std::string>& tokens, int lineNumber);

    /**
     * @brief Compact text for a numeric value used in equations and
     * descriptions (six significant digits).
     */
    static std::string formatValue(double value);

    /**
     * @brief Gets the element name
     * @return Name of the element
     */
    std::string getName() const { return name; }

    /**
     * @brief Gets the starting node name
     * @return Name of nodeA
     */
    std::string getNodeA() const { return nodeA; }

    /**
     * @brief Gets the ending node name
     * @return Name of nodeB
     */
    std::string getNodeB() const { return nodeB; }

    /**
     * @brief Gets the element value
     */
    double getValue() const { return value; }

    /**
     * @brief Gets the element type
     */
    ElementType getType() const { return type; }

    /**
     * @brief Gets the group classification
     * @return Group enum value
     */
    Group getGroup() const { return group; }
};
