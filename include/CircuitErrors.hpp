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
 * @file CircuitErrors.hpp
 * @brief Exception types raised by the nodal analysis pipeline.
 *
 * Every fatal condition detected while analysing a circuit is reported by
 * throwing a subclass of `CircuitError`. Each error carries an `ErrorKind`
 * tag (used by the JSON error payload), a human readable message and a short
 * suggestion telling the user what to check. Some errors also name the nodes
 * that caused them.
 *
 * Non-fatal numerical tolerance violations are not exceptions; they are
 * reported through the `verified` / `powerBalance` flags of the solution and
 * a "Warning:" line on stderr.
 */

#pragma once

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @enum ErrorKind
 * @brief Classification of fatal circuit analysis failures.
 */
enum class ErrorKind
{
    Validation,         /**< Malformed component list or topology */
    InconsistentSource, /**< Voltage sources imposing conflicting values */
    SingularSystem,     /**< Assembled system singular or ill-conditioned */
    Underconstrained    /**< Node with no resistive/source path to ground */
};

inline std::ostream& operator<<(std::ostream& os, ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::Validation:
            os << "ValidationError";
            break;
        case ErrorKind::InconsistentSource:
            os << "InconsistentSourceError";
            break;
        case ErrorKind::SingularSystem:
            os << "SingularSystemError";
            break;
        case ErrorKind::Underconstrained:
            os << "UnderconstrainedCircuitError";
            break;
        default:
            os << "UnknownError";
            break;
    }
    return os;
}

/**
 * @class CircuitError
 * @brief Base class of all fatal circuit analysis errors.
 */
class CircuitError : public std::runtime_error
{
   public:
    CircuitError(ErrorKind kind, const std::string& message,
                 const std::string& suggestion,
                 const std::vector<std::string>& nodes = {})
        : std::runtime_error(message),
          kind(kind),
          suggestion(suggestion),
          nodes(nodes)
    {
    }

    /** @brief Error classification. */
    ErrorKind getKind() const { return kind; }

    /** @brief Short hint for the user about what to check. */
    const std::string& getSuggestion() const { return suggestion; }

    /** @brief Labels of the nodes involved, when known. */
    const std::vector<std::string>& getNodes() const { return nodes; }

   private:
    ErrorKind kind;
    std::string suggestion;
    std::vector<std::string> nodes;
};

/**
 * @brief Raised by the topology builder and the input readers for malformed
 * component lists (no ground, zero-length branch, disconnected nodes, bad
 * values, duplicate names, unknown component types).
 */
class ValidationError : public CircuitError
{
   public:
    explicit ValidationError(const std::string& message,
                             const std::vector<std::string>& nodes = {})
        : CircuitError(ErrorKind::Validation, message,
                       "Check circuit connectivity and component values", nodes)
    {
    }
};

/**
 * @brief Raised when voltage sources in a loop (or in parallel) impose
 * conflicting potential differences.
 */
class InconsistentSourceError : public CircuitError
{
   public:
    explicit InconsistentSourceError(const std::string& message,
                                     const std::vector<std::string>& nodes = {})
        : CircuitError(ErrorKind::InconsistentSource, message,
                       "Remove or correct voltage sources that form a loop "
                       "with conflicting values",
                       nodes)
    {
    }
};

/**
 * @brief Raised when the assembled system cannot be solved reliably even
 * though every node has a path to ground.
 */
class SingularSystemError : public CircuitError
{
   public:
    explicit SingularSystemError(const std::string& message,
                                 const std::vector<std::string>& nodes = {})
        : CircuitError(ErrorKind::SingularSystem, message,
                       "Check for floating subcircuits or extreme component "
                       "values",
                       nodes)
    {
    }
};

/**
 * @brief Raised when some node voltages are not determined because the nodes
 * reach ground only through current sources.
 */
class UnderconstrainedCircuitError : public CircuitError
{
   public:
    explicit UnderconstrainedCircuitError(
        const std::string& message, const std::vector<std::string>& nodes = {})
        : CircuitError(ErrorKind::Underconstrained, message,
                       "Provide a resistive or voltage source path from every "
                       "node to ground",
                       nodes)
    {
    }
};
