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

#pragma once

#include <cmath>
#include <stdexcept>
#include <string>

/*
 * SolverOptions.hpp
 *
 * Lightweight configuration container for runtime solver options.
 *
 * This header declares `SolverOptions`, a simple POD-style struct that carries
 * solver configuration knobs from the command-line driver (or tests) into the
 * analysis pipeline. The options control the numerical tolerances used by the
 * supernode resolver, the linear solver and the verifier, the diagnostic
 * output and the format of the command-line report.
 */

/**
 * @enum OutputFormat
 * @brief Format of the report printed by the command-line driver.
 */
enum class OutputFormat
{
    Json, /**< JSON result payload (default) */
    Text  /**< Human readable tables */
};

/**
 * @struct SolverOptions
 * @brief Runtime options controlling solver tolerances and diagnostics.
 *
 * Fields in this struct are intentionally public to allow easy construction and
 * modification at the call-site (e.g., parsing CLI flags). Callers should
 * invoke `validate()` after setting options to ensure values are sensible.
 */
struct SolverOptions
{
    /**
     * @brief Verification threshold on max |G*V - I|.
     *
     * A solution whose residual exceeds this value is still returned but is
     * flagged as not verified and a warning is printed.
     */
    double residualTolerance = 1e-9;

    /**
     * @brief Absolute tolerance of the power balance check, in watts.
     *
     * Power balances when |sum of component powers| is below
     * `powerTolerance`. Circuits dissipating kilowatts may need a looser
     * value (`--power-tol`) since rounding grows with the power in play.
     */
    double powerTolerance = 1e-9;

    /**
     * @brief Relative tolerance used when comparing voltage source loops.
     *
     * Two source chains between the same nodes are consistent when their
     * voltages differ by at most `sourceTolerance * max(1, |V1|, |V2|)`.
     */
    double sourceTolerance = 1e-9;

    /**
     * @brief Smallest acceptable reciprocal condition number of G.
     *
     * Systems whose LU factorization reports a smaller rcond are treated as
     * singular.
     */
    double minReciprocalCondition = 1e-13;

    /** @brief Path to the diagnostic log file written by the solver. */
    std::string diagFile = "diagnostics.log";

    /**
     * @brief Append a diagnostic snapshot (bindings, G, I, solution,
     * residual) of every solve to `diagFile`.
     */
    bool diagVerbose = false;

    /** @brief Report format used by the command-line driver. */
    OutputFormat outputFormat = OutputFormat::Json;

    /**
     * @brief Validate option values.
     *
     * Throws:
     *   - std::invalid_argument if a tolerance is not a positive finite
     *     number, if the rcond threshold is outside [0, 1), or if verbose
     *     diagnostics are requested without a diagnostics file.
     */
    void validate() const
    {
        if (!(residualTolerance > 0.0) || !std::isfinite(residualTolerance))
            throw std::invalid_argument("residualTolerance must be > 0");
        if (!(powerTolerance > 0.0) || !std::isfinite(powerTolerance))
            throw std::invalid_argument("powerTolerance must be > 0");
        if (!(sourceTolerance > 0.0) || !std::isfinite(sourceTolerance))
            throw std::invalid_argument("sourceTolerance must be > 0");
        if (!(minReciprocalCondition >= 0.0) || minReciprocalCondition >= 1.0)
            throw std::invalid_argument(
                "minReciprocalCondition must be in [0, 1)");
        if (diagVerbose && diagFile.empty())
            throw std::invalid_argument(
                "diagFile must be set when diagVerbose is enabled");
    }
};
