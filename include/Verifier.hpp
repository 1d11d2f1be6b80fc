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
 * @file Verifier.hpp
 * @brief Residual check of a solved nodal system.
 */

#pragma once

#include <Eigen/Dense>

#include "Assembler.hpp"
#include "SolverOptions.hpp"

/**
 * @struct Verification
 * @brief Residual G*V - I of a solution and whether it is within tolerance.
 *
 * `verified == false` is the numerical tolerance warning state: the solution
 * is still usable but should not be trusted blindly.
 */
struct Verification
{
    Eigen::VectorXd residual;
    double maxError = 0.0;
    bool verified = true;
};

/**
 * @brief Recompute the residual of `x` and compare it against
 * `options.residualTolerance`.
 *
 * Prints a "Warning:" line to stderr when the tolerance is exceeded.
 */
Verification verifySolution(const LinearSystem &system,
                            const Eigen::VectorXd &x,
                            const SolverOptions &options = SolverOptions());
