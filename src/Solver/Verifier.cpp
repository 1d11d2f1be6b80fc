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
 * @file Verifier.cpp
 * @brief Implementation of the residual verifier.
 */

#include "Verifier.hpp"

#include <cmath>
#include <iostream>

Verification verifySolution(const LinearSystem &system,
                            const Eigen::VectorXd &x,
                            const SolverOptions &options)
{
    Verification verification;
    if (system.size() == 0) {
        verification.residual.resize(0);
        return verification;
    }

    verification.residual = system.G * x - system.I;
    verification.maxError = verification.residual.cwiseAbs().maxCoeff();
    verification.verified = std::isfinite(verification.maxError) &&
                            verification.maxError < options.residualTolerance;

    if (!verification.verified) {
        std::cerr << "Warning: Solution residual " << verification.maxError
                  << " exceeds tolerance " << options.residualTolerance
                  << std::endl;
    }
    return verification;
}
