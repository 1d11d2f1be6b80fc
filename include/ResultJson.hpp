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
 * @file ResultJson.hpp
 * @brief JSON serialization of solutions and errors (nlohmann::json).
 *
 * Success payload:
 * @code
 * { "status": "success",
 *   "voltages": { "0": 0.0, "N1": 12.0 },
 *   "components": [ { "name", "type", "value", "unit", "node1", "node2",
 *                     "voltage", "current", "power", "description" } ],
 *   "total_power": 0.0,
 *   "matrix_solution": { "conductance_matrix", "current_vector",
 *                        "voltage_solution", "unknowns", "matrix_equation",
 *                        "solution_method", "steps", "verification" },
 *   "summary": { "total_components", "solved_nodes", "power_balance" },
 *   "analysis": { ... circuit statistics ... } }
 * @endcode
 *
 * Error payload:
 * @code
 * { "status": "error", "kind": "ValidationError", "message": "...",
 *   "suggestion": "...", "nodes": [ ... ] }
 * @endcode
 */

#pragma once

#include <nlohmann/json.hpp>

#include "CircuitErrors.hpp"
#include "Solver.hpp"

/** @brief Success payload of a solved circuit. */
nlohmann::json toJson(const CircuitSolution &solution);

/** @brief Error payload of a failed solve. */
nlohmann::json errorToJson(const CircuitError &error);

/** @brief One derivation step as a JSON object. */
nlohmann::json stepToJson(const DerivationStep &step);
