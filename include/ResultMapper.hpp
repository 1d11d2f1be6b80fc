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
 * @file ResultMapper.hpp
 * @brief Back-substitution of node voltages into per-component results.
 *
 * For every element the mapper computes, with the passive sign convention:
 *  - voltage = V(nodeA) - V(nodeB);
 *  - current from nodeA to nodeB through the element;
 *  - power = voltage * current (positive = absorbing, negative = supplying).
 *
 * Resistor and current source currents follow directly from the voltages.
 * Voltage source currents are recovered per group of sources joined at
 * common nodes by solving KCL at the group's nodes for the source currents
 * (Eigen CompleteOrthogonalDecomposition). Trees of sources, series chains
 * included, give a unique answer. Sources closing a loop (for example two
 * identical sources in parallel) share the current with the minimum-norm
 * split, and a warning is printed.
 *
 * `mapComponents` depends only on its inputs, so mapping the same voltages
 * again reproduces the same currents.
 */

#pragma once

#include <string>
#include <vector>

#include <Eigen/Dense>

#include "SolverOptions.hpp"
#include "Topology.hpp"

/** @brief |power| at or below this value is described as "no power". */
constexpr double POWER_DISPLAY_THRESHOLD = 1e-12;

/**
 * @struct ComponentResult
 * @brief Voltage, current and power of one element.
 */
struct ComponentResult
{
    std::string name;
    std::string type; /**< Display type, e.g. "Resistor" */
    double value = 0.0;
    std::string unit;
    std::string node1; /**< nodeA label (ground reported as "0") */
    std::string node2; /**< nodeB label */
    double voltage = 0.0;
    double current = 0.0;
    double power = 0.0;
    std::string description;
};

/**
 * @brief Compute per-element results from the full node voltage vector.
 *
 * @param circuit Circuit graph.
 * @param nodeVoltages Voltage of every canonical node (index 0 = 0 V).
 * @return One result per element, in input order.
 */
std::vector<ComponentResult> mapComponents(const Circuit &circuit,
                                           const Eigen::VectorXd &nodeVoltages);

/** @brief Sum of component powers. */
double totalPower(const std::vector<ComponentResult> &components);

/**
 * @brief Power balance check: |sum P| < options.powerTolerance (watts).
 */
bool powerBalances(const std::vector<ComponentResult> &components,
                   const SolverOptions &options = SolverOptions());

/**
 * @brief "Resistor R1: absorbing 0.144 W", "...: supplying ...", or
 * "...: no power".
 */
std::string describePower(const std::string &type, const std::string &name,
                          double power);
