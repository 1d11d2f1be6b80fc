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
 * @file main.cpp
 *
 * @brief Command-line driver for the nodal analysis solver
 */

#include "main.hpp"

#include <getopt.h>

#include <iostream>
#include <stdexcept>

#include "Solver.hpp"
#include "SolverOptions.hpp"

static void printHelp(const char *prog)
{
    std::cout << "Usage: " << prog << " [options] [circuit-file]\n";
    std::cout << "Options:\n";
    std::cout << "  --format <json|text>      Report format (default json)\n";
    std::cout << "  --residual-tol <double>   Max |G*V - I| accepted "
                 "(default 1e-9)\n";
    std::cout << "  --power-tol <double>      Max |sum of powers| in watts "
                 "(default 1e-9)\n";
    std::cout << "  --source-tol <double>     Voltage source loop tolerance "
                 "(default 1e-9)\n";
    std::cout << "  --min-rcond <double>      Smallest reciprocal condition "
                 "accepted (default 1e-13)\n";
    std::cout << "  --diag-file <file>        Diagnostics output file (default "
                 "diagnostics.log)\n";
    std::cout << "  --diag-verbose            Append a diagnostics snapshot\n";
    std::cout << "  --help                    Show this help message\n";
}

static OutputFormat parseFormat(const std::string &text)
{
    if (text == "json") return OutputFormat::Json;
    if (text == "text") return OutputFormat::Text;
    throw std::invalid_argument("format must be 'json' or 'text', got '" +
                                text + "'");
}

int main(int argc, char *argv[])
{
    SolverOptions options;

    static struct option long_options[] = {
        {"format", required_argument, 0, 0},
        {"residual-tol", required_argument, 0, 0},
        {"power-tol", required_argument, 0, 0},
        {"source-tol", required_argument, 0, 0},
        {"min-rcond", required_argument, 0, 0},
        {"diag-file", required_argument, 0, 0},
        {"diag-verbose", no_argument, 0, 0},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}};

    int option_index = 0;
    int c;
    // Use getopt_long to iterate over options; std::stod/stoi failures and
    // validation errors are reported the same way.
    try {
        while ((c = getopt_long(argc, argv, "h", long_options,
                                &option_index)) != -1) {
            if (c == 'h') {
                printHelp(argv[0]);
                return 0;
            } else if (c == 0) {
                std::string name = long_options[option_index].name;
                if (name == "format")
                    options.outputFormat = parseFormat(optarg);
                else if (name == "residual-tol")
                    options.residualTolerance = std::stod(optarg);
                else if (name == "power-tol")
                    options.powerTolerance = std::stod(optarg);
                else if (name == "source-tol")
                    options.sourceTolerance = std::stod(optarg);
                else if (name == "min-rcond")
                    options.minReciprocalCondition = std::stod(optarg);
                else if (name == "diag-file")
                    options.diagFile = std::string(optarg);
                else if (name == "diag-verbose")
                    options.diagVerbose = true;
            } else {
                printHelp(argv[0]);
                return 1;
            }
        }

        // Validate options (throws on bad input)
        options.validate();
    } catch (const std::exception &ex) {
        std::cerr << "Invalid solver option: " << ex.what() << std::endl;
        return 1;
    }

    // Remaining non-option args: [circuit-file]
    std::string filename = "circuit.json";
    if (optind < argc) {
        filename = argv[optind];
    }

    // Prepare argc/argv for solver: program name + filename
    char *new_argv[2];
    new_argv[0] = argv[0];
    new_argv[1] = const_cast<char *>(filename.c_str());

    return runSolver(2, new_argv, options);
}
