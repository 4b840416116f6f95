/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file main.cpp
 * @brief Application Entry Point (Bootstrap).
 *
 * @details
 * This file contains the `main` function which orchestrates the startup sequence:
 * 1. Logging configuration (environment, then `--log-level`).
 * 2. Global option parsing.
 * 3. Subcommand dispatch through `cli::Handler`.
 */

#include "ulidkit/cli/handler.hpp"
#include "ulidkit/infra/logger.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using ulidkit::infra::Logger;
using ulidkit::infra::LogLevel;

/**
 * @brief Applies `ULIDKIT_LOG_LEVEL` as the initial log threshold.
 */
static void configure_from_environment()
{
    const char* env = std::getenv("ULIDKIT_LOG_LEVEL");
    if (!env) {
        return;
    }

    LogLevel level;
    if (Logger::parse_level(env, level)) {
        Logger::set_level(level);
    } else {
        Logger::log(LogLevel::WARN,
                    "Config: Ignoring unknown ULIDKIT_LOG_LEVEL '" + std::string(env) + "'.");
    }
}

/**
 * @brief Main Execution Entry Point.
 */
int main(int argc, char* argv[])
{
    configure_from_environment();

    std::vector<std::string> args;
    try {
        // 1. Parse Global Options (must precede the command)
        int i = 1;
        for (; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                ulidkit::cli::Handler::print_help(std::cout, argv[0]);
                return ulidkit::cli::EXIT_OK;
            }
            if (arg == "--log-level") {
                LogLevel level;
                if (i + 1 >= argc || !Logger::parse_level(argv[i + 1], level)) {
                    std::cerr << "Error: --log-level requires one of "
                                 "trace|debug|info|warn|error|fatal\n";
                    return ulidkit::cli::EXIT_USAGE;
                }
                Logger::set_level(level);
                ++i;
                continue;
            }
            break;
        }

        // 2. Collect Command and Arguments
        for (; i < argc; ++i) {
            args.emplace_back(argv[i]);
        }

        Logger::log(LogLevel::DEBUG, "System: ulidkit v1.0.0 starting.");

        // 3. Dispatch
        return ulidkit::cli::Handler::process(args, std::cout, std::cerr);

    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "System: Critical Failure: " + std::string(e.what()));
        return ulidkit::cli::EXIT_FAILED;
    }
}
