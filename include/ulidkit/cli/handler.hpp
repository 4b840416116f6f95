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
 * @file handler.hpp
 * @brief Command dispatcher for the `ulidkit` tool.
 *
 * @details
 * Decouples argument interpretation from process bootstrap: `main` handles
 * global options and logging configuration, then hands the remaining arguments
 * to `Handler::process`, which runs one subcommand against the core API.
 */

#pragma once

#include "ulidkit/core/ulid.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace ulidkit::cli {

/// @brief Command completed.
constexpr int EXIT_OK = 0;

/// @brief Command ran but its input was rejected by the core.
constexpr int EXIT_FAILED = 1;

/// @brief Unknown subcommand or wrong argument count.
constexpr int EXIT_USAGE = 2;

/**
 * @class Handler
 * @brief A static controller that decodes a subcommand and prints its result.
 *
 * @details
 * **Subcommands:**
 * - `gen [COUNT]` : Generate COUNT (default 1) identifiers, one per line.
 * - `from MILLIS RANDOMNESS` : Build from a timestamp and 20 hex digits.
 * - `bin CANONICAL` : Convert canonical form to 32 hex digits.
 * - `cano HEX` : Convert 32 hex digits to canonical form.
 * - `time VALUE` : Print the UTC time of a canonical or hex identifier.
 * - `rand VALUE` : Print the randomness of a canonical or hex identifier.
 */
class Handler {
  public:
    /**
     * @brief Executes one subcommand.
     *
     * Failures raised by the core are logged at `ERROR` and mapped to an exit
     * code; they never escape this function.
     *
     * @param args Subcommand name followed by its arguments.
     * @param out Receives the command output.
     * @param err Receives usage diagnostics.
     *
     * @return int `EXIT_OK`, `EXIT_FAILED` or `EXIT_USAGE`.
     */
    static int process(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

    /// @brief Prints usage instructions.
    static void print_help(std::ostream& os, const std::string& binary_name);

    /**
     * @brief Interprets a value as 32 hex digits (binary form) or canonical text.
     *
     * @throws core::UlidError or std::invalid_argument for malformed input.
     */
    static core::Ulid resolve(const std::string& value);
};

} // namespace ulidkit::cli
