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
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility for ulidkit.
 *
 * @details
 * This header declares the `Logger` class, the centralized reporting interface
 * for the library and the command-line tool. Diagnostics always go to standard
 * error so that command output on standard output stays machine-readable.
 */

#pragma once

#include <mutex>
#include <string>

namespace ulidkit::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Granular execution flow details.
    DEBUG, ///< Diagnostic information for development and troubleshooting.
    INFO,  ///< Nominal operational events.
    WARN,  ///< Non-blocking anomalies (e.g. an exhausted generation stream).
    ERROR, ///< A command failed; the process reports a non-zero exit code.
    FATAL  ///< Unexpected failures that abort the process.
};

/**
 * @class Logger
 * @brief A static utility class providing system-wide logging capabilities.
 *
 * @details
 * Writes are serialized by an internal mutex so entries from concurrent
 * threads never interleave. Messages below the configured threshold are
 * discarded before any formatting takes place.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to standard error.
     *
     * The output includes a timestamp, the severity tag, and the payload.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * // Example Usage:
     * ulidkit::infra::Logger::log(LogLevel::ERROR, "CLI: 'ZZZ' is not a valid ULID.");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Sets the minimum severity that reaches the console.
     *
     * Defaults to `WARN`.
     */
    static void set_level(LogLevel level);

    /// @brief Current minimum severity.
    static LogLevel level();

    /**
     * @brief Resolves a level name (`trace`, `debug`, `info`, `warn`, `error`, `fatal`).
     *
     * Matching is case-insensitive; `warning` is accepted for `warn`.
     *
     * @param name The textual level.
     * @param out Receives the level on success.
     * @return true If `name` was recognized.
     */
    static bool parse_level(const std::string& name, LogLevel& out);

  private:
    /// @brief Guards the threshold and the console stream.
    static std::mutex mutex_;

    static LogLevel threshold_;
};

} // namespace ulidkit::infra
