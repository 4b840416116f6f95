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
 * @file handler.cpp
 * @brief Implementation of the `ulidkit` subcommand pipeline.
 *
 * @details
 * Each invocation follows the same lifecycle:
 * 1. **Decode**: Match the subcommand and check its argument count.
 * 2. **Sanitize**: Trim every argument.
 * 3. **Execute**: Call the core API.
 * 4. **Respond**: Print the result on `out`, or log the failure and return
 * a non-zero exit code.
 */

#include "ulidkit/cli/handler.hpp"

#include "ulidkit/core/generator.hpp"
#include "ulidkit/infra/logger.hpp"
#include "ulidkit/infra/string.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace ulidkit::cli {

namespace {

/// @brief Length of the hexadecimal binary form (16 bytes).
constexpr std::size_t HEX_SIZE = 32;

/**
 * @brief Strict decimal parse. Rejects signs, spaces and trailing garbage,
 * which `std::stoull` would otherwise tolerate.
 */
uint64_t parse_u64(const std::string& text)
{
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) {
            return std::isdigit(c) != 0;
        })) {
        throw std::invalid_argument("'" + text + "' is not a non-negative integer");
    }
    return std::stoull(text);
}

int usage_error(std::ostream& err, const std::string& message)
{
    err << "Error: " << message << "\n"
        << "Run with --help for usage.\n";
    return EXIT_USAGE;
}

} // namespace

core::Ulid Handler::resolve(const std::string& value)
{
    if (value.size() == HEX_SIZE) {
        return core::Ulid::from_bytes(infra::String::from_hex(value));
    }
    return core::Ulid::parse(value);
}

int Handler::process(const std::vector<std::string>& args, std::ostream& out, std::ostream& err)
{
    if (args.empty()) {
        return usage_error(err, "missing command");
    }

    const std::string& command = args[0];
    std::vector<std::string> params;
    for (std::size_t i = 1; i < args.size(); ++i) {
        params.push_back(infra::String::trim(args[i]));
    }

    infra::Logger::log(infra::LogLevel::DEBUG,
                       "CLI: Dispatching '" + command + "' with " +
                           std::to_string(params.size()) + " argument(s).");

    try {
        if (command == "gen") {
            if (params.size() > 1) {
                return usage_error(err, "gen takes at most one argument");
            }
            uint64_t count = params.empty() ? 1 : parse_u64(params[0]);
            auto& stream = core::Generator::thread_default();
            for (uint64_t i = 0; i < count; ++i) {
                out << stream.generate() << "\n";
            }
        } else if (command == "from") {
            if (params.size() != 2) {
                return usage_error(err, "from requires MILLIS and RANDOMNESS");
            }
            core::Ulid id(parse_u64(params[0]), infra::String::from_hex(params[1]));
            out << id << "\n";
        } else if (command == "bin") {
            if (params.size() != 1) {
                return usage_error(err, "bin requires a canonical value");
            }
            auto id = core::Ulid::parse(params[0]);
            out << infra::String::to_hex(id.to_bytes()) << "\n";
        } else if (command == "cano") {
            if (params.size() != 1) {
                return usage_error(err, "cano requires a hex value");
            }
            auto id = core::Ulid::from_bytes(infra::String::from_hex(params[0]));
            out << id << "\n";
        } else if (command == "time") {
            if (params.size() != 1) {
                return usage_error(err, "time requires a value");
            }
            out << infra::String::format_utc_millis(resolve(params[0]).timestamp()) << "\n";
        } else if (command == "rand") {
            if (params.size() != 1) {
                return usage_error(err, "rand requires a value");
            }
            auto randomness = resolve(params[0]).randomness();
            out << infra::String::to_hex(randomness.data(), randomness.size()) << "\n";
        } else {
            return usage_error(err, "unknown command '" + command + "'");
        }
    } catch (const std::exception& e) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           "CLI: Command '" + command + "' failed: " + e.what());
        return EXIT_FAILED;
    }

    return EXIT_OK;
}

void Handler::print_help(std::ostream& os, const std::string& binary_name)
{
    os << "Usage: " << binary_name << " [--log-level LEVEL] COMMAND [ARGS]\n"
       << "Commands:\n"
       << "  gen [COUNT]             Generate COUNT new ULIDs (Default: 1)\n"
       << "  from MILLIS RANDOMNESS  Create a ULID from a Unix millisecond timestamp\n"
       << "                          and 20 hex digits of randomness\n"
       << "  bin CANONICAL           Convert a canonical form to binary (hex) form\n"
       << "  cano HEX                Convert a binary (hex) form to canonical form\n"
       << "  time VALUE              Get the time part in UTC\n"
       << "  rand VALUE              Get the randomness part as hex\n"
       << "Options:\n"
       << "  --log-level LEVEL       trace|debug|info|warn|error|fatal (Default: warn,\n"
       << "                          or $ULIDKIT_LOG_LEVEL)\n"
       << "  --help                  Show this help message\n"
       << "VALUE is either a 26-character canonical form or 32 hex digits.\n";
}

} // namespace ulidkit::cli
