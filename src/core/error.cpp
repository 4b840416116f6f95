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
 * @file error.cpp
 * @brief Implementation of the ULID failure taxonomy.
 */

#include "ulidkit/core/error.hpp"

namespace ulidkit::core {

const char* to_string(ErrorCode code)
{
    switch (code) {
    case ErrorCode::OutOfRange:
        return "OutOfRange";
    case ErrorCode::LengthMismatch:
        return "LengthMismatch";
    case ErrorCode::InsufficientCapacity:
        return "InsufficientCapacity";
    case ErrorCode::InvalidFormat:
        return "InvalidFormat";
    case ErrorCode::Overflow:
        return "Overflow";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream& os, ErrorCode code)
{
    return os << to_string(code);
}

/**
 * @brief Builds the exception message as `<Code>: <message>`.
 *
 * Prefixing the category keeps log lines self-describing when the error is
 * reported at the process boundary.
 */
UlidError::UlidError(ErrorCode code, const std::string& message)
    : std::runtime_error(std::string(to_string(code)) + ": " + message), code_(code)
{
}

} // namespace ulidkit::core
