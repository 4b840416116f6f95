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
 * @file error.hpp
 * @brief Failure taxonomy shared by every ULID operation.
 *
 * @details
 * All core operations report violated preconditions by throwing `UlidError`.
 * The attached `ErrorCode` identifies which precondition failed, so callers can
 * branch on the category without parsing the message text.
 */

#pragma once

#include <ostream>
#include <stdexcept>
#include <string>

namespace ulidkit::core {

/**
 * @enum ErrorCode
 * @brief Categorizes the precondition that an operation rejected.
 */
enum class ErrorCode {
    OutOfRange,           ///< Timestamp outside `[0, 2^48 - 1]`.
    LengthMismatch,       ///< Binary buffer not 16 bytes, or randomness not 10 bytes.
    InsufficientCapacity, ///< Destination buffer smaller than 16 bytes.
    InvalidFormat,        ///< Canonical string with bad length, character or leading digit.
    Overflow              ///< 80-bit randomness increment ran past its range.
};

/**
 * @brief Returns the stable name of an error category (e.g. `"InvalidFormat"`).
 */
const char* to_string(ErrorCode code);

/// @brief Writes the stable name of `code`.
std::ostream& operator<<(std::ostream& os, ErrorCode code);

/**
 * @class UlidError
 * @brief Exception raised by the identifier type, its codecs and the generator.
 *
 * @code
 * try {
 *     auto id = ulidkit::core::Ulid::parse(input);
 * } catch (const ulidkit::core::UlidError& e) {
 *     if (e.code() == ulidkit::core::ErrorCode::InvalidFormat) { ... }
 * }
 * @endcode
 */
class UlidError : public std::runtime_error {
  public:
    UlidError(ErrorCode code, const std::string& message);

    /// @brief The violated precondition.
    ErrorCode code() const noexcept { return code_; }

  private:
    ErrorCode code_;
};

} // namespace ulidkit::core
