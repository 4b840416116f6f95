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
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * This header defines the `String` utility class, a static extension to
 * `std::string` covering the text chores of the command-line tool and the
 * database mapping: whitespace trimming, hexadecimal conversion, and ISO 8601
 * rendering of millisecond timestamps.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ulidkit::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * @param s The source string to process.
     * @return std::string The trimmed content, or an empty string if `s` is
     * empty or consists solely of whitespace.
     */
    static std::string trim(const std::string& s);

    /**
     * @brief Renders bytes as uppercase hexadecimal, two digits per byte.
     *
     * @code
     * // Example Usage:
     * uint8_t raw[] = {0x01, 0xAB};
     * std::string hex = ulidkit::infra::String::to_hex(raw, 2); // "01AB"
     * @endcode
     */
    static std::string to_hex(const uint8_t* data, std::size_t length);

    /// @copydoc to_hex(const uint8_t*, std::size_t)
    static std::string to_hex(const std::vector<uint8_t>& data);

    /**
     * @brief Parses hexadecimal text (either letter case) into bytes.
     *
     * @throws std::invalid_argument For an odd number of digits or a non-hex character.
     */
    static std::vector<uint8_t> from_hex(const std::string& hex);

    /**
     * @brief Formats milliseconds since the Unix epoch as UTC ISO 8601.
     *
     * Output shape: `YYYY-MM-DDTHH:MM:SS.mmmZ`, e.g. `2021-05-13T10:00:32.009Z`.
     */
    static std::string format_utc_millis(uint64_t millis);
};

} // namespace ulidkit::infra
