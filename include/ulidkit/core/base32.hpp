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
 * @file base32.hpp
 * @brief Canonical text codec for 128-bit identifiers.
 *
 * @details
 * Converts between the 16-byte binary layout and the 26-character canonical
 * form. The codec treats the buffer as one 128-bit big-endian integer and emits
 * 5-bit digits most-significant first. Because 26 * 5 = 130, the leading digit
 * only carries the top 3 bits of the payload and must be in the range 0-7.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace ulidkit::core {

/**
 * @class Base32
 * @brief Stateless encoder/decoder for the ULID base32 alphabet.
 *
 * @details
 * The alphabet is `0123456789ABCDEFGHJKMNPQRSTVWXYZ` (no `I`, `L`, `O`, `U`).
 * Decoding is case-insensitive and accepts the visually confusable aliases
 * `I`/`L` for `1` and `O` for `0`.
 */
class Base32 {
  public:
    /// @brief Size of the binary payload in bytes.
    static constexpr std::size_t BINARY_SIZE = 16;

    /// @brief Length of the canonical text form.
    static constexpr std::size_t TEXT_SIZE = 26;

    /// @brief Output alphabet, indexed by 5-bit digit value.
    static constexpr const char* ALPHABET = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

    /**
     * @brief Encodes 16 bytes into the 26-character canonical form.
     *
     * @param data The binary payload.
     * @return std::string Uppercase canonical text.
     */
    static std::string encode(const std::array<uint8_t, BINARY_SIZE>& data);

    /**
     * @brief Decodes a canonical string back into its 16-byte payload.
     *
     * **Rejection Criteria** (all raise `UlidError` with `ErrorCode::InvalidFormat`):
     * - Input length is not exactly 26.
     * - A character falls outside the accepted alphabet (including `U`).
     * - The leading digit is greater than 7.
     *
     * @param text The canonical text, in any letter case.
     * @return std::array<uint8_t, 16> The decoded payload.
     */
    static std::array<uint8_t, BINARY_SIZE> decode(const std::string& text);

    /**
     * @brief Maps one character to its 5-bit value.
     *
     * @return int The digit value (0-31), or -1 if the character is not accepted.
     */
    static int digit_value(char c);
};

} // namespace ulidkit::core
