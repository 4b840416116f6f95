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
 * @file base32.cpp
 * @brief Implementation of the canonical ULID text codec.
 *
 * @details
 * Both directions use one fixed bit-extraction formula per output symbol rather
 * than a generic bit accumulator. Each formula reads at most two adjacent inputs,
 * which makes every line directly comparable with the published reference
 * implementations. Layout of the 130-bit digit stream over the 128-bit payload:
 *
 * @code
 *  digit:  0    1     2     3     4     5     6     7     8     9   ...
 *  bits:  [3]  [5]   [5]   [5]   [5]   [5]   [5]   [5]   [5]   [5]  ...
 *  byte:  |--- 0 ---|--- 1 ---|--- 2 ---|--- 3 ---|--- 4 ---|--- 5 ---| ...
 * @endcode
 */

#include "ulidkit/core/base32.hpp"

#include "ulidkit/core/error.hpp"

namespace ulidkit::core {

namespace {

// Inverse alphabet over 7-bit ASCII. -1 marks rejected characters.
// I/i and L/l alias 1, O/o aliases 0.
constexpr int8_t INVERSE[128] = {
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x00
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x10
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 0x20
    0,  1,  2,  3,  4,  5,  6,  7,  8,  9,  -1, -1, -1, -1, -1, -1, // 0-9
    -1, 10, 11, 12, 13, 14, 15, 16, 17, 1,  18, 19, 1,  20, 21, 0,  // @ A-O
    22, 23, 24, 25, 26, -1, 27, 28, 29, 30, 31, -1, -1, -1, -1, -1, // P-Z
    -1, 10, 11, 12, 13, 14, 15, 16, 17, 1,  18, 19, 1,  20, 21, 0,  // ` a-o
    22, 23, 24, 25, 26, -1, 27, 28, 29, 30, 31, -1, -1, -1, -1, -1, // p-z
};

} // namespace

int Base32::digit_value(char c)
{
    auto index = static_cast<unsigned char>(c);
    if (index >= 128) {
        return -1;
    }
    return INVERSE[index];
}

/**
 * @brief Emits the 26 canonical symbols for a 16-byte payload.
 *
 * Symbols 0-9 cover the 48-bit timestamp (bytes 0-5), symbols 10-25 cover
 * the 80-bit randomness (bytes 6-15). The randomness block splits into two
 * identical 40-bit groups (bytes 6-10 and 11-15) of 8 symbols each.
 */
std::string Base32::encode(const std::array<uint8_t, BINARY_SIZE>& d)
{
    const char* a = ALPHABET;
    std::string out(TEXT_SIZE, '0');

    // Timestamp.
    out[0] = a[d[0] >> 5];
    out[1] = a[d[0] & 0x1F];
    out[2] = a[d[1] >> 3];
    out[3] = a[((d[1] & 0x07) << 2) | (d[2] >> 6)];
    out[4] = a[(d[2] >> 1) & 0x1F];
    out[5] = a[((d[2] & 0x01) << 4) | (d[3] >> 4)];
    out[6] = a[((d[3] & 0x0F) << 1) | (d[4] >> 7)];
    out[7] = a[(d[4] >> 2) & 0x1F];
    out[8] = a[((d[4] & 0x03) << 3) | (d[5] >> 5)];
    out[9] = a[d[5] & 0x1F];

    // Randomness, first 40 bits.
    out[10] = a[d[6] >> 3];
    out[11] = a[((d[6] & 0x07) << 2) | (d[7] >> 6)];
    out[12] = a[(d[7] >> 1) & 0x1F];
    out[13] = a[((d[7] & 0x01) << 4) | (d[8] >> 4)];
    out[14] = a[((d[8] & 0x0F) << 1) | (d[9] >> 7)];
    out[15] = a[(d[9] >> 2) & 0x1F];
    out[16] = a[((d[9] & 0x03) << 3) | (d[10] >> 5)];
    out[17] = a[d[10] & 0x1F];

    // Randomness, last 40 bits.
    out[18] = a[d[11] >> 3];
    out[19] = a[((d[11] & 0x07) << 2) | (d[12] >> 6)];
    out[20] = a[(d[12] >> 1) & 0x1F];
    out[21] = a[((d[12] & 0x01) << 4) | (d[13] >> 4)];
    out[22] = a[((d[13] & 0x0F) << 1) | (d[14] >> 7)];
    out[23] = a[(d[14] >> 2) & 0x1F];
    out[24] = a[((d[14] & 0x03) << 3) | (d[15] >> 5)];
    out[25] = a[d[15] & 0x1F];

    return out;
}

/**
 * @brief Rebuilds the 16-byte payload from canonical text.
 *
 * Implementation Strategy:
 * 1. **Length Gate**: Rejects anything that is not exactly 26 symbols.
 * 2. **Symbol Mapping**: Resolves every symbol through the inverse table first,
 * so no byte is assembled from a rejected character.
 * 3. **Headroom Check**: The leading digit may only use its low 3 bits.
 * 4. **Reassembly**: Inverts each encoding formula; high bits shifted past the
 * byte boundary are discarded by the narrowing cast.
 */
std::array<uint8_t, Base32::BINARY_SIZE> Base32::decode(const std::string& text)
{
    if (text.size() != TEXT_SIZE) {
        throw UlidError(ErrorCode::InvalidFormat,
                        "canonical form must be 26 characters, got " +
                            std::to_string(text.size()));
    }

    std::array<uint8_t, TEXT_SIZE> v{};
    for (std::size_t i = 0; i < TEXT_SIZE; ++i) {
        int value = digit_value(text[i]);
        if (value < 0) {
            throw UlidError(ErrorCode::InvalidFormat, "'" + text + "' is not a valid ULID");
        }
        v[i] = static_cast<uint8_t>(value);
    }

    if (v[0] > 7) {
        throw UlidError(ErrorCode::InvalidFormat,
                        "'" + text + "' overflows 128 bits (leading digit above 7)");
    }

    std::array<uint8_t, BINARY_SIZE> d{};

    // Timestamp.
    d[0] = static_cast<uint8_t>((v[0] << 5) | v[1]);
    d[1] = static_cast<uint8_t>((v[2] << 3) | (v[3] >> 2));
    d[2] = static_cast<uint8_t>((v[3] << 6) | (v[4] << 1) | (v[5] >> 4));
    d[3] = static_cast<uint8_t>((v[5] << 4) | (v[6] >> 1));
    d[4] = static_cast<uint8_t>((v[6] << 7) | (v[7] << 2) | (v[8] >> 3));
    d[5] = static_cast<uint8_t>((v[8] << 5) | v[9]);

    // Randomness.
    d[6] = static_cast<uint8_t>((v[10] << 3) | (v[11] >> 2));
    d[7] = static_cast<uint8_t>((v[11] << 6) | (v[12] << 1) | (v[13] >> 4));
    d[8] = static_cast<uint8_t>((v[13] << 4) | (v[14] >> 1));
    d[9] = static_cast<uint8_t>((v[14] << 7) | (v[15] << 2) | (v[16] >> 3));
    d[10] = static_cast<uint8_t>((v[16] << 5) | v[17]);
    d[11] = static_cast<uint8_t>((v[18] << 3) | (v[19] >> 2));
    d[12] = static_cast<uint8_t>((v[19] << 6) | (v[20] << 1) | (v[21] >> 4));
    d[13] = static_cast<uint8_t>((v[21] << 4) | (v[22] >> 1));
    d[14] = static_cast<uint8_t>((v[22] << 7) | (v[23] << 2) | (v[24] >> 3));
    d[15] = static_cast<uint8_t>((v[24] << 5) | v[25]);

    return d;
}

} // namespace ulidkit::core
