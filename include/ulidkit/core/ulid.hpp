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
 * @file ulid.hpp
 * @brief The 128-bit Universally Unique Lexicographically Sortable Identifier.
 *
 * @details
 * This file declares `Ulid`, an immutable value type made of a 48-bit
 * millisecond timestamp followed by 80 bits of randomness. The binary layout is
 * big-endian, so plain byte-wise comparison sorts identifiers by creation time.
 *
 * **Binary Layout:**
 * @code
 *  0                   5 6                                     15
 * +---------------------+----------------------------------------+
 * |  timestamp (48 bit) |           randomness (80 bit)          |
 * +---------------------+----------------------------------------+
 * @endcode
 */

#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace ulidkit::core {

/**
 * @class Ulid
 * @brief A 16-byte sortable identifier with binary and canonical text forms.
 *
 * @details
 * Every 16-byte sequence is a structurally valid identifier, including the
 * all-zero "null" value. Construction from a timestamp validates the 48-bit
 * range; construction from raw buffers validates only the length.
 *
 * @code
 * // Example Usage:
 * auto id = ulidkit::core::Ulid::generate();
 * std::string text = id.to_string();           // "01ARYZ6S41TSV4RRFFQ69G5FAV"
 * auto same = ulidkit::core::Ulid::parse(text);
 * @endcode
 */
class Ulid {
  public:
    static constexpr std::size_t SIZE = 16;
    static constexpr std::size_t TIMESTAMP_SIZE = 6;
    static constexpr std::size_t RANDOMNESS_SIZE = 10;

    static constexpr uint64_t MIN_TIMESTAMP = 0;
    static constexpr uint64_t MAX_TIMESTAMP = 0xFFFFFFFFFFFFULL;

    using Bytes = std::array<uint8_t, SIZE>;
    using Randomness = std::array<uint8_t, RANDOMNESS_SIZE>;

    /// @brief Millisecond-precision UTC instant. Covers the full 48-bit range.
    using TimePoint = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

    /// @brief Constructs the null identifier (all 16 bytes zero).
    Ulid() = default;

    /**
     * @brief Constructs an identifier from its two fields.
     *
     * @param timestamp Milliseconds since the Unix epoch; must not exceed `MAX_TIMESTAMP`.
     * @param randomness Exactly 10 bytes of payload.
     *
     * @throws UlidError `OutOfRange` for a timestamp above 48 bits,
     * `LengthMismatch` if `randomness` is not 10 bytes.
     */
    Ulid(uint64_t timestamp, const std::vector<uint8_t>& randomness);

    /// @copydoc Ulid(uint64_t, const std::vector<uint8_t>&)
    Ulid(uint64_t timestamp, const uint8_t* randomness, std::size_t length);

    /**
     * @brief Constructs an identifier from a timestamp and a fixed-size payload.
     * @throws UlidError `OutOfRange` for a timestamp above 48 bits.
     */
    Ulid(uint64_t timestamp, const Randomness& randomness);

    /// @brief Adopts a complete 16-byte binary representation.
    explicit Ulid(const Bytes& bytes) : data_(bytes) {}

    /**
     * @brief Builds an identifier from an untyped binary buffer.
     *
     * @throws UlidError `LengthMismatch` if `length` is not exactly 16.
     */
    static Ulid from_bytes(const uint8_t* data, std::size_t length);

    /// @copydoc from_bytes(const uint8_t*, std::size_t)
    static Ulid from_bytes(const std::vector<uint8_t>& data);

    /**
     * @brief Decodes the 26-character canonical form.
     *
     * Input is case-insensitive. `I` and `L` are read as `1`, `O` as `0`.
     *
     * @throws UlidError `InvalidFormat` for a wrong length, a character outside
     * the alphabet, or a leading digit above 7.
     */
    static Ulid parse(const std::string& text);

    /**
     * @brief Non-throwing variant of `parse`.
     *
     * @param text Candidate canonical form.
     * @param out Receives the decoded value on success; untouched on failure.
     * @return true If `text` was a valid canonical form.
     */
    static bool try_parse(const std::string& text, Ulid& out);

    /**
     * @brief Mints a new identifier on the calling thread's default stream.
     *
     * Uses the current wall-clock time in milliseconds.
     *
     * @throws UlidError `Overflow` if the stream exhausts its randomness within one millisecond.
     */
    static Ulid generate();

    /**
     * @brief Mints a new identifier with an explicit timestamp on the calling thread's default stream.
     *
     * @throws UlidError `OutOfRange` or `Overflow`.
     */
    static Ulid generate(uint64_t timestamp);

    /// @brief Returns the null identifier.
    static Ulid null() { return Ulid(); }

    /// @brief Milliseconds since the Unix epoch (bytes 0-5, big-endian).
    uint64_t timestamp() const;

    /// @brief The timestamp as a UTC instant.
    TimePoint time() const;

    /// @brief Copy of the 80-bit payload (bytes 6-15).
    Randomness randomness() const;

    /**
     * @brief Copies the binary representation into caller storage.
     *
     * @param out Destination buffer.
     * @param capacity Size of `out` in bytes.
     * @throws UlidError `InsufficientCapacity` if `capacity` < 16. Nothing is written.
     */
    void write(uint8_t* out, std::size_t capacity) const;

    /// @brief Owned copy of the binary representation.
    std::vector<uint8_t> to_bytes() const;

    /// @brief Read-only view of the binary representation.
    const Bytes& bytes() const { return data_; }

    /// @brief Encodes the 26-character uppercase canonical form.
    std::string to_string() const;

    /// @brief True for the all-zero sentinel.
    bool is_null() const;

    /**
     * @brief Three-way unsigned byte-wise comparison.
     * @return int -1, 0 or 1.
     */
    int compare(const Ulid& other) const;

    /// @brief FNV-1a hash over all 16 bytes.
    std::size_t hash() const;

    bool operator==(const Ulid& other) const { return data_ == other.data_; }
    bool operator!=(const Ulid& other) const { return !(*this == other); }
    bool operator<(const Ulid& other) const { return compare(other) < 0; }
    bool operator<=(const Ulid& other) const { return compare(other) <= 0; }
    bool operator>(const Ulid& other) const { return compare(other) > 0; }
    bool operator>=(const Ulid& other) const { return compare(other) >= 0; }

  private:
    void assign(uint64_t timestamp, const uint8_t* randomness);

    Bytes data_{};
};

/// @brief Writes the canonical form.
std::ostream& operator<<(std::ostream& os, const Ulid& id);

} // namespace ulidkit::core

namespace std {

template <> struct hash<ulidkit::core::Ulid> {
    size_t operator()(const ulidkit::core::Ulid& id) const noexcept { return id.hash(); }
};

} // namespace std
