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
 * @file ulid.cpp
 * @brief Implementation of the `Ulid` value type.
 *
 * @details
 * Binary packing of the timestamp and randomness fields, accessors, ordering
 * and hashing. Text conversion is delegated to `Base32`, generation to the
 * calling thread's default `Generator`.
 */

#include "ulidkit/core/ulid.hpp"

#include "ulidkit/core/base32.hpp"
#include "ulidkit/core/error.hpp"
#include "ulidkit/core/generator.hpp"

#include <algorithm>

namespace ulidkit::core {

Ulid::Ulid(uint64_t timestamp, const std::vector<uint8_t>& randomness)
    : Ulid(timestamp, randomness.data(), randomness.size())
{
}

Ulid::Ulid(uint64_t timestamp, const uint8_t* randomness, std::size_t length)
{
    if (length != RANDOMNESS_SIZE) {
        throw UlidError(ErrorCode::LengthMismatch,
                        "randomness must be 10 bytes exactly, got " + std::to_string(length));
    }
    assign(timestamp, randomness);
}

Ulid::Ulid(uint64_t timestamp, const Randomness& randomness)
{
    assign(timestamp, randomness.data());
}

/**
 * @brief Packs both fields into the 16-byte layout.
 *
 * The range check runs before any byte is written, so a rejected call leaves
 * the object in its default (null) state.
 */
void Ulid::assign(uint64_t timestamp, const uint8_t* randomness)
{
    if (timestamp > MAX_TIMESTAMP) {
        throw UlidError(ErrorCode::OutOfRange,
                        "timestamp " + std::to_string(timestamp) + " exceeds 48 bits");
    }

    // Big-endian: most significant of the 6 timestamp bytes first.
    for (std::size_t i = 0; i < TIMESTAMP_SIZE; ++i) {
        data_[i] = static_cast<uint8_t>(timestamp >> (8 * (TIMESTAMP_SIZE - 1 - i)));
    }
    std::copy(randomness, randomness + RANDOMNESS_SIZE, data_.begin() + TIMESTAMP_SIZE);
}

Ulid Ulid::from_bytes(const uint8_t* data, std::size_t length)
{
    if (length != SIZE) {
        throw UlidError(ErrorCode::LengthMismatch,
                        "binary form must be 16 bytes exactly, got " + std::to_string(length));
    }
    Bytes bytes;
    std::copy(data, data + SIZE, bytes.begin());
    return Ulid(bytes);
}

Ulid Ulid::from_bytes(const std::vector<uint8_t>& data)
{
    return from_bytes(data.data(), data.size());
}

Ulid Ulid::parse(const std::string& text)
{
    return Ulid(Base32::decode(text));
}

bool Ulid::try_parse(const std::string& text, Ulid& out)
{
    try {
        out = parse(text);
        return true;
    } catch (const UlidError&) {
        return false;
    }
}

Ulid Ulid::generate()
{
    return Generator::thread_default().generate();
}

Ulid Ulid::generate(uint64_t timestamp)
{
    return Generator::thread_default().generate(timestamp);
}

uint64_t Ulid::timestamp() const
{
    uint64_t value = 0;
    for (std::size_t i = 0; i < TIMESTAMP_SIZE; ++i) {
        value = (value << 8) | data_[i];
    }
    return value;
}

Ulid::TimePoint Ulid::time() const
{
    return TimePoint(std::chrono::milliseconds(static_cast<int64_t>(timestamp())));
}

Ulid::Randomness Ulid::randomness() const
{
    Randomness out;
    std::copy(data_.begin() + TIMESTAMP_SIZE, data_.end(), out.begin());
    return out;
}

void Ulid::write(uint8_t* out, std::size_t capacity) const
{
    if (capacity < SIZE) {
        throw UlidError(ErrorCode::InsufficientCapacity,
                        "output buffer holds " + std::to_string(capacity) +
                            " bytes, 16 required");
    }
    std::copy(data_.begin(), data_.end(), out);
}

std::vector<uint8_t> Ulid::to_bytes() const
{
    return std::vector<uint8_t>(data_.begin(), data_.end());
}

std::string Ulid::to_string() const
{
    return Base32::encode(data_);
}

bool Ulid::is_null() const
{
    return std::all_of(data_.begin(), data_.end(), [](uint8_t b) { return b == 0; });
}

/**
 * @brief Lexicographic comparison of the raw layout.
 *
 * Bytes are `uint8_t`, so the first differing position decides the order as
 * unsigned big-endian integers. That is what makes canonical strings and binary
 * columns sort by creation time.
 */
int Ulid::compare(const Ulid& other) const
{
    for (std::size_t i = 0; i < SIZE; ++i) {
        if (data_[i] != other.data_[i]) {
            return data_[i] < other.data_[i] ? -1 : 1;
        }
    }
    return 0;
}

std::size_t Ulid::hash() const
{
    uint64_t h = 14695981039346656037ULL;
    for (uint8_t b : data_) {
        h ^= b;
        h *= 1099511628211ULL;
    }
    return static_cast<std::size_t>(h);
}

std::ostream& operator<<(std::ostream& os, const Ulid& id)
{
    return os << id.to_string();
}

} // namespace ulidkit::core
