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
 * @file generator.cpp
 * @brief Implementation of the monotonic generation stream.
 */

#include "ulidkit/core/generator.hpp"

#include "ulidkit/core/error.hpp"
#include "ulidkit/infra/logger.hpp"

#include <chrono>

namespace ulidkit::core {

namespace {

/**
 * @brief Adds one to an 80-bit big-endian integer in place.
 *
 * Ripple-carry from the least significant byte (index 9). A byte that wraps
 * from 0xFF to 0x00 passes the carry to its left neighbour.
 *
 * @return false If the carry ran past byte 0 (the input was all ones).
 */
bool increment(Ulid::Randomness& value)
{
    for (std::size_t i = value.size(); i-- > 0;) {
        if (++value[i] != 0) {
            return true;
        }
    }
    return false;
}

} // namespace

Generator::Generator(infra::Entropy& entropy) : entropy_(&entropy) {}

Ulid Generator::generate()
{
    return generate(now_millis());
}

/**
 * @brief Produces the next identifier of this stream.
 *
 * Operational Logic:
 * 1. **Range Gate**: Rejects timestamps above 48 bits.
 * 2. **Entropy**: Draws 10 fresh bytes unconditionally. The common case is a
 * new millisecond, where they are used as-is.
 * 3. **Collision Path**: On a repeated timestamp, works on a copy of the last
 * randomness and increments it. State is only committed after success.
 * 4. **Commit**: Stores the emitted timestamp and randomness.
 */
Ulid Generator::generate(uint64_t timestamp)
{
    if (timestamp > Ulid::MAX_TIMESTAMP) {
        throw UlidError(ErrorCode::OutOfRange,
                        "timestamp " + std::to_string(timestamp) + " exceeds 48 bits");
    }

    Ulid::Randomness randomness;
    entropy_->fill(randomness.data(), randomness.size());

    if (primed_ && last_timestamp_ == timestamp) {
        randomness = last_randomness_;
        if (!increment(randomness)) {
            infra::Logger::log(infra::LogLevel::WARN,
                               "Generator: Randomness exhausted at timestamp " +
                                   std::to_string(timestamp) + ".");
            throw UlidError(ErrorCode::Overflow,
                            "randomness increment overflowed 80 bits at timestamp " +
                                std::to_string(timestamp));
        }
    }

    Ulid id(timestamp, randomness);

    primed_ = true;
    last_timestamp_ = timestamp;
    last_randomness_ = randomness;
    return id;
}

Generator& Generator::thread_default()
{
    static thread_local Generator stream;
    return stream;
}

uint64_t Generator::now_millis()
{
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch());
    return static_cast<uint64_t>(ms.count());
}

} // namespace ulidkit::core
