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
 * @file generator.hpp
 * @brief Monotonic identifier generation stream.
 *
 * @details
 * A `Generator` remembers the timestamp and randomness of the last identifier it
 * produced. When asked for another identifier in the same millisecond it
 * increments the previous randomness instead of drawing new bytes, so values
 * from one stream are strictly increasing even at sub-millisecond rates.
 */

#pragma once

#include "ulidkit/core/ulid.hpp"
#include "ulidkit/infra/entropy.hpp"

#include <cstdint>

namespace ulidkit::core {

/**
 * @class Generator
 * @brief A single monotonic generation stream.
 *
 * @details
 * **State Machine:**
 * - *Uninitialized*: no identifier produced yet. The first call emits fresh
 *   randomness and primes the stream.
 * - *Primed(ts, rnd)*: a call with the same `ts` emits `rnd + 1` (80-bit
 *   big-endian); a call with a different timestamp emits fresh randomness.
 *
 * @warning A stream is not thread-safe. Confine each instance to one thread or
 * guard it externally. `thread_default()` hands every thread its own stream.
 */
class Generator {
  public:
    /**
     * @brief Creates an unprimed stream.
     *
     * @param entropy Random byte source. Must outlive the generator.
     */
    explicit Generator(infra::Entropy& entropy = infra::SystemEntropy::instance());

    /**
     * @brief Generates an identifier stamped with the current wall-clock millisecond.
     * @throws UlidError `Overflow` (see `generate(uint64_t)`).
     */
    Ulid generate();

    /**
     * @brief Generates an identifier with the given timestamp.
     *
     * Ten bytes of entropy are drawn on every call, before the stream state is
     * consulted. They are discarded when the timestamp repeats.
     *
     * @param timestamp Milliseconds since the Unix epoch.
     * @return Ulid The next identifier of this stream.
     *
     * @throws UlidError `OutOfRange` if `timestamp` exceeds 48 bits.
     * @throws UlidError `Overflow` if the timestamp repeats and the previous
     * randomness is already all ones. The stream state is left unchanged, the
     * caller decides whether to retry with a later timestamp.
     */
    Ulid generate(uint64_t timestamp);

    /// @brief True once the stream has produced at least one identifier.
    bool primed() const { return primed_; }

    /// @brief Timestamp of the last identifier produced (0 while unprimed).
    uint64_t last_timestamp() const { return last_timestamp_; }

    /// @brief Randomness of the last identifier produced (zero while unprimed).
    const Ulid::Randomness& last_randomness() const { return last_randomness_; }

    /**
     * @brief The calling thread's default stream.
     *
     * Created lazily on first use and destroyed with the thread.
     */
    static Generator& thread_default();

    /// @brief Current Unix time in milliseconds.
    static uint64_t now_millis();

  private:
    infra::Entropy* entropy_;
    bool primed_ = false;
    uint64_t last_timestamp_ = 0;
    Ulid::Randomness last_randomness_{};
};

} // namespace ulidkit::core
