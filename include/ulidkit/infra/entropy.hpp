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
 * @file entropy.hpp
 * @brief Random byte sources for identifier generation.
 *
 * @details
 * This file declares the `Entropy` interface consumed by the monotonic
 * generator, and `SystemEntropy`, the production source backed by the
 * operating system's non-deterministic random device. Tests substitute their
 * own `Entropy` to make generation reproducible.
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace ulidkit::infra {

/**
 * @class Entropy
 * @brief Abstract supplier of random bytes.
 */
class Entropy {
  public:
    virtual ~Entropy() = default;

    /**
     * @brief Fills `out[0..length)` with random bytes.
     *
     * @param out Destination buffer.
     * @param length Number of bytes to produce.
     */
    virtual void fill(uint8_t* out, std::size_t length) = 0;
};

/**
 * @class SystemEntropy
 * @brief Cryptographically secure source reading `std::random_device`.
 *
 * @details
 * On Linux toolchains `std::random_device` draws from the kernel CSPRNG
 * (`getrandom`/`/dev/urandom`) or the CPU's hardware generator. Each thread
 * owns its own device handle, so `fill` is safe to call concurrently without
 * locking.
 */
class SystemEntropy : public Entropy {
  public:
    void fill(uint8_t* out, std::size_t length) override;

    /**
     * @brief Process-wide shared instance.
     *
     * The instance is stateless; per-thread device handles live inside `fill`.
     */
    static SystemEntropy& instance();
};

} // namespace ulidkit::infra
