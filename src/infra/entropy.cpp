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
 * @file entropy.cpp
 * @brief Implementation of the system random byte source.
 */

#include "ulidkit/infra/entropy.hpp"

#include <random>

namespace ulidkit::infra {

/**
 * @brief Draws random bytes straight from the random device.
 *
 * Implementation Strategy:
 * 1. **Thread Safety**: Employs a `thread_local` device so concurrent streams
 * never contend on a shared handle.
 * 2. **Direct Draw**: Bytes come straight from the device, never from a seeded
 * pseudo-random engine.
 * 3. **Word Slicing**: Each 32-bit draw supplies up to four output bytes.
 */
void SystemEntropy::fill(uint8_t* out, std::size_t length)
{
    static thread_local std::random_device rd;

    std::size_t i = 0;
    while (i < length) {
        auto word = static_cast<uint32_t>(rd());
        for (int shift = 0; shift < 32 && i < length; shift += 8) {
            out[i++] = static_cast<uint8_t>(word >> shift);
        }
    }
}

SystemEntropy& SystemEntropy::instance()
{
    static SystemEntropy source;
    return source;
}

} // namespace ulidkit::infra
