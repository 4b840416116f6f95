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
 * @file fixtures.hpp
 * @brief Shared helpers for the ulidkit test suite.
 */

#pragma once

#include "ulidkit/core/error.hpp"
#include "ulidkit/infra/entropy.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace ulidkit::test {

/**
 * @brief Runs `f` and returns the code of the `UlidError` it throws.
 *
 * Throws `std::runtime_error` if `f` completes normally, which fails the
 * enclosing test through `run`.
 */
inline core::ErrorCode error_code_of(const std::function<void()>& f)
{
    try {
        f();
    } catch (const core::UlidError& e) {
        return e.code();
    }
    throw std::runtime_error("expected a UlidError, none was thrown");
}

/**
 * @class FixedEntropy
 * @brief Deterministic entropy: repeats one pattern and counts requests.
 */
class FixedEntropy : public infra::Entropy {
  public:
    explicit FixedEntropy(std::vector<uint8_t> pattern) : pattern_(std::move(pattern)) {}

    void fill(uint8_t* out, std::size_t length) override
    {
        for (std::size_t i = 0; i < length; ++i) {
            out[i] = pattern_[i % pattern_.size()];
        }
        calls++;
    }

    /// @brief Replaces the pattern returned by subsequent calls.
    void set(std::vector<uint8_t> pattern) { pattern_ = std::move(pattern); }

    int calls = 0;

  private:
    std::vector<uint8_t> pattern_;
};

} // namespace ulidkit::test
