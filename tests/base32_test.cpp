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
 * @file base32_test.cpp
 * @brief Unit tests for the canonical text codec.
 *
 * @details
 * Round-trips alone cannot detect a consistently transposed bit mapping, so the
 * codec is pinned against published vectors from other ULID implementations.
 */

#include "ulidkit/core/base32.hpp"
#include "ulidkit/core/error.hpp"
#include "ulidkit/core/ulid.hpp"
#include "fixtures.hpp"
#include "framework.hpp"

#include <string>
#include <vector>

using ulidkit::core::Base32;
using ulidkit::core::ErrorCode;
using ulidkit::core::Ulid;
using ulidkit::test::error_code_of;

namespace {

const std::vector<uint8_t> SEQUENTIAL = {0x00, 0x01, 0x02, 0x03, 0x04,
                                         0x05, 0x06, 0x07, 0x08, 0x09};

} // namespace

/**
 * @brief Reference vector shared with the JavaScript implementation's test suite.
 */
void test_base32_encode_reference_vector()
{
    Ulid id(1469918176385ULL, SEQUENTIAL);
    std::string text = id.to_string();

    ASSERT_EQ(text.size(), static_cast<size_t>(26));
    ASSERT_EQ(text.substr(0, 10), std::string("01ARYZ6S41"));
    ASSERT_EQ(text, std::string("01ARYZ6S41000G40R40M30E209"));
}

void test_base32_encode_boundaries()
{
    ASSERT_EQ(Ulid::null().to_string(), std::string("00000000000000000000000000"));

    auto max = Ulid::from_bytes(std::vector<uint8_t>(16, 0xFF));
    ASSERT_EQ(max.to_string(), std::string("7ZZZZZZZZZZZZZZZZZZZZZZZZZ"));

    Ulid id(0xFFFFFFFFFFULL, SEQUENTIAL);
    ASSERT_EQ(id.to_string(), std::string("00ZZZZZZZZ000G40R40M30E209"));
}

/**
 * @brief Every byte position contributes to the right symbols.
 */
void test_base32_encode_mixed_bytes()
{
    std::vector<uint8_t> binary = {0x01, 0x23, 0x45, 0x67, 0x89, 0xAB, 0xCD, 0xEF,
                                   0xFE, 0xDC, 0xBA, 0x98, 0x76, 0x54, 0x32, 0x10};
    auto id = Ulid::from_bytes(binary);
    ASSERT_EQ(id.to_string(), std::string("014D2PF2DBSQQZXQ5TK1V58CGG"));
    ASSERT_TRUE(Ulid::parse("014D2PF2DBSQQZXQ5TK1V58CGG").to_bytes() == binary);
}

void test_base32_decode_reference_vector()
{
    auto id = Ulid::parse("01ARYZ6S41000G40R40M30E209");
    ASSERT_EQ(id.timestamp(), static_cast<uint64_t>(1469918176385ULL));

    auto randomness = id.randomness();
    ASSERT_TRUE(std::vector<uint8_t>(randomness.begin(), randomness.end()) == SEQUENTIAL);

    auto max = Ulid::parse("7ZZZZZZZZZZZZZZZZZZZZZZZZZ");
    ASSERT_TRUE(max.to_bytes() == std::vector<uint8_t>(16, 0xFF));
    ASSERT_EQ(max.timestamp(), Ulid::MAX_TIMESTAMP);
}

void test_base32_decode_case_insensitive()
{
    auto upper = Ulid::parse("01ARYZ6S41TSV4RRFFQ69G5FAV");
    auto lower = Ulid::parse("01aryz6s41tsv4rrffq69g5fav");
    auto mixed = Ulid::parse("01ArYz6S41tSv4RrFfQ69g5FaV");
    ASSERT_EQ(upper, lower);
    ASSERT_EQ(upper, mixed);
    ASSERT_EQ(lower.to_string(), std::string("01ARYZ6S41TSV4RRFFQ69G5FAV"));
}

/**
 * @brief Visually confusable symbols decode as their look-alikes.
 */
void test_base32_decode_confusable_aliases()
{
    auto canonical = Ulid::parse("01ARYZ6S41000G40R40M30E209");
    ASSERT_EQ(Ulid::parse("O1ARYZ6S41000G40R40M30E209"), canonical);
    ASSERT_EQ(Ulid::parse("0IARYZ6S41000G40R40M30E209"), canonical);
    ASSERT_EQ(Ulid::parse("0LARYZ6S41000G40R40M30E209"), canonical);
    ASSERT_EQ(Ulid::parse("0lARYZ6S4iooOg4oR4oM3oE2o9"), canonical);

    ASSERT_EQ(Base32::digit_value('I'), 1);
    ASSERT_EQ(Base32::digit_value('L'), 1);
    ASSERT_EQ(Base32::digit_value('O'), 0);
    ASSERT_EQ(Base32::digit_value('U'), -1);
    ASSERT_EQ(Base32::digit_value('u'), -1);
}

void test_base32_decode_rejects_length()
{
    ASSERT_EQ(error_code_of([] { Ulid::parse("invalid-len-string"); }), ErrorCode::InvalidFormat);
    ASSERT_EQ(error_code_of([] { Ulid::parse(""); }), ErrorCode::InvalidFormat);
    ASSERT_EQ(error_code_of([] { Ulid::parse("01ARYZ6S41000G40R40M30E20"); }),
              ErrorCode::InvalidFormat);
    ASSERT_EQ(error_code_of([] { Ulid::parse("01ARYZ6S41000G40R40M30E2090"); }),
              ErrorCode::InvalidFormat);
}

void test_base32_decode_rejects_alphabet()
{
    ASSERT_EQ(error_code_of([] { Ulid::parse("01ARYZ6S41000G40R40M30E20U"); }),
              ErrorCode::InvalidFormat);
    ASSERT_EQ(error_code_of([] { Ulid::parse("01ARYZ6S41000G40R40M30E20-"); }),
              ErrorCode::InvalidFormat);
    ASSERT_EQ(error_code_of([] { Ulid::parse("01ARYZ6S41000G40R40M30E20 "); }),
              ErrorCode::InvalidFormat);

    std::string high_bit = "01ARYZ6S41000G40R40M30E209";
    high_bit[5] = static_cast<char>(0xC3);
    ASSERT_EQ(error_code_of([&] { Ulid::parse(high_bit); }), ErrorCode::InvalidFormat);
}

/**
 * @brief Leading digit above 7 would need more than 128 bits.
 */
void test_base32_decode_rejects_overflow()
{
    ASSERT_EQ(error_code_of([] { Ulid::parse("80000000000000000000000000"); }),
              ErrorCode::InvalidFormat);
    ASSERT_EQ(error_code_of([] { Ulid::parse("ZZZZZZZZZZZZZZZZZZZZZZZZZZ"); }),
              ErrorCode::InvalidFormat);
    ASSERT_EQ(Ulid::parse("70000000000000000000000000").to_bytes()[0], static_cast<uint8_t>(0xE0));
}

void test_base32_try_parse()
{
    Ulid out = Ulid::null();
    ASSERT_TRUE(Ulid::try_parse("01ARYZ6S41000G40R40M30E209", out));
    ASSERT_EQ(out.timestamp(), static_cast<uint64_t>(1469918176385ULL));

    Ulid untouched(42, SEQUENTIAL);
    ASSERT_FALSE(Ulid::try_parse("not-a-ulid", untouched));
    ASSERT_EQ(untouched.timestamp(), static_cast<uint64_t>(42));
}

/**
 * @brief Canonical round trip over values that exercise every symbol position.
 */
void test_base32_round_trip()
{
    std::vector<Ulid> samples = {Ulid::null(), Ulid(1469918176385ULL, SEQUENTIAL),
                                 Ulid::from_bytes(std::vector<uint8_t>(16, 0xA5)),
                                 Ulid::from_bytes(std::vector<uint8_t>(16, 0x5A))};
    for (uint8_t shift = 0; shift < 8; ++shift) {
        std::vector<uint8_t> bits(16, static_cast<uint8_t>(1u << shift));
        samples.push_back(Ulid::from_bytes(bits));
    }
    samples.push_back(Ulid::generate());

    for (const auto& id : samples) {
        ASSERT_EQ(Ulid::parse(id.to_string()), id);
    }
}
