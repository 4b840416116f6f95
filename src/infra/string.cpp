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
 * @file string.cpp
 * @brief Implementation of the string manipulation primitives.
 */

#include "ulidkit/infra/string.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace ulidkit::infra {

namespace {

int hex_digit(char c)
{
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

} // namespace

/**
 * @brief Trims leading and trailing whitespace from a string instance.
 *
 * @note The use of `static_cast<unsigned char>` is critical to prevent undefined
 * behavior with `std::isspace` when encountering characters with negative values
 * in signed `char` environments.
 */
std::string String::trim(const std::string& s)
{
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    if (start == s.end()) {
        return "";
    }

    auto end = s.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));

    return std::string(start, end + 1);
}

std::string String::to_hex(const uint8_t* data, std::size_t length)
{
    static const char* DIGITS = "0123456789ABCDEF";

    std::string out;
    out.reserve(length * 2);
    for (std::size_t i = 0; i < length; ++i) {
        out.push_back(DIGITS[data[i] >> 4]);
        out.push_back(DIGITS[data[i] & 0x0F]);
    }
    return out;
}

std::string String::to_hex(const std::vector<uint8_t>& data)
{
    return to_hex(data.data(), data.size());
}

std::vector<uint8_t> String::from_hex(const std::string& hex)
{
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("hex string has odd length " + std::to_string(hex.size()));
    }

    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_digit(hex[i]);
        int lo = hex_digit(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("'" + hex + "' is not a valid hex string");
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

/**
 * @brief Renders an epoch offset in milliseconds as a UTC calendar instant.
 *
 * The whole-second part goes through `gmtime_r`; the millisecond remainder
 * is appended by hand.
 */
std::string String::format_utc_millis(uint64_t millis)
{
    std::time_t seconds = static_cast<std::time_t>(millis / 1000);
    unsigned remainder = static_cast<unsigned>(millis % 1000);

    std::tm utc{};
    if (!gmtime_r(&seconds, &utc)) {
        throw std::out_of_range("Cannot represent " + std::to_string(millis) + " ms as UTC time");
    }

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03uZ",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min,
                  utc.tm_sec, remainder);
    return buffer;
}

} // namespace ulidkit::infra
