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
 * @file bytea.hpp
 * @brief Fixed-width binary column mapping for identifiers.
 *
 * @details
 * Relational stores keep an identifier as a 16-byte `bytea` value whose wire
 * bytes are exactly the binary representation. Because that layout is
 * big-endian, the database's native byte ordering on the column matches
 * identifier ordering, so indexes sort rows by creation time.
 */

#pragma once

#include "ulidkit/core/ulid.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace ulidkit::sql {

/**
 * @class MappingError
 * @brief A column value cannot be read as an identifier.
 */
class MappingError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @class ByteaMapping
 * @brief Static type mapping between `core::Ulid` and a `bytea` column.
 */
class ByteaMapping {
  public:
    /// @brief SQL store type of the column.
    static const char* store_type() { return "bytea"; }

    /// @brief Width of the column value in bytes.
    static constexpr std::size_t size() { return core::Ulid::SIZE; }

    /**
     * @brief Reads a binary-format column value.
     *
     * @param data Raw column bytes.
     * @param length Length reported by the driver.
     * @throws MappingError If `length` is not 16.
     */
    static core::Ulid read(const uint8_t* data, std::size_t length);

    /**
     * @brief Reads a text-format column value (`\x` followed by 32 hex digits).
     *
     * This is the form PostgreSQL returns for `bytea` in text result mode.
     *
     * @throws MappingError If the prefix is missing, a digit is invalid, or the
     * decoded value is not 16 bytes.
     */
    static core::Ulid read_text(const std::string& text);

    /**
     * @brief Writes the wire bytes of `id`.
     *
     * @return std::size_t Number of bytes written (always 16).
     * @throws core::UlidError `InsufficientCapacity` if `capacity` < 16.
     */
    static std::size_t write(const core::Ulid& id, uint8_t* out, std::size_t capacity);

    /**
     * @brief Builds an SQL literal embedding the identifier.
     *
     * @code
     * // BYTEA E'\\x01563DF3648100010203040506070809'
     * std::string lit = ulidkit::sql::ByteaMapping::literal(id);
     * @endcode
     *
     * @return std::string `BYTEA E'\\x` + 32 uppercase hex digits + `'`.
     */
    static std::string literal(const core::Ulid& id);
};

} // namespace ulidkit::sql
