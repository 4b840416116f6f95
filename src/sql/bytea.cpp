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
 * @file bytea.cpp
 * @brief Implementation of the `bytea` column mapping.
 */

#include "ulidkit/sql/bytea.hpp"

#include "ulidkit/infra/string.hpp"

#include <vector>

namespace ulidkit::sql {

core::Ulid ByteaMapping::read(const uint8_t* data, std::size_t length)
{
    if (length != size()) {
        throw MappingError("Cannot read bytea with length " + std::to_string(length) +
                           " as ULID");
    }
    return core::Ulid::from_bytes(data, length);
}

core::Ulid ByteaMapping::read_text(const std::string& text)
{
    if (text.size() < 2 || text[0] != '\\' || text[1] != 'x') {
        throw MappingError("bytea text value must start with \\x");
    }

    std::vector<uint8_t> raw;
    try {
        raw = infra::String::from_hex(text.substr(2));
    } catch (const std::invalid_argument& e) {
        throw MappingError(std::string("Malformed bytea text value: ") + e.what());
    }
    return read(raw.data(), raw.size());
}

std::size_t ByteaMapping::write(const core::Ulid& id, uint8_t* out, std::size_t capacity)
{
    id.write(out, capacity);
    return size();
}

std::string ByteaMapping::literal(const core::Ulid& id)
{
    const auto& bytes = id.bytes();
    return "BYTEA E'\\\\x" + infra::String::to_hex(bytes.data(), bytes.size()) + "'";
}

} // namespace ulidkit::sql
