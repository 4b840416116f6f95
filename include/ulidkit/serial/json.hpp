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
 * @file json.hpp
 * @brief cJSON conversion for identifiers.
 *
 * @details
 * Identifiers travel through JSON as their 26-character canonical string.
 * Reading parses that string; any failure is re-raised as a
 * `SerializationError` so JSON consumers deal with a single error type.
 */

#pragma once

#include "ulidkit/core/ulid.hpp"

#include <cJSON.h>
#include <stdexcept>
#include <string>

namespace ulidkit::serial {

/**
 * @class SerializationError
 * @brief A JSON value could not be converted to or from an identifier.
 */
class SerializationError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @class Json
 * @brief A static converter between `core::Ulid` and cJSON nodes.
 *
 * @code
 * // Example Usage:
 * cJSON* doc = cJSON_CreateObject();
 * ulidkit::serial::Json::set_field(doc, "_id", ulidkit::core::Ulid::generate());
 * auto id = ulidkit::serial::Json::get_field(doc, "_id");
 * cJSON_Delete(doc);
 * @endcode
 */
class Json {
  public:
    /**
     * @brief Creates a cJSON string node holding the canonical form.
     *
     * @return cJSON* A detached node. The caller owns it and must attach it or
     * release it with `cJSON_Delete`.
     */
    static cJSON* to_json(const core::Ulid& id);

    /**
     * @brief Reads an identifier from a cJSON string node.
     *
     * @throws SerializationError If `node` is null, not a string, or not a
     * valid canonical form.
     */
    static core::Ulid from_json(const cJSON* node);

    /**
     * @brief Stores `id` under `name` in a JSON object, replacing any existing member.
     *
     * @throws SerializationError If `object` is not a JSON object.
     */
    static void set_field(cJSON* object, const std::string& name, const core::Ulid& id);

    /**
     * @brief Reads the identifier stored under `name`.
     *
     * @throws SerializationError If the member is missing or invalid.
     */
    static core::Ulid get_field(const cJSON* object, const std::string& name);

    /// @brief Serializes `id` as a stand-alone JSON string value (`"01AR..."`).
    static std::string dump(const core::Ulid& id);

    /**
     * @brief Parses a stand-alone JSON string value.
     *
     * @throws SerializationError For malformed JSON or an invalid identifier.
     */
    static core::Ulid load(const std::string& json_text);
};

} // namespace ulidkit::serial
