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
 * @file json.cpp
 * @brief Implementation of the cJSON identifier converter.
 */

#include "ulidkit/serial/json.hpp"

#include "ulidkit/core/error.hpp"

#include <memory>

namespace ulidkit::serial {

namespace {

using JsonPtr = std::unique_ptr<cJSON, decltype(&cJSON_Delete)>;

} // namespace

cJSON* Json::to_json(const core::Ulid& id)
{
    cJSON* node = cJSON_CreateString(id.to_string().c_str());
    if (!node) {
        throw SerializationError("Failed to allocate JSON string node");
    }
    return node;
}

/**
 * @brief Decodes a string node through `Ulid::parse`.
 *
 * The `UlidError` message is kept in the re-raised error so the violated
 * rule (length, alphabet, leading digit) is still visible to the caller.
 */
core::Ulid Json::from_json(const cJSON* node)
{
    if (!node || !cJSON_IsString(node) || !node->valuestring) {
        throw SerializationError("JSON value is not a string, cannot read ULID");
    }

    std::string text = node->valuestring;
    try {
        return core::Ulid::parse(text);
    } catch (const core::UlidError& e) {
        throw SerializationError("'" + text + "' is not a valid ULID (" + e.what() + ")");
    }
}

void Json::set_field(cJSON* object, const std::string& name, const core::Ulid& id)
{
    if (!object || !cJSON_IsObject(object)) {
        throw SerializationError("Target of field '" + name + "' is not a JSON object");
    }

    cJSON_DeleteItemFromObjectCaseSensitive(object, name.c_str());
    cJSON_AddItemToObject(object, name.c_str(), to_json(id));
}

core::Ulid Json::get_field(const cJSON* object, const std::string& name)
{
    if (!object || !cJSON_IsObject(object)) {
        throw SerializationError("Source of field '" + name + "' is not a JSON object");
    }

    const cJSON* item = cJSON_GetObjectItemCaseSensitive(object, name.c_str());
    if (!item) {
        throw SerializationError("Missing required field '" + name + "'");
    }
    return from_json(item);
}

std::string Json::dump(const core::Ulid& id)
{
    JsonPtr node(to_json(id), &cJSON_Delete);

    char* raw = cJSON_PrintUnformatted(node.get());
    if (!raw) {
        throw SerializationError("Failed to print JSON value");
    }
    std::string out(raw);
    cJSON_free(raw);
    return out;
}

core::Ulid Json::load(const std::string& json_text)
{
    JsonPtr node(cJSON_Parse(json_text.c_str()), &cJSON_Delete);
    if (!node) {
        throw SerializationError("Invalid JSON syntax");
    }
    return from_json(node.get());
}

} // namespace ulidkit::serial
