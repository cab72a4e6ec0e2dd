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
 * @brief Thin cJSON wrappers around `ObjectId::to_hex` / `ObjectId::from_hex`.
 */

#include "oidkit/codec/json.hpp"

#include <cstdlib>

namespace oidkit::codec {

std::string Json::marshal(const core::ObjectId& id)
{
    cJSON* node = to_node(id);
    if (!node) {
        // Hex digits never need escaping; this only runs if cJSON cannot allocate.
        return "\"" + id.to_hex() + "\"";
    }

    char* raw_output = cJSON_PrintUnformatted(node);
    std::string result = raw_output ? std::string(raw_output) : "\"" + id.to_hex() + "\"";

    free(raw_output);
    cJSON_Delete(node);
    return result;
}

Error Json::unmarshal(std::string_view text, core::ObjectId& out)
{
    // The whole document must be one value; trailing bytes are rejected.
    std::string buffer(text);
    cJSON* node = cJSON_ParseWithOpts(buffer.c_str(), nullptr, true);
    if (!node) {
        out = core::ObjectId::nil();
        return Error::INVALID_ENCODING;
    }

    Error error = Error::INVALID_ENCODING;
    if (cJSON_IsString(node) && node->valuestring) {
        out = core::ObjectId::from_hex(node->valuestring, error);
    } else {
        out = core::ObjectId::nil();
    }

    cJSON_Delete(node);
    return error;
}

std::string Json::marshal_text(const core::ObjectId& id)
{
    return id.to_hex();
}

Error Json::unmarshal_text(std::string_view text, core::ObjectId& out)
{
    Error error = Error::NONE;
    out = core::ObjectId::from_hex(text, error);
    return error;
}

cJSON* Json::to_node(const core::ObjectId& id)
{
    return cJSON_CreateString(id.to_hex().c_str());
}

Error Json::from_node(const cJSON* node, core::ObjectId& out)
{
    if (!node || cJSON_IsNull(node)) {
        out = core::ObjectId::nil();
        return Error::NONE;
    }

    if (!cJSON_IsString(node) || !node->valuestring) {
        out = core::ObjectId::nil();
        return Error::INVALID_ENCODING;
    }

    return unmarshal_text(node->valuestring, out);
}

bool Json::add_to_object(cJSON* object, const char* key, const core::ObjectId& id)
{
    if (!cJSON_IsObject(object)) {
        return false;
    }
    return cJSON_AddStringToObject(object, key, id.to_hex().c_str()) != nullptr;
}

Error Json::get_from_object(const cJSON* object, const char* key, core::ObjectId& out)
{
    if (!cJSON_IsObject(object)) {
        out = core::ObjectId::nil();
        return Error::INVALID_ENCODING;
    }
    return from_node(cJSON_GetObjectItemCaseSensitive(object, key), out);
}

cJSON* Json::encode_map(const std::map<core::ObjectId, std::string>& entries)
{
    cJSON* root = cJSON_CreateObject();
    if (!root) {
        return nullptr;
    }

    for (const auto& [id, value] : entries) {
        if (!cJSON_AddStringToObject(root, marshal_text(id).c_str(), value.c_str())) {
            cJSON_Delete(root);
            return nullptr;
        }
    }
    return root;
}

Error Json::decode_map(const cJSON* object, std::map<core::ObjectId, std::string>& out)
{
    out.clear();
    if (!cJSON_IsObject(object)) {
        return Error::INVALID_ENCODING;
    }

    std::map<core::ObjectId, std::string> decoded;
    const cJSON* member = nullptr;
    cJSON_ArrayForEach(member, object)
    {
        core::ObjectId id;
        Error error = unmarshal_text(member->string ? member->string : "", id);
        if (error != Error::NONE) {
            return error;
        }
        if (!cJSON_IsString(member) || !member->valuestring) {
            return Error::INVALID_ENCODING;
        }
        decoded[id] = member->valuestring;
    }

    out.swap(decoded);
    return Error::NONE;
}

} // namespace oidkit::codec
