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
 * @brief cJSON adapter for embedding ObjectIds in JSON documents.
 *
 * @details
 * In JSON an identifier is its 24-character hex form inside a string literal,
 * e.g. `"640c5fe5d243553cda8dde1b"`. Because the text form is a plain string,
 * identifiers can also serve as object member names (`marshal_text` /
 * `unmarshal_text`, `encode_map` / `decode_map`).
 *
 * All decoders share one contract: on failure `out` is set to the nil
 * identifier and the error is returned to the caller. Nothing is logged.
 */

#pragma once

#include "oidkit/core/error.hpp"
#include "oidkit/core/object_id.hpp"

#include <cJSON.h>
#include <map>
#include <string>
#include <string_view>

namespace oidkit::codec {

/**
 * @class Json
 * @brief Static marshal/unmarshal hooks between `ObjectId` and cJSON.
 */
class Json {
  public:
    /// @brief Serialized JSON string literal, quotes included.
    static std::string marshal(const core::ObjectId& id);

    /**
     * @brief Parses a JSON document that must be a single string literal.
     *
     * @param text Raw JSON text such as `"640c5fe5d243553cda8dde1b"`.
     * @param out Receives the identifier, or nil on failure.
     * @return Error `INVALID_ENCODING` if `text` is not a JSON string, else the
     * result of hex decoding.
     */
    static Error unmarshal(std::string_view text, core::ObjectId& out);

    /// @brief Bare hex form, for use as a member name.
    static std::string marshal_text(const core::ObjectId& id);

    /// @brief Inverse of `marshal_text`.
    static Error unmarshal_text(std::string_view text, core::ObjectId& out);

    /**
     * @brief Creates a cJSON string node holding the hex form.
     *
     * @warning The caller owns the returned node and must either attach it to a
     * parent or release it with `cJSON_Delete`.
     */
    static cJSON* to_node(const core::ObjectId& id);

    /**
     * @brief Reads an identifier from a cJSON node.
     *
     * A null pointer or a JSON `null` yields the nil identifier with `NONE`.
     * Any other non-string node yields `INVALID_ENCODING`.
     */
    static Error from_node(const cJSON* node, core::ObjectId& out);

    /// @return false if `object` is not an object or allocation failed.
    static bool add_to_object(cJSON* object, const char* key, const core::ObjectId& id);

    /**
     * @brief Reads member `key` of `object`.
     *
     * A missing member decodes to the nil identifier, mirroring how an absent
     * field leaves a record's identifier unset.
     */
    static Error get_from_object(const cJSON* object, const char* key, core::ObjectId& out);

    /**
     * @brief Builds a JSON object keyed by identifier hex strings.
     *
     * @warning The caller owns the returned object.
     */
    static cJSON* encode_map(const std::map<core::ObjectId, std::string>& entries);

    /**
     * @brief Inverse of `encode_map`.
     *
     * Every member name must be a valid identifier and every value a string.
     * On failure `out` is left empty.
     */
    static Error decode_map(const cJSON* object, std::map<core::ObjectId, std::string>& out);
};

} // namespace oidkit::codec
