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
 * @file value.cpp
 * @brief Implementation of the value-store conversion hooks.
 */

#include "oidkit/codec/value.hpp"

#include <string_view>

namespace oidkit::codec {

Value to_value(const core::ObjectId& id)
{
    return Value(id.to_hex());
}

Error from_value(const Value& source, core::ObjectId& out)
{
    Error error = Error::NONE;

    if (const auto* text = std::get_if<std::string>(&source)) {
        out = core::ObjectId::from_hex(*text, error);
        return error;
    }

    // Byte cells hold the same hex text as string cells.
    if (const auto* raw = std::get_if<std::vector<uint8_t>>(&source)) {
        std::string_view text(reinterpret_cast<const char*>(raw->data()), raw->size());
        out = core::ObjectId::from_hex(text, error);
        return error;
    }

    out = core::ObjectId::nil();
    return Error::UNSUPPORTED_SOURCE_TYPE;
}

} // namespace oidkit::codec
