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
 * @file value.hpp
 * @brief Bridge between ObjectId and untyped column values of a value store.
 *
 * @details
 * Storage drivers hand back cells as loosely typed values. Writing an identifier
 * always produces its hex string; reading accepts that string or its raw byte
 * encoding.
 */

#pragma once

#include "oidkit/core/error.hpp"
#include "oidkit/core/object_id.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace oidkit::codec {

/// @brief A single untyped cell as exchanged with a value store.
using Value = std::variant<std::monostate, bool, int64_t, double, std::string, std::vector<uint8_t>>;

/// @brief The hex string of `id`. Never fails.
Value to_value(const core::ObjectId& id);

/**
 * @brief Reads an identifier from a store cell.
 *
 * - `std::string`: decoded as hex text.
 * - `std::vector<uint8_t>`: taken as the bytes of the hex text, whatever its length.
 * - anything else: `UNSUPPORTED_SOURCE_TYPE`.
 *
 * @param source The cell value.
 * @param out Receives the identifier, or nil on failure.
 */
Error from_value(const Value& source, core::ObjectId& out);

} // namespace oidkit::codec
