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
 * @file hex.hpp
 * @brief Base-16 text codec shared by the identifier and discriminator types.
 *
 * @details
 * Every textual adapter (plain text, JSON, value store) ends up here, so the
 * length and alphabet rules live in exactly one place.
 */

#pragma once

#include "oidkit/core/error.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace oidkit::codec {

/**
 * @class Hex
 * @brief Stateless lowercase hex encoder and case-insensitive decoder.
 */
class Hex {
  public:
    /**
     * @brief Encodes `length` bytes as `2 * length` lowercase hex digits.
     */
    static std::string encode(const uint8_t* data, size_t length);

    /**
     * @brief Decodes exactly `length` bytes from `text`.
     *
     * Both `a-f` and `A-F` are accepted. `out` is written only when the whole
     * input is valid.
     *
     * @param text The hex digits.
     * @param out Destination buffer of `length` bytes.
     * @param length Expected decoded size; `text` must be `2 * length` characters.
     * @return Error `NONE`, `INVALID_LENGTH`, or `INVALID_ENCODING`.
     */
    static Error decode(std::string_view text, uint8_t* out, size_t length);
};

} // namespace oidkit::codec
