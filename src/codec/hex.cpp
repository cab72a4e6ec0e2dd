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
 * @file hex.cpp
 * @brief Table-driven hex encoding and two-pass validated decoding.
 */

#include "oidkit/codec/hex.hpp"

namespace oidkit::codec {

namespace {

const char kDigits[] = "0123456789abcdef";

/// @return The nibble value of `c`, or -1 if `c` is not a hex digit.
int nibble(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F')
        return 10 + (c - 'A');
    return -1;
}

} // namespace

std::string Hex::encode(const uint8_t* data, size_t length)
{
    std::string out(length * 2, '0');
    for (size_t i = 0; i < length; ++i) {
        out[i * 2] = kDigits[(data[i] >> 4) & 0x0F];
        out[i * 2 + 1] = kDigits[data[i] & 0x0F];
    }
    return out;
}

Error Hex::decode(std::string_view text, uint8_t* out, size_t length)
{
    if (text.size() != length * 2) {
        return Error::INVALID_LENGTH;
    }

    // Validate before writing so a rejected input leaves `out` untouched.
    for (char c : text) {
        if (nibble(c) < 0) {
            return Error::INVALID_ENCODING;
        }
    }

    for (size_t i = 0; i < length; ++i) {
        out[i] = static_cast<uint8_t>((nibble(text[i * 2]) << 4) | nibble(text[i * 2 + 1]));
    }
    return Error::NONE;
}

} // namespace oidkit::codec
