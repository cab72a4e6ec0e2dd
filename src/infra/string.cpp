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
 * @file string.cpp
 * @brief Implementation of the string normalization helpers.
 */

#include "oidkit/infra/string.hpp"

#include <algorithm>
#include <cctype>

namespace oidkit::infra {

namespace {

/// @brief `std::isspace` over the byte value, defined for high-bit bytes too.
bool is_space(char c)
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

/**
 * @brief Strips leading and trailing whitespace.
 *
 * Operational Logic:
 * 1. **Bounds**: Finds the first and last non-whitespace bytes.
 * 2. **Short-circuit**: An all-whitespace input collapses to the empty string.
 * 3. **Copy**: Returns the inclusive range between the two bounds.
 *
 * Environment values and level names both pass through here, so a stray
 * newline from a shell export does not defeat the match.
 */
std::string String::trim(const std::string& s)
{
    // 1. Bounds: first byte that is not whitespace, scanning from the front.
    auto first = std::find_if_not(s.begin(), s.end(), is_space);

    // 2. Nothing but whitespace.
    if (first == s.end()) {
        return "";
    }

    // The reverse scan is guaranteed to stop at or after `first`.
    auto last = std::find_if_not(s.rbegin(), s.rend(), is_space).base();

    // 3. Copy [first, last).
    return std::string(first, last);
}

/**
 * @brief ASCII lowercase copy, used to match level names case-insensitively.
 */
std::string String::to_lower(const std::string& s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace oidkit::infra
