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
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * Static helpers used when normalizing configuration values read from the
 * environment.
 */

#pragma once

#include <string>

namespace oidkit::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * Whitespace is anything `std::isspace` accepts in the "C" locale
     * (space, `\t`, `\n`, `\r`, `\v`, `\f`).
     *
     * @param s The source string to process.
     * @return std::string The trimmed copy; empty if `s` is all whitespace.
     *
     * @code
     * std::string level = oidkit::infra::String::trim("  debug \n"); // "debug"
     * @endcode
     */
    static std::string trim(const std::string& s);

    /// @brief Returns an ASCII-lowercased copy of `s`.
    static std::string to_lower(const std::string& s);
};

} // namespace oidkit::infra
