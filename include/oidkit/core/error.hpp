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
 * @file error.hpp
 * @brief Error taxonomy shared by every oidkit subsystem.
 *
 * @details
 * Decode paths report failures by returning an `Error` value to the immediate
 * caller. The only unrecoverable condition (a random source that cannot supply
 * enough bytes while seeding) is raised as an `Exception` instead.
 */

#pragma once

#include <ostream>
#include <stdexcept>
#include <string>

namespace oidkit {

/**
 * @enum Error
 * @brief Failure categories reported by the identifier codecs and seeders.
 */
enum class Error {
    NONE,                   ///< Operation succeeded.
    RANDOM_SOURCE_FAILURE,  ///< Entropy source returned fewer bytes than requested.
    INVALID_LENGTH,         ///< Text form is not exactly the expected number of characters.
    INVALID_ENCODING,       ///< Text form has the right length but is not hexadecimal.
    UNSUPPORTED_SOURCE_TYPE ///< Value-store input is neither a string nor a byte sequence.
};

/**
 * @brief Returns a short, stable, human-readable description of an error code.
 */
const char* describe(Error error);

std::ostream& operator<<(std::ostream& os, Error error);

/**
 * @class Exception
 * @brief Throwable carrier for an `Error` code.
 *
 * @details
 * Raised when seeding fails, and by the throwing convenience decoders
 * (`ObjectId::parse`). The message combines `describe(code)` with the
 * context supplied at the throw site.
 */
class Exception : public std::runtime_error {
  public:
    Exception(Error code, const std::string& context);

    /// @brief The error category that caused this exception.
    Error code() const { return code_; }

  private:
    Error code_;
};

} // namespace oidkit
