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
 * @file error.cpp
 * @brief Descriptions and exception plumbing for `oidkit::Error`.
 */

#include "oidkit/core/error.hpp"

namespace oidkit {

const char* describe(Error error)
{
    switch (error) {
    case Error::NONE:
        return "ok";
    case Error::RANDOM_SOURCE_FAILURE:
        return "random source failure";
    case Error::INVALID_LENGTH:
        return "invalid length";
    case Error::INVALID_ENCODING:
        return "invalid encoding";
    case Error::UNSUPPORTED_SOURCE_TYPE:
        return "unsupported source type";
    }
    return "unknown error";
}

std::ostream& operator<<(std::ostream& os, Error error)
{
    return os << describe(error);
}

Exception::Exception(Error code, const std::string& context)
    : std::runtime_error(context.empty() ? std::string(describe(code))
                                         : context + ": " + describe(code)),
      code_(code)
{
}

} // namespace oidkit
