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
 * @file random_source.cpp
 * @brief Operating-system entropy source and exact-read helper.
 */

#include "oidkit/infra/random_source.hpp"

#include "oidkit/core/error.hpp"
#include "oidkit/infra/logger.hpp"

#include <exception>
#include <random>
#include <string>

namespace oidkit::infra {

/**
 * @brief Draws bytes from `std::random_device` four at a time.
 *
 * Each `operator()` call yields 32 bits of entropy; the final word is
 * truncated when `length` is not a multiple of four.
 */
size_t SystemRandomSource::read(uint8_t* buffer, size_t length)
{
    size_t written = 0;
    try {
        std::random_device rd;
        while (written < length) {
            uint32_t word = rd();
            for (int shift = 24; shift >= 0 && written < length; shift -= 8) {
                buffer[written++] = static_cast<uint8_t>(word >> shift);
            }
        }
    } catch (const std::exception& e) {
        Logger::log(LogLevel::ERROR, "Entropy: random_device failed: " + std::string(e.what()));
    }
    return written;
}

void read_full(RandomSource& source, uint8_t* buffer, size_t length, const char* what)
{
    size_t got = source.read(buffer, length);
    if (got < length) {
        throw Exception(Error::RANDOM_SOURCE_FAILURE,
                        std::string("generate ") + what + ": wanted " + std::to_string(length) +
                            " bytes, got " + std::to_string(got));
    }
}

} // namespace oidkit::infra
