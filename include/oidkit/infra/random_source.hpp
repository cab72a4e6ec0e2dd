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
 * @file random_source.hpp
 * @brief Injectable entropy interface used to seed identifier generation.
 *
 * @details
 * The counter seed and the machine/process discriminator are both drawn from a
 * `RandomSource`. Production code uses `SystemRandomSource`, which is backed by
 * the operating system's non-deterministic generator (`std::random_device`).
 * Tests substitute a scripted source to make generation reproducible.
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace oidkit::infra {

/**
 * @class RandomSource
 * @brief Abstract producer of raw random bytes.
 */
class RandomSource {
  public:
    virtual ~RandomSource() = default;

    /**
     * @brief Writes up to `length` random bytes into `buffer`.
     *
     * A short count signals that the source is exhausted or has failed.
     * Implementations must not throw.
     *
     * @param buffer Destination memory, at least `length` bytes long.
     * @param length Number of bytes requested.
     * @return size_t Number of bytes actually written.
     */
    virtual size_t read(uint8_t* buffer, size_t length) = 0;
};

/**
 * @class SystemRandomSource
 * @brief `RandomSource` backed by `std::random_device`.
 *
 * @details
 * A fresh device is opened per call, so a single instance may be shared across
 * threads. Device failures are logged and surface as a short read.
 */
class SystemRandomSource : public RandomSource {
  public:
    size_t read(uint8_t* buffer, size_t length) override;
};

/**
 * @brief Fills `buffer` completely from `source` or throws.
 *
 * @param source The entropy provider.
 * @param buffer Destination memory.
 * @param length Exact number of bytes required.
 * @param what Short label for the value being seeded, used in the error message.
 *
 * @throws oidkit::Exception with `Error::RANDOM_SOURCE_FAILURE` on a short read.
 */
void read_full(RandomSource& source, uint8_t* buffer, size_t length, const char* what);

} // namespace oidkit::infra
