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
 * @file counter.hpp
 * @brief Lock-free 32-bit sequence embedded (low 24 bits) in every ObjectId.
 */

#pragma once

#include "oidkit/infra/random_source.hpp"

#include <atomic>
#include <cstdint>

namespace oidkit::core {

/**
 * @class Counter
 * @brief Atomically incremented 32-bit sequence.
 *
 * @details
 * `next()` is a sequentially consistent read-modify-write, so concurrent callers
 * never lose an increment and never observe the same value. The value wraps
 * silently at 2^32.
 *
 * **Pre-increment semantics:** a counter holding `s` returns `s + 1` on the
 * first `next()`, not `s`.
 */
class Counter {
  public:
    explicit Counter(uint32_t initial = 0);

    Counter(const Counter&) = delete;
    Counter& operator=(const Counter&) = delete;

    /**
     * @brief Reads 4 bytes from `source` as a big-endian initial value.
     *
     * @throws oidkit::Exception with `Error::RANDOM_SOURCE_FAILURE` if the
     * source supplies fewer than 4 bytes.
     */
    static uint32_t draw_seed(infra::RandomSource& source);

    /// @brief Increments by one and returns the new value.
    uint32_t next();

    /**
     * @brief Replaces the stored value outright.
     *
     * @warning Racing `set()` against concurrent `next()` callers is safe but
     * makes the resulting sequence nondeterministic.
     */
    void set(uint32_t value);

    /// @brief The most recently returned (or set) value.
    uint32_t current() const;

  private:
    std::atomic<uint32_t> value_;
};

} // namespace oidkit::core
