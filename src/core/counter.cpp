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
 * @file counter.cpp
 * @brief Implementation of the atomic ObjectId counter.
 */

#include "oidkit/core/counter.hpp"

namespace oidkit::core {

Counter::Counter(uint32_t initial) : value_(initial) {}

uint32_t Counter::draw_seed(infra::RandomSource& source)
{
    uint8_t buf[4];
    infra::read_full(source, buf, sizeof(buf), "initial counter");

    return (static_cast<uint32_t>(buf[0]) << 24) | (static_cast<uint32_t>(buf[1]) << 16) |
           (static_cast<uint32_t>(buf[2]) << 8) | static_cast<uint32_t>(buf[3]);
}

uint32_t Counter::next()
{
    // fetch_add returns the prior value; unsigned overflow wraps by definition.
    return value_.fetch_add(1) + 1;
}

void Counter::set(uint32_t value)
{
    value_.store(value);
}

uint32_t Counter::current() const
{
    return value_.load();
}

} // namespace oidkit::core
