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
 * @file object_id.hpp
 * @brief Compact, sortable, 12-byte document identifiers (MongoDB ObjectId layout).
 *
 * @details
 * This file declares the `ObjectId` value type, the primary key format of the
 * oidkit library. Each identifier packs three big-endian fields:
 *
 * | Bytes     | Field                                             |
 * |-----------|---------------------------------------------------|
 * | `[0:4)`   | Seconds since the Unix epoch (uint32, wraps 2106) |
 * | `[4:9)`   | Machine/process discriminator                     |
 * | `[9:12)`  | Low 24 bits of the per-process counter            |
 *
 * Because the timestamp leads, byte-wise ordering follows creation time, and
 * within one process and one second it follows the counter.
 */

#pragma once

#include "oidkit/core/error.hpp"
#include "oidkit/core/machine_process_id.hpp"
#include "oidkit/core/registry.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace oidkit::core {

/**
 * @class ObjectId
 * @brief Immutable 12-byte identifier value.
 *
 * @details
 * A default-constructed `ObjectId` is the nil identifier (all zero bytes), which
 * stands for "absent". Identifiers are compared, hashed and copied by their raw
 * bytes and may be shared across threads freely.
 */
class ObjectId {
  public:
    static constexpr size_t kSize = 12;
    static constexpr size_t kHexLength = kSize * 2;
    using Bytes = std::array<uint8_t, kSize>;

    /// @brief Constructs the nil identifier.
    ObjectId();

    /// @brief The nil identifier.
    static ObjectId nil();

    /// @brief Wraps a raw 12-byte value without interpretation.
    static ObjectId from_bytes(const Bytes& bytes);

    /**
     * @brief Generates an identifier stamped with the current wall-clock second.
     *
     * Uses `Registry::global()`, seeding it on first use.
     *
     * @code
     * auto id = oidkit::core::ObjectId::generate();
     * std::string key = id.to_hex(); // e.g. "640c5fe5d243553cda8dde1b"
     * @endcode
     */
    static ObjectId generate();

    /// @brief As `generate()`, drawing state from `registry`.
    static ObjectId generate(Registry& registry);

    /**
     * @brief Generates an identifier for a caller-supplied time.
     *
     * `epoch_seconds` is truncated to its low 32 bits. Useful for deterministic
     * tests and for backdating.
     */
    static ObjectId generate_at(int64_t epoch_seconds);

    static ObjectId generate_at(int64_t epoch_seconds, Registry& registry);

    /**
     * @brief Decodes the 24-character hex form.
     *
     * Hex digits of either case are accepted.
     *
     * @param text The candidate text.
     * @param error Receives `NONE`, `INVALID_LENGTH` (not 24 characters) or
     * `INVALID_ENCODING` (24 characters, not all hex).
     * @return The decoded identifier, or the nil identifier on failure. Check
     * `error`; a nil result is also a legal success.
     */
    static ObjectId from_hex(std::string_view text, Error& error);

    /**
     * @brief Throwing form of `from_hex`.
     *
     * @throws oidkit::Exception carrying the decode error.
     */
    static ObjectId parse(std::string_view text);

    /// @brief 24 lowercase hex characters. Never fails.
    std::string to_hex() const;

    /// @brief Bytes `[0:4)` as seconds since the Unix epoch.
    uint32_t epoch_seconds() const;

    /// @brief `epoch_seconds()` as a UTC `system_clock` time point.
    std::chrono::system_clock::time_point timestamp() const;

    MachineProcessId machine_process_id() const;

    /// @brief Bytes `[9:12)` zero-extended to 32 bits; the top byte is always 0.
    uint32_t counter() const;

    /// @brief True iff all 12 bytes are zero.
    bool is_nil() const;

    const Bytes& bytes() const { return bytes_; }

    bool operator==(const ObjectId& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const ObjectId& other) const { return bytes_ != other.bytes_; }
    bool operator<(const ObjectId& other) const { return bytes_ < other.bytes_; }
    bool operator<=(const ObjectId& other) const { return bytes_ <= other.bytes_; }
    bool operator>(const ObjectId& other) const { return bytes_ > other.bytes_; }
    bool operator>=(const ObjectId& other) const { return bytes_ >= other.bytes_; }

  private:
    explicit ObjectId(const Bytes& bytes);

    Bytes bytes_;
};

/// @brief Writes the hex form.
std::ostream& operator<<(std::ostream& os, const ObjectId& id);

} // namespace oidkit::core

namespace std {

template <> struct hash<oidkit::core::ObjectId> {
    size_t operator()(const oidkit::core::ObjectId& id) const
    {
        const auto& b = id.bytes();
        return hash<string_view>{}(string_view(reinterpret_cast<const char*>(b.data()), b.size()));
    }
};

} // namespace std
