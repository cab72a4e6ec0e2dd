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
 * @file object_id.cpp
 * @brief Identifier assembly, field extraction and hex round-trip.
 *
 * @details
 * All multi-byte fields are written and read big-endian so that the binary
 * layout matches the reference ObjectId format byte for byte.
 */

#include "oidkit/core/object_id.hpp"

#include "oidkit/codec/hex.hpp"

#include <algorithm>

namespace oidkit::core {

namespace {

constexpr size_t kTimestampOffset = 0;
constexpr size_t kProcessOffset = 4;
constexpr size_t kCounterOffset = kProcessOffset + MachineProcessId::kSize;

int64_t now_epoch_seconds()
{
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count();
}

} // namespace

ObjectId::ObjectId() : bytes_{} {}

ObjectId::ObjectId(const Bytes& bytes) : bytes_(bytes) {}

ObjectId ObjectId::nil()
{
    return ObjectId();
}

ObjectId ObjectId::from_bytes(const Bytes& bytes)
{
    return ObjectId(bytes);
}

ObjectId ObjectId::generate()
{
    return generate_at(now_epoch_seconds(), Registry::global());
}

ObjectId ObjectId::generate(Registry& registry)
{
    return generate_at(now_epoch_seconds(), registry);
}

ObjectId ObjectId::generate_at(int64_t epoch_seconds)
{
    return generate_at(epoch_seconds, Registry::global());
}

/**
 * @brief Packs timestamp, discriminator and counter into a fresh identifier.
 *
 * Only the counter increment synchronizes; the discriminator read is a plain
 * atomic load once the registry is seeded.
 */
ObjectId ObjectId::generate_at(int64_t epoch_seconds, Registry& registry)
{
    Bytes bytes{};

    uint32_t ts = static_cast<uint32_t>(epoch_seconds);
    bytes[kTimestampOffset] = static_cast<uint8_t>(ts >> 24);
    bytes[kTimestampOffset + 1] = static_cast<uint8_t>(ts >> 16);
    bytes[kTimestampOffset + 2] = static_cast<uint8_t>(ts >> 8);
    bytes[kTimestampOffset + 3] = static_cast<uint8_t>(ts);

    MachineProcessId process = registry.machine_process_id();
    std::copy(process.bytes().begin(), process.bytes().end(), bytes.begin() + kProcessOffset);

    // Only the low 24 bits of the counter fit.
    uint32_t count = registry.next_counter();
    bytes[kCounterOffset] = static_cast<uint8_t>(count >> 16);
    bytes[kCounterOffset + 1] = static_cast<uint8_t>(count >> 8);
    bytes[kCounterOffset + 2] = static_cast<uint8_t>(count);

    return ObjectId(bytes);
}

ObjectId ObjectId::from_hex(std::string_view text, Error& error)
{
    Bytes bytes{};
    error = codec::Hex::decode(text, bytes.data(), bytes.size());
    if (error != Error::NONE) {
        return ObjectId();
    }
    return ObjectId(bytes);
}

ObjectId ObjectId::parse(std::string_view text)
{
    Error error = Error::NONE;
    ObjectId id = from_hex(text, error);
    if (error != Error::NONE) {
        throw Exception(error, "decode object id '" + std::string(text) + "'");
    }
    return id;
}

std::string ObjectId::to_hex() const
{
    return codec::Hex::encode(bytes_.data(), bytes_.size());
}

uint32_t ObjectId::epoch_seconds() const
{
    return (static_cast<uint32_t>(bytes_[kTimestampOffset]) << 24) |
           (static_cast<uint32_t>(bytes_[kTimestampOffset + 1]) << 16) |
           (static_cast<uint32_t>(bytes_[kTimestampOffset + 2]) << 8) |
           static_cast<uint32_t>(bytes_[kTimestampOffset + 3]);
}

std::chrono::system_clock::time_point ObjectId::timestamp() const
{
    return std::chrono::system_clock::time_point(std::chrono::seconds(epoch_seconds()));
}

MachineProcessId ObjectId::machine_process_id() const
{
    MachineProcessId::Bytes process{};
    std::copy(bytes_.begin() + kProcessOffset, bytes_.begin() + kCounterOffset, process.begin());
    return MachineProcessId(process);
}

uint32_t ObjectId::counter() const
{
    return (static_cast<uint32_t>(bytes_[kCounterOffset]) << 16) |
           (static_cast<uint32_t>(bytes_[kCounterOffset + 1]) << 8) |
           static_cast<uint32_t>(bytes_[kCounterOffset + 2]);
}

bool ObjectId::is_nil() const
{
    return std::all_of(bytes_.begin(), bytes_.end(), [](uint8_t b) { return b == 0; });
}

std::ostream& operator<<(std::ostream& os, const ObjectId& id)
{
    return os << id.to_hex();
}

} // namespace oidkit::core
