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
 * @file machine_process_id.cpp
 * @brief Seeding, derivation and text form of the process discriminator.
 */

#include "oidkit/core/machine_process_id.hpp"

#include "oidkit/codec/hex.hpp"

namespace oidkit::core {

MachineProcessId::MachineProcessId() : bytes_{} {}

MachineProcessId::MachineProcessId(const Bytes& bytes) : bytes_(bytes) {}

MachineProcessId MachineProcessId::generate(infra::RandomSource& source)
{
    Bytes bytes{};
    infra::read_full(source, bytes.data(), bytes.size(), "machine and process id");
    return MachineProcessId(bytes);
}

MachineProcessId MachineProcessId::derive(std::string_view host, uint32_t pid)
{
    // DJB2: hash * 33 + c
    uint32_t hash = 5381;
    for (char c : host)
        hash = ((hash << 5) + hash) + static_cast<unsigned char>(c);

    Bytes bytes{};
    bytes[0] = static_cast<uint8_t>(hash >> 16);
    bytes[1] = static_cast<uint8_t>(hash >> 8);
    bytes[2] = static_cast<uint8_t>(hash);
    bytes[3] = static_cast<uint8_t>(pid >> 8);
    bytes[4] = static_cast<uint8_t>(pid);
    return MachineProcessId(bytes);
}

MachineProcessId MachineProcessId::from_hex(std::string_view text, Error& error)
{
    Bytes bytes{};
    error = codec::Hex::decode(text, bytes.data(), bytes.size());
    if (error != Error::NONE) {
        return MachineProcessId();
    }
    return MachineProcessId(bytes);
}

std::string MachineProcessId::to_hex() const
{
    return codec::Hex::encode(bytes_.data(), bytes_.size());
}

uint64_t MachineProcessId::pack() const
{
    uint64_t packed = 0;
    for (uint8_t b : bytes_)
        packed = (packed << 8) | b;
    return packed;
}

MachineProcessId MachineProcessId::unpack(uint64_t packed)
{
    Bytes bytes{};
    for (size_t i = kSize; i-- > 0;) {
        bytes[i] = static_cast<uint8_t>(packed);
        packed >>= 8;
    }
    return MachineProcessId(bytes);
}

} // namespace oidkit::core
