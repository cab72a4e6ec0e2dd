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
 * @file machine_process_id.hpp
 * @brief The 5-byte per-process discriminator embedded in every ObjectId.
 *
 * @details
 * Two processes that generate identifiers in the same second are kept apart by
 * this value. It is normally random; operators who want explicit assignment can
 * derive it from host name and pid instead.
 */

#pragma once

#include "oidkit/core/error.hpp"
#include "oidkit/infra/random_source.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace oidkit::core {

/**
 * @class MachineProcessId
 * @brief Immutable 5-byte discriminator value.
 */
class MachineProcessId {
  public:
    static constexpr size_t kSize = 5;
    using Bytes = std::array<uint8_t, kSize>;

    /// @brief Constructs the all-zero discriminator.
    MachineProcessId();

    explicit MachineProcessId(const Bytes& bytes);

    /**
     * @brief Reads exactly 5 bytes from `source`.
     *
     * @throws oidkit::Exception with `Error::RANDOM_SOURCE_FAILURE` on a short read.
     */
    static MachineProcessId generate(infra::RandomSource& source);

    /**
     * @brief Deterministic discriminator in the legacy machine+pid layout.
     *
     * Bytes `[0:3)` hold the low 24 bits of a DJB2 hash of `host` and bytes
     * `[3:5)` the low 16 bits of `pid`, both big-endian.
     *
     * @code
     * registry.set_machine_process_id(MachineProcessId::derive(hostname, getpid()));
     * @endcode
     */
    static MachineProcessId derive(std::string_view host, uint32_t pid);

    /**
     * @brief Parses the 10-character hex form.
     *
     * @param text Hex digits, either case.
     * @param error Receives `NONE`, `INVALID_LENGTH` or `INVALID_ENCODING`.
     * @return The parsed value, or the all-zero value on failure.
     */
    static MachineProcessId from_hex(std::string_view text, Error& error);

    /// @brief 10 lowercase hex characters.
    std::string to_hex() const;

    const Bytes& bytes() const { return bytes_; }

    /// @brief Packs the bytes big-endian into the low 40 bits of a word.
    uint64_t pack() const;

    /// @brief Inverse of `pack()`; bits above 40 are ignored.
    static MachineProcessId unpack(uint64_t packed);

    bool operator==(const MachineProcessId& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const MachineProcessId& other) const { return bytes_ != other.bytes_; }

  private:
    Bytes bytes_;
};

} // namespace oidkit::core
