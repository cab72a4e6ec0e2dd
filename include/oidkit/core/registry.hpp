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
 * @file registry.hpp
 * @brief Owner of the generation state shared by every ObjectId producer.
 *
 * @details
 * A `Registry` bundles the counter and the machine/process discriminator
 * together with their execute-once seeding guards. Host programs normally use
 * the shared instance returned by `Registry::global()`; tests and embedders that
 * need isolated sequences construct their own and pass it to
 * `ObjectId::generate(Registry&)`.
 */

#pragma once

#include "oidkit/core/counter.hpp"
#include "oidkit/core/machine_process_id.hpp"
#include "oidkit/infra/random_source.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>

namespace oidkit::core {

/**
 * @class Registry
 * @brief Lazily seeded holder of the counter and discriminator.
 *
 * @details
 * **Initialization:** each component is seeded at most once, guarded by its own
 * `std::once_flag`. Seeding happens on the first `initialize()` call or, failing
 * that, on first use. After that the guard costs one atomic load per access.
 *
 * **Overrides:** `set_counter()` and `set_machine_process_id()` may be called
 * before or after seeding. An override issued first consumes the component's
 * guard, so automatic seeding never replaces an explicit assignment.
 *
 * **Failure:** if the random source cannot supply enough bytes, a FATAL record
 * is logged and `oidkit::Exception` (`Error::RANDOM_SOURCE_FAILURE`) propagates.
 * The guard stays unset, so whether to retry or terminate is the host's call.
 */
class Registry {
  public:
    Registry();

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    /**
     * @brief Seeds any component that is not yet established, using `source`.
     *
     * Safe to call concurrently; components already seeded or overridden are
     * left as they are.
     *
     * @throws oidkit::Exception on a short read from `source`.
     */
    void initialize(infra::RandomSource& source);

    /// @brief `initialize()` with a `SystemRandomSource`.
    void initialize();

    /// @brief Replaces the counter state outright.
    void set_counter(uint32_t value);

    /// @brief Replaces the discriminator outright.
    void set_machine_process_id(const MachineProcessId& id);

    /// @brief Advances the counter, seeding it first if needed.
    uint32_t next_counter();

    /// @brief The current discriminator, seeding it first if needed.
    MachineProcessId machine_process_id();

    /**
     * @brief The process-wide shared instance.
     *
     * Constructed on first call; it lives until static destruction.
     */
    static Registry& global();

  private:
    void seed_counter(infra::RandomSource& source);
    void seed_machine_process_id(infra::RandomSource& source);

    Counter counter_;

    /// @brief Discriminator packed into the low 40 bits (see `MachineProcessId::pack`).
    std::atomic<uint64_t> machine_process_id_;

    std::once_flag counter_once_;
    std::once_flag machine_process_id_once_;
};

} // namespace oidkit::core
