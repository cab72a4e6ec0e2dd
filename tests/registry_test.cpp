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
 * @file registry_test.cpp
 * @brief Seeding, override and failure semantics of the generation registry.
 *
 * @details
 * Every test builds its own `Registry` so sequences stay isolated from the
 * process-wide instance and from each other.
 */

#include "framework.hpp"
#include "oidkit/core/error.hpp"
#include "oidkit/core/registry.hpp"
#include "test_doubles.hpp"

#include <cstdint>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

using oidkit::core::MachineProcessId;
using oidkit::core::Registry;
using oidkit::test::FixedRandomSource;

void test_registry_initialize_from_source()
{
    Registry registry;
    FixedRandomSource source({0x00, 0x00, 0x01, 0x00, 0x01, 0x02, 0x03, 0x04, 0x05});
    registry.initialize(source);

    ASSERT_EQ(source.consumed(), static_cast<size_t>(9));
    ASSERT_EQ(registry.next_counter(), static_cast<uint32_t>(0x101));
    ASSERT_EQ(registry.machine_process_id().to_hex(), std::string("0102030405"));
}

/**
 * @brief A second initialize() is a no-op and reads no entropy.
 */
void test_registry_initialize_once()
{
    Registry registry;
    FixedRandomSource first({0, 0, 0, 9, 1, 1, 1, 1, 1});
    registry.initialize(first);

    FixedRandomSource second({0xFF, 0xFF, 0xFF, 0xFF, 2, 2, 2, 2, 2});
    registry.initialize(second);

    ASSERT_EQ(second.consumed(), static_cast<size_t>(0));
    ASSERT_EQ(registry.next_counter(), static_cast<uint32_t>(10));
    ASSERT_EQ(registry.machine_process_id().to_hex(), std::string("0101010101"));
}

/**
 * @brief Overrides issued before seeding survive the later initialize().
 */
void test_registry_override_before_initialize()
{
    Registry registry;
    registry.set_counter(500);
    registry.set_machine_process_id(MachineProcessId::derive("host", 77));

    FixedRandomSource source({9, 9, 9, 9, 9, 9, 9, 9, 9});
    registry.initialize(source);

    ASSERT_EQ(source.consumed(), static_cast<size_t>(0));
    ASSERT_EQ(registry.next_counter(), static_cast<uint32_t>(501));
    ASSERT_TRUE(registry.machine_process_id() == MachineProcessId::derive("host", 77));
}

void test_registry_override_after_initialize()
{
    Registry registry;
    FixedRandomSource source({0, 0, 0, 1, 1, 2, 3, 4, 5});
    registry.initialize(source);

    registry.set_counter(0xFFFFFFFEu);
    registry.set_machine_process_id(MachineProcessId());

    ASSERT_EQ(registry.next_counter(), static_cast<uint32_t>(0xFFFFFFFFu));
    ASSERT_EQ(registry.next_counter(), static_cast<uint32_t>(0));
    ASSERT_EQ(registry.machine_process_id().to_hex(), std::string("0000000000"));
}

/**
 * @brief A short entropy read surfaces as RANDOM_SOURCE_FAILURE and can be retried.
 */
void test_registry_seed_failure()
{
    Registry registry;
    FixedRandomSource empty({});

    oidkit::Error code = oidkit::Error::NONE;
    try {
        registry.initialize(empty);
    } catch (const oidkit::Exception& e) {
        code = e.code();
    }
    ASSERT_EQ(code, oidkit::Error::RANDOM_SOURCE_FAILURE);

    FixedRandomSource good({0, 0, 0, 0, 7, 7, 7, 7, 7});
    registry.initialize(good);
    ASSERT_EQ(registry.next_counter(), static_cast<uint32_t>(1));
    ASSERT_EQ(registry.machine_process_id().to_hex(), std::string("0707070707"));
}

/**
 * @brief Lazy seeding from the system source happens once under contention.
 *
 * Both components are first touched concurrently. The counter values must form
 * one run from a single seed; the run may wrap past 2^32, so contiguity is
 * checked as "exactly one value lacks a predecessor".
 */
void test_registry_lazy_concurrent_first_use()
{
    Registry registry;
    const size_t threads = 8;
    const size_t per_thread = 1000;
    std::vector<MachineProcessId> seen(threads);
    std::vector<std::vector<uint32_t>> counts(threads);
    std::vector<std::thread> workers;

    for (size_t t = 0; t < threads; ++t) {
        workers.emplace_back([&registry, &seen, &counts, t, per_thread] {
            for (size_t i = 0; i < per_thread; ++i) {
                counts[t].push_back(registry.next_counter());
            }
            seen[t] = registry.machine_process_id();
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    for (size_t t = 1; t < threads; ++t) {
        ASSERT_TRUE(seen[t] == seen[0]);
    }

    std::unordered_set<uint32_t> values;
    for (const auto& chunk : counts) {
        values.insert(chunk.begin(), chunk.end());
    }
    ASSERT_EQ(values.size(), threads * per_thread);

    size_t run_starts = 0;
    for (uint32_t v : values) {
        if (values.count(v - 1) == 0) {
            ++run_starts;
        }
    }
    ASSERT_EQ(run_starts, static_cast<size_t>(1));
}

void test_registry_global_is_shared()
{
    ASSERT_TRUE(&Registry::global() == &Registry::global());
}
