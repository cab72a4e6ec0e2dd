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
 * @file registry.cpp
 * @brief Execute-once seeding and override plumbing for the generation state.
 */

#include "oidkit/core/registry.hpp"

#include "oidkit/core/error.hpp"
#include "oidkit/infra/logger.hpp"

#include <string>

namespace oidkit::core {

Registry::Registry() : counter_(0), machine_process_id_(0) {}

void Registry::initialize(infra::RandomSource& source)
{
    std::call_once(counter_once_, [this, &source] { seed_counter(source); });
    std::call_once(machine_process_id_once_,
                   [this, &source] { seed_machine_process_id(source); });
}

void Registry::initialize()
{
    infra::SystemRandomSource source;
    initialize(source);
}

void Registry::set_counter(uint32_t value)
{
    // Consume the guard so a later lazy seed cannot clobber the override.
    std::call_once(counter_once_, [] {});
    counter_.set(value);
}

void Registry::set_machine_process_id(const MachineProcessId& id)
{
    std::call_once(machine_process_id_once_, [] {});
    machine_process_id_.store(id.pack());
}

uint32_t Registry::next_counter()
{
    std::call_once(counter_once_, [this] {
        infra::SystemRandomSource source;
        seed_counter(source);
    });
    return counter_.next();
}

MachineProcessId Registry::machine_process_id()
{
    std::call_once(machine_process_id_once_, [this] {
        infra::SystemRandomSource source;
        seed_machine_process_id(source);
    });
    return MachineProcessId::unpack(machine_process_id_.load());
}

Registry& Registry::global()
{
    static Registry instance;
    return instance;
}

void Registry::seed_counter(infra::RandomSource& source)
{
    try {
        counter_.set(Counter::draw_seed(source));
    } catch (const Exception& e) {
        infra::Logger::log(infra::LogLevel::FATAL, "Registry: " + std::string(e.what()));
        throw;
    }
}

void Registry::seed_machine_process_id(infra::RandomSource& source)
{
    try {
        machine_process_id_.store(MachineProcessId::generate(source).pack());
    } catch (const Exception& e) {
        infra::Logger::log(infra::LogLevel::FATAL, "Registry: " + std::string(e.what()));
        throw;
    }
}

} // namespace oidkit::core
