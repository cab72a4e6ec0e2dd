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
 * @file config.cpp
 * @brief Environment loading and application of host settings.
 */

#include "oidkit/infra/config.hpp"

#include "oidkit/core/machine_process_id.hpp"
#include "oidkit/infra/string.hpp"

#include <cstdlib>
#include <mutex>

namespace oidkit::infra {

namespace {

/**
 * @brief Trimmed value of `name`, or empty when unset.
 *
 * The lock only serializes reads made through this function. It does not guard
 * against a host calling `setenv`/`unsetenv` concurrently; hosts that mutate the
 * environment must finish doing so before loading the configuration.
 */
std::string read_env(const char* name)
{
    static std::mutex env_mutex;
    std::lock_guard<std::mutex> lock(env_mutex);

    const char* value = std::getenv(name); // NOLINT(concurrency-mt-unsafe)
    return value ? String::trim(value) : "";
}

} // namespace

Config Config::from_environment()
{
    Config config;

    std::string level = read_env("OIDKIT_LOG_LEVEL");
    if (!level.empty()) {
        LogLevel parsed = LogLevel::INFO;
        if (Logger::parse_level(level, parsed)) {
            config.log_level = parsed;
        } else {
            Logger::log(LogLevel::WARN, "Config: ignoring unknown OIDKIT_LOG_LEVEL '" + level + "'");
        }
    }

    std::string process = read_env("OIDKIT_MACHINE_PROCESS_ID");
    if (!process.empty()) {
        config.machine_process_id = process;
    }

    return config;
}

Error Config::apply(core::Registry& registry) const
{
    core::MachineProcessId process;
    if (machine_process_id) {
        Error error = Error::NONE;
        process = core::MachineProcessId::from_hex(*machine_process_id, error);
        if (error != Error::NONE) {
            return error;
        }
    }

    if (log_level) {
        Logger::set_level(*log_level);
    }
    if (machine_process_id) {
        registry.set_machine_process_id(process);
    }
    return Error::NONE;
}

} // namespace oidkit::infra
