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
 * @file config.hpp
 * @brief Optional host-facing settings for the logger and the generation state.
 *
 * @details
 * The library never reads configuration on its own. A host that wants
 * environment-driven setup calls `Config::from_environment()` and then
 * `apply()` on the registry it uses.
 *
 * | Variable                     | Meaning                                   |
 * |------------------------------|-------------------------------------------|
 * | `OIDKIT_LOG_LEVEL`           | `trace`, `debug`, `info`, `warn`, `error`, `fatal` |
 * | `OIDKIT_MACHINE_PROCESS_ID`  | Explicit discriminator, 10 hex characters |
 */

#pragma once

#include "oidkit/core/error.hpp"
#include "oidkit/core/registry.hpp"
#include "oidkit/infra/logger.hpp"

#include <optional>
#include <string>

namespace oidkit::infra {

/**
 * @class Config
 * @brief Settings a host may apply at startup.
 */
class Config {
  public:
    /// @brief Logger threshold; unset keeps the current one.
    std::optional<LogLevel> log_level;

    /// @brief Discriminator hex text; unset keeps random seeding.
    std::optional<std::string> machine_process_id;

    /**
     * @brief Reads `OIDKIT_LOG_LEVEL` and `OIDKIT_MACHINE_PROCESS_ID`.
     *
     * Empty variables count as unset. An unrecognized level name is reported
     * with a WARN record and ignored.
     *
     * Concurrent calls are serialized against each other only. The process
     * environment must not be modified while this runs.
     */
    static Config from_environment();

    /**
     * @brief Installs the settings.
     *
     * The discriminator is validated first. If it is malformed, the decode
     * error is returned and neither the logger nor `registry` is touched.
     */
    Error apply(core::Registry& registry) const;
};

} // namespace oidkit::infra
