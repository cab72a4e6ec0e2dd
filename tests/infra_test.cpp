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
 * @file infra_test.cpp
 * @brief Unit tests for shared infrastructure (String, Logger, RandomSource, Config).
 */

#include "framework.hpp"
#include "oidkit/core/error.hpp"
#include "oidkit/core/machine_process_id.hpp"
#include "oidkit/core/registry.hpp"
#include "oidkit/infra/config.hpp"
#include "oidkit/infra/logger.hpp"
#include "oidkit/infra/random_source.hpp"
#include "oidkit/infra/string.hpp"
#include "test_doubles.hpp"

#include <cstdint>
#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

using oidkit::infra::Config;
using oidkit::infra::Logger;
using oidkit::infra::LogLevel;
using oidkit::infra::String;

/**
 * @brief Leading/trailing whitespace goes, interior whitespace stays.
 */
void test_string_trim()
{
    ASSERT_EQ(String::trim("   hello oidkit \t\n"), std::string("hello oidkit"));
    ASSERT_EQ(String::trim("  \t\n  \r "), std::string(""));
    ASSERT_EQ(String::trim(""), std::string(""));
    ASSERT_EQ(String::trim("x"), std::string("x"));
    ASSERT_EQ(String::trim(" a b "), std::string("a b"));
    ASSERT_EQ(String::trim("0a0b0c0d0e\n"), std::string("0a0b0c0d0e"));
    ASSERT_EQ(String::to_lower("DeBuG"), std::string("debug"));
}

void test_logger_parse_level()
{
    LogLevel level = LogLevel::INFO;

    ASSERT_TRUE(Logger::parse_level(" TRACE ", level));
    ASSERT_TRUE(level == LogLevel::TRACE);
    ASSERT_TRUE(Logger::parse_level("warning", level));
    ASSERT_TRUE(level == LogLevel::WARN);
    ASSERT_FALSE(Logger::parse_level("verbose", level));
    ASSERT_TRUE(level == LogLevel::WARN);
}

void test_logger_threshold()
{
    LogLevel saved = Logger::level();

    Logger::set_level(LogLevel::ERROR);
    ASSERT_TRUE(Logger::level() == LogLevel::ERROR);
    Logger::log(LogLevel::INFO, "filtered out");

    Logger::set_level(saved);
    ASSERT_TRUE(Logger::level() == saved);
}

void test_system_random_source_fills()
{
    oidkit::infra::SystemRandomSource source;
    uint8_t buf[13] = {};
    ASSERT_EQ(source.read(buf, sizeof(buf)), sizeof(buf));
}

void test_read_full_short()
{
    oidkit::test::FixedRandomSource source({1, 2});
    uint8_t buf[3] = {};
    ASSERT_THROWS(oidkit::infra::read_full(source, buf, sizeof(buf), "test bytes"), oidkit::Exception);
}

/**
 * @brief Environment values are trimmed, parsed and applied to a registry.
 */
void test_config_from_environment()
{
    LogLevel saved = Logger::level();
    setenv("OIDKIT_LOG_LEVEL", "  Debug ", 1);
    setenv("OIDKIT_MACHINE_PROCESS_ID", "0a0b0c0d0e", 1);

    Config config = Config::from_environment();
    ASSERT_TRUE(config.log_level.has_value());
    ASSERT_TRUE(*config.log_level == LogLevel::DEBUG);
    ASSERT_EQ(config.machine_process_id.value_or(""), std::string("0a0b0c0d0e"));

    oidkit::core::Registry registry;
    ASSERT_EQ(config.apply(registry), oidkit::Error::NONE);
    ASSERT_TRUE(Logger::level() == LogLevel::DEBUG);
    ASSERT_EQ(registry.machine_process_id().to_hex(), std::string("0a0b0c0d0e"));

    unsetenv("OIDKIT_LOG_LEVEL");
    unsetenv("OIDKIT_MACHINE_PROCESS_ID");
    Logger::set_level(saved);

    Config empty = Config::from_environment();
    ASSERT_FALSE(empty.log_level.has_value());
    ASSERT_FALSE(empty.machine_process_id.has_value());
}

/**
 * @brief Parallel loads of a settled environment all see the same values.
 */
void test_config_concurrent_reads()
{
    setenv("OIDKIT_MACHINE_PROCESS_ID", " 0102030405 ", 1);

    const size_t threads = 8;
    std::vector<std::string> seen(threads);
    std::vector<std::thread> workers;
    for (size_t t = 0; t < threads; ++t) {
        workers.emplace_back([&seen, t] {
            for (int i = 0; i < 200; ++i) {
                seen[t] = Config::from_environment().machine_process_id.value_or("");
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }
    unsetenv("OIDKIT_MACHINE_PROCESS_ID");

    for (const auto& value : seen) {
        ASSERT_EQ(value, std::string("0102030405"));
    }
}

/**
 * @brief A malformed discriminator is rejected and nothing is applied.
 */
void test_config_apply_rejects_bad_discriminator()
{
    LogLevel saved = Logger::level();

    Config config;
    config.log_level = LogLevel::FATAL;
    config.machine_process_id = "not-hex!!!";

    oidkit::core::Registry registry;
    registry.set_machine_process_id(oidkit::core::MachineProcessId::derive("keep", 1));

    ASSERT_EQ(config.apply(registry), oidkit::Error::INVALID_ENCODING);
    ASSERT_TRUE(Logger::level() == saved);
    ASSERT_TRUE(registry.machine_process_id() == oidkit::core::MachineProcessId::derive("keep", 1));
}
