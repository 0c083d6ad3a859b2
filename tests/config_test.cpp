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
 * @file config_test.cpp
 * @brief Tests for loading server settings from JSON.
 */

#include "conduit/config/settings.hpp"
#include "framework.hpp"

#include <stdexcept>
#include <string>

using conduit::config::Settings;
using conduit::infra::LogLevel;

void test_settings_defaults_and_overrides()
{
    Settings defaults = Settings::parse("{}");
    ASSERT_EQ(defaults.port, 8080);
    ASSERT_EQ(defaults.flash_ttl_seconds, 180);
    ASSERT_FALSE(defaults.throw_if_no_handler_found);

    Settings custom = Settings::parse(R"({
        "port": 9090,
        "worker_threads": 4,
        "flash_ttl_seconds": 60,
        "async_timeout_ms": 1500,
        "log_level": "debug",
        "throw_if_no_handler_found": true
    })");
    ASSERT_EQ(custom.port, 9090);
    ASSERT_EQ(custom.worker_threads, static_cast<size_t>(4));
    ASSERT_EQ(custom.flash_ttl_seconds, 60);
    ASSERT_EQ(custom.async_timeout_ms, 1500L);
    ASSERT_TRUE(custom.log_level == LogLevel::DEBUG);
    ASSERT_TRUE(custom.throw_if_no_handler_found);
}

/**
 * @brief Wrong types, out-of-range ports and unreadable files are rejected.
 */
void test_settings_validation()
{
    ASSERT_THROWS(Settings::parse("[1, 2]"), std::invalid_argument);
    ASSERT_THROWS(Settings::parse("{\"port\": \"80\"}"), std::invalid_argument);
    ASSERT_THROWS(Settings::parse("{\"port\": 70000}"), std::invalid_argument);
    ASSERT_THROWS(Settings::parse("{\"log_level\": 3}"), std::invalid_argument);
    ASSERT_THROWS(Settings::load_file("/nonexistent/conduit.json"), std::runtime_error);
}
