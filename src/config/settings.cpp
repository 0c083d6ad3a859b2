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
 * @file settings.cpp
 * @brief JSON loading of server settings.
 */

#include "conduit/config/settings.hpp"

#include "conduit/infra/json.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace conduit::config {

using infra::ScopedJson;

namespace {

cJSON* field(const ScopedJson& root, const char* name)
{
    return cJSON_GetObjectItemCaseSensitive(root.get(), name);
}

double number_field(const ScopedJson& root, const char* name, double fallback)
{
    cJSON* item = field(root, name);
    if (!item) {
        return fallback;
    }
    if (!cJSON_IsNumber(item)) {
        throw std::invalid_argument(std::string("Setting '") + name + "' must be a number");
    }
    return item->valuedouble;
}

} // namespace

Settings Settings::parse(const std::string& json, Settings defaults)
{
    ScopedJson root(cJSON_Parse(json.c_str()));
    if (!root || !cJSON_IsObject(root.get())) {
        throw std::invalid_argument("Settings must be a JSON object");
    }

    Settings settings = defaults;
    settings.port = static_cast<int>(number_field(root, "port", settings.port));
    settings.worker_threads = static_cast<size_t>(
        number_field(root, "worker_threads", static_cast<double>(settings.worker_threads)));
    settings.flash_ttl_seconds =
        static_cast<int>(number_field(root, "flash_ttl_seconds", settings.flash_ttl_seconds));
    settings.async_timeout_ms = static_cast<long>(
        number_field(root, "async_timeout_ms", static_cast<double>(settings.async_timeout_ms)));

    cJSON* level = field(root, "log_level");
    if (level) {
        if (!cJSON_IsString(level)) {
            throw std::invalid_argument("Setting 'log_level' must be a string");
        }
        settings.log_level = infra::Logger::parse_level(level->valuestring, settings.log_level);
    }

    cJSON* strict = field(root, "throw_if_no_handler_found");
    if (strict) {
        if (!cJSON_IsBool(strict)) {
            throw std::invalid_argument("Setting 'throw_if_no_handler_found' must be a boolean");
        }
        settings.throw_if_no_handler_found = cJSON_IsTrue(strict);
    }

    if (settings.port <= 0 || settings.port > 65535) {
        throw std::invalid_argument("Setting 'port' out of range: " + std::to_string(settings.port));
    }
    return settings;
}

Settings Settings::parse(const std::string& json)
{
    return parse(json, Settings());
}

Settings Settings::load_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open settings file '" + path + "'");
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return parse(buffer.str());
}

} // namespace conduit::config
