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
 * @file flash_manager.cpp
 * @brief Flash retrieval at request start and save on redirect.
 */

#include "conduit/flash/flash_manager.hpp"

#include "conduit/infra/logger.hpp"

namespace conduit::flash {

using infra::Logger;
using infra::LogLevel;

const char* const FlashManager::INPUT_ATTRIBUTE = "conduit.flash.input";

namespace {

/**
 * @brief Strips scheme and authority from an absolute `Location`.
 */
std::string location_target(const std::string& location)
{
    size_t scheme = location.find("://");
    if (scheme == std::string::npos) {
        return location;
    }
    size_t path = location.find('/', scheme + 3);
    return path == std::string::npos ? "/" : location.substr(path);
}

} // namespace

FlashManager::FlashManager(std::shared_ptr<FlashStore> store, int ttl_seconds,
                           infra::MillisClock clock)
    : store_(std::move(store)), ttl_seconds_(ttl_seconds), clock_(std::move(clock))
{
}

std::optional<FlashState> FlashManager::retrieve_and_update(http::Request& request,
                                                            http::Response&)
{
    if (request.session_id().empty()) {
        return std::nullopt;
    }

    std::optional<FlashState> input =
        store_->retrieve_and_remove_best_match(request.session_id(), request);
    if (!input) {
        return std::nullopt;
    }

    for (const auto& entry : input->attributes()) {
        request.model()[entry.first] = entry.second;
    }
    request.set_attribute(INPUT_ATTRIBUTE, *input);

    if (Logger::is_enabled(LogLevel::DEBUG)) {
        Logger::log(LogLevel::DEBUG, "[" + request.id() + "] Retrieved " + input->to_string());
    }
    return input;
}

bool FlashManager::save_output(FlashState state, const http::Request& request,
                               const http::Response& response)
{
    if (state.empty()) {
        return false;
    }
    if (response.is_committed()) {
        Logger::log(LogLevel::WARN, "[" + request.id() +
                                        "] Response already committed, flash state not saved");
        return false;
    }
    if (request.session_id().empty()) {
        Logger::log(LogLevel::WARN,
                    "[" + request.id() + "] No session, flash state not saved");
        return false;
    }

    std::optional<std::string> location = response.header("Location");
    if (location) {
        http::Request target(http::Method::GET, location_target(*location));
        if (!state.target_path()) {
            state.set_target_path(target.path());
        }
        if (state.target_params().empty()) {
            for (const auto& entry : target.params()) {
                for (const std::string& value : entry.second) {
                    state.add_target_param(entry.first, value);
                }
            }
        }
    }

    state.start_expiration(ttl_seconds_, clock_());
    store_->save(state, request.session_id());

    if (Logger::is_enabled(LogLevel::DEBUG)) {
        Logger::log(LogLevel::DEBUG, "[" + request.id() + "] Saved " + state.to_string());
    }
    return true;
}

int FlashManager::ttl_seconds() const
{
    return ttl_seconds_;
}

FlashStore& FlashManager::store()
{
    return *store_;
}

} // namespace conduit::flash
