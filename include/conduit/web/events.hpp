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
 * @file events.hpp
 * @brief Notification published after every completed request.
 */

#pragma once

#include "conduit/http/method.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace conduit::web {

/**
 * @struct RequestHandledEvent
 * @brief Summary of one request, published once it is fully processed
 * (after the resumed pass for async requests).
 */
struct RequestHandledEvent {
    std::string request_id;
    http::Method method;
    std::string path;
    std::string session_id;
    int status;
    int64_t duration_ms;
    bool async;
    /// Message of the failure that escaped the dispatcher; empty on success.
    std::string failure;

    std::string to_string() const
    {
        std::string out = "RequestHandledEvent: method=[" + http::to_string(method) + "]; url=[" +
                          path + "]; session=[" + session_id + "]; status=[" +
                          std::to_string(status) + "]; time=[" + std::to_string(duration_ms) +
                          "ms]";
        if (!failure.empty()) {
            out += "; failure=[" + failure + "]";
        }
        return out;
    }
};

using EventListener = std::function<void(const RequestHandledEvent&)>;

} // namespace conduit::web
