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
 * @file adapter.hpp
 * @brief Uniform invocation of handlers of any shape.
 */

#pragma once

#include "conduit/web/handler.hpp"
#include "conduit/web/result.hpp"

#include <cstdint>
#include <optional>

namespace conduit::web {

/**
 * @class HandlerAdapter
 * @brief Knows how to call one kind of handler.
 *
 * @details
 * The dispatcher asks its adapters in registration order and uses the first
 * whose `supports` returns true.
 */
class HandlerAdapter {
  public:
    virtual ~HandlerAdapter() = default;

    /// @brief Pure type test on the handler.
    virtual bool supports(const Handler& handler) const = 0;

    /**
     * @brief Runs the handler.
     *
     * @return The result to render, or `std::nullopt` if the handler wrote
     * the response itself (or started async processing).
     */
    virtual std::optional<Result> invoke(http::Request& request, http::Response& response,
                                         const Handler& handler) = 0;

    /**
     * @brief Freshness probe used for conditional GET/HEAD.
     *
     * @return Last modification in epoch milliseconds, or -1 if unknown.
     */
    virtual int64_t last_modified(const http::Request&, const Handler&) const
    {
        return -1;
    }
};

} // namespace conduit::web
