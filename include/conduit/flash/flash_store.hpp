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
 * @file flash_store.hpp
 * @brief Storage boundary for flash state between requests.
 */

#pragma once

#include "conduit/flash/flash_state.hpp"
#include "conduit/http/request.hpp"

#include <optional>
#include <string>

namespace conduit::flash {

/**
 * @class FlashStore
 * @brief Abstract persistence for pending flash state, keyed by session.
 *
 * @details
 * Implementations must serialize `save` and `retrieve_and_remove_best_match`
 * for the same session so that an entry is delivered to exactly one request.
 */
class FlashStore {
  public:
    virtual ~FlashStore() = default;

    /// @brief Stores `state` (expiration already started) under `session_key`.
    virtual void save(const FlashState& state, const std::string& session_key) = 0;

    /**
     * @brief Purges expired entries of the session, then removes and returns
     * the most specific remaining entry that matches `request`.
     *
     * @return The selected state, or `std::nullopt` if nothing matches.
     */
    virtual std::optional<FlashState>
    retrieve_and_remove_best_match(const std::string& session_key,
                                   const http::Request& request) = 0;

    /**
     * @brief Drops expired entries across all sessions.
     *
     * @return The number of entries removed.
     */
    virtual size_t sweep_expired() = 0;
};

} // namespace conduit::flash
