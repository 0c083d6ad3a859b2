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
 * @file flash_manager.hpp
 * @brief Moves flash state in and out of the store around a dispatch.
 */

#pragma once

#include "conduit/flash/flash_store.hpp"
#include "conduit/http/response.hpp"
#include "conduit/infra/time.hpp"

#include <memory>

namespace conduit::flash {

/**
 * @class FlashManager
 * @brief Glue between the dispatcher and a `FlashStore`.
 *
 * @details
 * The session key is the request's session id; requests without a session
 * never receive or persist flash state.
 */
class FlashManager {
  public:
    /// @brief Request attribute holding the input `FlashState` of this request.
    static const char* const INPUT_ATTRIBUTE;

    /**
     * @param store Backing store, shared with other managers if needed.
     * @param ttl_seconds Expiration window, counted from save time.
     * @param clock Source of "now" used to start the expiration window.
     */
    FlashManager(std::shared_ptr<FlashStore> store, int ttl_seconds,
                 infra::MillisClock clock = infra::Time::now_millis);

    /**
     * @brief Retrieves the best matching state for `request` and removes it.
     *
     * A match is copied into the request model and exposed under
     * `INPUT_ATTRIBUTE`.
     *
     * @return The retrieved state, or `std::nullopt` when none matches.
     */
    std::optional<FlashState> retrieve_and_update(http::Request& request, http::Response& response);

    /**
     * @brief Persists `state` for the request following the redirect in `response`.
     *
     * Empty states are ignored. A missing target path is taken from the
     * `Location` header, and so are target parameters when none were set.
     * Nothing is saved once the response is committed.
     *
     * @return True if the state was handed to the store.
     */
    bool save_output(FlashState state, const http::Request& request, const http::Response& response);

    int ttl_seconds() const;

    FlashStore& store();

  private:
    std::shared_ptr<FlashStore> store_;
    int ttl_seconds_;
    infra::MillisClock clock_;
};

} // namespace conduit::flash
