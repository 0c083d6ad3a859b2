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
 * @file flash_state.hpp
 * @brief Attributes carried across a redirect to the next request.
 *
 * @details
 * A `FlashState` is filled by a handler before it redirects, saved just
 * before the redirect response is committed, and handed to the first later
 * request that matches its target. The optional target path and target
 * parameters narrow which request that is; the expiration timestamp bounds
 * how long an unclaimed state survives.
 */

#pragma once

#include "conduit/http/request.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace conduit::flash {

/**
 * @class FlashState
 * @brief A string-keyed attribute bag with target matching and expiry.
 */
class FlashState {
  public:
    /// @brief Marker for a state whose expiration period has not started.
    static constexpr int64_t NO_EXPIRATION = -1;

    FlashState();

    // ------------------------------------------------------------------------
    // Attributes
    // ------------------------------------------------------------------------

    void put(const std::string& name, const std::string& value);

    std::optional<std::string> get(const std::string& name) const;

    bool contains(const std::string& name) const;

    const std::map<std::string, std::string>& attributes() const;

    bool empty() const;

    // ------------------------------------------------------------------------
    // Target
    // ------------------------------------------------------------------------

    void set_target_path(const std::string& path);

    const std::optional<std::string>& target_path() const;

    /**
     * @brief Adds an expected request parameter.
     *
     * Pairs with an empty name or value are ignored.
     */
    FlashState& add_target_param(const std::string& name, const std::string& value);

    const http::ParamMap& target_params() const;

    /// @brief Number of (name, value) pairs across all target parameters.
    size_t target_param_count() const;

    /**
     * @brief True when `request` is the intended recipient.
     *
     * The target path, if set, must equal the request path (a trailing slash
     * on either side is ignored). Every expected parameter value must be
     * among the request's values for that name.
     */
    bool matches(const http::Request& request) const;

    // ------------------------------------------------------------------------
    // Expiry
    // ------------------------------------------------------------------------

    /**
     * @brief Starts the expiration clock.
     *
     * @param ttl_seconds Lifetime counted from `now_millis`.
     * @param now_millis Current time in epoch milliseconds.
     */
    void start_expiration(int ttl_seconds, int64_t now_millis);

    void set_expiration_time(int64_t epoch_millis);

    int64_t expiration_time() const;

    bool is_expired(int64_t now_millis) const;

    // ------------------------------------------------------------------------
    // Ordering and persistence
    // ------------------------------------------------------------------------

    /**
     * @brief Specificity ordering used to pick among several matching states.
     *
     * A state with a target path outranks one without; otherwise the one with
     * more target parameters wins.
     *
     * @return Negative if this state is more specific.
     */
    int compare_to(const FlashState& other) const;

    /// @brief Serializes to the JSON wire layout (attributes, target, expiry).
    std::string to_json() const;

    /**
     * @brief Parses the JSON wire layout.
     *
     * @throws std::invalid_argument if `text` is not a JSON object.
     */
    static FlashState from_json(const std::string& text);

    std::string to_string() const;

    bool operator==(const FlashState& other) const;

  private:
    std::map<std::string, std::string> attributes_;
    std::optional<std::string> target_path_;
    http::ParamMap target_params_;
    int64_t expiration_time_;
};

} // namespace conduit::flash
