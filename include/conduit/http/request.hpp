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
 * @file request.hpp
 * @brief In-memory view of one inbound HTTP exchange.
 *
 * @details
 * A `Request` is created by the transport layer and lives until the response
 * has been written, which for async handling spans two dispatch passes. Its
 * method and path are fixed at construction; the attribute bag and the
 * request-scoped model are the only parts the dispatch pipeline mutates.
 */

#pragma once

#include "conduit/http/method.hpp"

#include <any>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace conduit::async {
class AsyncManager;
}

namespace conduit::http {

/// @brief Multi-valued parameter map (name -> values in arrival order).
using ParamMap = std::map<std::string, std::vector<std::string>>;

/// @brief Named values exposed to views.
using Model = std::map<std::string, std::string>;

/**
 * @enum DispatchType
 * @brief Distinguishes the initial pass from the resumed async pass.
 */
enum class DispatchType {
    REQUEST, ///< First pass, driven by the transport.
    ASYNC    ///< Re-entry after an async handler task completed.
};

/**
 * @class Request
 * @brief One inbound HTTP request and its per-exchange state.
 */
class Request {
  public:
    /**
     * @brief Builds a request from its method and request target.
     *
     * The query part of `target` (after `?`) is decoded into the parameter map;
     * the remaining path is URL-decoded once.
     *
     * @param method The request method.
     * @param target The origin-form request target, e.g. `/accounts?id=42`.
     */
    Request(Method method, const std::string& target);

    ~Request();

    Request(const Request&) = delete;
    Request& operator=(const Request&) = delete;

    Method method() const;

    /// @brief Decoded path without query string. Immutable for the exchange.
    const std::string& path() const;

    /// @brief Raw query string as received (no leading `?`).
    const std::string& query_string() const;

    // ------------------------------------------------------------------------
    // Parameters
    // ------------------------------------------------------------------------

    const ParamMap& params() const;

    /// @brief First value of parameter `name`, if present.
    std::optional<std::string> param(const std::string& name) const;

    bool has_param(const std::string& name) const;

    /// @brief Appends a value; form bodies are merged in this way by the transport.
    void add_param(const std::string& name, const std::string& value);

    // ------------------------------------------------------------------------
    // Headers (names are case-insensitive)
    // ------------------------------------------------------------------------

    std::optional<std::string> header(const std::string& name) const;

    bool has_header(const std::string& name) const;

    /// @brief Adds a header; repeated names are folded into a comma separated list.
    void add_header(const std::string& name, const std::string& value);

    /// @brief All headers keyed by lower-cased name.
    const std::map<std::string, std::string>& headers() const;

    std::optional<std::string> cookie(const std::string& name) const;

    void set_cookie(const std::string& name, const std::string& value);

    const std::string& body() const;

    void set_body(std::string body);

    // ------------------------------------------------------------------------
    // Session and correlation
    // ------------------------------------------------------------------------

    /// @brief Session key used by the flash store; empty when the client has none.
    const std::string& session_id() const;

    void set_session_id(const std::string& id);

    /// @brief Short id for log correlation, stable across both dispatch passes.
    const std::string& id() const;

    // ------------------------------------------------------------------------
    // Attributes and request-scoped model
    // ------------------------------------------------------------------------

    void set_attribute(const std::string& name, std::any value);

    /// @brief Raw attribute lookup; null when absent.
    const std::any* attribute(const std::string& name) const;

    /**
     * @brief Typed attribute lookup.
     *
     * @return A pointer to the stored value, or null when absent or of another type.
     */
    template <typename T> const T* attribute_as(const std::string& name) const
    {
        const std::any* value = attribute(name);
        return value ? std::any_cast<T>(value) : nullptr;
    }

    void remove_attribute(const std::string& name);

    /// @brief Model entries every rendered view sees (e.g. input flash attributes).
    Model& model();
    const Model& model() const;

    // ------------------------------------------------------------------------
    // Dispatch state
    // ------------------------------------------------------------------------

    DispatchType dispatch_type() const;

    void set_dispatch_type(DispatchType type);

    /// @brief Async handling state for this exchange (created on first use).
    async::AsyncManager& async();

    /// @brief True once a handler has started async processing.
    bool is_async_started() const;

  private:
    void parse_query();

    Method method_;
    std::string path_;
    std::string query_;
    ParamMap params_;
    std::map<std::string, std::string> headers_;
    std::map<std::string, std::string> cookies_;
    std::string body_;
    std::string session_id_;
    std::string id_;
    std::map<std::string, std::any> attributes_;
    Model model_;
    DispatchType dispatch_type_;
    std::unique_ptr<async::AsyncManager> async_;
};

} // namespace conduit::http
