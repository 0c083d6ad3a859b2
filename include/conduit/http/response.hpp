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
 * @file response.hpp
 * @brief Buffered HTTP response built by handlers, views and the dispatcher.
 *
 * @details
 * The response is fully buffered. Nothing reaches the client until the
 * transport serializes it and marks it committed, which is what allows the
 * dispatcher to save flash state after a redirect has been rendered.
 */

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace conduit::http {

/**
 * @class Response
 * @brief Status line, headers and body of one outgoing HTTP response.
 */
class Response {
  public:
    Response();

    int status() const;

    void set_status(int status);

    /// @brief Replaces every header named `name` (case-insensitive) with one value.
    void set_header(const std::string& name, const std::string& value);

    /// @brief Appends a header without touching existing ones (e.g. `Set-Cookie`).
    void add_header(const std::string& name, const std::string& value);

    /// @brief First value of header `name`, if present.
    std::optional<std::string> header(const std::string& name) const;

    bool has_header(const std::string& name) const;

    void remove_header(const std::string& name);

    /// @brief Headers in insertion order with their original spelling.
    const std::vector<std::pair<std::string, std::string>>& headers() const;

    void set_content_type(const std::string& type);

    const std::string& body() const;

    void set_body(std::string body);

    /// @brief Appends text to the body.
    void write(const std::string& text);

    /**
     * @brief Turns the response into a `302 Found` pointing at `location`.
     */
    void send_redirect(const std::string& location);

    /**
     * @brief Sets an error status with a plain-text body.
     *
     * @param status The 4xx/5xx status code.
     * @param message Body text; the reason phrase is used when empty.
     */
    void send_error(int status, const std::string& message = "");

    /// @brief True for a 3xx status that carries a `Location` header.
    bool is_redirect() const;

    /// @brief True once the transport has started writing the response.
    bool is_committed() const;

    void commit();

    /// @brief Standard reason phrase for `status` ("Unknown" otherwise).
    static std::string reason_phrase(int status);

  private:
    int status_;
    std::vector<std::pair<std::string, std::string>> headers_;
    std::string body_;
    bool committed_;
};

} // namespace conduit::http
