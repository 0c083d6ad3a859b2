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
 * @file media_type.hpp
 * @brief Minimal MIME type model for consumes/produces matching.
 */

#pragma once

#include <string>
#include <vector>

namespace conduit::condition {

/**
 * @class MediaType
 * @brief A `type/subtype` pair; parameters such as `charset` or `q` are ignored.
 */
class MediaType {
  public:
    MediaType(std::string type, std::string subtype);

    /**
     * @brief Parses `text/html; charset=utf-8`.
     *
     * A bare `*` is read as the all-types wildcard. Text without a `/` throws
     * `std::invalid_argument`.
     */
    static MediaType parse(const std::string& text);

    /// @brief Parses a comma separated list such as an `Accept` header.
    static std::vector<MediaType> parse_list(const std::string& text);

    static MediaType all();

    const std::string& type() const;
    const std::string& subtype() const;

    bool is_wildcard_type() const;
    bool is_wildcard_subtype() const;

    /// @brief True if this type covers `other` (`text/*` includes `text/html`).
    bool includes(const MediaType& other) const;

    /// @brief Symmetric form of `includes`.
    bool is_compatible_with(const MediaType& other) const;

    std::string to_string() const;

    bool operator==(const MediaType& other) const;
    bool operator!=(const MediaType& other) const;

  private:
    std::string type_;
    std::string subtype_;
};

} // namespace conduit::condition
