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
 * @file url_handler_mapping.hpp
 * @brief Maps URL patterns straight to handlers.
 */

#pragma once

#include "conduit/mapping/abstract_handler_mapping.hpp"

#include <map>
#include <string>

namespace conduit::mapping {

/**
 * @class UrlHandlerMapping
 * @brief A pattern table such as `/static/** -> resources`.
 *
 * @details
 * An exact path entry wins outright. Otherwise every matching pattern is
 * ranked with `PathMatcher::compare`; equally specific patterns for the
 * same path are an ambiguity. Registering a second handler for the same
 * pattern is rejected.
 */
class UrlHandlerMapping : public AbstractHandlerMapping {
  public:
    /// @throws web::AmbiguousMappingError if `pattern` is mapped to another handler.
    void register_handler(const std::string& pattern, web::Handler handler);

    const std::map<std::string, web::Handler>& handlers() const;

  protected:
    web::Handler lookup_handler(http::Request& request) override;

  private:
    std::map<std::string, web::Handler> handlers_;
};

} // namespace conduit::mapping
