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
 * @file locale_resolver.hpp
 * @brief Determines the locale used to resolve views for a request.
 */

#pragma once

#include "conduit/http/request.hpp"

#include <string>

namespace conduit::web {

class LocaleResolver {
  public:
    virtual ~LocaleResolver() = default;

    virtual std::string resolve_locale(const http::Request& request) const = 0;
};

/**
 * @class AcceptHeaderLocaleResolver
 * @brief Uses the first language tag of `Accept-Language`.
 *
 * `da, en-GB;q=0.8` resolves to `da`; a missing or wildcard header
 * resolves to the default locale.
 */
class AcceptHeaderLocaleResolver : public LocaleResolver {
  public:
    explicit AcceptHeaderLocaleResolver(std::string default_locale = "en");

    std::string resolve_locale(const http::Request& request) const override;

  private:
    std::string default_locale_;
};

} // namespace conduit::web
