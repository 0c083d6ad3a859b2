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
 * @file view_name_translator.hpp
 * @brief Derives a view name when a result does not name one.
 */

#pragma once

#include "conduit/http/request.hpp"

#include <string>

namespace conduit::web {

class ViewNameTranslator {
  public:
    virtual ~ViewNameTranslator() = default;

    virtual std::string view_name(const http::Request& request) const = 0;
};

/**
 * @class DefaultViewNameTranslator
 * @brief `/accounts/list.html` becomes `accounts/list`, wrapped in prefix and suffix.
 */
class DefaultViewNameTranslator : public ViewNameTranslator {
  public:
    explicit DefaultViewNameTranslator(std::string prefix = "", std::string suffix = "");

    std::string view_name(const http::Request& request) const override;

    /// @brief Strips leading and trailing slashes and the file extension of `path`.
    static std::string transform_path(const std::string& path);

  private:
    std::string prefix_;
    std::string suffix_;
};

} // namespace conduit::web
