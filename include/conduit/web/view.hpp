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
 * @file view.hpp
 * @brief Rendering boundary: views and the resolvers that find them by name.
 */

#pragma once

#include "conduit/http/request.hpp"
#include "conduit/http/response.hpp"

#include <memory>
#include <string>

namespace conduit::web {

/**
 * @class View
 * @brief Writes a model into a response.
 */
class View {
  public:
    virtual ~View() = default;

    virtual std::string content_type() const
    {
        return "text/html; charset=utf-8";
    }

    /**
     * @brief Renders `model` for `request`.
     *
     * @param model The request model overlaid with the result model.
     */
    virtual void render(const http::Model& model, http::Request& request,
                        http::Response& response) = 0;
};

/**
 * @class ViewResolver
 * @brief Maps a logical view name to a `View`. Resolvers are chained; the
 * first non-null answer wins.
 */
class ViewResolver {
  public:
    virtual ~ViewResolver() = default;

    /// @return The view, or null if this resolver does not know `view_name`.
    virtual std::shared_ptr<View> resolve_view(const std::string& view_name,
                                               const std::string& locale) = 0;
};

} // namespace conduit::web
