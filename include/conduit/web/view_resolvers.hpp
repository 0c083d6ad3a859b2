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
 * @file view_resolvers.hpp
 * @brief Stock `ViewResolver` implementations.
 */

#pragma once

#include "conduit/web/view.hpp"

#include <functional>
#include <map>
#include <mutex>

namespace conduit::web {

/**
 * @class ViewRegistry
 * @brief Resolves names registered up front to shared view instances.
 */
class ViewRegistry : public ViewResolver {
  public:
    void register_view(const std::string& name, std::shared_ptr<View> view);

    std::shared_ptr<View> resolve_view(const std::string& view_name,
                                       const std::string& locale) override;

  private:
    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<View>> views_;
};

/**
 * @class UrlBasedViewResolver
 * @brief Builds views from `prefix + name + suffix`.
 *
 * @details
 * Names starting with `redirect:` always yield a `RedirectView`. Other
 * names go through the factory; without one the resolver declines them so
 * that the next resolver in the chain gets a chance. Views are cached per
 * name and locale.
 */
class UrlBasedViewResolver : public ViewResolver {
  public:
    using ViewFactory = std::function<std::shared_ptr<View>(const std::string& url)>;

    explicit UrlBasedViewResolver(std::string prefix = "", std::string suffix = "",
                                  ViewFactory factory = nullptr);

    /// @param status Status used for `redirect:` views (302 by default).
    void set_redirect_status(int status);

    std::shared_ptr<View> resolve_view(const std::string& view_name,
                                       const std::string& locale) override;

  private:
    std::shared_ptr<View> create_view(const std::string& view_name) const;

    std::string prefix_;
    std::string suffix_;
    ViewFactory factory_;
    int redirect_status_;
    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<View>> cache_;
};

} // namespace conduit::web
