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

#include "conduit/web/view_resolvers.hpp"

#include "conduit/infra/string.hpp"
#include "conduit/web/redirect_view.hpp"
#include "conduit/web/result.hpp"

namespace conduit::web {

using infra::String;

void ViewRegistry::register_view(const std::string& name, std::shared_ptr<View> view)
{
    std::lock_guard<std::mutex> lock(mutex_);
    views_[name] = std::move(view);
}

std::shared_ptr<View> ViewRegistry::resolve_view(const std::string& view_name, const std::string&)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = views_.find(view_name);
    return it == views_.end() ? nullptr : it->second;
}

UrlBasedViewResolver::UrlBasedViewResolver(std::string prefix, std::string suffix,
                                           ViewFactory factory)
    : prefix_(std::move(prefix)), suffix_(std::move(suffix)), factory_(std::move(factory)),
      redirect_status_(302)
{
}

void UrlBasedViewResolver::set_redirect_status(int status)
{
    redirect_status_ = status;
}

std::shared_ptr<View> UrlBasedViewResolver::create_view(const std::string& view_name) const
{
    if (String::starts_with(view_name, Result::REDIRECT_PREFIX)) {
        std::string url = view_name.substr(std::string(Result::REDIRECT_PREFIX).size());
        return std::make_shared<RedirectView>(url, redirect_status_);
    }
    if (!factory_) {
        return nullptr;
    }
    return factory_(prefix_ + view_name + suffix_);
}

std::shared_ptr<View> UrlBasedViewResolver::resolve_view(const std::string& view_name,
                                                         const std::string& locale)
{
    std::string key = view_name + "_" + locale;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(key);
        if (it != cache_.end()) {
            return it->second;
        }
    }

    std::shared_ptr<View> view = create_view(view_name);
    if (view) {
        std::lock_guard<std::mutex> lock(mutex_);
        cache_.emplace(key, view);
    }
    return view;
}

} // namespace conduit::web
