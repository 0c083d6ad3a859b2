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
 * @file controller.hpp
 * @brief Object-style handlers and their adapter.
 */

#pragma once

#include "conduit/web/adapter.hpp"

#include <string>

namespace conduit::web {

/**
 * @class Controller
 * @brief A handler object with a single entry point.
 *
 * Register it as `Handler::of<Controller>(ptr)`.
 */
class Controller {
  public:
    virtual ~Controller() = default;

    virtual std::optional<Result> handle_request(http::Request& request,
                                                 http::Response& response) = 0;
};

/**
 * @class LastModified
 * @brief Optional capability of a `Controller` used for conditional GET.
 */
class LastModified {
  public:
    virtual ~LastModified() = default;

    /// @return Epoch milliseconds of the last change, or -1 if unknown.
    virtual int64_t last_modified(const http::Request& request) const = 0;
};

class ControllerHandlerAdapter : public HandlerAdapter {
  public:
    bool supports(const Handler& handler) const override;

    std::optional<Result> invoke(http::Request& request, http::Response& response,
                                 const Handler& handler) override;

    int64_t last_modified(const http::Request& request, const Handler& handler) const override;
};

/**
 * @class UrlViewController
 * @brief Renders the view named after the lookup path.
 *
 * `/admin/index.html` with prefix `pages/` becomes the view
 * `pages/admin/index`. Input flash attributes are added to the model.
 */
class UrlViewController : public Controller {
  public:
    explicit UrlViewController(std::string prefix = "", std::string suffix = "");

    std::optional<Result> handle_request(http::Request& request,
                                         http::Response& response) override;

  private:
    std::string prefix_;
    std::string suffix_;
};

} // namespace conduit::web
