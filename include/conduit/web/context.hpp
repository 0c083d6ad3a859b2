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
 * @file context.hpp
 * @brief Request-scoped state bound to the worker running a dispatch pass.
 *
 * @details
 * Workers are pooled, and an async request runs its two passes on different
 * workers. Every pass therefore binds its context on entry and restores the
 * previous binding on exit:
 *
 * @code
 * {
 *     ContextScope scope(DispatchContext{&request, &response, locale});
 *     ContextScope::current()->locale; // visible to views and handlers
 * } // previous context restored here, even on exceptions
 * @endcode
 */

#pragma once

#include "conduit/http/request.hpp"
#include "conduit/http/response.hpp"

#include <string>

namespace conduit::web {

struct DispatchContext {
    http::Request* request;
    http::Response* response;
    std::string locale;
};

/**
 * @class ContextScope
 * @brief RAII binding of a `DispatchContext` to the current thread.
 */
class ContextScope {
  public:
    explicit ContextScope(DispatchContext context);

    ~ContextScope();

    ContextScope(const ContextScope&) = delete;
    ContextScope& operator=(const ContextScope&) = delete;

    /// @brief The innermost context bound on this thread, or null.
    static const DispatchContext* current();

  private:
    DispatchContext context_;
    const DispatchContext* previous_;
};

} // namespace conduit::web
