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
 * @file execution_chain.hpp
 * @brief A resolved handler plus the interceptors that wrap it.
 *
 * @details
 * The chain also carries the state of the dispatch that uses it:
 *
 * `RESOLVED -> PRE_RUNNING -> {HANDLER_RUNNING | ASYNC_STARTED} -> POST_RUNNING
 * -> RENDERING -> COMPLETED`, with `FAILED` reachable from any state before
 * completion.
 *
 * An async request keeps using the same chain on its resumed pass. The two
 * passes never overlap, so the chain itself is not synchronized.
 */

#pragma once

#include "conduit/web/interceptor.hpp"

#include <memory>
#include <string>
#include <vector>

namespace conduit::web {

enum class ChainState {
    RESOLVED,
    PRE_RUNNING,
    HANDLER_RUNNING,
    ASYNC_STARTED,
    POST_RUNNING,
    RENDERING,
    COMPLETED,
    FAILED
};

std::string to_string(ChainState state);

/**
 * @class ExecutionChain
 * @brief Runs the interceptor phases in the documented order.
 */
class ExecutionChain {
  public:
    using Interceptors = std::vector<std::shared_ptr<HandlerInterceptor>>;

    explicit ExecutionChain(Handler handler, Interceptors interceptors = {});

    const Handler& handler() const;

    const Interceptors& interceptors() const;

    void add_interceptor(std::shared_ptr<HandlerInterceptor> interceptor);

    void add_interceptors(const Interceptors& interceptors);

    /**
     * @brief Runs `pre_handle` in registration order.
     *
     * On the first `false` the cleanup phase runs for every interceptor
     * invoked so far, the vetoing one included, and the method returns `false`.
     */
    bool apply_pre_handle(http::Request& request, http::Response& response);

    /// @brief Runs `post_handle` in reverse order. Exceptions propagate.
    void apply_post_handle(http::Request& request, http::Response& response, Result* result);

    /**
     * @brief Runs `after_completion` in reverse order for every interceptor
     * whose `pre_handle` was invoked and returned.
     *
     * Each callback is isolated: a throwing interceptor is logged and the
     * rest still run. A second call is a no-op.
     */
    void trigger_after_completion(http::Request& request, http::Response& response,
                                  std::exception_ptr error);

    /// @brief Notifies passed interceptors, in reverse order, that the handler went async.
    void apply_after_async_started(http::Request& request, http::Response& response);

    ChainState state() const;

    void set_state(ChainState state);

    /// @brief Index of the last interceptor whose pre phase returned; -1 if none.
    int interceptor_index() const;

    std::string to_string() const;

  private:
    Handler handler_;
    Interceptors interceptors_;
    int interceptor_index_;
    bool completed_;
    ChainState state_;
};

} // namespace conduit::web
