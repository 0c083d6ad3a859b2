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
 * @file deferred_result.hpp
 * @brief A result that some other thread supplies later.
 */

#pragma once

#include "conduit/web/result.hpp"

#include <chrono>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>

namespace conduit::async {

/**
 * @struct ConcurrentResult
 * @brief The single outcome of an async task: a value (possibly "handled
 * directly") or an error.
 */
struct ConcurrentResult {
    std::optional<web::Result> value;
    std::exception_ptr error;
};

/**
 * @class DeferredResult
 * @brief Returned by a handler that will produce its result from another
 * thread, e.g. a message listener or a scheduled job.
 *
 * @details
 * Only the first of `set_result`, `set_error` and a timeout takes effect.
 * The value can be set before the dispatcher starts listening; it is then
 * delivered as soon as it does.
 *
 * @code
 * auto deferred = std::make_shared<DeferredResult>(std::chrono::seconds(5));
 * request.async().start_deferred(deferred);
 * queue.subscribe([deferred](const Event& e) { deferred->set_result(Result("event")); });
 * @endcode
 */
class DeferredResult {
  public:
    using ResultHandler = std::function<void(const ConcurrentResult&)>;

    /// @param timeout Overrides the dispatcher's async timeout when set.
    explicit DeferredResult(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// @param timeout_result Result used if the timeout fires first.
    DeferredResult(std::chrono::milliseconds timeout, web::Result timeout_result);

    const std::optional<std::chrono::milliseconds>& timeout() const;

    /// @return false if a result was already set or the request expired.
    bool set_result(std::optional<web::Result> result);

    /// @return false if a result was already set or the request expired.
    bool set_error(std::exception_ptr error);

    bool is_set_or_expired() const;

    /// @brief Invoked on timeout, before the timeout result is applied.
    void on_timeout(std::function<void()> callback);

    /// @brief Invoked once the resumed dispatch of the request completed.
    void on_completion(std::function<void()> callback);

    // ------------------------------------------------------------------------
    // Driven by AsyncManager
    // ------------------------------------------------------------------------

    void set_result_handler(ResultHandler handler);

    /**
     * @brief Runs the timeout callback, then applies the timeout result if any.
     *
     * @return true if a result is now set.
     */
    bool handle_timeout();

    /// @brief Rejects every later `set_result` / `set_error`.
    void expire();

    void handle_completion();

  private:
    bool set_internal(ConcurrentResult result);

    mutable std::mutex mutex_;
    std::optional<std::chrono::milliseconds> timeout_;
    std::optional<web::Result> timeout_result_;
    std::function<void()> timeout_callback_;
    std::function<void()> completion_callback_;
    ResultHandler handler_;
    std::optional<ConcurrentResult> result_;
    bool expired_;
};

} // namespace conduit::async
