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
 * @file async_manager.hpp
 * @brief Per-request coordination of async handler execution.
 *
 * @details
 * A handler starts async processing by calling `start_callable` or
 * `start_deferred` on `request.async()` and returning without a result.
 * From there the manager guarantees:
 *
 * 1. The first outcome wins: value, error, timeout or cancellation.
 * 2. The dispatch handler (the re-entry into the dispatcher) fires exactly
 *    once, and only after the initiating pass called
 *    `release_initial_pass`.
 * 3. Completion listeners run once, after the resumed pass finished.
 *
 * Timeouts are armed on the scheduler's delayed queue. A timer that fires
 * after the request is gone finds the shared state released and does nothing.
 */

#pragma once

#include "conduit/async/deferred_result.hpp"
#include "conduit/infra/scheduler.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>

namespace conduit::async {

class AsyncManager {
  public:
    using Task = std::function<std::optional<web::Result>()>;
    using Callback = std::function<void()>;

    AsyncManager();

    ~AsyncManager();

    AsyncManager(const AsyncManager&) = delete;
    AsyncManager& operator=(const AsyncManager&) = delete;

    /// @brief Pool that runs callables, timers and released continuations.
    void set_scheduler(infra::Scheduler* scheduler);

    /// @brief Default timeout for tasks that do not bring their own; zero disables it.
    void set_timeout(std::chrono::milliseconds timeout);

    std::chrono::milliseconds timeout() const;

    /**
     * @brief Runs `task` on the scheduler; its return value or exception
     * becomes the concurrent result.
     *
     * @throws web::AsyncStateError if already started or no scheduler is set.
     */
    void start_callable(Task task, std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /**
     * @brief Waits for `deferred` to be set by someone else.
     *
     * @throws web::AsyncStateError if already started, or if a timeout applies
     * and no scheduler is set to enforce it.
     */
    void start_deferred(std::shared_ptr<DeferredResult> deferred);

    bool is_started() const;

    bool has_concurrent_result() const;

    /// @brief The recorded outcome; empty value and null error until completed.
    ConcurrentResult concurrent_result() const;

    /**
     * @brief Completes the request with `AsyncCancelledError`.
     *
     * @return false if it had already completed.
     */
    bool cancel();

    /// @brief Continuation that re-enters the dispatcher with the concurrent result.
    void set_dispatch_handler(Callback handler);

    /**
     * @brief Marks the initiating pass as finished. If the outcome is already
     * known, the continuation is dispatched now.
     *
     * @throws web::AsyncStateError if async processing was not started or no
     * dispatch handler is set.
     */
    void release_initial_pass();

    void add_completion_listener(Callback listener);

    /// @brief Called by the dispatcher at the end of the resumed pass.
    void on_dispatch_completed();

  private:
    struct State;

    static bool complete(const std::shared_ptr<State>& state, ConcurrentResult result);

    static void on_timeout(const std::shared_ptr<State>& state);

    void arm_timeout(infra::Scheduler* scheduler, std::chrono::milliseconds delay);

    std::shared_ptr<State> state_;
};

} // namespace conduit::async
