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
 * @file async_manager.cpp
 * @brief Exactly-once completion and re-dispatch of async requests.
 */

#include "conduit/async/async_manager.hpp"

#include "conduit/infra/logger.hpp"
#include "conduit/web/errors.hpp"

#include <mutex>
#include <vector>

namespace conduit::async {

using infra::Logger;
using infra::LogLevel;

struct AsyncManager::State {
    std::mutex mutex;
    infra::Scheduler* scheduler = nullptr;
    std::chrono::milliseconds timeout{0};
    bool started = false;
    bool released = false;
    bool completed = false;
    bool dispatched = false;
    bool finished = false;
    ConcurrentResult result;
    Callback dispatch_handler;
    std::vector<Callback> completion_listeners;
    std::shared_ptr<DeferredResult> deferred;
};

AsyncManager::AsyncManager() : state_(std::make_shared<State>()) {}

AsyncManager::~AsyncManager() = default;

void AsyncManager::set_scheduler(infra::Scheduler* scheduler)
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->scheduler = scheduler;
}

void AsyncManager::set_timeout(std::chrono::milliseconds timeout)
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->timeout = timeout;
}

std::chrono::milliseconds AsyncManager::timeout() const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->timeout;
}

void AsyncManager::start_callable(Task task, std::optional<std::chrono::milliseconds> timeout)
{
    infra::Scheduler* scheduler = nullptr;
    std::chrono::milliseconds delay{0};
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->started) {
            throw web::AsyncStateError("Async processing already started");
        }
        if (!state_->scheduler) {
            throw web::AsyncStateError("No scheduler configured for async callables");
        }
        state_->started = true;
        scheduler = state_->scheduler;
        delay = timeout.value_or(state_->timeout);
    }

    arm_timeout(scheduler, delay);

    std::shared_ptr<State> state = state_;
    scheduler->enqueue([state, task]() {
        ConcurrentResult outcome;
        try {
            outcome.value = task();
        } catch (...) {
            outcome.error = std::current_exception();
        }
        if (!complete(state, std::move(outcome))) {
            Logger::log(LogLevel::DEBUG, "Async callable finished after the request completed");
        }
    });
}

void AsyncManager::start_deferred(std::shared_ptr<DeferredResult> deferred)
{
    infra::Scheduler* scheduler = nullptr;
    std::chrono::milliseconds delay{0};
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->started) {
            throw web::AsyncStateError("Async processing already started");
        }
        delay = deferred->timeout().value_or(state_->timeout);
        if (delay.count() > 0 && !state_->scheduler) {
            throw web::AsyncStateError("No scheduler configured to time out the deferred result");
        }
        state_->started = true;
        state_->deferred = deferred;
        scheduler = state_->scheduler;
    }

    arm_timeout(scheduler, delay);

    std::weak_ptr<State> weak = state_;
    deferred->set_result_handler([weak](const ConcurrentResult& outcome) {
        if (std::shared_ptr<State> state = weak.lock()) {
            complete(state, outcome);
        }
    });
}

void AsyncManager::arm_timeout(infra::Scheduler* scheduler, std::chrono::milliseconds delay)
{
    if (delay.count() <= 0 || !scheduler) {
        return;
    }

    std::weak_ptr<State> weak = state_;
    scheduler->schedule(delay, [weak]() {
        if (std::shared_ptr<State> state = weak.lock()) {
            on_timeout(state);
        }
    });
}

void AsyncManager::on_timeout(const std::shared_ptr<State>& state)
{
    std::shared_ptr<DeferredResult> deferred;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->completed) {
            return;
        }
        deferred = state->deferred;
    }

    if (deferred && deferred->handle_timeout()) {
        return;
    }
    if (complete(state, ConcurrentResult{std::nullopt,
                                         std::make_exception_ptr(web::AsyncTimeoutError())})) {
        Logger::log(LogLevel::WARN, "Async request timed out");
    }
}

bool AsyncManager::complete(const std::shared_ptr<State>& state, ConcurrentResult result)
{
    Callback dispatch;
    std::shared_ptr<DeferredResult> deferred;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->completed) {
            return false;
        }
        state->completed = true;
        state->result = std::move(result);
        deferred = state->deferred;
        if (state->released && !state->dispatched) {
            state->dispatched = true;
            dispatch = std::move(state->dispatch_handler);
            state->dispatch_handler = nullptr;
        }
    }

    if (deferred) {
        deferred->expire();
    }
    if (dispatch) {
        dispatch();
    }
    return true;
}

bool AsyncManager::is_started() const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->started;
}

bool AsyncManager::has_concurrent_result() const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->completed;
}

ConcurrentResult AsyncManager::concurrent_result() const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->result;
}

bool AsyncManager::cancel()
{
    return complete(state_,
                    ConcurrentResult{std::nullopt, std::make_exception_ptr(web::AsyncCancelledError())});
}

void AsyncManager::set_dispatch_handler(Callback handler)
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->dispatch_handler = std::move(handler);
}

void AsyncManager::release_initial_pass()
{
    Callback dispatch;
    infra::Scheduler* scheduler = nullptr;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->started) {
            throw web::AsyncStateError("Async processing was not started");
        }
        if (!state_->dispatch_handler) {
            throw web::AsyncStateError("No dispatch handler registered");
        }
        state_->released = true;
        if (state_->completed && !state_->dispatched) {
            state_->dispatched = true;
            dispatch = std::move(state_->dispatch_handler);
            state_->dispatch_handler = nullptr;
            scheduler = state_->scheduler;
        }
    }

    if (!dispatch) {
        return;
    }
    if (scheduler) {
        scheduler->enqueue(std::move(dispatch));
    } else {
        dispatch();
    }
}

void AsyncManager::add_completion_listener(Callback listener)
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->completion_listeners.push_back(std::move(listener));
}

void AsyncManager::on_dispatch_completed()
{
    std::vector<Callback> listeners;
    std::shared_ptr<DeferredResult> deferred;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->finished) {
            return;
        }
        state_->finished = true;
        listeners.swap(state_->completion_listeners);
        deferred = state_->deferred;
    }

    if (deferred) {
        deferred->handle_completion();
    }
    for (const Callback& listener : listeners) {
        try {
            listener();
        } catch (const std::exception& e) {
            Logger::log(LogLevel::WARN, std::string("Async completion listener threw: ") + e.what());
        }
    }
}

} // namespace conduit::async
