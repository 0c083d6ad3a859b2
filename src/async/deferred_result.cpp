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

#include "conduit/async/deferred_result.hpp"

namespace conduit::async {

DeferredResult::DeferredResult(std::optional<std::chrono::milliseconds> timeout)
    : timeout_(timeout), expired_(false)
{
}

DeferredResult::DeferredResult(std::chrono::milliseconds timeout, web::Result timeout_result)
    : timeout_(timeout), timeout_result_(std::move(timeout_result)), expired_(false)
{
}

const std::optional<std::chrono::milliseconds>& DeferredResult::timeout() const
{
    return timeout_;
}

bool DeferredResult::set_result(std::optional<web::Result> result)
{
    return set_internal(ConcurrentResult{std::move(result), nullptr});
}

bool DeferredResult::set_error(std::exception_ptr error)
{
    return set_internal(ConcurrentResult{std::nullopt, error});
}

bool DeferredResult::set_internal(ConcurrentResult result)
{
    ResultHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (result_ || expired_) {
            return false;
        }
        result_ = std::move(result);
        handler = handler_;
    }
    if (handler) {
        handler(*result_);
    }
    return true;
}

bool DeferredResult::is_set_or_expired() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return result_.has_value() || expired_;
}

void DeferredResult::on_timeout(std::function<void()> callback)
{
    std::lock_guard<std::mutex> lock(mutex_);
    timeout_callback_ = std::move(callback);
}

void DeferredResult::on_completion(std::function<void()> callback)
{
    std::lock_guard<std::mutex> lock(mutex_);
    completion_callback_ = std::move(callback);
}

void DeferredResult::set_result_handler(ResultHandler handler)
{
    std::optional<ConcurrentResult> ready;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = handler;
        ready = result_;
    }
    if (ready) {
        handler(*ready);
    }
}

bool DeferredResult::handle_timeout()
{
    std::function<void()> callback;
    std::optional<web::Result> fallback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = timeout_callback_;
        fallback = timeout_result_;
    }
    if (callback) {
        callback();
    }
    if (fallback) {
        set_result(std::move(fallback));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return result_.has_value();
}

void DeferredResult::expire()
{
    std::lock_guard<std::mutex> lock(mutex_);
    expired_ = true;
}

void DeferredResult::handle_completion()
{
    std::function<void()> callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = std::move(completion_callback_);
        completion_callback_ = nullptr;
    }
    if (callback) {
        callback();
    }
}

} // namespace conduit::async
