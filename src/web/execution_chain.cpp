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
 * @file execution_chain.cpp
 * @brief Interceptor phase ordering and cleanup isolation.
 */

#include "conduit/web/execution_chain.hpp"

#include "conduit/infra/logger.hpp"

namespace conduit::web {

using infra::Logger;
using infra::LogLevel;

std::string to_string(ChainState state)
{
    switch (state) {
    case ChainState::RESOLVED:
        return "RESOLVED";
    case ChainState::PRE_RUNNING:
        return "PRE_RUNNING";
    case ChainState::HANDLER_RUNNING:
        return "HANDLER_RUNNING";
    case ChainState::ASYNC_STARTED:
        return "ASYNC_STARTED";
    case ChainState::POST_RUNNING:
        return "POST_RUNNING";
    case ChainState::RENDERING:
        return "RENDERING";
    case ChainState::COMPLETED:
        return "COMPLETED";
    case ChainState::FAILED:
        return "FAILED";
    }
    return "UNKNOWN";
}

ExecutionChain::ExecutionChain(Handler handler, Interceptors interceptors)
    : handler_(std::move(handler)), interceptors_(std::move(interceptors)),
      interceptor_index_(-1), completed_(false), state_(ChainState::RESOLVED)
{
}

const Handler& ExecutionChain::handler() const
{
    return handler_;
}

const ExecutionChain::Interceptors& ExecutionChain::interceptors() const
{
    return interceptors_;
}

void ExecutionChain::add_interceptor(std::shared_ptr<HandlerInterceptor> interceptor)
{
    interceptors_.push_back(std::move(interceptor));
}

void ExecutionChain::add_interceptors(const Interceptors& interceptors)
{
    interceptors_.insert(interceptors_.end(), interceptors.begin(), interceptors.end());
}

bool ExecutionChain::apply_pre_handle(http::Request& request, http::Response& response)
{
    state_ = ChainState::PRE_RUNNING;
    for (size_t i = 0; i < interceptors_.size(); ++i) {
        if (!interceptors_[i]->pre_handle(request, response, handler_)) {
            Logger::log(LogLevel::DEBUG, "[" + request.id() + "] Interceptor " +
                                             std::to_string(i) + " stopped the chain");
            interceptor_index_ = static_cast<int>(i);
            trigger_after_completion(request, response, nullptr);
            return false;
        }
        interceptor_index_ = static_cast<int>(i);
    }
    return true;
}

void ExecutionChain::apply_post_handle(http::Request& request, http::Response& response,
                                       Result* result)
{
    state_ = ChainState::POST_RUNNING;
    for (auto it = interceptors_.rbegin(); it != interceptors_.rend(); ++it) {
        (*it)->post_handle(request, response, handler_, result);
    }
}

void ExecutionChain::trigger_after_completion(http::Request& request, http::Response& response,
                                              std::exception_ptr error)
{
    if (completed_) {
        return;
    }
    completed_ = true;

    for (int i = interceptor_index_; i >= 0; --i) {
        try {
            interceptors_[i]->after_completion(request, response, handler_, error);
        } catch (const std::exception& e) {
            Logger::log(LogLevel::ERROR, "[" + request.id() + "] after_completion of interceptor " +
                                             std::to_string(i) + " threw: " + e.what());
        } catch (...) {
            Logger::log(LogLevel::ERROR, "[" + request.id() + "] after_completion of interceptor " +
                                             std::to_string(i) + " threw a non-standard exception");
        }
    }
    state_ = error ? ChainState::FAILED : ChainState::COMPLETED;
}

void ExecutionChain::apply_after_async_started(http::Request& request, http::Response& response)
{
    state_ = ChainState::ASYNC_STARTED;
    for (int i = static_cast<int>(interceptors_.size()) - 1; i >= 0; --i) {
        try {
            interceptors_[i]->after_async_started(request, response, handler_);
        } catch (const std::exception& e) {
            Logger::log(LogLevel::ERROR, "[" + request.id() +
                                             "] after_async_started of interceptor " +
                                             std::to_string(i) + " threw: " + e.what());
        } catch (...) {
            Logger::log(LogLevel::ERROR, "[" + request.id() +
                                             "] after_async_started of interceptor " +
                                             std::to_string(i) + " threw a non-standard exception");
        }
    }
}

ChainState ExecutionChain::state() const
{
    return state_;
}

void ExecutionChain::set_state(ChainState state)
{
    state_ = state;
}

int ExecutionChain::interceptor_index() const
{
    return interceptor_index_;
}

std::string ExecutionChain::to_string() const
{
    return "ExecutionChain with [" + handler_.description() + "] and " +
           std::to_string(interceptors_.size()) + " interceptor(s)";
}

} // namespace conduit::web
