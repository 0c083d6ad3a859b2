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
 * @file dispatcher.cpp
 * @brief The dispatch algorithm, including the resumed async pass.
 */

#include "conduit/web/dispatcher.hpp"

#include "conduit/async/async_manager.hpp"
#include "conduit/infra/logger.hpp"
#include "conduit/infra/time.hpp"
#include "conduit/web/context.hpp"
#include "conduit/web/controller.hpp"
#include "conduit/web/errors.hpp"
#include "conduit/web/function_adapter.hpp"
#include "conduit/web/view_resolvers.hpp"

#include <algorithm>

namespace conduit::web {

using infra::Logger;
using infra::LogLevel;
using SteadyClock = std::chrono::steady_clock;

const char* const Dispatcher::CHAIN_ATTRIBUTE = "conduit.dispatch.chain";
const char* const Dispatcher::START_TIME_ATTRIBUTE = "conduit.dispatch.start_time";
const std::chrono::milliseconds Dispatcher::DEFAULT_ASYNC_TIMEOUT(30000);

namespace {

/// Message of a captured failure, for logs and events.
std::string describe(std::exception_ptr error)
{
    if (!error) {
        return "";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

std::string request_line(const http::Request& request)
{
    return "[" + request.id() + "] " + http::to_string(request.method()) + " " + request.path();
}

} // namespace

Dispatcher::Dispatcher()
    : default_adapters_(true), default_exception_resolvers_(true), default_view_resolvers_(true),
      locale_resolver_(std::make_shared<AcceptHeaderLocaleResolver>()),
      view_name_translator_(std::make_shared<DefaultViewNameTranslator>()),
      throw_if_no_handler_found_(false), scheduler_(nullptr), async_timeout_(DEFAULT_ASYNC_TIMEOUT)
{
    handler_adapters_.push_back(std::make_shared<FunctionHandlerAdapter>());
    handler_adapters_.push_back(std::make_shared<ControllerHandlerAdapter>());
    exception_resolvers_.push_back(std::make_shared<DefaultExceptionResolver>());
    view_resolvers_.push_back(std::make_shared<UrlBasedViewResolver>());
}

// ----------------------------------------------------------------------------
// Configuration
// ----------------------------------------------------------------------------

void Dispatcher::add_handler_mapping(std::shared_ptr<mapping::HandlerMapping> mapping)
{
    handler_mappings_.push_back(std::move(mapping));
    std::stable_sort(handler_mappings_.begin(), handler_mappings_.end(),
                     [](const auto& a, const auto& b) { return a->order() < b->order(); });
}

void Dispatcher::add_handler_adapter(std::shared_ptr<HandlerAdapter> adapter)
{
    if (default_adapters_) {
        handler_adapters_.clear();
        default_adapters_ = false;
    }
    handler_adapters_.push_back(std::move(adapter));
}

void Dispatcher::add_exception_resolver(std::shared_ptr<HandlerExceptionResolver> resolver)
{
    if (default_exception_resolvers_) {
        exception_resolvers_.clear();
        default_exception_resolvers_ = false;
    }
    exception_resolvers_.push_back(std::move(resolver));
}

void Dispatcher::add_view_resolver(std::shared_ptr<ViewResolver> resolver)
{
    if (default_view_resolvers_) {
        view_resolvers_.clear();
        default_view_resolvers_ = false;
    }
    view_resolvers_.push_back(std::move(resolver));
}

void Dispatcher::set_locale_resolver(std::shared_ptr<LocaleResolver> resolver)
{
    locale_resolver_ = std::move(resolver);
}

void Dispatcher::set_view_name_translator(std::shared_ptr<ViewNameTranslator> translator)
{
    view_name_translator_ = std::move(translator);
}

void Dispatcher::set_flash_manager(std::shared_ptr<flash::FlashManager> manager)
{
    flash_manager_ = std::move(manager);
}

void Dispatcher::set_default_handler(Handler handler)
{
    default_handler_ = std::move(handler);
}

void Dispatcher::set_throw_if_no_handler_found(bool enabled)
{
    throw_if_no_handler_found_ = enabled;
}

void Dispatcher::set_scheduler(infra::Scheduler* scheduler)
{
    scheduler_ = scheduler;
}

void Dispatcher::set_async_timeout(std::chrono::milliseconds timeout)
{
    async_timeout_ = timeout;
}

void Dispatcher::add_event_listener(EventListener listener)
{
    event_listeners_.push_back(std::move(listener));
}

// ----------------------------------------------------------------------------
// Entry points
// ----------------------------------------------------------------------------

void Dispatcher::dispatch(http::Request& request, http::Response& response)
{
    bool resumed = request.dispatch_type() == http::DispatchType::ASYNC;
    if (!resumed) {
        request.set_attribute(START_TIME_ATTRIBUTE, SteadyClock::now());
    }

    std::string locale = locale_resolver_ ? locale_resolver_->resolve_locale(request) : "";
    ContextScope scope(DispatchContext{&request, &response, locale});

    Logger::log(LogLevel::DEBUG, (resumed ? "Resuming " : "") + request_line(request));

    try {
        if (resumed) {
            resume_dispatch(request, response);
        } else {
            if (flash_manager_) {
                flash_manager_->retrieve_and_update(request, response);
            }
            do_dispatch(request, response);
        }
    } catch (...) {
        std::exception_ptr failure = std::current_exception();
        Logger::log(LogLevel::ERROR, request_line(request) + " failed: " + describe(failure));
        finish(request, response, failure, resumed);
        throw;
    }

    if (!resumed && is_async_pending(request)) {
        Logger::log(LogLevel::DEBUG, request_line(request) + " exiting, async started");
        return;
    }
    finish(request, response, nullptr, resumed);
}

void Dispatcher::serve(std::shared_ptr<http::Request> request,
                       std::shared_ptr<http::Response> response, CompletionCallback on_complete)
{
    std::exception_ptr failure;
    try {
        dispatch(*request, *response);
    } catch (...) {
        failure = std::current_exception();
    }

    if (failure || !is_async_pending(*request)) {
        on_complete(failure);
        return;
    }

    async::AsyncManager& manager = request->async();
    manager.set_dispatch_handler([this, request, response, on_complete]() {
        request->set_dispatch_type(http::DispatchType::ASYNC);
        std::exception_ptr resumed_failure;
        try {
            dispatch(*request, *response);
        } catch (...) {
            resumed_failure = std::current_exception();
        }
        on_complete(resumed_failure);
    });
    manager.release_initial_pass();
}

bool Dispatcher::is_async_pending(const http::Request& request)
{
    return request.dispatch_type() == http::DispatchType::REQUEST &&
           request.attribute(CHAIN_ATTRIBUTE) != nullptr;
}

// ----------------------------------------------------------------------------
// Passes
// ----------------------------------------------------------------------------

void Dispatcher::do_dispatch(http::Request& request, http::Response& response)
{
    std::shared_ptr<ExecutionChain> chain;
    std::optional<Result> result;
    std::exception_ptr error;

    try {
        chain = get_handler(request);
        if (!chain) {
            no_handler_found(request, response);
            return;
        }

        HandlerAdapter& adapter = get_adapter(chain->handler());

        if (request.method() == http::Method::GET || request.method() == http::Method::HEAD) {
            int64_t last_modified = adapter.last_modified(request, chain->handler());
            if (check_not_modified(request, response, last_modified)) {
                Logger::log(LogLevel::DEBUG, request_line(request) + " not modified");
                return;
            }
        }

        if (!chain->apply_pre_handle(request, response)) {
            return;
        }

        request.async().set_scheduler(scheduler_);
        request.async().set_timeout(async_timeout_);

        chain->set_state(ChainState::HANDLER_RUNNING);
        result = adapter.invoke(request, response, chain->handler());

        if (request.is_async_started()) {
            request.set_attribute(CHAIN_ATTRIBUTE, chain);
            chain->apply_after_async_started(request, response);
            return;
        }

        apply_default_view_name(request, result);
        chain->apply_post_handle(request, response, result ? &*result : nullptr);
    } catch (const ConfigurationError&) {
        if (chain) {
            chain->trigger_after_completion(request, response, std::current_exception());
        }
        throw;
    } catch (...) {
        error = std::current_exception();
        if (request.is_async_started() && !is_async_pending(request)) {
            request.async().cancel();
        }
    }

    process_dispatch_result(request, response, chain, result, error);
}

void Dispatcher::resume_dispatch(http::Request& request, http::Response& response)
{
    const auto* parked = request.attribute_as<std::shared_ptr<ExecutionChain>>(CHAIN_ATTRIBUTE);
    if (!parked || !*parked) {
        throw AsyncStateError("No execution chain to resume for " + request.path());
    }
    std::shared_ptr<ExecutionChain> chain = *parked;
    request.remove_attribute(CHAIN_ATTRIBUTE);

    async::ConcurrentResult outcome = request.async().concurrent_result();
    std::optional<Result> result = std::move(outcome.value);
    std::exception_ptr error = outcome.error;

    if (!error) {
        try {
            apply_default_view_name(request, result);
            chain->apply_post_handle(request, response, result ? &*result : nullptr);
        } catch (...) {
            error = std::current_exception();
        }
    }

    process_dispatch_result(request, response, chain, result, error);
    request.async().on_dispatch_completed();
}

void Dispatcher::process_dispatch_result(http::Request& request, http::Response& response,
                                         const std::shared_ptr<ExecutionChain>& chain,
                                         std::optional<Result>& result, std::exception_ptr error)
{
    try {
        if (error) {
            result = process_handler_exception(request, response,
                                               chain ? &chain->handler() : nullptr, error);
        }

        if (result && !result->was_cleared()) {
            if (chain) {
                chain->set_state(ChainState::RENDERING);
            }
            render(*result, request, response);
        }

        if (result && flash_manager_ && response.is_redirect()) {
            flash_manager_->save_output(result->flash(), request, response);
        }
    } catch (...) {
        if (chain) {
            chain->trigger_after_completion(request, response, std::current_exception());
        }
        throw;
    }

    if (chain) {
        chain->trigger_after_completion(request, response, error);
    }
}

// ----------------------------------------------------------------------------
// Steps
// ----------------------------------------------------------------------------

std::shared_ptr<ExecutionChain> Dispatcher::get_handler(http::Request& request)
{
    for (const auto& mapping : handler_mappings_) {
        std::shared_ptr<ExecutionChain> chain = mapping->resolve(request);
        if (chain) {
            Logger::log(LogLevel::DEBUG,
                        request_line(request) + " -> " + chain->handler().description());
            return chain;
        }
    }
    if (!default_handler_.empty()) {
        return std::make_shared<ExecutionChain>(default_handler_);
    }
    return nullptr;
}

HandlerAdapter& Dispatcher::get_adapter(const Handler& handler)
{
    for (const auto& adapter : handler_adapters_) {
        if (adapter->supports(handler)) {
            return *adapter;
        }
    }
    throw AdapterNotFoundError(handler.description());
}

std::optional<Result> Dispatcher::process_handler_exception(http::Request& request,
                                                            http::Response& response,
                                                            const Handler* handler,
                                                            std::exception_ptr error)
{
    for (const auto& resolver : exception_resolvers_) {
        std::optional<Result> resolved = resolver->resolve(request, response, handler, error);
        if (!resolved) {
            continue;
        }
        if (!resolved->was_cleared()) {
            apply_default_view_name(request, resolved);
        }
        Logger::log(LogLevel::DEBUG, request_line(request) + " resolved [" + describe(error) +
                                         "] to " + resolved->to_string());
        return resolved;
    }
    std::rethrow_exception(error);
}

void Dispatcher::render(Result& result, http::Request& request, http::Response& response)
{
    const DispatchContext* context = ContextScope::current();
    std::string locale = context ? context->locale : "";

    std::shared_ptr<View> view;
    if (result.is_reference()) {
        view = resolve_view_name(result.view_name(), locale);
        if (!view) {
            throw ViewResolutionError(result.view_name());
        }
    } else {
        view = result.view();
        if (!view) {
            throw DispatchError("Result for " + request.path() +
                                " has neither a view name nor a view");
        }
    }

    if (result.status()) {
        response.set_status(*result.status());
    }
    if (!response.has_header("Content-Type")) {
        response.set_content_type(view->content_type());
    }

    http::Model model = request.model();
    for (const auto& entry : result.model()) {
        model[entry.first] = entry.second;
    }

    Logger::log(LogLevel::DEBUG, request_line(request) + " rendering " + result.to_string());
    view->render(model, request, response);
}

std::shared_ptr<View> Dispatcher::resolve_view_name(const std::string& view_name,
                                                    const std::string& locale)
{
    for (const auto& resolver : view_resolvers_) {
        std::shared_ptr<View> view = resolver->resolve_view(view_name, locale);
        if (view) {
            return view;
        }
    }
    return nullptr;
}

void Dispatcher::apply_default_view_name(const http::Request& request,
                                         std::optional<Result>& result)
{
    if (result && !result->has_view() && !result->was_cleared() && view_name_translator_) {
        result->set_view_name(view_name_translator_->view_name(request));
    }
}

bool Dispatcher::check_not_modified(const http::Request& request, http::Response& response,
                                    int64_t last_modified)
{
    if (last_modified < 0) {
        return false;
    }
    response.set_header("Last-Modified", infra::Time::format_http_date(last_modified));

    std::optional<std::string> header = request.header("If-Modified-Since");
    if (!header) {
        return false;
    }
    int64_t since = infra::Time::parse_http_date(*header);
    if (since < 0) {
        return false;
    }
    // HTTP dates carry whole seconds.
    if (last_modified / 1000 * 1000 <= since) {
        response.set_status(304);
        return true;
    }
    return false;
}

void Dispatcher::no_handler_found(const http::Request& request, http::Response& response)
{
    Logger::log(LogLevel::WARN, "No mapping for " + http::to_string(request.method()) + " " +
                                    request.path());
    if (throw_if_no_handler_found_) {
        throw NoHandlerFoundError(request.method(), request.path());
    }
    response.send_error(404);
}

void Dispatcher::finish(http::Request& request, const http::Response& response,
                        std::exception_ptr failure, bool resumed)
{
    if (resumed && failure) {
        request.async().on_dispatch_completed();
    }
    if (event_listeners_.empty()) {
        return;
    }

    int64_t duration = 0;
    const auto* start = request.attribute_as<SteadyClock::time_point>(START_TIME_ATTRIBUTE);
    if (start) {
        duration = std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - *start)
                       .count();
    }

    RequestHandledEvent event{request.id(),
                              request.method(),
                              request.path(),
                              request.session_id(),
                              failure ? 500 : response.status(),
                              duration,
                              resumed,
                              describe(failure)};
    for (const EventListener& listener : event_listeners_) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            Logger::log(LogLevel::WARN, std::string("Event listener threw: ") + e.what());
        }
    }
}

} // namespace conduit::web
