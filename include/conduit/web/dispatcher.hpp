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
 * @file dispatcher.hpp
 * @brief The front controller: one entry point for every request.
 *
 * @details
 * ### Initial pass
 * 1. Input flash state is retrieved and merged into the request model.
 * 2. Handler mappings are queried in order; the dispatcher's default
 *    handler is the last resort. Without any, the request gets a 404 (or a
 *    `NoHandlerFoundError` if configured).
 * 3. A GET/HEAD whose handler reports a last-modified time not newer than
 *    `If-Modified-Since` is answered with 304.
 * 4. Interceptor pre phase, handler invocation, interceptor post phase.
 * 5. Failures go through the exception resolvers; unclaimed ones propagate.
 * 6. The result is rendered; flash state is saved if the response redirects.
 * 7. Interceptor cleanup runs, whatever happened after step 4 began.
 *
 * ### Async
 * If the handler starts async processing, step 4 stops after the handler
 * and the pass returns. The chain is parked on the request, and a second
 * pass (`DispatchType::ASYNC`) later runs post phase, rendering and
 * cleanup on it with the concurrent result.
 *
 * Configuration errors (`AmbiguousMappingError`, `AdapterNotFoundError`)
 * skip the exception resolvers and propagate after cleanup.
 */

#pragma once

#include "conduit/flash/flash_manager.hpp"
#include "conduit/infra/scheduler.hpp"
#include "conduit/mapping/handler_mapping.hpp"
#include "conduit/web/adapter.hpp"
#include "conduit/web/events.hpp"
#include "conduit/web/exception_resolver.hpp"
#include "conduit/web/locale_resolver.hpp"
#include "conduit/web/view_name_translator.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <vector>

namespace conduit::web {

class Dispatcher {
  public:
    using CompletionCallback = std::function<void(std::exception_ptr)>;

    /// @brief Request attribute parking the execution chain between the two async passes.
    static const char* const CHAIN_ATTRIBUTE;

    /// @brief Request attribute holding the steady-clock start of the initial pass.
    static const char* const START_TIME_ATTRIBUTE;

    /// @brief Async timeout applied until `set_async_timeout` says otherwise.
    static const std::chrono::milliseconds DEFAULT_ASYNC_TIMEOUT;

    /**
     * @brief Creates a dispatcher with the default strategies: function and
     * controller adapters, the default exception resolver, a URL-based view
     * resolver (for `redirect:`), the `Accept-Language` locale resolver and
     * the default view name translator. Registering any component of a kind
     * replaces the defaults of that kind.
     */
    Dispatcher();

    void add_handler_mapping(std::shared_ptr<mapping::HandlerMapping> mapping);

    void add_handler_adapter(std::shared_ptr<HandlerAdapter> adapter);

    void add_exception_resolver(std::shared_ptr<HandlerExceptionResolver> resolver);

    void add_view_resolver(std::shared_ptr<ViewResolver> resolver);

    void set_locale_resolver(std::shared_ptr<LocaleResolver> resolver);

    /// @param translator Null disables default view names.
    void set_view_name_translator(std::shared_ptr<ViewNameTranslator> translator);

    /// @param manager Null disables flash state.
    void set_flash_manager(std::shared_ptr<flash::FlashManager> manager);

    /// @brief Handler used when no mapping resolves the request.
    void set_default_handler(Handler handler);

    /// @brief Raise `NoHandlerFoundError` through the exception resolvers instead of a plain 404.
    void set_throw_if_no_handler_found(bool enabled);

    /// @brief Pool for async callables and timeouts. Not owned.
    void set_scheduler(infra::Scheduler* scheduler);

    /**
     * @brief Timeout for async work that brings none of its own.
     *
     * Zero disables it; a deferred result nobody sets then never resumes.
     * Any other value needs a scheduler, or starting async work fails.
     */
    void set_async_timeout(std::chrono::milliseconds timeout);

    void add_event_listener(EventListener listener);

    /**
     * @brief Runs one dispatch pass for `request`.
     *
     * On the initial pass this returns early when the handler went async;
     * `is_async_pending` then reports true and the caller must arrange the
     * resumed pass (see `serve`).
     *
     * @throws Whatever no exception resolver claimed, and configuration errors.
     */
    void dispatch(http::Request& request, http::Response& response);

    /**
     * @brief Dispatches and, for async requests, wires the resumed pass.
     *
     * `on_complete` is called exactly once after the final pass with the
     * failure that escaped it, if any. It runs on the thread that finished
     * the request.
     */
    void serve(std::shared_ptr<http::Request> request, std::shared_ptr<http::Response> response,
               CompletionCallback on_complete);

    /// @brief True between an initial pass that went async and its resumed pass.
    static bool is_async_pending(const http::Request& request);

  private:
    void do_dispatch(http::Request& request, http::Response& response);

    void resume_dispatch(http::Request& request, http::Response& response);

    void process_dispatch_result(http::Request& request, http::Response& response,
                                 const std::shared_ptr<ExecutionChain>& chain,
                                 std::optional<Result>& result, std::exception_ptr error);

    std::shared_ptr<ExecutionChain> get_handler(http::Request& request);

    HandlerAdapter& get_adapter(const Handler& handler);

    std::optional<Result> process_handler_exception(http::Request& request,
                                                    http::Response& response,
                                                    const Handler* handler,
                                                    std::exception_ptr error);

    void render(Result& result, http::Request& request, http::Response& response);

    std::shared_ptr<View> resolve_view_name(const std::string& view_name,
                                            const std::string& locale);

    void apply_default_view_name(const http::Request& request, std::optional<Result>& result);

    bool check_not_modified(const http::Request& request, http::Response& response,
                            int64_t last_modified);

    void no_handler_found(const http::Request& request, http::Response& response);

    void finish(http::Request& request, const http::Response& response,
                std::exception_ptr failure, bool resumed);

    std::vector<std::shared_ptr<mapping::HandlerMapping>> handler_mappings_;
    std::vector<std::shared_ptr<HandlerAdapter>> handler_adapters_;
    std::vector<std::shared_ptr<HandlerExceptionResolver>> exception_resolvers_;
    std::vector<std::shared_ptr<ViewResolver>> view_resolvers_;
    bool default_adapters_;
    bool default_exception_resolvers_;
    bool default_view_resolvers_;
    std::shared_ptr<LocaleResolver> locale_resolver_;
    std::shared_ptr<ViewNameTranslator> view_name_translator_;
    std::shared_ptr<flash::FlashManager> flash_manager_;
    Handler default_handler_;
    bool throw_if_no_handler_found_;
    infra::Scheduler* scheduler_;
    std::chrono::milliseconds async_timeout_;
    std::vector<EventListener> event_listeners_;
};

} // namespace conduit::web
