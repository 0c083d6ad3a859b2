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
 * @file dispatcher_test.cpp
 * @brief End-to-end tests of the dispatch pipeline.
 *
 * @details
 * Each case wires a `Dispatcher` with in-memory mappings, handlers and
 * views, drives one or two requests through it, and inspects the response
 * together with the journal of interceptor callbacks.
 */

#include "conduit/async/async_manager.hpp"
#include "conduit/async/deferred_result.hpp"
#include "conduit/condition/mapping_info.hpp"
#include "conduit/flash/flash_manager.hpp"
#include "conduit/flash/session_flash_store.hpp"
#include "conduit/infra/scheduler.hpp"
#include "conduit/mapping/request_mapping_handler_mapping.hpp"
#include "conduit/mapping/url_handler_mapping.hpp"
#include "conduit/web/context.hpp"
#include "conduit/web/controller.hpp"
#include "conduit/web/dispatcher.hpp"
#include "conduit/web/errors.hpp"
#include "conduit/web/exception_resolver.hpp"
#include "conduit/web/function_adapter.hpp"
#include "conduit/web/view_resolvers.hpp"
#include "framework.hpp"
#include "recording.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace conduit::web;
using conduit::async::DeferredResult;
using conduit::condition::RequestMappingInfo;
using conduit::http::Method;
using conduit::http::Request;
using conduit::http::Response;
using conduit::mapping::RequestMappingHandlerMapping;
using conduit::mapping::UrlHandlerMapping;
using conduit::test::Journal;
using conduit::test::joined;
using conduit::test::RecordingInterceptor;
using conduit::test::TextView;

namespace {

/**
 * @brief A dispatcher with one URL mapping, text views and a journal.
 */
struct App {
    conduit::infra::Scheduler scheduler{2};
    Journal journal = conduit::test::make_journal();
    Dispatcher dispatcher;
    std::shared_ptr<UrlHandlerMapping> urls = std::make_shared<UrlHandlerMapping>();
    std::shared_ptr<ViewRegistry> views = std::make_shared<ViewRegistry>();

    App()
    {
        dispatcher.set_scheduler(&scheduler);
        dispatcher.add_handler_mapping(urls);
        for (const char* name : {"home", "accounts/list", "error"}) {
            views->register_view(name, std::make_shared<TextView>(name));
        }
        dispatcher.add_view_resolver(views);
        dispatcher.add_view_resolver(std::make_shared<UrlBasedViewResolver>());
    }

    /// Installs interceptors named `I1`, `I2`, ... ; `veto` names one that stops the chain.
    void intercept(int count, const std::string& veto = "")
    {
        for (int i = 1; i <= count; ++i) {
            std::string name = "I" + std::to_string(i);
            urls->add_interceptor(std::make_shared<RecordingInterceptor>(name, journal, name != veto));
        }
    }

    void route(const std::string& pattern, HandlerFunction fn)
    {
        Journal log = journal;
        urls->register_handler(pattern, function_handler(
                                            [log, fn](Request& request, Response& response) {
                                                log->push_back("handler");
                                                return fn(request, response);
                                            },
                                            pattern));
    }
};

std::optional<Result> home(Request&, Response&)
{
    Result result("home");
    result.add("user", "ada");
    return result;
}

bool is_cancellation(std::exception_ptr error)
{
    if (!error) {
        return false;
    }
    try {
        std::rethrow_exception(error);
    } catch (const AsyncCancelledError&) {
        return true;
    } catch (...) {
        return false;
    }
}

class Snapshot : public Controller, public LastModified {
  public:
    int calls = 0;

    std::optional<Result> handle_request(Request&, Response&) override
    {
        calls++;
        return Result("home");
    }

    int64_t last_modified(const Request&) const override
    {
        return 784111777000LL;
    }
};

} // namespace

/**
 * @brief Pre-phase in order, handler, post-phase and cleanup in reverse, then render.
 */
void test_dispatch_happy_path()
{
    App app;
    app.intercept(3);
    app.route("/", home);

    Request request(Method::GET, "/");
    Response response;
    app.dispatcher.dispatch(request, response);

    ASSERT_EQ(joined(app.journal), std::string("pre:I1 pre:I2 pre:I3 handler post:I3 post:I2 "
                                               "post:I1 after:I3 after:I2 after:I1"));
    ASSERT_EQ(response.status(), 200);
    ASSERT_EQ(response.body(), std::string("home|user=ada;"));
    ASSERT_EQ(*response.header("Content-Type"), std::string("text/plain"));
}

/**
 * @brief A veto by I2 skips the handler and the post-phase and cleans up I2, I1 only.
 */
void test_dispatch_interceptor_veto()
{
    App app;
    app.intercept(3, "I2");
    app.route("/", home);

    Request request(Method::GET, "/");
    Response response;
    app.dispatcher.dispatch(request, response);

    ASSERT_EQ(joined(app.journal), std::string("pre:I1 pre:I2 after:I2 after:I1"));
    ASSERT_EQ(response.body(), std::string(""));
}

/**
 * @brief An unclaimed handler failure runs cleanup with the error, then propagates.
 */
void test_dispatch_unresolved_exception_propagates()
{
    App app;
    app.intercept(2);
    app.route("/", [](Request&, Response&) -> std::optional<Result> {
        throw std::runtime_error("boom");
    });

    Request request(Method::GET, "/");
    Response response;
    ASSERT_THROWS(app.dispatcher.dispatch(request, response), std::runtime_error);
    ASSERT_EQ(joined(app.journal), std::string("pre:I1 pre:I2 handler after:I2! after:I1!"));
}

/**
 * @brief A claimed failure skips the post-phase; cleanup still sees the error.
 */
void test_dispatch_resolved_exception()
{
    App app;
    app.intercept(1);
    app.route("/", [](Request&, Response&) -> std::optional<Result> {
        throw ResponseStatusError(409, "duplicate account");
    });

    Request request(Method::GET, "/");
    Response response;
    app.dispatcher.dispatch(request, response);

    ASSERT_EQ(response.status(), 409);
    ASSERT_EQ(joined(app.journal), std::string("pre:I1 handler after:I1!"));
}

void test_dispatch_exception_view()
{
    App app;
    auto resolver = std::make_shared<MappingExceptionResolver>();
    resolver->map<std::invalid_argument>("error", 400);
    app.dispatcher.add_exception_resolver(resolver);
    app.route("/", [](Request&, Response&) -> std::optional<Result> {
        throw std::invalid_argument("bad id");
    });

    Request request(Method::GET, "/");
    Response response;
    app.dispatcher.dispatch(request, response);

    ASSERT_EQ(response.status(), 400);
    ASSERT_EQ(response.body(), std::string("error|exception=bad id;"));
}

/**
 * @brief No handler yields a 404, or `NoHandlerFoundError` through the resolvers.
 */
void test_dispatch_no_handler()
{
    App app;
    Request request(Method::GET, "/missing");
    Response response;
    app.dispatcher.dispatch(request, response);
    ASSERT_EQ(response.status(), 404);

    App strict;
    strict.dispatcher.set_throw_if_no_handler_found(true);
    Response resolved;
    strict.dispatcher.dispatch(request, resolved);
    ASSERT_EQ(resolved.status(), 404);

    strict.dispatcher.add_exception_resolver(std::make_shared<MappingExceptionResolver>());
    Response unresolved;
    ASSERT_THROWS(strict.dispatcher.dispatch(request, unresolved), NoHandlerFoundError);
}

/**
 * @brief A mapping whose required parameter is missing does not match, so
 * the next mapping, then the default handler, then 404 apply.
 */
void test_dispatch_missing_param_falls_through()
{
    auto search = std::make_shared<RequestMappingHandlerMapping>();
    search->set_order(0);
    search->register_handler(RequestMappingInfo::paths({"/search"}).params({"q"}).build(),
                             function_handler([](Request&, Response& response) {
                                 response.write("search");
                                 return std::optional<Result>();
                             }));

    App app;
    app.dispatcher.add_handler_mapping(search);
    app.urls->register_handler("/search", function_handler([](Request&, Response& response) {
                                   response.write("browse");
                                   return std::optional<Result>();
                               }));

    Request with_query(Method::GET, "/search?q=ledger");
    Response first;
    app.dispatcher.dispatch(with_query, first);
    ASSERT_EQ(first.body(), std::string("search"));

    Request without_query(Method::GET, "/search");
    Response second;
    app.dispatcher.dispatch(without_query, second);
    ASSERT_EQ(second.body(), std::string("browse"));

    Dispatcher only_search;
    only_search.add_handler_mapping(search);
    Response third;
    only_search.dispatch(without_query, third);
    ASSERT_EQ(third.status(), 404);

    only_search.set_default_handler(function_handler([](Request&, Response& response) {
        response.write("default");
        return std::optional<Result>();
    }));
    Response fourth;
    only_search.dispatch(without_query, fourth);
    ASSERT_EQ(fourth.body(), std::string("default"));
}

/**
 * @brief A result without a view gets its name from the request path.
 */
void test_dispatch_default_view_name()
{
    App app;
    app.route("/accounts/list.html", [](Request&, Response&) -> std::optional<Result> {
        Result result;
        result.add("count", "3");
        return result;
    });

    Request request(Method::GET, "/accounts/list.html");
    Response response;
    app.dispatcher.dispatch(request, response);
    ASSERT_EQ(response.body(), std::string("accounts/list|count=3;"));
}

void test_dispatch_unknown_view_fails()
{
    App app;
    app.route("/", [](Request&, Response&) -> std::optional<Result> { return Result("nope"); });

    Request request(Method::GET, "/");
    Response response;
    ASSERT_THROWS(app.dispatcher.dispatch(request, response), ViewResolutionError);
}

/**
 * @brief Flash attributes set before a redirect reach the redirect target once.
 */
void test_dispatch_flash_across_redirect()
{
    App app;
    auto store = std::make_shared<conduit::flash::SessionFlashStore>();
    app.dispatcher.set_flash_manager(std::make_shared<conduit::flash::FlashManager>(store, 180));
    app.route("/accounts", [](Request&, Response&) -> std::optional<Result> {
        Result result = Result::redirect("/accounts/42");
        result.flash().put("message", "Account created");
        return result;
    });
    app.route("/accounts/{id}", home);

    Request post(Method::POST, "/accounts");
    post.set_session_id("session-1");
    Response redirect;
    app.dispatcher.dispatch(post, redirect);
    ASSERT_EQ(redirect.status(), 302);
    ASSERT_EQ(*redirect.header("Location"), std::string("/accounts/42"));
    ASSERT_EQ(store->size("session-1"), static_cast<size_t>(1));

    Request get(Method::GET, "/accounts/42");
    get.set_session_id("session-1");
    Response page;
    app.dispatcher.dispatch(get, page);
    ASSERT_EQ(page.body(), std::string("home|message=Account created;user=ada;"));

    Request again(Method::GET, "/accounts/42");
    again.set_session_id("session-1");
    Response second;
    app.dispatcher.dispatch(again, second);
    ASSERT_EQ(second.body(), std::string("home|user=ada;"));
}

/**
 * @brief A conditional GET against an unchanged resource short-circuits to 304.
 */
void test_dispatch_not_modified()
{
    App app;
    app.intercept(1);
    auto snapshot = std::make_shared<Snapshot>();
    app.urls->register_handler("/snapshot", Handler::of<Controller>(snapshot, "snapshot"));

    Request fresh(Method::GET, "/snapshot");
    fresh.add_header("If-Modified-Since", "Sun, 06 Nov 1994 08:49:37 GMT");
    Response not_modified;
    app.dispatcher.dispatch(fresh, not_modified);
    ASSERT_EQ(not_modified.status(), 304);
    ASSERT_EQ(snapshot->calls, 0);
    ASSERT_EQ(joined(app.journal), std::string(""));

    Request stale(Method::GET, "/snapshot");
    stale.add_header("If-Modified-Since", "Sat, 05 Nov 1994 08:49:37 GMT");
    Response full;
    app.dispatcher.dispatch(stale, full);
    ASSERT_EQ(full.status(), 200);
    ASSERT_EQ(snapshot->calls, 1);
    ASSERT_EQ(*full.header("Last-Modified"), std::string("Sun, 06 Nov 1994 08:49:37 GMT"));
}

/**
 * @brief Configuration errors bypass the exception resolvers.
 */
void test_dispatch_configuration_errors_propagate()
{
    App app;
    app.route("/{type}/items", home);
    app.route("/users/{id}", home);

    Request ambiguous(Method::GET, "/users/items");
    Response response;
    ASSERT_THROWS(app.dispatcher.dispatch(ambiguous, response), AmbiguousMappingError);

    app.urls->register_handler("/raw", Handler::of(std::make_shared<int>(7), "int"));
    Request raw(Method::GET, "/raw");
    Response second;
    ASSERT_THROWS(app.dispatcher.dispatch(raw, second), AdapterNotFoundError);
}

/**
 * @brief Async handling: the initial pass stops after the handler, the
 * resumed pass runs the post-phase and cleanup exactly once.
 */
void test_dispatch_async_deferred()
{
    App app;
    app.intercept(2);
    auto deferred = std::make_shared<DeferredResult>();
    app.route("/reports/{name}", [deferred](Request& request, Response&) {
        request.async().start_deferred(deferred);
        return std::optional<Result>();
    });

    auto request = std::make_shared<Request>(Method::GET, "/reports/monthly");
    auto response = std::make_shared<Response>();
    std::vector<std::exception_ptr> completions;
    app.dispatcher.serve(request, response,
                         [&completions](std::exception_ptr error) { completions.push_back(error); });

    ASSERT_EQ(joined(app.journal), std::string("pre:I1 pre:I2 handler async:I2 async:I1"));
    ASSERT_TRUE(Dispatcher::is_async_pending(*request));
    ASSERT_TRUE(completions.empty());

    Result report("home");
    report.add("report", "monthly");
    ASSERT_TRUE(deferred->set_result(report));

    ASSERT_EQ(joined(app.journal), std::string("pre:I1 pre:I2 handler async:I2 async:I1 "
                                               "post:I2 post:I1 after:I2 after:I1"));
    ASSERT_EQ(completions.size(), static_cast<size_t>(1));
    ASSERT_TRUE(completions[0] == nullptr);
    ASSERT_EQ(response->body(), std::string("home|report=monthly;"));
    ASSERT_FALSE(Dispatcher::is_async_pending(*request));
}

void test_dispatch_async_error_is_resolved()
{
    App app;
    app.intercept(1);
    auto deferred = std::make_shared<DeferredResult>();
    app.route("/reports", [deferred](Request& request, Response&) {
        request.async().start_deferred(deferred);
        return std::optional<Result>();
    });

    auto request = std::make_shared<Request>(Method::GET, "/reports");
    auto response = std::make_shared<Response>();
    int completions = 0;
    app.dispatcher.serve(request, response, [&completions](std::exception_ptr error) {
        if (!error) {
            completions++;
        }
    });

    deferred->set_error(std::make_exception_ptr(ResponseStatusError(503, "backend busy")));
    ASSERT_EQ(completions, 1);
    ASSERT_EQ(response->status(), 503);
    ASSERT_EQ(joined(app.journal), std::string("pre:I1 handler async:I1 after:I1!"));
}

/**
 * @brief A deferred result nobody sets times out; the timeout still drives
 * exactly one resumed pass, resolved to 503, with the cleanup phase.
 */
void test_dispatch_async_timeout_resumes_once()
{
    App app;
    app.intercept(1);
    app.route("/slow", [](Request& request, Response&) {
        request.async().start_deferred(
            std::make_shared<DeferredResult>(std::chrono::milliseconds(20)));
        return std::optional<Result>();
    });

    auto request = std::make_shared<Request>(Method::GET, "/slow");
    auto response = std::make_shared<Response>();
    std::atomic<int> completions{0};
    std::promise<std::exception_ptr> finished;
    std::future<std::exception_ptr> outcome = finished.get_future();
    app.dispatcher.serve(request, response, [&completions, &finished](std::exception_ptr error) {
        if (completions.fetch_add(1) == 0) {
            finished.set_value(error);
        }
    });

    ASSERT_TRUE(outcome.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    ASSERT_TRUE(outcome.get() == nullptr);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    ASSERT_EQ(completions.load(), 1);
    ASSERT_EQ(response->status(), 503);
    ASSERT_EQ(joined(app.journal), std::string("pre:I1 handler async:I1 after:I1!"));
    ASSERT_FALSE(Dispatcher::is_async_pending(*request));
}

/**
 * @brief A handler that fails after starting async work cancels it: one
 * cleanup on the initial pass, no resumed pass, late results ignored.
 */
void test_dispatch_async_start_then_throw_cancels()
{
    App app;
    app.intercept(1);
    auto deferred = std::make_shared<DeferredResult>();
    app.route("/broken", [deferred](Request& request, Response&) -> std::optional<Result> {
        request.async().start_deferred(deferred);
        throw std::runtime_error("gave up");
    });

    auto request = std::make_shared<Request>(Method::GET, "/broken");
    auto response = std::make_shared<Response>();
    std::vector<std::exception_ptr> completions;
    app.dispatcher.serve(request, response,
                         [&completions](std::exception_ptr error) { completions.push_back(error); });

    ASSERT_EQ(completions.size(), static_cast<size_t>(1));
    ASSERT_TRUE(completions[0] != nullptr);
    ASSERT_EQ(joined(app.journal), std::string("pre:I1 handler after:I1!"));
    ASSERT_TRUE(is_cancellation(request->async().concurrent_result().error));

    ASSERT_FALSE(deferred->set_result(Result("home")));
    ASSERT_EQ(completions.size(), static_cast<size_t>(1));
    ASSERT_EQ(joined(app.journal), std::string("pre:I1 handler after:I1!"));
}

/**
 * @brief Without a scheduler the default timeout cannot be enforced, so
 * starting async work fails on the initial pass instead of hanging.
 */
void test_dispatch_async_without_scheduler_fails_fast()
{
    Journal journal = conduit::test::make_journal();
    Dispatcher dispatcher;
    auto urls = std::make_shared<UrlHandlerMapping>();
    urls->add_interceptor(std::make_shared<RecordingInterceptor>("I1", journal));
    urls->register_handler("/reports", function_handler([](Request& request, Response&) {
                               request.async().start_deferred(std::make_shared<DeferredResult>());
                               return std::optional<Result>();
                           }));
    dispatcher.add_handler_mapping(urls);

    auto request = std::make_shared<Request>(Method::GET, "/reports");
    auto response = std::make_shared<Response>();
    std::vector<std::exception_ptr> completions;
    dispatcher.serve(request, response,
                     [&completions](std::exception_ptr error) { completions.push_back(error); });

    ASSERT_EQ(completions.size(), static_cast<size_t>(1));
    ASSERT_TRUE(completions[0] != nullptr);
    ASSERT_THROWS(std::rethrow_exception(completions[0]), AsyncStateError);
    ASSERT_FALSE(request->is_async_started());
    ASSERT_EQ(joined(journal), std::string("pre:I1 after:I1!"));
}

/**
 * @brief One event per request, carrying the final status or the failure.
 */
void test_dispatch_events_and_context()
{
    App app;
    std::vector<RequestHandledEvent> events;
    app.dispatcher.add_event_listener(
        [&events](const RequestHandledEvent& event) { events.push_back(event); });

    std::string seen_locale;
    app.route("/", [&seen_locale](Request& request, Response&) -> std::optional<Result> {
        const DispatchContext* context = ContextScope::current();
        if (context && context->request == &request) {
            seen_locale = context->locale;
        }
        return Result("home");
    });
    app.route("/fail", [](Request&, Response&) -> std::optional<Result> {
        throw std::runtime_error("kaput");
    });

    Request request(Method::GET, "/");
    request.add_header("Accept-Language", "de-DE");
    Response response;
    app.dispatcher.dispatch(request, response);
    ASSERT_EQ(seen_locale, std::string("de-DE"));
    ASSERT_TRUE(ContextScope::current() == nullptr);

    Request failing(Method::GET, "/fail");
    Response failed;
    ASSERT_THROWS(app.dispatcher.dispatch(failing, failed), std::runtime_error);

    ASSERT_EQ(events.size(), static_cast<size_t>(2));
    ASSERT_EQ(events[0].status, 200);
    ASSERT_FALSE(events[0].async);
    ASSERT_EQ(events[1].status, 500);
    ASSERT_EQ(events[1].failure, std::string("kaput"));
}
