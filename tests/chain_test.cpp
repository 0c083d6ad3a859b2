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
 * @file chain_test.cpp
 * @brief Tests for the interceptor lifecycle of an `ExecutionChain`.
 *
 * @details
 * Pre-phase runs in registration order, post-phase and cleanup in reverse,
 * and cleanup only reaches interceptors whose pre-phase was invoked.
 */

#include "conduit/http/request.hpp"
#include "conduit/http/response.hpp"
#include "conduit/web/execution_chain.hpp"
#include "conduit/web/function_adapter.hpp"
#include "framework.hpp"
#include "recording.hpp"

#include <memory>
#include <stdexcept>
#include <string>

using namespace conduit::web;
using conduit::http::Method;
using conduit::http::Request;
using conduit::http::Response;
using conduit::test::Journal;
using conduit::test::RecordingInterceptor;

namespace {

ExecutionChain make_chain(const Journal& journal, bool second_proceeds = true)
{
    Handler handler = function_handler(
        [](Request&, Response&) -> std::optional<Result> { return Result("home"); }, "home");
    return ExecutionChain(handler,
                          {std::make_shared<RecordingInterceptor>("I1", journal),
                           std::make_shared<RecordingInterceptor>("I2", journal, second_proceeds),
                           std::make_shared<RecordingInterceptor>("I3", journal)});
}

} // namespace

/**
 * @brief I1, I2, I3 on the way in; I3, I2, I1 on the way out.
 */
void test_chain_full_lifecycle_order()
{
    Journal journal = conduit::test::make_journal();
    ExecutionChain chain = make_chain(journal);
    Request request(Method::GET, "/");
    Response response;

    ASSERT_TRUE(chain.apply_pre_handle(request, response));
    Result result("home");
    chain.apply_post_handle(request, response, &result);
    chain.trigger_after_completion(request, response, nullptr);

    ASSERT_EQ(conduit::test::joined(journal),
              std::string("pre:I1 pre:I2 pre:I3 post:I3 post:I2 post:I1 "
                          "after:I3 after:I2 after:I1"));
    ASSERT_EQ(chain.interceptor_index(), 2);
    ASSERT_TRUE(chain.state() == ChainState::COMPLETED);
}

/**
 * @brief A veto by I2 stops the chain and cleans up I2 and I1 only.
 */
void test_chain_pre_handle_abort()
{
    Journal journal = conduit::test::make_journal();
    ExecutionChain chain = make_chain(journal, false);
    Request request(Method::GET, "/");
    Response response;

    ASSERT_FALSE(chain.apply_pre_handle(request, response));
    ASSERT_EQ(conduit::test::joined(journal), std::string("pre:I1 pre:I2 after:I2 after:I1"));
    ASSERT_EQ(chain.interceptor_index(), 1);
}

/**
 * @brief Cleanup runs at most once, even if triggered again.
 */
void test_chain_cleanup_runs_once()
{
    Journal journal = conduit::test::make_journal();
    ExecutionChain chain = make_chain(journal);
    Request request(Method::GET, "/");
    Response response;

    ASSERT_TRUE(chain.apply_pre_handle(request, response));
    std::exception_ptr error = std::make_exception_ptr(std::runtime_error("boom"));
    chain.trigger_after_completion(request, response, error);
    chain.trigger_after_completion(request, response, nullptr);

    ASSERT_EQ(conduit::test::joined(journal),
              std::string("pre:I1 pre:I2 pre:I3 after:I3! after:I2! after:I1!"));
    ASSERT_TRUE(chain.state() == ChainState::FAILED);
}

/**
 * @brief A failing cleanup callback does not stop the remaining ones.
 */
void test_chain_cleanup_failure_is_contained()
{
    class Failing : public HandlerInterceptor {
      public:
        void after_completion(Request&, Response&, const Handler&, std::exception_ptr) override
        {
            throw std::runtime_error("cleanup failed");
        }
    };

    Journal journal = conduit::test::make_journal();
    Handler handler = function_handler(
        [](Request&, Response&) -> std::optional<Result> { return std::nullopt; });
    ExecutionChain chain(handler, {std::make_shared<RecordingInterceptor>("I1", journal),
                                   std::make_shared<Failing>()});
    Request request(Method::GET, "/");
    Response response;

    ASSERT_TRUE(chain.apply_pre_handle(request, response));
    chain.trigger_after_completion(request, response, nullptr);
    ASSERT_EQ(conduit::test::joined(journal), std::string("pre:I1 after:I1"));
}

/**
 * @brief A cleanup callback throwing something other than `std::exception`
 * is contained as well.
 */
void test_chain_cleanup_non_standard_failure_is_contained()
{
    class ThrowsInt : public HandlerInterceptor {
      public:
        void after_completion(Request&, Response&, const Handler&, std::exception_ptr) override
        {
            throw 42;
        }
    };

    Journal journal = conduit::test::make_journal();
    Handler handler = function_handler(
        [](Request&, Response&) -> std::optional<Result> { return std::nullopt; });
    ExecutionChain chain(handler, {std::make_shared<RecordingInterceptor>("I1", journal),
                                   std::make_shared<ThrowsInt>()});
    Request request(Method::GET, "/");
    Response response;

    ASSERT_TRUE(chain.apply_pre_handle(request, response));
    chain.trigger_after_completion(request, response, nullptr);
    ASSERT_EQ(conduit::test::joined(journal), std::string("pre:I1 after:I1"));
    ASSERT_TRUE(chain.state() == ChainState::COMPLETED);
}

void test_chain_async_started_notifies_in_reverse()
{
    Journal journal = conduit::test::make_journal();
    ExecutionChain chain = make_chain(journal);
    Request request(Method::GET, "/");
    Response response;

    ASSERT_TRUE(chain.apply_pre_handle(request, response));
    chain.apply_after_async_started(request, response);
    ASSERT_EQ(conduit::test::joined(journal),
              std::string("pre:I1 pre:I2 pre:I3 async:I3 async:I2 async:I1"));
    ASSERT_TRUE(chain.state() == ChainState::ASYNC_STARTED);
    ASSERT_EQ(to_string(chain.state()), std::string("ASYNC_STARTED"));
}
