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
 * @file adapter_test.cpp
 * @brief Tests for handler adapters, results, views and the view-side strategies.
 */

#include "conduit/condition/path_matcher.hpp"
#include "conduit/mapping/handler_mapping.hpp"
#include "conduit/web/controller.hpp"
#include "conduit/web/errors.hpp"
#include "conduit/web/exception_resolver.hpp"
#include "conduit/web/function_adapter.hpp"
#include "conduit/web/json_view.hpp"
#include "conduit/web/locale_resolver.hpp"
#include "conduit/web/redirect_view.hpp"
#include "conduit/web/result.hpp"
#include "conduit/web/view_name_translator.hpp"
#include "conduit/web/view_resolvers.hpp"
#include "framework.hpp"
#include "recording.hpp"

#include <memory>
#include <stdexcept>
#include <string>

using namespace conduit::web;
using conduit::condition::UriVariables;
using conduit::http::Method;
using conduit::http::Model;
using conduit::http::Request;
using conduit::http::Response;
using conduit::mapping::HandlerMapping;

namespace {

class StaticController : public Controller, public LastModified {
  public:
    std::optional<Result> handle_request(Request&, Response&) override
    {
        return Result("static");
    }

    int64_t last_modified(const Request&) const override
    {
        return 1000;
    }
};

} // namespace

/**
 * @brief Each adapter claims exactly its own handler shape.
 */
void test_adapters_support_by_type()
{
    FunctionHandlerAdapter functions;
    ControllerHandlerAdapter controllers;

    Handler fn = function_handler(
        [](Request&, Response&) -> std::optional<Result> { return Result("fn"); });
    Handler controller = Handler::of<Controller>(std::make_shared<StaticController>(), "static");
    Handler unknown = Handler::of(std::make_shared<std::string>("not a handler"));

    ASSERT_TRUE(functions.supports(fn));
    ASSERT_FALSE(functions.supports(controller));
    ASSERT_TRUE(controllers.supports(controller));
    ASSERT_FALSE(controllers.supports(fn));
    ASSERT_FALSE(functions.supports(unknown) || controllers.supports(unknown));

    Request request(Method::GET, "/");
    Response response;
    ASSERT_EQ(functions.invoke(request, response, fn)->view_name(), std::string("fn"));
    ASSERT_EQ(controllers.invoke(request, response, controller)->view_name(),
              std::string("static"));
    ASSERT_EQ(controllers.last_modified(request, controller), static_cast<int64_t>(1000));
    ASSERT_EQ(functions.last_modified(request, fn), static_cast<int64_t>(-1));
}

void test_handler_identity()
{
    auto target = std::make_shared<StaticController>();
    Handler a = Handler::of<Controller>(target);
    Handler b = Handler::of<Controller>(target);
    ASSERT_TRUE(a == b);
    ASSERT_TRUE(Handler().empty());
    ASSERT_FALSE(a.empty());
    ASSERT_TRUE(a.as<StaticController>() == nullptr);
}

void test_result_states()
{
    Result result("accounts/show");
    result.add("id", "42").set_status(201);
    ASSERT_TRUE(result.is_reference());
    ASSERT_EQ(*result.status(), 201);
    ASSERT_FALSE(result.was_cleared());

    Result handled = Result::handled();
    ASSERT_TRUE(handled.was_cleared());
    handled.add("late", "x");
    ASSERT_FALSE(handled.was_cleared());

    ASSERT_EQ(Result::redirect("/accounts/42").view_name(), std::string("redirect:/accounts/42"));
    ASSERT_TRUE(Result().empty());
}

/**
 * @brief Redirect targets expand URI variables and optionally carry the model.
 */
void test_redirect_view_target()
{
    Request request(Method::POST, "/accounts/42");
    request.set_attribute(HandlerMapping::URI_VARIABLES_ATTRIBUTE,
                          UriVariables{{"id", "42"}, {"name", "a b"}});
    Response response;

    RedirectView plain("/accounts/{id}/owners/{name}#top");
    plain.render(Model{{"ignored", "1"}}, request, response);
    ASSERT_EQ(response.status(), 302);
    ASSERT_EQ(*response.header("Location"), std::string("/accounts/42/owners/a%20b#top"));

    RedirectView exposing("/accounts/{id}?tab=x#top", 303, true);
    ASSERT_EQ(exposing.target_url(Model{{"saved", "yes"}}, request),
              std::string("/accounts/42?tab=x&saved=yes#top"));
    ASSERT_EQ(exposing.status(), 303);
}

void test_json_view_render()
{
    JsonView view;
    Request request(Method::GET, "/");
    Response response;
    view.render(Model{{"id", "42"}, {"name", "Ada"}}, request, response);

    ASSERT_EQ(response.body(), std::string("{\"id\":\"42\",\"name\":\"Ada\"}"));
    ASSERT_EQ(*response.header("Content-Type"), std::string("application/json"));
}

/**
 * @brief Named views, factory-built views and `redirect:` names.
 */
void test_view_resolvers()
{
    ViewRegistry registry;
    auto home = std::make_shared<conduit::test::TextView>("home");
    registry.register_view("home", home);
    ASSERT_TRUE(registry.resolve_view("home", "en") == home);
    ASSERT_TRUE(registry.resolve_view("missing", "en") == nullptr);

    int created = 0;
    UrlBasedViewResolver resolver("views/", ".txt", [&created](const std::string& url) {
        created++;
        return std::make_shared<conduit::test::TextView>(url);
    });
    resolver.set_redirect_status(303);

    std::shared_ptr<View> first = resolver.resolve_view("accounts/show", "en");
    std::shared_ptr<View> second = resolver.resolve_view("accounts/show", "en");
    ASSERT_TRUE(first == second);
    ASSERT_EQ(created, 1);
    resolver.resolve_view("accounts/show", "de");
    ASSERT_EQ(created, 2);

    auto redirect = std::dynamic_pointer_cast<RedirectView>(
        resolver.resolve_view("redirect:/accounts/42", "en"));
    ASSERT_TRUE(redirect != nullptr);
    ASSERT_EQ(redirect->url(), std::string("/accounts/42"));
    ASSERT_EQ(redirect->status(), 303);

    UrlBasedViewResolver bare;
    ASSERT_TRUE(bare.resolve_view("anything", "en") == nullptr);
}

void test_view_name_translation()
{
    ASSERT_EQ(DefaultViewNameTranslator::transform_path("/accounts/42/"),
              std::string("accounts/42"));
    ASSERT_EQ(DefaultViewNameTranslator::transform_path("/docs/guide.html"),
              std::string("docs/guide"));
    ASSERT_EQ(DefaultViewNameTranslator::transform_path("/v1.2/list"), std::string("v1.2/list"));

    DefaultViewNameTranslator translator("pages/", ".tpl");
    Request request(Method::GET, "/about.html");
    ASSERT_EQ(translator.view_name(request), std::string("pages/about.tpl"));
}

void test_accept_header_locale()
{
    AcceptHeaderLocaleResolver resolver("en");
    Request none(Method::GET, "/");
    ASSERT_EQ(resolver.resolve_locale(none), std::string("en"));

    Request german(Method::GET, "/");
    german.add_header("Accept-Language", "de-CH;q=0.9, en;q=0.5");
    ASSERT_EQ(resolver.resolve_locale(german), std::string("de-CH"));

    Request wildcard(Method::GET, "/");
    wildcard.add_header("Accept-Language", "*");
    ASSERT_EQ(resolver.resolve_locale(wildcard), std::string("en"));
}

/**
 * @brief URL views are named after the path within the mapping.
 */
void test_url_view_controller()
{
    UrlViewController controller("pages/");
    Request request(Method::GET, "/pages/help/faq.html");
    request.set_attribute(HandlerMapping::PATH_WITHIN_MAPPING_ATTRIBUTE,
                          std::string("help/faq.html"));
    Response response;

    std::optional<Result> result = controller.handle_request(request, response);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->view_name(), std::string("pages/help/faq"));
}

/**
 * @brief The default resolver maps known failures to statuses; the mapping
 * resolver maps failure types to error views.
 */
void test_exception_resolvers()
{
    DefaultExceptionResolver defaults;
    Request request(Method::GET, "/missing");

    Response not_found;
    std::optional<Result> handled = defaults.resolve(
        request, not_found, nullptr,
        std::make_exception_ptr(NoHandlerFoundError(Method::GET, "/missing")));
    ASSERT_TRUE(handled.has_value() && handled->was_cleared());
    ASSERT_EQ(not_found.status(), 404);

    Response teapot;
    defaults.resolve(request, teapot, nullptr,
                     std::make_exception_ptr(ResponseStatusError(418, "short and stout")));
    ASSERT_EQ(teapot.status(), 418);

    Response other;
    ASSERT_FALSE(defaults
                     .resolve(request, other, nullptr,
                              std::make_exception_ptr(std::runtime_error("unrelated")))
                     .has_value());

    MappingExceptionResolver mapping;
    mapping.map<std::invalid_argument>("errors/bad-input", 400);
    std::optional<Result> mapped = mapping.resolve(
        request, other, nullptr, std::make_exception_ptr(std::invalid_argument("no id")));
    ASSERT_TRUE(mapped.has_value());
    ASSERT_EQ(mapped->view_name(), std::string("errors/bad-input"));
    ASSERT_EQ(*mapped->status(), 400);
    ASSERT_EQ(mapped->model().at("exception"), std::string("no id"));

    ASSERT_FALSE(mapping
                     .resolve(request, other, nullptr,
                              std::make_exception_ptr(std::runtime_error("x")))
                     .has_value());
    mapping.set_default_view("errors/generic");
    ASSERT_EQ(mapping
                  .resolve(request, other, nullptr,
                           std::make_exception_ptr(std::runtime_error("x")))
                  ->view_name(),
              std::string("errors/generic"));
}

/**
 * @brief A failure that is not a `std::exception` is declined by the default
 * resolver and still reaches the mapping resolver's default view.
 */
void test_exception_resolvers_non_standard_failure()
{
    Request request(Method::GET, "/odd");
    Response response;
    std::exception_ptr odd = std::make_exception_ptr(7);

    DefaultExceptionResolver defaults;
    ASSERT_FALSE(defaults.resolve(request, response, nullptr, odd).has_value());

    MappingExceptionResolver mapping;
    mapping.map<std::invalid_argument>("errors/bad-input", 400);
    ASSERT_FALSE(mapping.resolve(request, response, nullptr, odd).has_value());

    mapping.set_default_view("errors/generic");
    std::optional<Result> mapped = mapping.resolve(request, response, nullptr, odd);
    ASSERT_TRUE(mapped.has_value());
    ASSERT_EQ(mapped->model().at("exception"), std::string("non-standard exception"));
    ASSERT_EQ(response.status(), 200);
}
