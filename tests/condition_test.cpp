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
 * @file condition_test.cpp
 * @brief Tests for request conditions and the URL pattern matcher.
 *
 * @details
 * Verifies the three condition operations (combine, matching, compare_to)
 * on each concrete condition, and pattern matching, extraction and ranking
 * in `PathMatcher`.
 */

#include "conduit/condition/headers_condition.hpp"
#include "conduit/condition/mapping_info.hpp"
#include "conduit/condition/media_type_conditions.hpp"
#include "conduit/condition/methods_condition.hpp"
#include "conduit/condition/params_condition.hpp"
#include "conduit/condition/path_matcher.hpp"
#include "conduit/condition/patterns_condition.hpp"
#include "conduit/http/request.hpp"
#include "framework.hpp"

#include <optional>
#include <string>
#include <vector>

using namespace conduit::condition;
using conduit::http::Method;
using conduit::http::Request;

namespace {
using Strings = std::vector<std::string>;
}

/**
 * @brief `combine` is the union of both expression sets, in either order.
 */
void test_params_combine_is_union()
{
    ParamsCondition a(Strings{"x=1", "y"});
    ParamsCondition b(Strings{"y", "!z"});

    ParamsCondition ab = a.combine(b);
    ParamsCondition ba = b.combine(a);

    ASSERT_EQ(ab.size(), static_cast<size_t>(3));
    ASSERT_TRUE(ab == ba);
    ASSERT_TRUE(a.combine(ParamsCondition()) == a);
}

/**
 * @brief `matching` fails as soon as one expression is unsatisfied.
 */
void test_params_matching()
{
    ParamsCondition condition(Strings{"view=full", "!debug"});

    Request ok(Method::GET, "/accounts?view=full");
    ASSERT_TRUE(condition.matching(ok).has_value());

    Request wrong_value(Method::GET, "/accounts?view=brief");
    ASSERT_FALSE(condition.matching(wrong_value).has_value());

    Request negated(Method::GET, "/accounts?view=full&debug=1");
    ASSERT_FALSE(condition.matching(negated).has_value());

    Request missing(Method::GET, "/accounts");
    ASSERT_FALSE(condition.matching(missing).has_value());
}

/**
 * @brief The condition with more expressions ranks first.
 */
void test_params_compare_more_specific_first()
{
    Request request(Method::GET, "/accounts?a=1&b=2");
    ParamsCondition one(Strings{"a"});
    ParamsCondition two(Strings{"a", "b=2"});

    ASSERT_TRUE(two.compare_to(one, request) < 0);
    ASSERT_TRUE(one.compare_to(two, request) > 0);
    ASSERT_EQ(one.compare_to(one, request), 0);
}

void test_headers_case_insensitive_names()
{
    HeadersCondition condition(Strings{"X-Api-Version=2"});
    Request request(Method::GET, "/");
    request.add_header("x-api-version", "2");

    ASSERT_TRUE(condition.matching(request).has_value());
    ASSERT_TRUE(HeadersCondition(Strings{"x-api-version=2"}) == condition);
}

/**
 * @brief Methods form a disjunction; HEAD falls back to GET.
 */
void test_methods_matching()
{
    MethodsCondition condition({Method::GET, Method::POST});

    Request post(Method::POST, "/");
    std::optional<MethodsCondition> reduced = condition.matching(post);
    ASSERT_TRUE(reduced.has_value());
    ASSERT_EQ(reduced->methods().size(), static_cast<size_t>(1));
    ASSERT_TRUE(reduced->methods()[0] == Method::POST);

    Request head(Method::HEAD, "/");
    ASSERT_TRUE(condition.matching(head).has_value());

    Request del(Method::DELETE, "/");
    ASSERT_FALSE(condition.matching(del).has_value());
    ASSERT_TRUE(MethodsCondition().matching(del).has_value());
}

void test_consumes_and_produces()
{
    ConsumesCondition consumes(Strings{"application/json"});
    Request json(Method::POST, "/");
    json.add_header("Content-Type", "application/json; charset=utf-8");
    ASSERT_TRUE(consumes.matching(json).has_value());

    Request form(Method::POST, "/");
    form.add_header("Content-Type", "application/x-www-form-urlencoded");
    ASSERT_FALSE(consumes.matching(form).has_value());

    ProducesCondition produces(Strings{"text/html", "application/json"});
    Request accept(Method::GET, "/");
    accept.add_header("Accept", "application/json");
    std::optional<ProducesCondition> reduced = produces.matching(accept);
    ASSERT_TRUE(reduced.has_value());
    ASSERT_EQ(reduced->expressions().size(), static_cast<size_t>(1));

    Request any(Method::GET, "/");
    ASSERT_TRUE(produces.matching(any).has_value());
}

/**
 * @brief Pattern matching captures template variables and handles wildcards.
 */
void test_path_matcher_match()
{
    UriVariables vars;
    ASSERT_TRUE(PathMatcher::match("/accounts/{id}", "/accounts/42", &vars));
    ASSERT_EQ(vars["id"], std::string("42"));

    ASSERT_TRUE(PathMatcher::match("/files/**", "/files/a/b/c.txt"));
    ASSERT_TRUE(PathMatcher::match("/files/**", "/files"));
    ASSERT_TRUE(PathMatcher::match("/*.html", "/index.html"));
    ASSERT_TRUE(PathMatcher::match("/v?/ping", "/v2/ping"));
    ASSERT_FALSE(PathMatcher::match("/accounts/{id:[0-9]+}", "/accounts/abc"));
    ASSERT_FALSE(PathMatcher::match("/accounts/*", "/accounts/1/2"));
}

void test_path_matcher_extract_and_combine()
{
    ASSERT_EQ(PathMatcher::extract_path_within_pattern("/docs/**", "/docs/guide/intro.html"),
              std::string("guide/intro.html"));
    ASSERT_EQ(PathMatcher::extract_path_within_pattern("/docs/index", "/docs/index"),
              std::string(""));
    ASSERT_EQ(PathMatcher::combine("/accounts", "{id}"), std::string("/accounts/{id}"));
    ASSERT_EQ(PathMatcher::combine("/accounts/*", "/list"), std::string("/accounts/list"));
    ASSERT_EQ(PathMatcher::combine("", "ping"), std::string("/ping"));
}

/**
 * @brief Exact beats variables, fewer wildcards beat more, catch-all ranks last.
 */
void test_path_matcher_compare()
{
    std::string path = "/accounts/new";
    ASSERT_TRUE(PathMatcher::compare("/accounts/new", "/accounts/{id}", path) < 0);
    ASSERT_TRUE(PathMatcher::compare("/accounts/{id}", "/accounts/**", path) < 0);
    ASSERT_TRUE(PathMatcher::compare("/**", "/accounts/**", path) > 0);
    ASSERT_TRUE(PathMatcher::compare("/accounts/{id}", "/{type}/{id}", path) < 0);
}

void test_patterns_matching_sorts_best_first()
{
    PatternsCondition condition(Strings{"/accounts/**", "/accounts/{id}", "/other"});
    Request request(Method::GET, "/accounts/7");

    std::optional<PatternsCondition> reduced = condition.matching(request);
    ASSERT_TRUE(reduced.has_value());
    ASSERT_EQ(reduced->patterns().size(), static_cast<size_t>(2));
    ASSERT_EQ(reduced->patterns()[0], std::string("/accounts/{id}"));

    PatternsCondition joined =
        PatternsCondition(Strings{"/api"}).concat(PatternsCondition(Strings{"/a", "/b"}));
    ASSERT_EQ(joined.patterns().size(), static_cast<size_t>(2));
    ASSERT_EQ(joined.patterns()[1], std::string("/api/b"));
}

/**
 * @brief A mapping with more discrete expressions outranks one with fewer,
 * regardless of how specific its URL pattern is.
 */
void test_mapping_info_ranking()
{
    Request request(Method::GET, "/accounts/42?view=full");

    RequestMappingInfo plain = RequestMappingInfo::paths({"/accounts/42"}).build();
    RequestMappingInfo with_params =
        RequestMappingInfo::paths({"/accounts/{id}"}).params({"view=full"}).build();

    std::optional<RequestMappingInfo> a = plain.matching(request);
    std::optional<RequestMappingInfo> b = with_params.matching(request);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    ASSERT_TRUE(b->compare_to(*a, request) < 0);

    RequestMappingInfo exact = RequestMappingInfo::paths({"/accounts/42"}).build();
    RequestMappingInfo variable = RequestMappingInfo::paths({"/accounts/{id}"}).build();
    ASSERT_TRUE(exact.matching(request)->compare_to(*variable.matching(request), request) < 0);
}

void test_mapping_info_combine()
{
    RequestMappingInfo type_level =
        RequestMappingInfo::paths({"/accounts"}).headers({"X-Tenant"}).build();
    RequestMappingInfo method_level = RequestMappingInfo::paths({"/{id}"})
                                          .methods({Method::GET})
                                          .produces({"application/json"})
                                          .build();

    RequestMappingInfo combined = type_level.combine(method_level);
    ASSERT_EQ(combined.patterns().patterns()[0], std::string("/accounts/{id}"));
    ASSERT_EQ(combined.headers().size(), static_cast<size_t>(1));
    ASSERT_EQ(combined.methods().methods().size(), static_cast<size_t>(1));

    Request request(Method::GET, "/accounts/9");
    ASSERT_FALSE(combined.matching(request).has_value());
    request.add_header("X-Tenant", "acme");
    ASSERT_TRUE(combined.matching(request).has_value());
}
