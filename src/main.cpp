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
 * @file main.cpp
 * @brief Application Entry Point (Bootstrap).
 *
 * @details
 * This file contains the `main` function which orchestrates the startup sequence:
 * 1. Argument Parsing and settings loading.
 * 2. Signal Handling Registration (SIGINT/SIGTERM).
 * 3. Dispatcher wiring (mappings, interceptors, views, flash).
 * 4. Main Event Loop Execution.
 *
 * The wired routes form a small demo application:
 * - `GET /` plain text greeting written directly by the handler.
 * - `GET /accounts/{id}` JSON account view, conditional GET aware.
 * - `POST /accounts/{id}` redirect back to the account with a flash message.
 * - `GET /reports/{name}` async report produced on the worker pool.
 * - `GET /pages/**` view named after the URL.
 */

#include "conduit/async/async_manager.hpp"
#include "conduit/condition/path_matcher.hpp"
#include "conduit/config/settings.hpp"
#include "conduit/flash/session_flash_store.hpp"
#include "conduit/infra/logger.hpp"
#include "conduit/infra/time.hpp"
#include "conduit/mapping/request_mapping_handler_mapping.hpp"
#include "conduit/mapping/url_handler_mapping.hpp"
#include "conduit/network/server.hpp"
#include "conduit/web/controller.hpp"
#include "conduit/web/function_adapter.hpp"
#include "conduit/web/json_view.hpp"
#include "conduit/web/view_resolvers.hpp"

#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

using namespace conduit;

/// @brief Global pointer to the active server instance (used by the signal handler).
static network::Server* g_server = nullptr;

void signal_handler(int signum)
{
    infra::Logger::log(infra::LogLevel::WARN, "System: Interrupt received (Signal " +
                                                  std::to_string(signum) +
                                                  "). Initiating graceful shutdown...");
    if (g_server) {
        g_server->stop();
    }
}

void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [CONFIG_FILE] [PORT]\n"
              << "Options:\n"
              << "  CONFIG_FILE JSON settings file (Default: built-in settings)\n"
              << "  PORT        TCP port to listen on, overrides the file (Default: 8080)\n"
              << "  --help      Show this help message\n";
}

namespace {

/**
 * @brief Demo controller serving one account; the start time of the process
 * stands in for the last modification.
 */
class AccountController : public web::Controller, public web::LastModified {
  public:
    AccountController() : started_(infra::Time::now_millis()) {}

    std::optional<web::Result> handle_request(http::Request& request, http::Response&) override
    {
        const auto* vars = request.attribute_as<condition::UriVariables>(
            mapping::HandlerMapping::URI_VARIABLES_ATTRIBUTE);
        web::Result result("account");
        result.add("id", vars ? vars->at("id") : "");
        if (request.model().count("message") == 0) {
            result.add("message", "");
        }
        return result;
    }

    int64_t last_modified(const http::Request&) const override
    {
        return started_;
    }

  private:
    int64_t started_;
};

/// @brief Logs how long each handler took.
class TimingInterceptor : public web::HandlerInterceptor {
  public:
    bool pre_handle(http::Request& request, http::Response&, const web::Handler&) override
    {
        request.set_attribute("timing.start", infra::Time::now_millis());
        return true;
    }

    void after_completion(http::Request& request, http::Response&, const web::Handler& handler,
                          std::exception_ptr) override
    {
        const int64_t* start = request.attribute_as<int64_t>("timing.start");
        if (start) {
            infra::Logger::log(infra::LogLevel::DEBUG,
                               "[" + request.id() + "] " + handler.description() + " took " +
                                   std::to_string(infra::Time::now_millis() - *start) + "ms");
        }
    }
};

void wire(web::Dispatcher& dispatcher, const config::Settings& settings)
{
    using condition::RequestMappingInfo;
    using http::Method;

    auto mapping = std::make_shared<mapping::RequestMappingHandlerMapping>();
    mapping->set_order(0);
    mapping->add_interceptor({"/accounts/**"}, {}, std::make_shared<TimingInterceptor>());

    mapping->register_handler(RequestMappingInfo::paths({"/"}).methods({Method::GET}).build(),
                              web::function_handler(
                                  [](http::Request&, http::Response& response) {
                                      response.set_content_type("text/plain; charset=utf-8");
                                      response.write("Conduit is running.\n");
                                      return std::optional<web::Result>();
                                  },
                                  "home"));

    mapping->register_handler(
        RequestMappingInfo::paths({"/accounts/{id}"}).methods({Method::GET}).build(),
        web::Handler::of<web::Controller>(std::make_shared<AccountController>(), "show_account"));

    mapping->register_handler(
        RequestMappingInfo::paths({"/accounts/{id}"}).methods({Method::POST}).build(),
        web::function_handler(
            [](http::Request&, http::Response&) {
                web::Result result = web::Result::redirect("/accounts/{id}");
                result.flash().put("message", "Account updated");
                return std::optional<web::Result>(result);
            },
            "update_account"));

    mapping->register_handler(
        RequestMappingInfo::paths({"/reports/{name}"}).methods({Method::GET}).build(),
        web::function_handler(
            [](http::Request& request, http::Response&) {
                const auto* vars = request.attribute_as<condition::UriVariables>(
                    mapping::HandlerMapping::URI_VARIABLES_ATTRIBUTE);
                std::string name = vars ? vars->at("name") : "";
                request.async().start_callable([name]() {
                    std::this_thread::sleep_for(std::chrono::milliseconds(100));
                    web::Result result("report");
                    result.add("name", name);
                    result.add("generated_at", std::to_string(infra::Time::now_millis()));
                    return std::optional<web::Result>(result);
                });
                return std::optional<web::Result>();
            },
            "report"));

    auto pages = std::make_shared<mapping::UrlHandlerMapping>();
    pages->set_order(1);
    pages->register_handler("/pages/**", web::Handler::of<web::Controller>(
                                             std::make_shared<web::UrlViewController>("pages/"),
                                             "pages"));

    dispatcher.add_handler_mapping(mapping);
    dispatcher.add_handler_mapping(pages);

    auto json = std::make_shared<web::JsonView>();
    auto registry = std::make_shared<web::ViewRegistry>();
    registry->register_view("account", json);
    registry->register_view("report", json);
    dispatcher.add_view_resolver(registry);
    dispatcher.add_view_resolver(std::make_shared<web::UrlBasedViewResolver>(
        "", "", [json](const std::string&) { return json; }));

    dispatcher.set_flash_manager(std::make_shared<flash::FlashManager>(
        std::make_shared<flash::SessionFlashStore>(), settings.flash_ttl_seconds));
    dispatcher.set_throw_if_no_handler_found(settings.throw_if_no_handler_found);
    dispatcher.set_async_timeout(std::chrono::milliseconds(settings.async_timeout_ms));
    dispatcher.add_event_listener([](const web::RequestHandledEvent& event) {
        infra::Logger::log(infra::LogLevel::INFO, event.to_string());
    });
}

} // namespace

/**
 * @brief Main Execution Entry Point.
 */
int main(int argc, char* argv[])
{
    if (argc > 1 && std::string(argv[1]) == "--help") {
        print_help(argv[0]);
        return 0;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        config::Settings settings;
        if (argc > 1) {
            settings = config::Settings::load_file(argv[1]);
        }
        if (argc > 2) {
            settings.port = std::stoi(argv[2]);
        }
        infra::Logger::set_level(settings.log_level);

        infra::Logger::log(infra::LogLevel::INFO, "System: Booting Conduit...");
        infra::Logger::log(infra::LogLevel::INFO,
                           "Config: Flash state expires after " +
                               std::to_string(settings.flash_ttl_seconds) + "s, async after " +
                               std::to_string(settings.async_timeout_ms) + "ms");

        web::Dispatcher dispatcher;
        wire(dispatcher, settings);

        network::Server server(dispatcher, settings.port, settings.worker_threads);
        g_server = &server;

        // Blocks until stop() is called from the signal handler.
        server.run();
        g_server = nullptr;
    } catch (const std::exception& e) {
        infra::Logger::log(infra::LogLevel::FATAL,
                           "System: Critical Failure: " + std::string(e.what()));
        return 1;
    }

    infra::Logger::log(infra::LogLevel::INFO, "System: Shutdown complete.");
    return 0;
}
