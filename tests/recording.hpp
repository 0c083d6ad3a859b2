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
 * @file recording.hpp
 * @brief Test doubles shared by the dispatch-level test suites.
 */

#pragma once

#include "conduit/web/interceptor.hpp"
#include "conduit/web/view.hpp"

#include <memory>
#include <string>
#include <vector>

namespace conduit::test {

/// @brief Ordered log of lifecycle callbacks, shared by several doubles.
using Journal = std::shared_ptr<std::vector<std::string>>;

inline Journal make_journal()
{
    return std::make_shared<std::vector<std::string>>();
}

/**
 * @brief Interceptor that appends `<phase>:<name>` to a journal.
 *
 * `pre_handle` returns `proceed`. When `after_completion` receives an
 * error, the entry is suffixed with `!`.
 */
class RecordingInterceptor : public web::HandlerInterceptor {
  public:
    RecordingInterceptor(std::string name, Journal journal, bool proceed = true)
        : name_(std::move(name)), journal_(std::move(journal)), proceed_(proceed)
    {
    }

    bool pre_handle(http::Request&, http::Response&, const web::Handler&) override
    {
        journal_->push_back("pre:" + name_);
        return proceed_;
    }

    void post_handle(http::Request&, http::Response&, const web::Handler&,
                     web::Result*) override
    {
        journal_->push_back("post:" + name_);
    }

    void after_completion(http::Request&, http::Response&, const web::Handler&,
                          std::exception_ptr error) override
    {
        journal_->push_back("after:" + name_ + (error ? "!" : ""));
    }

    void after_async_started(http::Request&, http::Response&, const web::Handler&) override
    {
        journal_->push_back("async:" + name_);
    }

  private:
    std::string name_;
    Journal journal_;
    bool proceed_;
};

/**
 * @brief View that writes `name` and the sorted model as `k=v;` pairs.
 */
class TextView : public web::View {
  public:
    explicit TextView(std::string name) : name_(std::move(name)) {}

    std::string content_type() const override
    {
        return "text/plain";
    }

    void render(const http::Model& model, http::Request&, http::Response& response) override
    {
        std::string out = name_ + "|";
        for (const auto& entry : model) {
            out += entry.first + "=" + entry.second + ";";
        }
        response.write(out);
    }

  private:
    std::string name_;
};

/// @brief Joins journal entries with spaces, for compact assertions.
inline std::string joined(const Journal& journal)
{
    std::string out;
    for (const std::string& entry : *journal) {
        if (!out.empty()) {
            out += ' ';
        }
        out += entry;
    }
    return out;
}

} // namespace conduit::test
