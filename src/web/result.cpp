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
 * @file result.cpp
 * @brief Implementation of the handler result value.
 */

#include "conduit/web/result.hpp"

namespace conduit::web {

const char* const Result::REDIRECT_PREFIX = "redirect:";

Result::Result() : cleared_(false) {}

Result::Result(const std::string& view_name) : view_name_(view_name), cleared_(false) {}

Result::Result(const std::string& view_name, http::Model model)
    : view_name_(view_name), model_(std::move(model)), cleared_(false)
{
}

Result::Result(std::shared_ptr<View> view) : view_(std::move(view)), cleared_(false) {}

Result Result::redirect(const std::string& target)
{
    return Result(REDIRECT_PREFIX + target);
}

Result Result::handled()
{
    Result result;
    result.clear();
    return result;
}

const std::string& Result::view_name() const
{
    return view_name_;
}

void Result::set_view_name(const std::string& name)
{
    view_name_ = name;
    view_.reset();
    cleared_ = false;
}

const std::shared_ptr<View>& Result::view() const
{
    return view_;
}

void Result::set_view(std::shared_ptr<View> view)
{
    view_ = std::move(view);
    view_name_.clear();
    cleared_ = false;
}

bool Result::is_reference() const
{
    return !view_name_.empty();
}

bool Result::has_view() const
{
    return !view_name_.empty() || view_ != nullptr;
}

http::Model& Result::model()
{
    return model_;
}

const http::Model& Result::model() const
{
    return model_;
}

Result& Result::add(const std::string& name, const std::string& value)
{
    model_[name] = value;
    return *this;
}

const std::optional<int>& Result::status() const
{
    return status_;
}

void Result::set_status(int status)
{
    status_ = status;
}

flash::FlashState& Result::flash()
{
    return flash_;
}

const flash::FlashState& Result::flash() const
{
    return flash_;
}

bool Result::empty() const
{
    return !has_view() && model_.empty();
}

void Result::clear()
{
    view_name_.clear();
    view_.reset();
    model_.clear();
    status_.reset();
    cleared_ = true;
}

bool Result::was_cleared() const
{
    return cleared_ && empty();
}

std::string Result::to_string() const
{
    std::string out = "Result [";
    if (is_reference()) {
        out += "view=\"" + view_name_ + "\"";
    } else if (view_) {
        out += "view=<instance>";
    } else {
        out += "view=null";
    }
    out += "; model={";
    bool first = true;
    for (const auto& entry : model_) {
        out += (first ? "" : ", ") + entry.first + "=" + entry.second;
        first = false;
    }
    return out + "}]";
}

} // namespace conduit::web
