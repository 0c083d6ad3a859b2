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
 * @file flash_state.cpp
 * @brief Flash state matching, ordering and JSON persistence.
 */

#include "conduit/flash/flash_state.hpp"

#include "conduit/infra/json.hpp"

#include <algorithm>
#include <stdexcept>

namespace conduit::flash {

using infra::ScopedJson;

namespace {

std::string strip_trailing_slash(const std::string& path)
{
    if (path.size() > 1 && path.back() == '/') {
        return path.substr(0, path.size() - 1);
    }
    return path;
}

} // namespace

FlashState::FlashState() : expiration_time_(NO_EXPIRATION) {}

void FlashState::put(const std::string& name, const std::string& value)
{
    attributes_[name] = value;
}

std::optional<std::string> FlashState::get(const std::string& name) const
{
    auto it = attributes_.find(name);
    if (it == attributes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool FlashState::contains(const std::string& name) const
{
    return attributes_.count(name) > 0;
}

const std::map<std::string, std::string>& FlashState::attributes() const
{
    return attributes_;
}

bool FlashState::empty() const
{
    return attributes_.empty();
}

void FlashState::set_target_path(const std::string& path)
{
    if (path.empty()) {
        target_path_.reset();
    } else {
        target_path_ = path;
    }
}

const std::optional<std::string>& FlashState::target_path() const
{
    return target_path_;
}

FlashState& FlashState::add_target_param(const std::string& name, const std::string& value)
{
    if (!name.empty() && !value.empty()) {
        target_params_[name].push_back(value);
    }
    return *this;
}

const http::ParamMap& FlashState::target_params() const
{
    return target_params_;
}

size_t FlashState::target_param_count() const
{
    size_t count = 0;
    for (const auto& entry : target_params_) {
        count += entry.second.size();
    }
    return count;
}

bool FlashState::matches(const http::Request& request) const
{
    if (target_path_ &&
        strip_trailing_slash(*target_path_) != strip_trailing_slash(request.path())) {
        return false;
    }

    for (const auto& expected : target_params_) {
        auto actual = request.params().find(expected.first);
        if (actual == request.params().end()) {
            return false;
        }
        for (const std::string& value : expected.second) {
            if (std::find(actual->second.begin(), actual->second.end(), value) ==
                actual->second.end()) {
                return false;
            }
        }
    }
    return true;
}

void FlashState::start_expiration(int ttl_seconds, int64_t now_millis)
{
    expiration_time_ = now_millis + static_cast<int64_t>(ttl_seconds) * 1000;
}

void FlashState::set_expiration_time(int64_t epoch_millis)
{
    expiration_time_ = epoch_millis;
}

int64_t FlashState::expiration_time() const
{
    return expiration_time_;
}

bool FlashState::is_expired(int64_t now_millis) const
{
    return expiration_time_ != NO_EXPIRATION && now_millis > expiration_time_;
}

int FlashState::compare_to(const FlashState& other) const
{
    int this_path = target_path_ ? 1 : 0;
    int other_path = other.target_path_ ? 1 : 0;
    if (this_path != other_path) {
        return other_path - this_path;
    }
    return static_cast<int>(other.target_param_count()) -
           static_cast<int>(target_param_count());
}

/**
 * @brief Encodes the state as
 * `{"attributes":{},"target_path":null,"target_params":{},"expires_at":-1}`.
 */
std::string FlashState::to_json() const
{
    ScopedJson root(cJSON_CreateObject());

    cJSON* attrs = cJSON_AddObjectToObject(root.get(), "attributes");
    for (const auto& entry : attributes_) {
        cJSON_AddStringToObject(attrs, entry.first.c_str(), entry.second.c_str());
    }

    if (target_path_) {
        cJSON_AddStringToObject(root.get(), "target_path", target_path_->c_str());
    } else {
        cJSON_AddNullToObject(root.get(), "target_path");
    }

    cJSON* params = cJSON_AddObjectToObject(root.get(), "target_params");
    for (const auto& entry : target_params_) {
        cJSON* values = cJSON_AddArrayToObject(params, entry.first.c_str());
        for (const std::string& v : entry.second) {
            cJSON_AddItemToArray(values, cJSON_CreateString(v.c_str()));
        }
    }

    cJSON_AddNumberToObject(root.get(), "expires_at", static_cast<double>(expiration_time_));
    return root.print();
}

FlashState FlashState::from_json(const std::string& text)
{
    ScopedJson root(cJSON_Parse(text.c_str()));
    if (!root || !cJSON_IsObject(root.get())) {
        throw std::invalid_argument("Flash state payload is not a JSON object");
    }

    FlashState state;

    cJSON* attrs = cJSON_GetObjectItemCaseSensitive(root.get(), "attributes");
    cJSON* item = nullptr;
    if (cJSON_IsObject(attrs)) {
        cJSON_ArrayForEach(item, attrs)
        {
            if (cJSON_IsString(item) && item->string) {
                state.put(item->string, item->valuestring);
            }
        }
    }

    cJSON* path = cJSON_GetObjectItemCaseSensitive(root.get(), "target_path");
    if (cJSON_IsString(path)) {
        state.set_target_path(path->valuestring);
    }

    cJSON* params = cJSON_GetObjectItemCaseSensitive(root.get(), "target_params");
    if (cJSON_IsObject(params)) {
        cJSON_ArrayForEach(item, params)
        {
            cJSON* value = nullptr;
            if (!cJSON_IsArray(item) || !item->string) {
                continue;
            }
            cJSON_ArrayForEach(value, item)
            {
                if (cJSON_IsString(value)) {
                    state.add_target_param(item->string, value->valuestring);
                }
            }
        }
    }

    cJSON* expires = cJSON_GetObjectItemCaseSensitive(root.get(), "expires_at");
    if (cJSON_IsNumber(expires)) {
        state.set_expiration_time(static_cast<int64_t>(expires->valuedouble));
    }

    return state;
}

std::string FlashState::to_string() const
{
    std::string out = "FlashState[attributes={";
    bool first = true;
    for (const auto& entry : attributes_) {
        out += (first ? "" : ", ") + entry.first + "=" + entry.second;
        first = false;
    }
    out += "}, target_path=" + target_path_.value_or("null") + ", target_params={";
    first = true;
    for (const auto& entry : target_params_) {
        for (const std::string& v : entry.second) {
            out += (first ? "" : ", ") + entry.first + "=" + v;
            first = false;
        }
    }
    return out + "}]";
}

bool FlashState::operator==(const FlashState& other) const
{
    return attributes_ == other.attributes_ && target_path_ == other.target_path_ &&
           target_params_ == other.target_params_;
}

} // namespace conduit::flash
