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

#include "conduit/web/context.hpp"

namespace conduit::web {

namespace {

thread_local const DispatchContext* bound_context = nullptr;

} // namespace

ContextScope::ContextScope(DispatchContext context)
    : context_(std::move(context)), previous_(bound_context)
{
    bound_context = &context_;
}

ContextScope::~ContextScope()
{
    bound_context = previous_;
}

const DispatchContext* ContextScope::current()
{
    return bound_context;
}

} // namespace conduit::web
