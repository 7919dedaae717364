/* -*- Mode: C++; tab-width: 4; c-basic-offset: 4; indent-tabs-mode: nil -*- */
/*
 *   Copyright 2026 Couchbase, Inc.
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */

#pragma once

#include <tao/json/value.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace lambdatrace::core::lambda
{
/**
 * Derives the identifier of the upstream system that triggered the invocation from the shape of
 * the event.
 *
 * @return the event source ARN, or an empty optional if the event has no recognizable source
 */
auto
classify_event_source(const tao::json::value& event) -> std::optional<std::string>;

/**
 * @return true if the event is an API Gateway Lambda proxy request, i.e. it has `httpMethod`,
 * `path`, `headers` and `requestContext` members
 */
auto
is_api_gateway_proxy_event(const tao::json::value& event) -> bool;

/**
 * @return the status code of an API Gateway Lambda proxy response, if the result is one
 */
auto
proxy_response_status_code(const tao::json::value& result) -> std::optional<std::uint32_t>;
} // namespace lambdatrace::core::lambda
