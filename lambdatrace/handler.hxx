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

#include <lambdatrace/handler_error.hxx>

#include <tao/json/value.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace lambdatrace
{
/**
 * Trailing callback handed to the handler. The first argument is the failure (if any), the
 * second one is the result of the invocation.
 */
using completion_callback =
  std::function<void(std::optional<handler_error> error, tao::json::value result)>;

/**
 * The invocation-context object supplied by the host for each call of the handler.
 *
 * Besides the identity of the invoked function, it exposes three of the four completion
 * conventions: `done(error, result)`, `succeed(result)` and `fail(error)`. The fourth one is the
 * trailing callback passed next to the context.
 */
struct invocation_context {
  std::string function_name{};
  std::string function_version{};
  std::string invoked_function_arn{};
  std::string memory_limit_in_mb{};
  std::string aws_request_id{};
  std::string log_group_name{};
  std::string log_stream_name{};

  std::function<void(std::optional<handler_error> error, tao::json::value result)> done{};
  std::function<void(tao::json::value result)> succeed{};
  std::function<void(std::optional<handler_error> error)> fail{};
};

/**
 * Signature of a serverless function handler.
 */
using handler = std::function<void(const tao::json::value& event,
                                   std::shared_ptr<invocation_context> context,
                                   completion_callback callback)>;
} // namespace lambdatrace
