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

#include <tao/json/forward.hpp>
#include <tl/expected.hpp>

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace lambdatrace
{
/**
 * What the error aggregator does with a new error once the retention cap is reached.
 */
enum class error_overflow_policy {
  /**
   * Keep the retained errors, reject the incoming one.
   */
  drop_newest,

  /**
   * Evict the oldest retained error to make room for the incoming one.
   */
  drop_oldest,
};

struct attribute_options {
  static auto default_exclude() -> std::vector<std::string>;

  /**
   * When disabled, no attribute reaches any destination.
   */
  bool enabled{ true };

  /**
   * Patterns (exact key or prefix ending with '*') that make a key visible in every destination.
   * This is the only way to collect `request.parameters.*`.
   */
  std::vector<std::string> include{};

  /**
   * Patterns (exact key or prefix ending with '*') that hide a key from every destination.
   */
  std::vector<std::string> exclude{ default_exclude() };
};

struct error_collector_options {
  static constexpr std::size_t default_max_trace_samples{ 20 };

  bool enabled{ true };
  std::size_t max_trace_samples{ default_max_trace_samples };
  error_overflow_policy overflow_policy{ error_overflow_policy::drop_newest };

  /**
   * Errors with these class names are captured with `error.expected` set to true.
   */
  std::vector<std::string> expected_classes{};

  /**
   * Errors with these class names are never captured.
   */
  std::vector<std::string> ignore_classes{};

  /**
   * Notice an error when a web invocation responds with a 5xx status code.
   */
  bool capture_server_errors{ true };
};

struct agent_options {
  /**
   * Group used to build the transaction name `<group>/<function name>`.
   */
  std::string transaction_group{ "Function" };

  /**
   * Apdex threshold of web transactions.
   */
  std::chrono::milliseconds apdex_t{ 100 };

  /**
   * Period of the background harvest, once the agent has been started.
   */
  std::chrono::milliseconds harvest_interval{ std::chrono::seconds{ 60 } };

  attribute_options attributes{};
  error_collector_options error_collector{};

  /**
   * Decodes options from a JSON document. Members that are not present keep their defaults.
   *
   * @return the options, or errc::agent::invalid_configuration if a member has the wrong type
   */
  static auto from_json(const tao::json::value& document)
    -> tl::expected<agent_options, std::error_code>;

  /**
   * Same as above, but parses the document first.
   */
  static auto from_json(std::string_view document)
    -> tl::expected<agent_options, std::error_code>;
};
} // namespace lambdatrace
