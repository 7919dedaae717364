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

#include <lambdatrace/agent_options.hxx>
#include <lambdatrace/error_codes.hxx>

#include "core/logger/logger.hxx"
#include "core/utils/json.hxx"

#include <tao/json/value.hpp>

namespace lambdatrace
{
namespace
{
auto
decode_string_list(const tao::json::value& list, std::vector<std::string>& out) -> bool
{
  if (!list.is_array()) {
    return false;
  }
  std::vector<std::string> values;
  for (const auto& entry : list.get_array()) {
    if (!entry.is_string()) {
      return false;
    }
    values.emplace_back(entry.get_string());
  }
  out = std::move(values);
  return true;
}

auto
decode_attributes(const tao::json::value& doc, attribute_options& out) -> bool
{
  if (!doc.is_object()) {
    return false;
  }
  if (const auto* enabled = doc.find("enabled"); enabled != nullptr) {
    if (!enabled->is_boolean()) {
      return false;
    }
    out.enabled = enabled->get_boolean();
  }
  if (const auto* include = doc.find("include");
      include != nullptr && !decode_string_list(*include, out.include)) {
    return false;
  }
  if (const auto* exclude = doc.find("exclude");
      exclude != nullptr && !decode_string_list(*exclude, out.exclude)) {
    return false;
  }
  return true;
}

auto
decode_error_collector(const tao::json::value& doc, error_collector_options& out) -> bool
{
  if (!doc.is_object()) {
    return false;
  }
  if (const auto* enabled = doc.find("enabled"); enabled != nullptr) {
    if (!enabled->is_boolean()) {
      return false;
    }
    out.enabled = enabled->get_boolean();
  }
  if (const auto* samples = doc.find("max_trace_samples"); samples != nullptr) {
    if (!samples->is_integer() || samples->as<std::int64_t>() < 0) {
      return false;
    }
    out.max_trace_samples = samples->as<std::size_t>();
  }
  if (const auto* policy = doc.find("overflow_policy"); policy != nullptr) {
    if (!policy->is_string()) {
      return false;
    }
    if (policy->get_string() == "drop_newest") {
      out.overflow_policy = error_overflow_policy::drop_newest;
    } else if (policy->get_string() == "drop_oldest") {
      out.overflow_policy = error_overflow_policy::drop_oldest;
    } else {
      return false;
    }
  }
  if (const auto* expected = doc.find("expected_classes");
      expected != nullptr && !decode_string_list(*expected, out.expected_classes)) {
    return false;
  }
  if (const auto* ignored = doc.find("ignore_classes");
      ignored != nullptr && !decode_string_list(*ignored, out.ignore_classes)) {
    return false;
  }
  if (const auto* server_errors = doc.find("capture_server_errors"); server_errors != nullptr) {
    if (!server_errors->is_boolean()) {
      return false;
    }
    out.capture_server_errors = server_errors->get_boolean();
  }
  return true;
}
} // namespace

auto
attribute_options::default_exclude() -> std::vector<std::string>
{
  return {
    "request.headers.cookie",          "request.headers.authorization",
    "request.headers.proxyAuthorization", "request.headers.setCookie*",
    "request.headers.x*",              "response.headers.cookie",
    "response.headers.authorization",  "response.headers.proxyAuthorization",
    "response.headers.setCookie*",     "response.headers.x*",
  };
}

auto
agent_options::from_json(const tao::json::value& document)
  -> tl::expected<agent_options, std::error_code>
{
  if (!document.is_object()) {
    return tl::unexpected(errc::agent::invalid_configuration);
  }

  agent_options options{};
  if (const auto* group = document.find("transaction_group"); group != nullptr) {
    if (!group->is_string() || group->get_string().empty()) {
      LT_LOG_WARNING("\"transaction_group\" must be a non-empty string");
      return tl::unexpected(errc::agent::invalid_configuration);
    }
    options.transaction_group = group->get_string();
  }
  if (const auto* apdex_t = document.find("apdex_t"); apdex_t != nullptr) {
    if (!apdex_t->is_number()) {
      LT_LOG_WARNING("\"apdex_t\" must be a number of seconds");
      return tl::unexpected(errc::agent::invalid_configuration);
    }
    options.apdex_t = std::chrono::milliseconds{ static_cast<std::int64_t>(
      apdex_t->as<double>() * 1000) };
  }
  if (const auto* interval = document.find("harvest_interval"); interval != nullptr) {
    if (!interval->is_integer() || interval->as<std::int64_t>() <= 0) {
      LT_LOG_WARNING("\"harvest_interval\" must be a positive number of milliseconds");
      return tl::unexpected(errc::agent::invalid_configuration);
    }
    options.harvest_interval = std::chrono::milliseconds{ interval->as<std::int64_t>() };
  }
  if (const auto* attributes = document.find("attributes");
      attributes != nullptr && !decode_attributes(*attributes, options.attributes)) {
    LT_LOG_WARNING("unable to decode \"attributes\" section of agent options");
    return tl::unexpected(errc::agent::invalid_configuration);
  }
  if (const auto* errors = document.find("error_collector");
      errors != nullptr && !decode_error_collector(*errors, options.error_collector)) {
    LT_LOG_WARNING("unable to decode \"error_collector\" section of agent options");
    return tl::unexpected(errc::agent::invalid_configuration);
  }
  return options;
}

auto
agent_options::from_json(std::string_view document) -> tl::expected<agent_options, std::error_code>
{
  tao::json::value parsed;
  try {
    parsed = core::utils::json::parse(document);
  } catch (const std::exception& e) {
    LT_LOG_WARNING("unable to parse agent options: {}", e.what());
    return tl::unexpected(errc::agent::invalid_configuration);
  }
  return from_json(parsed);
}
} // namespace lambdatrace
