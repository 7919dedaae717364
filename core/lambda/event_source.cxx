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

#include "event_source.hxx"

#include <cstdint>
#include <limits>

namespace lambdatrace::core::lambda
{
namespace
{
constexpr auto firehose_event_source = "aws:lambda:events";

auto
member(const tao::json::value& object, const std::string& key) -> const tao::json::value*
{
  if (!object.is_object()) {
    return nullptr;
  }
  return object.find(key);
}

auto
string_member(const tao::json::value& object, const std::string& key) -> std::optional<std::string>
{
  if (const auto* value = member(object, key); value != nullptr && value->is_string()) {
    return value->get_string();
  }
  return {};
}

auto
first_record(const tao::json::value& event) -> const tao::json::value*
{
  const auto* records = member(event, "Records");
  if (records == nullptr || !records->is_array() || records->get_array().empty()) {
    return nullptr;
  }
  return &records->get_array().front();
}
} // namespace

auto
classify_event_source(const tao::json::value& event) -> std::optional<std::string>
{
  if (const auto* record = first_record(event); record != nullptr) {
    const auto event_source = string_member(*record, "eventSource");
    const auto event_source_arn = string_member(*record, "eventSourceARN");

    if (event_source == "aws:kinesis" && event_source_arn) {
      return "kinesis:" + event_source_arn.value();
    }
    if (const auto* s3 = member(*record, "s3"); s3 != nullptr) {
      if (const auto* bucket = member(*s3, "bucket"); bucket != nullptr) {
        if (auto arn = string_member(*bucket, "arn"); arn) {
          return arn;
        }
      }
    }
    if (auto arn = string_member(*record, "EventSubscriptionArn"); arn) {
      return arn;
    }
    if (event_source == "aws:dynamodb" && event_source_arn) {
      return "dynamodb:" + event_source_arn.value();
    }
    if (event_source_arn) {
      return event_source_arn;
    }
    return {};
  }

  if (member(event, "deliveryStreamArn") != nullptr) {
    return firehose_event_source;
  }
  return {};
}

auto
is_api_gateway_proxy_event(const tao::json::value& event) -> bool
{
  return member(event, "httpMethod") != nullptr && member(event, "path") != nullptr &&
         member(event, "headers") != nullptr && member(event, "requestContext") != nullptr;
}

auto
proxy_response_status_code(const tao::json::value& result) -> std::optional<std::uint32_t>
{
  const auto* status_code = member(result, "statusCode");
  if (status_code == nullptr) {
    return {};
  }
  if (status_code->is_unsigned()) {
    const auto code = status_code->get_unsigned();
    if (code <= std::numeric_limits<std::uint32_t>::max()) {
      return static_cast<std::uint32_t>(code);
    }
  } else if (status_code->is_signed()) {
    const auto code = status_code->get_signed();
    if (code >= 0 && code <= std::numeric_limits<std::uint32_t>::max()) {
      return static_cast<std::uint32_t>(code);
    }
  } else if (status_code->is_string()) {
    const auto& text = status_code->get_string();
    std::uint32_t code = 0;
    if (text.empty() || text.size() > 3) {
      return {};
    }
    for (const char c : text) {
      if (c < '0' || c > '9') {
        return {};
      }
      code = code * 10 + static_cast<std::uint32_t>(c - '0');
    }
    return code;
  }
  return {};
}
} // namespace lambdatrace::core::lambda
