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
#include <vector>

namespace lambdatrace::core::errors
{
constexpr auto unknown_transaction_name = "Unknown";

/**
 * A captured application failure, pending serialization.
 */
struct noticed_error {
  /**
   * Start of the transaction in milliseconds since epoch, 0 when noticed outside of a transaction.
   */
  std::int64_t timestamp{ 0 };
  std::string transaction_name{ unknown_transaction_name };
  std::string message{};
  std::string class_name{ "Error" };
  tao::json::value user_attributes = tao::json::empty_object;
  tao::json::value agent_attributes = tao::json::empty_object;
  tao::json::value intrinsics = tao::json::empty_object;
  std::optional<std::vector<std::string>> stack_trace{};

  /**
   * Identifier of the transaction the error belongs to, used for deduplication only.
   */
  std::optional<std::string> transaction_id{};
};
} // namespace lambdatrace::core::errors
