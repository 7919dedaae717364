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

#include <atomic>
#include <mutex>
#include <optional>
#include <string>

namespace lambdatrace::core
{
/**
 * Process-wide facts about the function instance the agent runs in.
 *
 * Every field is mutated at most once (first writer wins) between two calls of reset(), which is
 * only used when the agent is re-initialized.
 */
class agent_state
{
public:
  agent_state() = default;
  agent_state(const agent_state&) = delete;
  agent_state(agent_state&&) = delete;
  auto operator=(const agent_state&) -> agent_state& = delete;
  auto operator=(agent_state&&) -> agent_state& = delete;
  ~agent_state() = default;

  /**
   * @return true for the first caller only, every later call returns false
   */
  auto consume_cold_start() -> bool;

  [[nodiscard]] auto is_cold_start() const -> bool;

  /**
   * Stores the ARN of the invoked function unless one is already cached.
   *
   * @return true if this call stored the ARN
   */
  auto cache_lambda_arn(const std::string& arn) -> bool;

  [[nodiscard]] auto lambda_arn() const -> std::optional<std::string>;

  void reset();

private:
  std::atomic_bool cold_start_{ true };
  mutable std::mutex arn_mutex_{};
  std::optional<std::string> lambda_arn_{};
};
} // namespace lambdatrace::core
