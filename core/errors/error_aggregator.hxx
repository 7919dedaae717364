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

#include "noticed_error.hxx"

#include <lambdatrace/agent_options.hxx>
#include <lambdatrace/handler_error.hxx>

#include <cstdint>
#include <deque>
#include <mutex>
#include <set>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace lambdatrace::core
{
class transaction;
} // namespace lambdatrace::core

namespace lambdatrace::core::errors
{
/**
 * Splits a stack text into one entry per line. Empty lines are dropped.
 */
auto
split_stack(const std::string& stack) -> std::vector<std::string>;

/**
 * Collects noticed errors between two harvests.
 *
 * Errors are kept in capture order, up to error_collector_options::max_trace_samples. The same
 * error noticed twice for one transaction is kept once.
 */
class error_aggregator
{
public:
  explicit error_aggregator(error_collector_options options);

  error_aggregator(const error_aggregator&) = delete;
  error_aggregator(error_aggregator&&) = delete;
  auto operator=(const error_aggregator&) -> error_aggregator& = delete;
  auto operator=(error_aggregator&&) -> error_aggregator& = delete;
  ~error_aggregator() = default;

  void reconfigure(error_collector_options options);

  /**
   * Builds a noticed error from the failure and appends it.
   *
   * @param tx the transaction the error belongs to, or nullptr if noticed outside of any
   * transaction
   * @return empty error code if the error has been retained, or the reason why it was not
   */
  auto add(const transaction* tx, const handler_error& error) -> std::error_code;

  /**
   * Moves out all retained errors, in capture order.
   */
  auto drain() -> std::vector<noticed_error>;

  /**
   * Puts back errors that could not be delivered. They are placed before any error captured
   * since the drain, and the retention cap still applies.
   */
  void merge(std::vector<noticed_error>&& errors);

  [[nodiscard]] auto size() const -> std::size_t;
  [[nodiscard]] auto dropped_count() const -> std::size_t;
  [[nodiscard]] auto errors() const -> std::vector<noticed_error>;

  [[nodiscard]] auto create_noticed_error(const transaction* tx, const handler_error& error) const
    -> noticed_error;

private:
  auto append_locked(noticed_error&& error) -> std::error_code;

  mutable std::mutex mutex_{};
  error_collector_options options_;
  std::deque<noticed_error> errors_{};
  std::size_t dropped_count_{ 0 };
  std::set<std::pair<std::string, std::string>> seen_{};
};
} // namespace lambdatrace::core::errors
