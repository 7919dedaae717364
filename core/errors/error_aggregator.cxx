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

#include "error_aggregator.hxx"

#include "core/attributes/attribute_names.hxx"
#include "core/logger/logger.hxx"
#include "core/transaction.hxx"

#include <lambdatrace/error_codes.hxx>

#include <fmt/core.h>

#include <algorithm>
#include <chrono>

namespace lambdatrace::core::errors
{
namespace
{
auto
contains(const std::vector<std::string>& names, const std::string& name) -> bool
{
  return std::find(names.begin(), names.end(), name) != names.end();
}

auto
to_object(const attributes::attribute_map& attributes) -> tao::json::value
{
  tao::json::value object = tao::json::empty_object;
  for (const auto& [key, value] : attributes) {
    object[key] = value;
  }
  return object;
}

auto
fingerprint(const handler_error& error) -> std::string
{
  std::string result = error.class_name();
  result.append("\n").append(error.message());
  if (error.stack()) {
    result.append("\n").append(error.stack().value());
  }
  return result;
}
} // namespace

auto
split_stack(const std::string& stack) -> std::vector<std::string>
{
  std::vector<std::string> lines{};
  std::size_t pos = 0;
  while (pos <= stack.size()) {
    auto next = stack.find('\n', pos);
    if (next == std::string::npos) {
      next = stack.size();
    }
    auto line = stack.substr(pos, next - pos);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (!line.empty()) {
      lines.emplace_back(std::move(line));
    }
    pos = next + 1;
  }
  return lines;
}

error_aggregator::error_aggregator(error_collector_options options)
  : options_{ std::move(options) }
{
}

void
error_aggregator::reconfigure(error_collector_options options)
{
  const std::scoped_lock lock(mutex_);
  options_ = std::move(options);
  while (errors_.size() > options_.max_trace_samples) {
    if (options_.overflow_policy == error_overflow_policy::drop_oldest) {
      errors_.pop_front();
    } else {
      errors_.pop_back();
    }
    ++dropped_count_;
  }
}

auto
error_aggregator::create_noticed_error(const transaction* tx, const handler_error& error) const
  -> noticed_error
{
  noticed_error result{};
  result.class_name = error.class_name();
  result.message = error.message();

  bool expected = false;
  {
    const std::scoped_lock lock(mutex_);
    expected = contains(options_.expected_classes, error.class_name());
  }
  result.intrinsics[attributes::intrinsics::error_expected] = expected;

  if (tx != nullptr) {
    result.timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
                         tx->start_time().time_since_epoch())
                         .count();
    result.transaction_name = tx->full_name();
    result.transaction_id = tx->id();
    result.agent_attributes = to_object(tx->project_agent_attributes().error_event);
    result.user_attributes = to_object(tx->project_custom_attributes().error_event);
  }

  if (error.is_raw_string()) {
    std::vector<std::string> stack{ fmt::format("Error: {}", error.message()) };
    if (tx != nullptr) {
      stack.emplace_back(fmt::format("    at {}", tx->full_name()));
    }
    result.stack_trace = std::move(stack);
  } else if (error.stack()) {
    result.stack_trace = split_stack(error.stack().value());
  }
  return result;
}

auto
error_aggregator::add(const transaction* tx, const handler_error& error) -> std::error_code
{
  {
    const std::scoped_lock lock(mutex_);
    if (!options_.enabled) {
      return errc::agent::capture_disabled;
    }
    if (contains(options_.ignore_classes, error.class_name())) {
      return errc::agent::error_ignored;
    }
    if (tx != nullptr && seen_.count({ tx->id(), fingerprint(error) }) > 0) {
      return errc::agent::duplicate_error;
    }
  }

  auto noticed = create_noticed_error(tx, error);

  const std::scoped_lock lock(mutex_);
  if (tx != nullptr && !seen_.emplace(tx->id(), fingerprint(error)).second) {
    return errc::agent::duplicate_error;
  }
  return append_locked(std::move(noticed));
}

auto
error_aggregator::append_locked(noticed_error&& error) -> std::error_code
{
  if (options_.max_trace_samples == 0) {
    ++dropped_count_;
    return errc::agent::retention_cap_reached;
  }
  if (errors_.size() >= options_.max_trace_samples) {
    ++dropped_count_;
    if (options_.overflow_policy == error_overflow_policy::drop_newest) {
      return errc::agent::retention_cap_reached;
    }
    errors_.pop_front();
  }
  errors_.emplace_back(std::move(error));
  return {};
}

auto
error_aggregator::drain() -> std::vector<noticed_error>
{
  std::deque<noticed_error> drained{};
  {
    const std::scoped_lock lock(mutex_);
    std::swap(drained, errors_);
    seen_.clear();
    if (dropped_count_ > 0) {
      LT_LOG_DEBUG("{} error(s) have been dropped since the previous harvest", dropped_count_);
      dropped_count_ = 0;
    }
  }
  return { std::make_move_iterator(drained.begin()), std::make_move_iterator(drained.end()) };
}

void
error_aggregator::merge(std::vector<noticed_error>&& errors)
{
  if (errors.empty()) {
    return;
  }

  const std::scoped_lock lock(mutex_);
  std::deque<noticed_error> merged{ std::make_move_iterator(errors.begin()),
                                    std::make_move_iterator(errors.end()) };
  for (auto& error : errors_) {
    merged.emplace_back(std::move(error));
  }
  while (merged.size() > options_.max_trace_samples) {
    if (options_.overflow_policy == error_overflow_policy::drop_oldest) {
      merged.pop_front();
    } else {
      merged.pop_back();
    }
    ++dropped_count_;
  }
  errors_ = std::move(merged);
}

auto
error_aggregator::size() const -> std::size_t
{
  const std::scoped_lock lock(mutex_);
  return errors_.size();
}

auto
error_aggregator::dropped_count() const -> std::size_t
{
  const std::scoped_lock lock(mutex_);
  return dropped_count_;
}

auto
error_aggregator::errors() const -> std::vector<noticed_error>
{
  const std::scoped_lock lock(mutex_);
  return { errors_.begin(), errors_.end() };
}
} // namespace lambdatrace::core::errors
