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

#include "transaction.hxx"

#include "agent.hxx"
#include "core/errors/error_aggregator.hxx"
#include "core/lambda/event_source.hxx"
#include "core/logger/logger.hxx"
#include "core/metrics/metric_aggregator.hxx"

#include <lambdatrace/fmt/transaction_kind.hxx>

#include <fmt/core.h>
#include <gsl/assert>

#include <random>
#include <utility>

namespace lambdatrace::core
{
namespace
{
constexpr std::uint32_t first_server_error_status{ 500 };
constexpr std::uint32_t last_server_error_status{ 599 };

auto
generate_transaction_id() -> std::string
{
  thread_local std::mt19937_64 gen{ std::random_device{}() };
  return fmt::format("{:016x}", gen());
}

auto
make_full_name(transaction_kind kind, const std::string& partial_name) -> std::string
{
  switch (kind) {
    case transaction_kind::web:
      return fmt::format("WebTransaction/{}", partial_name);
    case transaction_kind::background:
      break;
  }
  return fmt::format("OtherTransaction/{}", partial_name);
}
} // namespace

transaction::transaction(std::shared_ptr<agent> agent,
                         transaction_kind kind,
                         std::string group,
                         std::string name,
                         bool cold_start)
  : agent_{ std::move(agent) }
  , id_{ generate_transaction_id() }
  , kind_{ kind }
  , partial_name_{ fmt::format("{}/{}", group, name) }
  , full_name_{ make_full_name(kind, partial_name_) }
  , cold_start_{ cold_start }
{
}

void
transaction::begin()
{
  {
    const std::scoped_lock lock(mutex_);
    Expects(state_ == transaction_state::pending);

    start_time_ = std::chrono::system_clock::now();
    start_ = std::chrono::steady_clock::now();
    state_ = transaction_state::active;
  }
  LT_LOG_TRACE("transaction \"{}\" ({}, {}) started", full_name_, id_, kind_);
}

auto
transaction::complete(const std::optional<handler_error>& error, const tao::json::value& result)
  -> bool
{
  const auto end = std::chrono::steady_clock::now();
  std::optional<std::uint32_t> response_status_code{};
  if (kind_ == transaction_kind::web) {
    response_status_code = lambda::proxy_response_status_code(result);
  }

  bool ended = false;
  {
    const std::scoped_lock lock(mutex_);
    auto expected = transaction_state::active;
    if (state_.compare_exchange_strong(expected, transaction_state::ended)) {
      ended = true;
      end_ = end;
      error_ = error;
      if (response_status_code) {
        status_code_ = response_status_code;
      }
    }
  }
  if (!ended) {
    LT_LOG_TRACE("ignore completion of transaction \"{}\" ({}), it is not active", full_name_, id_);
    return false;
  }
  finalize(error);
  return true;
}

void
transaction::finalize(const std::optional<handler_error>& error)
{
  const auto elapsed = duration();

  bool errored = error.has_value();
  {
    const std::scoped_lock lock(mutex_);
    errored = errored || !noticed_errors_.empty();
    if (!errored && kind_ == transaction_kind::web && status_code_.has_value()) {
      errored = status_code_.value() >= first_server_error_status &&
                status_code_.value() <= last_server_error_status;
    }
  }

  try {
    record_metrics(errored);
  } catch (const std::exception& e) {
    LT_LOG_DEBUG(
      "unable to record metrics for transaction \"{}\" ({}): {}", full_name_, id_, e.what());
  } catch (...) {
    LT_LOG_DEBUG(
      "unable to record metrics for transaction \"{}\" ({}): unknown exception", full_name_, id_);
  }

  try {
    capture_errors(error);
  } catch (const std::exception& e) {
    LT_LOG_DEBUG(
      "unable to capture errors for transaction \"{}\" ({}): {}", full_name_, id_, e.what());
  } catch (...) {
    LT_LOG_DEBUG(
      "unable to capture errors for transaction \"{}\" ({}): unknown exception", full_name_, id_);
  }

  try {
    freeze_attributes();
  } catch (const std::exception& e) {
    LT_LOG_DEBUG(
      "unable to project attributes of transaction \"{}\" ({}): {}", full_name_, id_, e.what());
  } catch (...) {
    LT_LOG_DEBUG(
      "unable to project attributes of transaction \"{}\" ({}): unknown exception", full_name_, id_);
  }

  LT_LOG_DEBUG("transaction \"{}\" ({}) ended in {}us, errored={}",
               full_name_,
               id_,
               std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count(),
               errored);
  agent_->emit_transaction_finished(shared_from_this());
}

void
transaction::record_metrics(bool errored)
{
  auto& meter = agent_->metrics();
  const auto elapsed = duration();

  switch (kind_) {
    case transaction_kind::background:
      meter.measure(full_name_, elapsed, elapsed);
      meter.measure(metrics::names::other_transaction_all, elapsed, elapsed);
      meter.measure(metrics::names::other_transaction_total_time, elapsed, elapsed);
      meter.measure(
        fmt::format("{}/{}", metrics::names::other_transaction_total_time, partial_name_),
        elapsed,
        elapsed);
      break;

    case transaction_kind::web: {
      const auto apdex_t = agent_->options().apdex_t;
      const auto zone = metrics::apdex_zone_for(elapsed, apdex_t, errored);

      meter.measure(metrics::names::http_dispatcher, elapsed, elapsed);
      meter.measure(full_name_, elapsed, elapsed);
      meter.measure(metrics::names::web_transaction, elapsed, elapsed);
      meter.measure(metrics::names::web_transaction_total_time, elapsed, elapsed);
      meter.measure(
        fmt::format("{}/{}", metrics::names::web_transaction_total_time, partial_name_),
        elapsed,
        elapsed);
      meter.record_apdex(metrics::names::apdex, zone, apdex_t);
      meter.record_apdex(fmt::format("{}/{}", metrics::names::apdex, partial_name_), zone, apdex_t);
    } break;
  }
}

void
transaction::capture_errors(const std::optional<handler_error>& error)
{
  std::vector<handler_error> noticed{};
  std::optional<std::uint32_t> status_code{};
  {
    const std::scoped_lock lock(mutex_);
    std::swap(noticed, noticed_errors_);
    status_code = status_code_;
  }

  auto& aggregator = agent_->errors();
  auto deliver = [this, &aggregator](const handler_error& e) {
    if (auto ec = aggregator.add(this, e); ec) {
      LT_LOG_DEBUG("error \"{}\" of transaction \"{}\" ({}) has not been retained: {}",
                   e.class_name(),
                   full_name_,
                   id_,
                   ec.message());
    }
  };

  for (const auto& e : noticed) {
    deliver(e);
  }
  if (error) {
    deliver(error.value());
    return;
  }
  if (kind_ == transaction_kind::web && status_code &&
      status_code.value() >= first_server_error_status &&
      status_code.value() <= last_server_error_status &&
      agent_->options().error_collector.capture_server_errors) {
    deliver(handler_error{ "HttpError", fmt::format("HttpError {}", status_code.value()) });
  }
}

void
transaction::freeze_attributes()
{
  auto agent_projection = project_agent_attributes();
  auto custom_projection = project_custom_attributes();

  const std::scoped_lock lock(mutex_);
  agent_projection_ = std::move(agent_projection);
  custom_projection_ = std::move(custom_projection);
}

auto
transaction::id() const -> const std::string&
{
  return id_;
}

auto
transaction::kind() const -> transaction_kind
{
  return kind_;
}

auto
transaction::state() const -> transaction_state
{
  return state_;
}

auto
transaction::is_active() const -> bool
{
  return state_ == transaction_state::active;
}

auto
transaction::cold_start() const -> bool
{
  return cold_start_;
}

auto
transaction::partial_name() const -> const std::string&
{
  return partial_name_;
}

auto
transaction::full_name() const -> const std::string&
{
  return full_name_;
}

auto
transaction::start_time() const -> std::chrono::system_clock::time_point
{
  const std::scoped_lock lock(mutex_);
  return start_time_;
}

auto
transaction::duration() const -> std::chrono::nanoseconds
{
  const std::scoped_lock lock(mutex_);
  switch (state_.load()) {
    case transaction_state::pending:
      return std::chrono::nanoseconds::zero();
    case transaction_state::active:
      return std::chrono::steady_clock::now() - start_;
    case transaction_state::ended:
      break;
  }
  return end_ - start_;
}

void
transaction::add_agent_attribute(const std::string& key, tao::json::value value)
{
  const std::scoped_lock lock(mutex_);
  if (state_ != transaction_state::active) {
    return;
  }
  agent_candidates_.insert_or_assign(key, std::move(value));
}

void
transaction::add_custom_attribute(const std::string& key, tao::json::value value)
{
  const std::scoped_lock lock(mutex_);
  if (state_ != transaction_state::active) {
    return;
  }
  custom_candidates_.insert_or_assign(key, std::move(value));
}

auto
transaction::agent_attribute_candidates() const -> attributes::attribute_map
{
  const std::scoped_lock lock(mutex_);
  return agent_candidates_;
}

auto
transaction::agent_attributes() const -> attributes::attribute_projection
{
  const std::scoped_lock lock(mutex_);
  return agent_projection_;
}

auto
transaction::custom_attributes() const -> attributes::attribute_projection
{
  const std::scoped_lock lock(mutex_);
  return custom_projection_;
}

auto
transaction::project_agent_attributes() const -> attributes::attribute_projection
{
  return agent_->attribute_filter().project(agent_attribute_candidates());
}

auto
transaction::project_custom_attributes() const -> attributes::attribute_projection
{
  attributes::attribute_map candidates{};
  {
    const std::scoped_lock lock(mutex_);
    candidates = custom_candidates_;
  }
  return agent_->attribute_filter().project(candidates);
}

void
transaction::set_status_code(std::uint32_t status_code)
{
  const std::scoped_lock lock(mutex_);
  if (state_ != transaction_state::active) {
    return;
  }
  status_code_ = status_code;
}

auto
transaction::status_code() const -> std::optional<std::uint32_t>
{
  const std::scoped_lock lock(mutex_);
  return status_code_;
}

void
transaction::notice_error(handler_error error)
{
  const std::scoped_lock lock(mutex_);
  if (state_ != transaction_state::active) {
    return;
  }
  noticed_errors_.emplace_back(std::move(error));
}

auto
transaction::error() const -> std::optional<handler_error>
{
  const std::scoped_lock lock(mutex_);
  return error_;
}
} // namespace lambdatrace::core
