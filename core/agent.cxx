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

#include "agent.hxx"

#include "core/errors/error_trace_serializer.hxx"
#include "core/logger/logger.hxx"
#include "core/transaction.hxx"
#include "core/utils/json.hxx"

#include <lambdatrace/error_codes.hxx>

#include <utility>
#include <vector>

namespace lambdatrace::core
{
namespace
{
constexpr auto error_data_method = "error_data";
constexpr auto metric_data_method = "metric_data";
} // namespace

auto
agent::create(asio::io_context& io,
              agent_options options,
              std::shared_ptr<collector_transport> transport) -> std::shared_ptr<agent>
{
  return std::make_shared<agent>(io, std::move(options), std::move(transport));
}

agent::agent(asio::io_context& io,
             agent_options options,
             std::shared_ptr<collector_transport> transport)
  : io_{ io }
  , harvest_timer_{ io }
  , options_{ std::move(options) }
  , transport_{ std::move(transport) }
  , errors_{ options_.error_collector }
  , attribute_filter_{ options_.attributes }
  , tracer_{ *this }
{
}

agent::~agent()
{
  harvest_timer_.cancel();
}

auto
agent::options() const -> agent_options
{
  const std::scoped_lock lock(options_mutex_);
  return options_;
}

void
agent::reconfigure(agent_options options)
{
  errors_.reconfigure(options.error_collector);
  attribute_filter_.reconfigure(options.attributes);

  const std::scoped_lock lock(options_mutex_);
  options_ = std::move(options);
}

void
agent::reset()
{
  state_.reset();
  errors_.drain();
  metrics_.take_snapshot();
  LT_LOG_DEBUG("agent state has been reset");
}

auto
agent::io_context() -> asio::io_context&
{
  return io_;
}

auto
agent::state() -> agent_state&
{
  return state_;
}

auto
agent::metrics() -> metrics::metric_aggregator&
{
  return metrics_;
}

auto
agent::errors() -> errors::error_aggregator&
{
  return errors_;
}

auto
agent::attribute_filter() -> attributes::attribute_filter&
{
  return attribute_filter_;
}

auto
agent::tracer() -> tracing::tracer&
{
  return tracer_;
}

void
agent::set_run_id(std::int64_t run_id)
{
  const std::scoped_lock lock(options_mutex_);
  run_id_ = run_id;
}

auto
agent::run_id() const -> std::int64_t
{
  const std::scoped_lock lock(options_mutex_);
  return run_id_;
}

void
agent::set_transport(std::shared_ptr<collector_transport> transport)
{
  const std::scoped_lock lock(options_mutex_);
  transport_ = std::move(transport);
}

auto
agent::on_transaction_finished(transaction_finished_handler handler) -> std::uint64_t
{
  const std::scoped_lock lock(handlers_mutex_);
  auto token = ++next_handler_token_;
  transaction_finished_handlers_.try_emplace(token, std::move(handler));
  return token;
}

void
agent::remove_transaction_finished_handler(std::uint64_t token)
{
  const std::scoped_lock lock(handlers_mutex_);
  transaction_finished_handlers_.erase(token);
}

void
agent::emit_transaction_finished(const std::shared_ptr<transaction>& tx)
{
  std::vector<transaction_finished_handler> handlers{};
  {
    const std::scoped_lock lock(handlers_mutex_);
    handlers.reserve(transaction_finished_handlers_.size());
    for (const auto& [token, handler] : transaction_finished_handlers_) {
      handlers.push_back(handler);
    }
  }
  for (const auto& handler : handlers) {
    try {
      handler(tx);
    } catch (const std::exception& e) {
      LT_LOG_WARNING("transaction_finished observer failed for \"{}\" ({}): {}",
                     tx->full_name(),
                     tx->id(),
                     e.what());
    } catch (...) {
      LT_LOG_WARNING("transaction_finished observer failed for \"{}\" ({}): unknown exception",
                     tx->full_name(),
                     tx->id());
    }
  }
}

void
agent::harvest(std::function<void(std::error_code)>&& handler)
{
  std::shared_ptr<collector_transport> transport{};
  {
    const std::scoped_lock lock(options_mutex_);
    transport = transport_;
  }
  if (transport == nullptr) {
    LT_LOG_DEBUG("collector transport is not configured, skip harvest");
    return handler(errc::agent::transport_failure);
  }

  send_errors(transport,
              [self = shared_from_this(), transport, handler = std::move(handler)](
                std::error_code errors_ec) mutable {
                self->send_metrics(
                  transport,
                  [errors_ec, handler = std::move(handler)](std::error_code metrics_ec) mutable {
                    handler(errors_ec ? errors_ec : metrics_ec);
                  });
              });
}

void
agent::send_errors(std::shared_ptr<collector_transport> transport,
                   std::function<void(std::error_code)>&& handler)
{
  auto drained = errors_.drain();
  if (drained.empty()) {
    return handler({});
  }

  auto payload = errors::error_trace_serializer::serialize(run_id(), drained);
  LT_LOG_DEBUG("send {} error(s) to the collector", drained.size());
  transport->send(
    error_data_method,
    std::move(payload),
    [self = shared_from_this(), drained = std::move(drained), handler = std::move(handler)](
      std::error_code ec) mutable {
      if (ec) {
        LT_LOG_WARNING("unable to send {} error(s), keep them for the next harvest: {}",
                       drained.size(),
                       ec.message());
        self->errors_.merge(std::move(drained));
        return handler(errc::agent::transport_failure);
      }
      handler({});
    });
}

void
agent::send_metrics(std::shared_ptr<collector_transport> transport,
                    std::function<void(std::error_code)>&& handler)
{
  auto snapshot = metrics_.take_snapshot();
  if (snapshot.empty()) {
    return handler({});
  }

  auto payload = utils::json::generate(snapshot.to_payload(run_id()));
  transport->send(
    metric_data_method,
    std::move(payload),
    [self = shared_from_this(), snapshot = std::move(snapshot), handler = std::move(handler)](
      std::error_code ec) mutable {
      if (ec) {
        LT_LOG_WARNING("unable to send metrics, keep them for the next harvest: {}",
                       ec.message());
        self->metrics_.merge(std::move(snapshot));
        return handler(errc::agent::transport_failure);
      }
      handler({});
    });
}

void
agent::rearm_harvest()
{
  harvest_timer_.expires_after(options().harvest_interval);
  harvest_timer_.async_wait([self = shared_from_this()](std::error_code ec) {
    if (ec == asio::error::operation_aborted) {
      return;
    }
    self->harvest([](std::error_code harvest_ec) {
      if (harvest_ec) {
        LT_LOG_DEBUG("harvest failed: {}", harvest_ec.message());
      }
    });
    self->rearm_harvest();
  });
}

void
agent::start()
{
  LT_LOG_DEBUG("start harvest every {}ms", options().harvest_interval.count());
  rearm_harvest();
}

void
agent::stop()
{
  harvest_timer_.cancel();
}
} // namespace lambdatrace::core
