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

#include "agent_state.hxx"
#include "core/attributes/attribute_filter.hxx"
#include "core/errors/error_aggregator.hxx"
#include "core/metrics/metric_aggregator.hxx"
#include "core/tracing/tracer.hxx"

#include <lambdatrace/agent_options.hxx>
#include <lambdatrace/collector_transport.hxx>

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <system_error>

namespace lambdatrace::core
{
class transaction;

using transaction_finished_handler = std::function<void(const std::shared_ptr<transaction>& tx)>;

/**
 * Owns everything the instrumentation shares between invocations: options, process state,
 * aggregated metrics and errors, and the observers of finished transactions.
 */
class agent : public std::enable_shared_from_this<agent>
{
public:
  static auto create(asio::io_context& io,
                     agent_options options = {},
                     std::shared_ptr<collector_transport> transport = nullptr)
    -> std::shared_ptr<agent>;

  agent(asio::io_context& io, agent_options options, std::shared_ptr<collector_transport> transport);
  agent(const agent&) = delete;
  agent(agent&&) = delete;
  auto operator=(const agent&) -> agent& = delete;
  auto operator=(agent&&) -> agent& = delete;
  ~agent();

  [[nodiscard]] auto options() const -> agent_options;

  /**
   * Replaces the options. Attribute and error policy apply to transactions that end after the
   * call.
   */
  void reconfigure(agent_options options);

  /**
   * Forgets process state and drops everything aggregated so far, as if the agent was just
   * created. Registered observers are kept.
   */
  void reset();

  [[nodiscard]] auto io_context() -> asio::io_context&;
  [[nodiscard]] auto state() -> agent_state&;
  [[nodiscard]] auto metrics() -> metrics::metric_aggregator&;
  [[nodiscard]] auto errors() -> errors::error_aggregator&;
  [[nodiscard]] auto attribute_filter() -> attributes::attribute_filter&;
  [[nodiscard]] auto tracer() -> tracing::tracer&;

  void set_run_id(std::int64_t run_id);
  [[nodiscard]] auto run_id() const -> std::int64_t;

  void set_transport(std::shared_ptr<collector_transport> transport);

  /**
   * Registers an observer of finished transactions.
   *
   * @return token to pass to remove_transaction_finished_handler()
   */
  auto on_transaction_finished(transaction_finished_handler handler) -> std::uint64_t;
  void remove_transaction_finished_handler(std::uint64_t token);

  /**
   * Notifies the observers. Called by the transaction as the very last step of its finalization.
   */
  void emit_transaction_finished(const std::shared_ptr<transaction>& tx);

  /**
   * Drains errors and metrics and hands them to the collector transport (`error_data` then
   * `metric_data`). Whatever the transport fails to deliver is merged back for the next harvest.
   */
  void harvest(std::function<void(std::error_code)>&& handler);

  /**
   * Starts the periodic harvest on the io_context.
   */
  void start();
  void stop();

private:
  void rearm_harvest();
  void send_errors(std::shared_ptr<collector_transport> transport,
                   std::function<void(std::error_code)>&& handler);
  void send_metrics(std::shared_ptr<collector_transport> transport,
                    std::function<void(std::error_code)>&& handler);

  asio::io_context& io_;
  asio::steady_timer harvest_timer_;

  mutable std::mutex options_mutex_{};
  agent_options options_;
  std::int64_t run_id_{ 0 };
  std::shared_ptr<collector_transport> transport_;

  agent_state state_{};
  metrics::metric_aggregator metrics_{};
  errors::error_aggregator errors_;
  attributes::attribute_filter attribute_filter_;
  tracing::tracer tracer_;

  std::mutex handlers_mutex_{};
  std::uint64_t next_handler_token_{ 0 };
  std::map<std::uint64_t, transaction_finished_handler> transaction_finished_handlers_{};
};
} // namespace lambdatrace::core
