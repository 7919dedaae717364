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

#include "core/attributes/attribute_filter.hxx"

#include <lambdatrace/handler_error.hxx>
#include <lambdatrace/transaction_kind.hxx>

#include <tao/json/value.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lambdatrace::core
{
class agent;

enum class transaction_state {
  pending,
  active,
  ended,
};

/**
 * The traced record of one invocation.
 *
 * A transaction is created PENDING, becomes ACTIVE on begin() and ENDED on the first call of
 * complete(). Every later call of complete() is ignored, and attribute writes after the end are
 * silently dropped.
 */
class transaction : public std::enable_shared_from_this<transaction>
{
public:
  transaction(std::shared_ptr<agent> agent,
              transaction_kind kind,
              std::string group,
              std::string name,
              bool cold_start);

  transaction(const transaction&) = delete;
  transaction(transaction&&) = delete;
  auto operator=(const transaction&) -> transaction& = delete;
  auto operator=(transaction&&) -> transaction& = delete;
  ~transaction() = default;

  void begin();

  /**
   * Ends the transaction and runs finalization: metrics, error capture, attribute projection and,
   * last, the transaction-finished notification. The status code of an HTTP-shaped result ends up
   * in status_code() for web transactions.
   *
   * @return true if this call ended the transaction, false if it had already ended (or never
   * began)
   */
  auto complete(const std::optional<handler_error>& error = std::nullopt,
                const tao::json::value& result = tao::json::null) -> bool;

  [[nodiscard]] auto id() const -> const std::string&;
  [[nodiscard]] auto kind() const -> transaction_kind;
  [[nodiscard]] auto state() const -> transaction_state;
  [[nodiscard]] auto is_active() const -> bool;
  [[nodiscard]] auto cold_start() const -> bool;

  /**
   * `<group>/<name>`
   */
  [[nodiscard]] auto partial_name() const -> const std::string&;

  /**
   * `WebTransaction/<group>/<name>` or `OtherTransaction/<group>/<name>`
   */
  [[nodiscard]] auto full_name() const -> const std::string&;

  [[nodiscard]] auto start_time() const -> std::chrono::system_clock::time_point;
  [[nodiscard]] auto duration() const -> std::chrono::nanoseconds;

  void add_agent_attribute(const std::string& key, tao::json::value value);
  void add_custom_attribute(const std::string& key, tao::json::value value);

  /**
   * Agent attributes as written, before any filtering.
   */
  [[nodiscard]] auto agent_attribute_candidates() const -> attributes::attribute_map;

  /**
   * Filtered agent attributes per destination. Empty until the transaction has ended.
   */
  [[nodiscard]] auto agent_attributes() const -> attributes::attribute_projection;
  [[nodiscard]] auto custom_attributes() const -> attributes::attribute_projection;

  /**
   * Projections of the current candidates under the current attribute policy. Unlike
   * agent_attributes(), these are available while the transaction is still running.
   */
  [[nodiscard]] auto project_agent_attributes() const -> attributes::attribute_projection;
  [[nodiscard]] auto project_custom_attributes() const -> attributes::attribute_projection;

  void set_status_code(std::uint32_t status_code);
  [[nodiscard]] auto status_code() const -> std::optional<std::uint32_t>;

  /**
   * Remembers an error noticed while the transaction is running, it is handed to the error
   * aggregator when the transaction ends.
   */
  void notice_error(handler_error error);

  /**
   * The failure reported by the completion signal, if any.
   */
  [[nodiscard]] auto error() const -> std::optional<handler_error>;

private:
  void finalize(const std::optional<handler_error>& error);
  void record_metrics(bool errored);
  void capture_errors(const std::optional<handler_error>& error);
  void freeze_attributes();

  std::shared_ptr<agent> agent_;
  const std::string id_;
  const transaction_kind kind_;
  const std::string partial_name_;
  const std::string full_name_;
  const bool cold_start_;
  std::atomic<transaction_state> state_{ transaction_state::pending };

  std::chrono::system_clock::time_point start_time_{};
  std::chrono::steady_clock::time_point start_{};
  std::chrono::steady_clock::time_point end_{};

  mutable std::mutex mutex_{};
  attributes::attribute_map agent_candidates_{};
  attributes::attribute_map custom_candidates_{};
  attributes::attribute_projection agent_projection_{};
  attributes::attribute_projection custom_projection_{};
  std::optional<std::uint32_t> status_code_{};
  std::vector<handler_error> noticed_errors_{};
  std::optional<handler_error> error_{};
};
} // namespace lambdatrace::core
