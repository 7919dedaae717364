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

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace lambdatrace::core::metrics
{
namespace names
{
constexpr auto other_transaction_all = "OtherTransaction/all";
constexpr auto other_transaction_total_time = "OtherTransactionTotalTime";
constexpr auto http_dispatcher = "HttpDispatcher";
constexpr auto apdex = "Apdex";
constexpr auto web_transaction = "WebTransaction";
constexpr auto web_transaction_total_time = "WebTransactionTotalTime";
constexpr auto supportability_record_lambda = "Supportability/API/recordLambda";
} // namespace names

/**
 * Unscoped timing statistics of a single metric. Durations are kept in seconds.
 */
struct metric_stats {
  std::uint64_t call_count{ 0 };
  double total{ 0 };
  double total_exclusive{ 0 };
  double min{ 0 };
  double max{ 0 };
  double sum_of_squares{ 0 };

  void record(std::chrono::nanoseconds duration, std::chrono::nanoseconds exclusive);
  void increment(std::uint64_t count = 1);
  void merge(const metric_stats& other);

  [[nodiscard]] auto to_json() const -> tao::json::value;
};

enum class apdex_zone {
  satisfying,
  tolerating,
  frustrating,
};

struct apdex_stats {
  std::uint64_t satisfying{ 0 };
  std::uint64_t tolerating{ 0 };
  std::uint64_t frustrating{ 0 };
  double apdex_t{ 0 };

  void record(apdex_zone zone);
  void merge(const apdex_stats& other);

  [[nodiscard]] auto to_json() const -> tao::json::value;
};

/**
 * Computes the apdex zone of a response time. Errored transactions are always frustrating.
 */
auto
apdex_zone_for(std::chrono::nanoseconds duration, std::chrono::milliseconds apdex_t, bool errored)
  -> apdex_zone;

struct metric_snapshot {
  std::chrono::system_clock::time_point begin{};
  std::chrono::system_clock::time_point end{};
  std::map<std::string, metric_stats> metrics{};
  std::map<std::string, apdex_stats> apdex{};

  [[nodiscard]] auto empty() const -> bool;

  /**
   * Collector payload: `[run_id, begin_s, end_s, [[{"name": ...}, [count, total, exclusive, min,
   * max, sum_of_squares]], ...]]`, apdex metrics use `[s, t, f, apdex_t, apdex_t, 0]`.
   */
  [[nodiscard]] auto to_payload(std::int64_t run_id) const -> tao::json::value;
};

class metric_aggregator
{
public:
  metric_aggregator() = default;
  metric_aggregator(const metric_aggregator&) = delete;
  metric_aggregator(metric_aggregator&&) = delete;
  auto operator=(const metric_aggregator&) -> metric_aggregator& = delete;
  auto operator=(metric_aggregator&&) -> metric_aggregator& = delete;
  ~metric_aggregator() = default;

  void measure(const std::string& name,
               std::chrono::nanoseconds duration,
               std::chrono::nanoseconds exclusive);
  void increment(const std::string& name, std::uint64_t count = 1);
  void record_apdex(const std::string& name, apdex_zone zone, std::chrono::milliseconds apdex_t);

  [[nodiscard]] auto get_metric(const std::string& name) const -> std::optional<metric_stats>;
  [[nodiscard]] auto get_apdex(const std::string& name) const -> std::optional<apdex_stats>;

  /**
   * Moves out all metrics collected since the previous snapshot.
   */
  auto take_snapshot() -> metric_snapshot;

  /**
   * Puts back a snapshot that could not be delivered, so that it is reported with the next one.
   */
  void merge(metric_snapshot&& snapshot);

private:
  mutable std::mutex mutex_{};
  std::chrono::system_clock::time_point begin_{ std::chrono::system_clock::now() };
  std::map<std::string, metric_stats> metrics_{};
  std::map<std::string, apdex_stats> apdex_{};
};
} // namespace lambdatrace::core::metrics
