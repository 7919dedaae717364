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

#include "metric_aggregator.hxx"

#include <algorithm>

namespace lambdatrace::core::metrics
{
namespace
{
auto
to_seconds(std::chrono::nanoseconds duration) -> double
{
  return std::chrono::duration<double>(duration).count();
}

auto
to_epoch_seconds(std::chrono::system_clock::time_point point) -> std::int64_t
{
  return std::chrono::duration_cast<std::chrono::seconds>(point.time_since_epoch()).count();
}
} // namespace

void
metric_stats::record(std::chrono::nanoseconds duration, std::chrono::nanoseconds exclusive)
{
  const auto value = to_seconds(duration);
  if (call_count == 0) {
    min = value;
    max = value;
  } else {
    min = std::min(min, value);
    max = std::max(max, value);
  }
  ++call_count;
  total += value;
  total_exclusive += to_seconds(exclusive);
  sum_of_squares += value * value;
}

void
metric_stats::increment(std::uint64_t count)
{
  call_count += count;
}

void
metric_stats::merge(const metric_stats& other)
{
  if (other.call_count == 0) {
    return;
  }
  if (call_count == 0) {
    min = other.min;
    max = other.max;
  } else {
    min = std::min(min, other.min);
    max = std::max(max, other.max);
  }
  call_count += other.call_count;
  total += other.total;
  total_exclusive += other.total_exclusive;
  sum_of_squares += other.sum_of_squares;
}

auto
metric_stats::to_json() const -> tao::json::value
{
  return tao::json::value::array({ call_count, total, total_exclusive, min, max, sum_of_squares });
}

void
apdex_stats::record(apdex_zone zone)
{
  switch (zone) {
    case apdex_zone::satisfying:
      ++satisfying;
      break;
    case apdex_zone::tolerating:
      ++tolerating;
      break;
    case apdex_zone::frustrating:
      ++frustrating;
      break;
  }
}

void
apdex_stats::merge(const apdex_stats& other)
{
  satisfying += other.satisfying;
  tolerating += other.tolerating;
  frustrating += other.frustrating;
  apdex_t = other.apdex_t;
}

auto
apdex_stats::to_json() const -> tao::json::value
{
  return tao::json::value::array({ satisfying, tolerating, frustrating, apdex_t, apdex_t, 0 });
}

auto
apdex_zone_for(std::chrono::nanoseconds duration, std::chrono::milliseconds apdex_t, bool errored)
  -> apdex_zone
{
  if (errored) {
    return apdex_zone::frustrating;
  }
  if (duration <= apdex_t) {
    return apdex_zone::satisfying;
  }
  if (duration <= 4 * apdex_t) {
    return apdex_zone::tolerating;
  }
  return apdex_zone::frustrating;
}

auto
metric_snapshot::empty() const -> bool
{
  return metrics.empty() && apdex.empty();
}

auto
metric_snapshot::to_payload(std::int64_t run_id) const -> tao::json::value
{
  tao::json::value entries = tao::json::empty_array;
  for (const auto& [name, stats] : metrics) {
    entries.emplace_back(
      tao::json::value::array({ tao::json::value{ { "name", name } }, stats.to_json() }));
  }
  for (const auto& [name, stats] : apdex) {
    entries.emplace_back(
      tao::json::value::array({ tao::json::value{ { "name", name } }, stats.to_json() }));
  }
  return tao::json::value::array(
    { run_id, to_epoch_seconds(begin), to_epoch_seconds(end), std::move(entries) });
}

void
metric_aggregator::measure(const std::string& name,
                           std::chrono::nanoseconds duration,
                           std::chrono::nanoseconds exclusive)
{
  const std::scoped_lock lock(mutex_);
  metrics_[name].record(duration, exclusive);
}

void
metric_aggregator::increment(const std::string& name, std::uint64_t count)
{
  const std::scoped_lock lock(mutex_);
  metrics_[name].increment(count);
}

void
metric_aggregator::record_apdex(const std::string& name,
                                apdex_zone zone,
                                std::chrono::milliseconds apdex_t)
{
  const std::scoped_lock lock(mutex_);
  auto& stats = apdex_[name];
  stats.apdex_t = std::chrono::duration<double>(apdex_t).count();
  stats.record(zone);
}

auto
metric_aggregator::get_metric(const std::string& name) const -> std::optional<metric_stats>
{
  const std::scoped_lock lock(mutex_);
  if (auto it = metrics_.find(name); it != metrics_.end()) {
    return it->second;
  }
  return {};
}

auto
metric_aggregator::get_apdex(const std::string& name) const -> std::optional<apdex_stats>
{
  const std::scoped_lock lock(mutex_);
  if (auto it = apdex_.find(name); it != apdex_.end()) {
    return it->second;
  }
  return {};
}

auto
metric_aggregator::take_snapshot() -> metric_snapshot
{
  metric_snapshot snapshot{};
  snapshot.end = std::chrono::system_clock::now();

  const std::scoped_lock lock(mutex_);
  snapshot.begin = begin_;
  std::swap(snapshot.metrics, metrics_);
  std::swap(snapshot.apdex, apdex_);
  begin_ = snapshot.end;
  return snapshot;
}

void
metric_aggregator::merge(metric_snapshot&& snapshot)
{
  const std::scoped_lock lock(mutex_);
  begin_ = std::min(begin_, snapshot.begin);
  for (const auto& [name, stats] : snapshot.metrics) {
    metrics_[name].merge(stats);
  }
  for (const auto& [name, stats] : snapshot.apdex) {
    apdex_[name].merge(stats);
  }
}
} // namespace lambdatrace::core::metrics
