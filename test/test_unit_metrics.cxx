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

#include "test_helper.hxx"

#include "core/metrics/metric_aggregator.hxx"

#include <catch2/matchers/catch_matchers_floating_point.hpp>

using namespace std::chrono_literals;
using lambdatrace::core::metrics::apdex_zone;
using lambdatrace::core::metrics::apdex_zone_for;
using lambdatrace::core::metrics::metric_aggregator;
using Catch::Matchers::WithinRel;

TEST_CASE("unit: metric statistics", "[unit]")
{
  metric_aggregator metrics{};
  metrics.measure("OtherTransaction/all", 200ms, 200ms);
  metrics.measure("OtherTransaction/all", 100ms, 50ms);
  metrics.measure("OtherTransaction/all", 300ms, 300ms);

  auto stats = metrics.get_metric("OtherTransaction/all");
  REQUIRE(stats);
  REQUIRE(stats->call_count == 3);
  REQUIRE_THAT(stats->total, WithinRel(0.6, 1e-9));
  REQUIRE_THAT(stats->total_exclusive, WithinRel(0.55, 1e-9));
  REQUIRE_THAT(stats->min, WithinRel(0.1, 1e-9));
  REQUIRE_THAT(stats->max, WithinRel(0.3, 1e-9));
  REQUIRE_THAT(stats->sum_of_squares, WithinRel(0.14, 1e-9));

  REQUIRE_FALSE(metrics.get_metric("WebTransaction"));

  metrics.increment("Supportability/API/recordLambda");
  metrics.increment("Supportability/API/recordLambda", 2);
  REQUIRE(metrics.get_metric("Supportability/API/recordLambda")->call_count == 3);
  REQUIRE(metrics.get_metric("Supportability/API/recordLambda")->total == 0);
}

TEST_CASE("unit: apdex zones", "[unit]")
{
  REQUIRE(apdex_zone_for(50ms, 100ms, false) == apdex_zone::satisfying);
  REQUIRE(apdex_zone_for(100ms, 100ms, false) == apdex_zone::satisfying);
  REQUIRE(apdex_zone_for(101ms, 100ms, false) == apdex_zone::tolerating);
  REQUIRE(apdex_zone_for(400ms, 100ms, false) == apdex_zone::tolerating);
  REQUIRE(apdex_zone_for(401ms, 100ms, false) == apdex_zone::frustrating);
  REQUIRE(apdex_zone_for(1ms, 100ms, true) == apdex_zone::frustrating);

  metric_aggregator metrics{};
  metrics.record_apdex("Apdex", apdex_zone::satisfying, 500ms);
  metrics.record_apdex("Apdex", apdex_zone::satisfying, 500ms);
  metrics.record_apdex("Apdex", apdex_zone::tolerating, 500ms);
  metrics.record_apdex("Apdex", apdex_zone::frustrating, 500ms);

  auto apdex = metrics.get_apdex("Apdex");
  REQUIRE(apdex);
  REQUIRE(apdex->satisfying == 2);
  REQUIRE(apdex->tolerating == 1);
  REQUIRE(apdex->frustrating == 1);
  REQUIRE(apdex->apdex_t == 0.5);
}

TEST_CASE("unit: metric snapshots", "[unit]")
{
  metric_aggregator metrics{};
  metrics.measure("WebTransaction", 250ms, 250ms);
  metrics.record_apdex("Apdex", apdex_zone::satisfying, 100ms);

  auto snapshot = metrics.take_snapshot();
  REQUIRE_FALSE(snapshot.empty());
  REQUIRE(snapshot.begin <= snapshot.end);
  REQUIRE(snapshot.metrics.at("WebTransaction").call_count == 1);
  REQUIRE(snapshot.apdex.at("Apdex").satisfying == 1);

  REQUIRE_FALSE(metrics.get_metric("WebTransaction"));
  REQUIRE(metrics.take_snapshot().empty());

  SECTION("payload")
  {
    auto payload = snapshot.to_payload(42);
    REQUIRE(payload.is_array());
    const auto& entries = payload.get_array();
    REQUIRE(entries.size() == 4);
    REQUIRE(entries[0] == 42);
    REQUIRE(entries[1].as<std::int64_t>() <= entries[2].as<std::int64_t>());

    const auto& metric_entries = entries[3].get_array();
    REQUIRE(metric_entries.size() == 2);
    REQUIRE(metric_entries[0].at(0).at("name") == "WebTransaction");
    REQUIRE(metric_entries[0].at(1).at(0) == 1U);
    REQUIRE_THAT(metric_entries[0].at(1).at(1).as<double>(), WithinRel(0.25, 1e-9));
    REQUIRE(metric_entries[1].at(0).at("name") == "Apdex");
    REQUIRE(metric_entries[1].at(1).at(0) == 1U);
    REQUIRE_THAT(metric_entries[1].at(1).at(3).as<double>(), WithinRel(0.1, 1e-9));
  }

  SECTION("undelivered snapshots are merged back")
  {
    metrics.measure("WebTransaction", 50ms, 50ms);
    metrics.merge(std::move(snapshot));

    auto stats = metrics.get_metric("WebTransaction");
    REQUIRE(stats->call_count == 2);
    REQUIRE_THAT(stats->min, WithinRel(0.05, 1e-9));
    REQUIRE_THAT(stats->max, WithinRel(0.25, 1e-9));
    REQUIRE(metrics.get_apdex("Apdex")->satisfying == 1);

    auto merged = metrics.take_snapshot();
    REQUIRE(merged.metrics.size() == 1);
    REQUIRE(merged.begin <= merged.end);
  }
}
