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

#include "core/agent.hxx"
#include "core/lambda/completion_latch.hxx"
#include "core/metrics/metric_aggregator.hxx"
#include "core/transaction.hxx"

#include <asio/io_context.hpp>

#include <atomic>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <thread>

using lambdatrace::handler_error;
using lambdatrace::transaction_kind;
using lambdatrace::core::transaction_state;

TEST_CASE("unit: transaction lifecycle", "[unit]")
{
  asio::io_context io;
  auto agent = lambdatrace::core::agent::create(io);

  auto tx = std::make_shared<lambdatrace::core::transaction>(
    agent, transaction_kind::background, "Function", "testName", false);
  REQUIRE(tx->state() == transaction_state::pending);
  REQUIRE_FALSE(tx->is_active());
  REQUIRE(tx->id().size() == 16);
  REQUIRE(tx->id().find_first_not_of("0123456789abcdef") == std::string::npos);
  REQUIRE(tx->partial_name() == "Function/testName");
  REQUIRE(tx->full_name() == "OtherTransaction/Function/testName");

  SECTION("completion before begin is ignored")
  {
    REQUIRE_FALSE(tx->complete());
    REQUIRE(tx->state() == transaction_state::pending);
  }

  SECTION("first completion wins")
  {
    std::size_t finished = 0;
    agent->on_transaction_finished([&finished](const auto& /* tx */) { ++finished; });

    tx->begin();
    REQUIRE(tx->is_active());

    REQUIRE(tx->complete(handler_error{ "first" }));
    REQUIRE_FALSE(tx->is_active());
    REQUIRE(tx->state() == transaction_state::ended);

    REQUIRE_FALSE(tx->complete(handler_error{ "second" }));
    REQUIRE_FALSE(tx->complete());

    REQUIRE(finished == 1);
    REQUIRE(tx->error() == handler_error{ "first" });
    REQUIRE(agent->errors().size() == 1);
    REQUIRE(agent->metrics().get_metric("OtherTransaction/all")->call_count == 1);
  }

  SECTION("attribute writes after the end are dropped")
  {
    tx->begin();
    tx->add_agent_attribute("aws.requestId", "testid");
    tx->add_custom_attribute("answer", 42);
    REQUIRE(tx->complete());

    tx->add_agent_attribute("aws.region", "us-west-2");
    tx->add_custom_attribute("late", true);
    tx->set_status_code(200);

    REQUIRE(tx->agent_attribute_candidates().size() == 1);
    REQUIRE(tx->agent_attributes().trans_event.size() == 1);
    REQUIRE(tx->agent_attributes().trans_event.at("aws.requestId") == "testid");
    REQUIRE(tx->custom_attributes().trans_event.size() == 1);
    REQUIRE_FALSE(tx->status_code().has_value());
  }

  SECTION("duration is measured between begin and completion")
  {
    REQUIRE(tx->duration() == std::chrono::nanoseconds::zero());
    tx->begin();
    REQUIRE(tx->complete());
    const auto duration = tx->duration();
    REQUIRE(duration >= std::chrono::nanoseconds::zero());
    REQUIRE(tx->duration() == duration);
  }
}

TEST_CASE("unit: transaction finalization", "[unit]")
{
  asio::io_context io;
  auto agent = lambdatrace::core::agent::create(io);

  SECTION("background metrics")
  {
    auto tx = agent->tracer().begin(transaction_kind::background, "Function", "testName");
    REQUIRE(tx->complete(std::nullopt, "worked"));

    const auto& metrics = agent->metrics();
    for (const auto* name : { "OtherTransaction/all",
                              "OtherTransaction/Function/testName",
                              "OtherTransactionTotalTime",
                              "OtherTransactionTotalTime/Function/testName" }) {
      INFO(name);
      REQUIRE(metrics.get_metric(name).has_value());
      REQUIRE(metrics.get_metric(name)->call_count == 1);
    }
    REQUIRE_FALSE(metrics.get_metric("WebTransaction").has_value());
    REQUIRE_FALSE(metrics.get_apdex("Apdex").has_value());
  }

  SECTION("web metrics")
  {
    auto tx = agent->tracer().begin(transaction_kind::web, "Function", "testName");
    REQUIRE(tx->full_name() == "WebTransaction/Function/testName");
    REQUIRE(tx->complete());

    const auto& metrics = agent->metrics();
    for (const auto* name : { "HttpDispatcher",
                              "WebTransaction",
                              "WebTransaction/Function/testName",
                              "WebTransactionTotalTime",
                              "WebTransactionTotalTime/Function/testName" }) {
      INFO(name);
      REQUIRE(metrics.get_metric(name).has_value());
      REQUIRE(metrics.get_metric(name)->call_count == 1);
    }
    REQUIRE(metrics.get_apdex("Apdex")->satisfying == 1);
    REQUIRE(metrics.get_apdex("Apdex/Function/testName")->satisfying == 1);
    REQUIRE_FALSE(metrics.get_metric("OtherTransaction/all").has_value());
  }

  SECTION("errored web transactions are frustrating")
  {
    auto tx = agent->tracer().begin(transaction_kind::web, "Function", "testName");
    REQUIRE(tx->complete(handler_error{ "failed" }));

    REQUIRE(agent->metrics().get_apdex("Apdex")->frustrating == 1);
    REQUIRE(agent->metrics().get_apdex("Apdex")->satisfying == 0);
  }

  SECTION("server error responses are noticed")
  {
    auto tx = agent->tracer().begin(transaction_kind::web, "Function", "testName");
    tx->set_status_code(503);
    REQUIRE(tx->complete());

    const auto errors = agent->errors().errors();
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].class_name == "HttpError");
    REQUIRE(errors[0].message == "HttpError 503");
    REQUIRE(agent->metrics().get_apdex("Apdex")->frustrating == 1);
  }

  SECTION("server error results passed to completion are noticed")
  {
    auto tx = agent->tracer().begin(transaction_kind::web, "Function", "testName");
    REQUIRE(tx->complete(std::nullopt, tao::json::value{ { "statusCode", 503 } }));
    REQUIRE(tx->status_code() == std::optional<std::uint32_t>{ 503 });

    const auto errors = agent->errors().errors();
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].class_name == "HttpError");
    REQUIRE(errors[0].message == "HttpError 503");
    REQUIRE(agent->metrics().get_apdex("Apdex")->frustrating == 1);
    REQUIRE(agent->metrics().get_apdex("Apdex")->satisfying == 0);
  }

  SECTION("successful results passed to completion are satisfying")
  {
    auto tx = agent->tracer().begin(transaction_kind::web, "Function", "testName");
    REQUIRE(tx->complete(std::nullopt, tao::json::value{ { "statusCode", "200" } }));
    REQUIRE(tx->status_code() == std::optional<std::uint32_t>{ 200 });
    REQUIRE(agent->errors().size() == 0);
    REQUIRE(agent->metrics().get_apdex("Apdex")->satisfying == 1);
  }

  SECTION("status codes of background results are ignored")
  {
    auto tx = agent->tracer().begin(transaction_kind::background, "Function", "testName");
    REQUIRE(tx->complete(std::nullopt, tao::json::value{ { "statusCode", 500 } }));
    REQUIRE_FALSE(tx->status_code().has_value());
    REQUIRE(agent->errors().size() == 0);
  }

  SECTION("server error capture can be disabled")
  {
    auto options = agent->options();
    options.error_collector.capture_server_errors = false;
    agent->reconfigure(options);

    auto tx = agent->tracer().begin(transaction_kind::web, "Function", "testName");
    tx->set_status_code(500);
    REQUIRE(tx->complete());
    REQUIRE(agent->errors().size() == 0);
  }

  SECTION("errors noticed while running are captured with the completion error")
  {
    auto tx = agent->tracer().begin(transaction_kind::background, "Function", "testName");
    tx->notice_error(handler_error{ "RangeError", "out of range" });
    REQUIRE(tx->complete(handler_error{ "SyntaxError", "sad day" }));

    const auto errors = agent->errors().errors();
    REQUIRE(errors.size() == 2);
    REQUIRE(errors[0].class_name == "RangeError");
    REQUIRE(errors[1].class_name == "SyntaxError");
  }

  SECTION("observers see settled transactions")
  {
    std::size_t noticed_errors = 0;
    std::size_t frozen_attributes = 0;
    std::uint64_t call_count = 0;
    agent->on_transaction_finished([&](const std::shared_ptr<lambdatrace::core::transaction>& tx) {
      REQUIRE_FALSE(tx->is_active());
      noticed_errors = agent->errors().size();
      frozen_attributes = tx->agent_attributes().trans_trace.size();
      call_count = agent->metrics().get_metric("OtherTransaction/all")->call_count;
    });

    auto tx = agent->tracer().begin(transaction_kind::background, "Function", "testName");
    tx->add_agent_attribute("aws.requestId", "testid");
    REQUIRE(tx->complete(handler_error{ "failed" }));

    REQUIRE(noticed_errors == 1);
    REQUIRE(frozen_attributes == 1);
    REQUIRE(call_count == 1);
  }

  SECTION("failing observers do not affect other observers")
  {
    std::size_t finished = 0;
    agent->on_transaction_finished([](const auto& /* tx */) { throw std::runtime_error("observer failure"); });
    auto token = agent->on_transaction_finished([&finished](const auto& /* tx */) { ++finished; });

    auto tx = agent->tracer().begin(transaction_kind::background, "Function", "testName");
    REQUIRE(tx->complete());
    REQUIRE(finished == 1);

    agent->remove_transaction_finished_handler(token);
    auto other = agent->tracer().begin(transaction_kind::background, "Function", "testName");
    REQUIRE(other->complete());
    REQUIRE(finished == 1);
  }

  SECTION("observers throwing values of any type do not escape completion")
  {
    std::size_t finished = 0;
    agent->on_transaction_finished([](const auto& /* tx */) { throw 42; });
    agent->on_transaction_finished([&finished](const auto& /* tx */) { ++finished; });

    auto tx = agent->tracer().begin(transaction_kind::web, "Function", "testName");
    REQUIRE_NOTHROW(tx->complete(std::nullopt, tao::json::value{ { "statusCode", 200 } }));
    REQUIRE(finished == 1);
    REQUIRE(tx->state() == transaction_state::ended);
  }
}

TEST_CASE("unit: transaction duration is never read before the end is recorded", "[unit]")
{
  asio::io_context io;
  auto agent = lambdatrace::core::agent::create(io);

  for (int attempt = 0; attempt < 100; ++attempt) {
    auto tx = agent->tracer().begin(transaction_kind::background, "Function", "testName");

    std::atomic_bool done{ false };
    std::atomic_bool negative{ false };
    std::thread reader([&]() {
      while (!done) {
        if (tx->duration() < std::chrono::nanoseconds::zero()) {
          negative = true;
        }
      }
    });
    REQUIRE(tx->complete());
    done = true;
    reader.join();

    REQUIRE_FALSE(negative);
    REQUIRE(tx->duration() >= std::chrono::nanoseconds::zero());
  }
}

TEST_CASE("unit: completion latch", "[unit]")
{
  using lambdatrace::core::lambda::completion_latch;
  using lambdatrace::core::lambda::completion_signal;

  completion_latch latch{};
  REQUIRE_FALSE(latch.is_fired());
  REQUIRE_FALSE(latch.fired_by().has_value());

  REQUIRE(latch.try_fire(completion_signal::succeed));
  REQUIRE(latch.is_fired());
  REQUIRE(latch.fired_by() == completion_signal::succeed);

  for (auto signal : { completion_signal::callback,
                       completion_signal::done,
                       completion_signal::succeed,
                       completion_signal::fail,
                       completion_signal::exception }) {
    REQUIRE_FALSE(latch.try_fire(signal));
  }
  REQUIRE(latch.fired_by() == completion_signal::succeed);
}
