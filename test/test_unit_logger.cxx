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

#include "core/logger/configuration.hxx"
#include "core/logger/logger.hxx"

#include <spdlog/sinks/ringbuffer_sink.h>

#include <memory>
#include <string>
#include <vector>

using lambdatrace::core::logger::level;

namespace
{
auto
capture_logger(level log_level) -> std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt>
{
  auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(16);

  lambdatrace::core::logger::configuration config{};
  config.unit_test = true;
  config.console = false;
  config.log_level = log_level;
  config.sink = sink;
  auto error = lambdatrace::core::logger::create_file_logger(config);
  INFO(error.value_or(""));
  REQUIRE_FALSE(error);
  return sink;
}
} // namespace

TEST_CASE("unit: log levels from strings", "[unit]")
{
  REQUIRE(lambdatrace::core::logger::level_from_str("trace") == level::trace);
  REQUIRE(lambdatrace::core::logger::level_from_str("debug") == level::debug);
  REQUIRE(lambdatrace::core::logger::level_from_str("info") == level::info);
  REQUIRE(lambdatrace::core::logger::level_from_str("warning") == level::warn);
  REQUIRE(lambdatrace::core::logger::level_from_str("error") == level::err);
  REQUIRE(lambdatrace::core::logger::level_from_str("critical") == level::critical);
  REQUIRE(lambdatrace::core::logger::level_from_str("off") == level::off);
}

TEST_CASE("unit: logger filters by level", "[unit]")
{
  auto sink = capture_logger(level::info);
  REQUIRE(lambdatrace::core::logger::is_initialized());
  REQUIRE(lambdatrace::core::logger::should_log(level::info));
  REQUIRE_FALSE(lambdatrace::core::logger::should_log(level::debug));

  LT_LOG_DEBUG("hidden {}", 1);
  LT_LOG_INFO("transaction \"{}\" has been finished", "OtherTransaction/Function/testName");
  LT_LOG_WARNING("unable to send {} error(s)", 3);

  auto messages = sink->last_formatted();
  REQUIRE(messages.size() == 2);
  REQUIRE(messages[0].find("transaction \"OtherTransaction/Function/testName\" has been finished") !=
          std::string::npos);
  REQUIRE(messages[1].find("unable to send 3 error(s)") != std::string::npos);

  lambdatrace::core::logger::set_log_levels(level::debug);
  LT_LOG_DEBUG("visible {}", 2);
  messages = sink->last_formatted();
  REQUIRE(messages.size() == 3);
  REQUIRE(messages[2].find("visible 2") != std::string::npos);

  lambdatrace::core::logger::reset();
}

TEST_CASE("unit: logging without logger", "[unit]")
{
  lambdatrace::core::logger::reset();
  REQUIRE_FALSE(lambdatrace::core::logger::is_initialized());
  REQUIRE_FALSE(lambdatrace::core::logger::should_log(level::critical));
  LT_LOG_CRITICAL("dropped {}", 1);
  lambdatrace::core::logger::flush();

  lambdatrace::core::logger::create_blackhole_logger();
  REQUIRE(lambdatrace::core::logger::is_initialized());
  REQUIRE_FALSE(lambdatrace::core::logger::should_log(level::critical));
  LT_LOG_CRITICAL("dropped {}", 2);

  lambdatrace::core::logger::reset();
}
