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

#include "core/errors/error_aggregator.hxx"
#include "core/errors/error_trace_serializer.hxx"

#include <tao/json/from_string.hpp>

using lambdatrace::core::errors::error_trace_serializer;
using lambdatrace::core::errors::noticed_error;

TEST_CASE("unit: error trace serializer matches the collector protocol", "[unit]")
{
  lambdatrace::core::errors::error_aggregator aggregator{ lambdatrace::error_collector_options{} };

  auto ec = aggregator.add(nullptr, lambdatrace::handler_error{ "Error", "test", "test stack" });
  REQUIRE_SUCCESS(ec);

  const auto payload = error_trace_serializer::serialize(1, aggregator.drain());
  REQUIRE(payload == R"([1,[[0,"Unknown","test","Error",{"userAttributes":{},"agentAttributes":{},)"
                     R"("intrinsics":{"error.expected":false},"stack_trace":["test stack"]}]]])");
}

TEST_CASE("unit: error trace serializer", "[unit]")
{
  SECTION("no errors")
  {
    REQUIRE(error_trace_serializer::serialize(42, {}) == "[42,[]]");
  }

  SECTION("stack trace is omitted when the error has no stack")
  {
    noticed_error error{};
    error.message = "boom";
    error.class_name = "RangeError";
    error.intrinsics["error.expected"] = true;

    REQUIRE(error_trace_serializer::serialize(7, { error }) ==
            R"([7,[[0,"Unknown","boom","RangeError",{"userAttributes":{},"agentAttributes":{},)"
            R"("intrinsics":{"error.expected":true}}]]])");
  }

  SECTION("errors keep capture order and attributes keep their values")
  {
    noticed_error first{};
    first.timestamp = 1529596800123;
    first.transaction_name = "OtherTransaction/Function/testName";
    first.message = "sad day";
    first.class_name = "SyntaxError";
    first.user_attributes["answer"] = 42;
    first.agent_attributes["aws.requestId"] = "testid";
    first.agent_attributes["aws.lambda.coldStart"] = true;
    first.intrinsics["error.expected"] = false;
    first.stack_trace = std::vector<std::string>{ "SyntaxError: sad day", "    at handler" };

    noticed_error second{};
    second.message = "quote \" and backslash \\";
    second.intrinsics["error.expected"] = false;

    const auto payload = error_trace_serializer::serialize(3, { first, second });
    REQUIRE(payload ==
            R"([3,[[1529596800123,"OtherTransaction/Function/testName","sad day","SyntaxError",)"
            R"({"userAttributes":{"answer":42},)"
            R"("agentAttributes":{"aws.lambda.coldStart":true,"aws.requestId":"testid"},)"
            R"("intrinsics":{"error.expected":false},)"
            R"("stack_trace":["SyntaxError: sad day","    at handler"]}],)"
            R"([0,"Unknown","quote \" and backslash \\","Error",{"userAttributes":{},)"
            R"("agentAttributes":{},"intrinsics":{"error.expected":false}}]]])");

    const auto parsed = tao::json::from_string(payload);
    REQUIRE(parsed.get_array().at(1).get_array().size() == 2);
  }
}
