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

#include "core/attributes/attribute_filter.hxx"
#include "core/attributes/attribute_names.hxx"

using lambdatrace::core::attributes::attribute_filter;
using lambdatrace::core::attributes::attribute_map;
using lambdatrace::core::attributes::destination;

TEST_CASE("unit: header keys are canonicalized to lowerCamel case", "[unit]")
{
  REQUIRE(attribute_filter::normalize_key("request.headers.X-Forwarded-For") ==
          "request.headers.xForwardedFor");
  REQUIRE(attribute_filter::normalize_key("request.headers.xForwardedFor") ==
          "request.headers.xForwardedFor");
  REQUIRE(attribute_filter::normalize_key("request.headers.XForwardedFor") ==
          "request.headers.xForwardedFor");
  REQUIRE(attribute_filter::normalize_key("request.headers.CloudFront-Is-SmartTV-Viewer") ==
          "request.headers.cloudFrontIsSmartTVViewer");
  REQUIRE(attribute_filter::normalize_key("response.headers.Content-Type") ==
          "response.headers.contentType");
  REQUIRE(attribute_filter::normalize_key("request.headers.host") == "request.headers.host");

  SECTION("keys outside of header namespaces are kept as is")
  {
    REQUIRE(attribute_filter::normalize_key("request.parameters.Team-Name") ==
            "request.parameters.Team-Name");
    REQUIRE(attribute_filter::normalize_key("aws.lambda.arn") == "aws.lambda.arn");
  }
}

TEST_CASE("unit: default destinations of attribute keys", "[unit]")
{
  const attribute_filter filter{ lambdatrace::attribute_options{} };

  attribute_map candidates{
    { "aws.region", "us-west-2" },
    { "aws.requestId", "testid" },
    { "aws.lambda.arn", "arn:test:function" },
    { "aws.lambda.coldStart", true },
    { "aws.lambda.functionName", "testName" },
    { "aws.lambda.functionVersion", "TestVersion" },
    { "aws.lambda.memoryLimit", "128" },
    { "aws.lambda.eventSource.arn", "stub:eventsource:arn" },
    { "request.parameters.name", "me" },
    { "some.unknown.key", 42 },
  };
  const auto projection = filter.project(candidates);

  for (const auto* key : { "aws.region", "aws.requestId", "aws.lambda.arn", "aws.lambda.coldStart", "some.unknown.key" }) {
    INFO(key);
    REQUIRE(projection.trans_event.count(key) == 1);
    REQUIRE(projection.trans_trace.count(key) == 1);
    REQUIRE(projection.error_event.count(key) == 1);
  }
  for (const auto* key : { "aws.lambda.functionName",
                           "aws.lambda.functionVersion",
                           "aws.lambda.memoryLimit",
                           "aws.lambda.eventSource.arn" }) {
    INFO(key);
    REQUIRE(projection.trans_event.count(key) == 0);
    REQUIRE(projection.trans_trace.count(key) == 1);
    REQUIRE(projection.error_event.count(key) == 1);
  }

  REQUIRE(projection.trans_event.count("request.parameters.name") == 0);
  REQUIRE(projection.trans_trace.count("request.parameters.name") == 0);
  REQUIRE(projection.error_event.count("request.parameters.name") == 0);

  REQUIRE(projection.get(destination::trans_trace).at("aws.lambda.coldStart") == true);
  REQUIRE(projection.get(destination::error_event).at("some.unknown.key") == 42);
}

TEST_CASE("unit: one exclude rule hides every casing of a header", "[unit]")
{
  lambdatrace::attribute_options options{};
  options.exclude = { "request.headers.xForwardedFor" };
  const attribute_filter filter{ options };

  attribute_map candidates{
    { "request.headers.X-Forwarded-For", "192.168.100.1" },
    { "request.headers.XForwardedFor", "192.168.100.1" },
    { "request.headers.xForwardedFor", "192.168.100.1" },
    { "request.headers.X-Forwarded-Port", "443" },
  };
  const auto projection = filter.project(candidates);

  for (const auto& attributes : { projection.trans_event, projection.trans_trace, projection.error_event }) {
    REQUIRE(attributes.count("request.headers.xForwardedFor") == 0);
    REQUIRE(attributes.count("request.headers.X-Forwarded-For") == 0);
    REQUIRE(attributes.count("request.headers.XForwardedFor") == 0);
    REQUIRE(attributes.at("request.headers.xForwardedPort") == "443");
  }
}

TEST_CASE("unit: default exclude rules", "[unit]")
{
  const attribute_filter filter{ lambdatrace::attribute_options{} };

  attribute_map candidates{
    { "request.headers.Cookie", "a=b" },
    { "request.headers.Authorization", "Basic Zm9vOmJhcg==" },
    { "request.headers.Proxy-Authorization", "Basic Zm9vOmJhcg==" },
    { "request.headers.X-Amz-Cf-Id", "cfid" },
    { "request.headers.X-Forwarded-Proto", "https" },
    { "response.headers.Set-Cookie", "a=b" },
    { "response.headers.Set-Cookie2", "a=b" },
    { "request.headers.Accept-Language", "en-US,en;q=0.8" },
    { "response.headers.Content-Type", "application/json" },
  };
  const auto projection = filter.project(candidates);

  REQUIRE(projection.trans_event.size() == 2);
  REQUIRE(projection.trans_event.at("request.headers.acceptLanguage") == "en-US,en;q=0.8");
  REQUIRE(projection.trans_event.at("response.headers.contentType") == "application/json");
}

TEST_CASE("unit: include rules", "[unit]")
{
  lambdatrace::attribute_options options{};
  options.include = { "request.parameters.*", "aws.lambda.functionName", "request.headers.x*" };
  const attribute_filter filter{ options };

  attribute_map candidates{
    { "request.parameters.name", "me" },
    { "request.parameters.team", "node agent" },
    { "aws.lambda.functionName", "testName" },
    { "aws.lambda.functionVersion", "TestVersion" },
    { "request.headers.X-Forwarded-For", "192.168.100.1" },
  };
  const auto projection = filter.project(candidates);

  SECTION("include-only keys become visible in every destination")
  {
    REQUIRE(projection.trans_event.at("request.parameters.name") == "me");
    REQUIRE(projection.trans_event.at("request.parameters.team") == "node agent");
    REQUIRE(projection.error_event.at("request.parameters.name") == "me");
  }

  SECTION("limited keys are widened to the transaction events")
  {
    REQUIRE(projection.trans_event.at("aws.lambda.functionName") == "testName");
    REQUIRE(projection.trans_event.count("aws.lambda.functionVersion") == 0);
  }

  SECTION("include does not override exclude")
  {
    REQUIRE(projection.trans_event.count("request.headers.xForwardedFor") == 0);
    REQUIRE(projection.trans_trace.count("request.headers.xForwardedFor") == 0);
  }
}

TEST_CASE("unit: disabled attributes", "[unit]")
{
  lambdatrace::attribute_options options{};
  options.enabled = false;
  options.include = { "aws.*" };
  attribute_filter filter{ options };

  attribute_map candidates{
    { "aws.region", "us-west-2" },
    { "aws.lambda.coldStart", true },
  };

  auto projection = filter.project(candidates);
  REQUIRE(projection.trans_event.empty());
  REQUIRE(projection.trans_trace.empty());
  REQUIRE(projection.error_event.empty());

  SECTION("reconfigure applies to the next projection")
  {
    filter.reconfigure(lambdatrace::attribute_options{});
    REQUIRE(projection.trans_event.empty());

    projection = filter.project(candidates);
    REQUIRE(projection.trans_event.size() == 2);
  }
}
