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

#include <lambdatrace/agent_options.hxx>
#include <lambdatrace/api.hxx>
#include <lambdatrace/collector_transport.hxx>

#include "core/agent.hxx"
#include "core/logger/logger.hxx"

#include <asio/io_context.hpp>
#include <fmt/core.h>
#include <tao/json.hpp>

#include <iostream>
#include <memory>
#include <string_view>
#include <system_error>

using namespace std::literals::string_view_literals;

namespace
{
class stdout_transport : public lambdatrace::collector_transport
{
public:
  void send(const std::string& method,
            std::string payload,
            std::function<void(std::error_code)>&& handler) override
  {
    std::cout << method << ": " << payload << "\n";
    handler({});
  }
};
} // namespace

int
main()
{
  lambdatrace::core::logger::create_console_logger();
  lambdatrace::core::logger::set_log_levels(lambdatrace::core::logger::level::debug);

  auto options = lambdatrace::agent_options::from_json(R"({
    "transaction_group": "Function",
    "attributes": { "include": ["request.parameters.*"] }
  })"sv);
  if (!options) {
    std::cout << "Unable to decode agent options. ec: " << options.error().message() << "\n";
    return 1;
  }

  asio::io_context io;
  auto agent =
    lambdatrace::core::agent::create(io, options.value(), std::make_shared<stdout_transport>());
  agent->set_run_id(1);
  const lambdatrace::api api{ agent };

  auto handler = api.record_lambda([&api](const tao::json::value& event,
                                          const std::shared_ptr<lambdatrace::invocation_context>& context,
                                          const lambdatrace::completion_callback& callback) {
    if (event.find("httpMethod") == nullptr) {
      return context->fail(lambdatrace::handler_error{ "not an HTTP request" });
    }
    if (auto ec = api.add_custom_attribute("customer", "acme"); ec) {
      std::cout << "Unable to add custom attribute. ec: " << ec.message() << "\n";
    }
    callback(std::nullopt, tao::json::value{ { "statusCode", 200 }, { "body", "hello" } });
  });

  auto context = std::make_shared<lambdatrace::invocation_context>();
  context->function_name = "minimal";
  context->function_version = "$LATEST";
  context->invoked_function_arn = "arn:aws:lambda:us-east-1:123456789012:function:minimal";
  context->memory_limit_in_mb = "128";
  context->aws_request_id = "00000000-0000-0000-0000-000000000001";

  const tao::json::value web_event{
    { "httpMethod", "GET" },
    { "path", "/hello" },
    { "queryStringParameters", { { "name", "me" } } },
    { "headers", { { "Accept", "text/plain" } } },
  };
  handler(web_event, context, [](auto error, auto result) {
    std::cout << "web invocation: " << (error ? error->message() : tao::json::to_string(result))
              << "\n";
  });

  handler(tao::json::empty_object, context, [](auto /* error */, auto /* result */) {});

  agent->harvest([](std::error_code ec) {
    std::cout << "harvest: " << (ec ? ec.message() : "ok") << "\n";
  });
  io.run();

  lambdatrace::core::logger::shutdown();
  return 0;
}
