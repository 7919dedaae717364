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

#include "invocation_wrapper.hxx"

#include "completion_latch.hxx"
#include "event_source.hxx"

#include "core/agent.hxx"
#include "core/attributes/attribute_names.hxx"
#include "core/logger/logger.hxx"
#include "core/metrics/metric_aggregator.hxx"
#include "core/tracing/context_frame.hxx"
#include "core/tracing/tracer.hxx"
#include "core/transaction.hxx"

#include <cstdlib>
#include <string>
#include <utility>

namespace lambdatrace::core::lambda
{
namespace
{
constexpr auto region_variable = "AWS_REGION";

void
add_string_attribute(transaction& tx, const char* key, const std::string& value)
{
  if (!value.empty()) {
    tx.add_agent_attribute(key, value);
  }
}

void
add_prefixed_attributes(transaction& tx,
                        const std::string& prefix,
                        const tao::json::value& object,
                        const std::string& member)
{
  const auto* values = object.find(member);
  if (values == nullptr || !values->is_object()) {
    return;
  }
  for (const auto& [name, value] : values->get_object()) {
    tx.add_agent_attribute(prefix + name, value);
  }
}

void
capture_request_attributes(transaction& tx, const tao::json::value& event)
{
  if (const auto* method = event.find("httpMethod"); method != nullptr) {
    tx.add_agent_attribute(attributes::http::request_method, *method);
  }
  if (const auto* path = event.find("path"); path != nullptr) {
    tx.add_agent_attribute(attributes::http::request_uri, *path);
  }
  add_prefixed_attributes(tx, attributes::http::request_parameters_prefix, event, "queryStringParameters");
  add_prefixed_attributes(tx, attributes::http::request_parameters_prefix, event, "pathParameters");
  add_prefixed_attributes(tx, attributes::http::request_headers_prefix, event, "headers");
}

void
capture_invocation_attributes(agent& agent,
                              transaction& tx,
                              const tao::json::value& event,
                              const invocation_context& context)
{
  if (tx.cold_start()) {
    tx.add_agent_attribute(attributes::lambda::cold_start, true);
  }
  if (!context.invoked_function_arn.empty()) {
    agent.state().cache_lambda_arn(context.invoked_function_arn);
    tx.add_agent_attribute(attributes::lambda::arn, context.invoked_function_arn);
  }
  if (const auto* region = std::getenv(region_variable); region != nullptr && region[0] != '\0') {
    tx.add_agent_attribute(attributes::aws::region, std::string{ region });
  }
  add_string_attribute(tx, attributes::aws::request_id, context.aws_request_id);
  add_string_attribute(tx, attributes::lambda::function_name, context.function_name);
  add_string_attribute(tx, attributes::lambda::function_version, context.function_version);
  add_string_attribute(tx, attributes::lambda::memory_limit, context.memory_limit_in_mb);

  if (auto event_source_arn = classify_event_source(event); event_source_arn) {
    tx.add_agent_attribute(attributes::lambda::event_source_arn, event_source_arn.value());
  }
  if (tx.kind() == transaction_kind::web) {
    capture_request_attributes(tx, event);
  }
}

void
capture_response_attributes(transaction& tx, const tao::json::value& result)
{
  const auto status_code = proxy_response_status_code(result);
  if (!status_code) {
    return;
  }
  const auto status = std::to_string(status_code.value());
  tx.add_agent_attribute(attributes::http::response_code, status);
  tx.add_agent_attribute(attributes::http::response_status, status);
  add_prefixed_attributes(tx, attributes::http::response_headers_prefix, result, "headers");
}

/**
 * Ends the transaction of one invocation, at most once.
 */
class invocation_completion
{
public:
  explicit invocation_completion(std::shared_ptr<transaction> tx)
    : tx_{ std::move(tx) }
  {
  }

  void operator()(completion_signal signal,
                  const std::optional<handler_error>& error,
                  const tao::json::value& result) const
  {
    if (!latch_->try_fire(signal)) {
      LT_LOG_TRACE("transaction \"{}\" ({}) has already been completed, ignore signal {}",
                   tx_->full_name(),
                   tx_->id(),
                   static_cast<int>(signal));
      return;
    }
    if (tx_->kind() == transaction_kind::web) {
      try {
        capture_response_attributes(*tx_, result);
      } catch (const std::exception& e) {
        LT_LOG_DEBUG("unable to capture response attributes of transaction \"{}\" ({}): {}",
                     tx_->full_name(),
                     tx_->id(),
                     e.what());
      } catch (...) {
        LT_LOG_DEBUG(
          "unable to capture response attributes of transaction \"{}\" ({}): unknown exception",
          tx_->full_name(),
          tx_->id());
      }
    }
    tx_->complete(error, result);
  }

  void notice_exception(const std::exception_ptr& exception) const noexcept
  {
    try {
      (*this)(completion_signal::exception,
              handler_error::from_exception_ptr(exception),
              tao::json::null);
    } catch (const std::exception& e) {
      LT_LOG_DEBUG("unable to complete transaction \"{}\" ({}) after exception: {}",
                   tx_->full_name(),
                   tx_->id(),
                   e.what());
    } catch (...) {
      LT_LOG_DEBUG("unable to complete transaction \"{}\" ({}) after exception: unknown exception",
                   tx_->full_name(),
                   tx_->id());
    }
  }

private:
  std::shared_ptr<transaction> tx_;
  std::shared_ptr<completion_latch> latch_{ std::make_shared<completion_latch>() };
};

void
invoke(const std::shared_ptr<agent>& agent,
       const handler& user_handler,
       const tao::json::value& event,
       std::shared_ptr<invocation_context> context,
       completion_callback callback)
{
  if (context == nullptr) {
    LT_LOG_DEBUG("invocation without context object, run handler without instrumentation");
    return user_handler(event, std::move(context), std::move(callback));
  }

  const auto kind =
    is_api_gateway_proxy_event(event) ? transaction_kind::web : transaction_kind::background;
  auto tx = agent->tracer().begin(kind, agent->options().transaction_group, context->function_name);

  try {
    capture_invocation_attributes(*agent, *tx, event, *context);
  } catch (const std::exception& e) {
    LT_LOG_DEBUG("unable to capture invocation attributes of transaction \"{}\" ({}): {}",
                 tx->full_name(),
                 tx->id(),
                 e.what());
  } catch (...) {
    LT_LOG_DEBUG(
      "unable to capture invocation attributes of transaction \"{}\" ({}): unknown exception",
      tx->full_name(),
      tx->id());
  }

  const invocation_completion completion{ tx };

  auto instrumented_context = std::make_shared<invocation_context>(*context);
  instrumented_context->done = [completion, original = context->done](
                                 std::optional<handler_error> error, tao::json::value result) {
    completion(completion_signal::done, error, result);
    if (original) {
      original(std::move(error), std::move(result));
    }
  };
  instrumented_context->succeed = [completion, original = context->succeed](tao::json::value result) {
    completion(completion_signal::succeed, std::nullopt, result);
    if (original) {
      original(std::move(result));
    }
  };
  instrumented_context->fail = [completion, original = context->fail](std::optional<handler_error> error) {
    completion(completion_signal::fail, error, tao::json::null);
    if (original) {
      original(std::move(error));
    }
  };
  completion_callback instrumented_callback = [completion, original = std::move(callback)](
                                                std::optional<handler_error> error,
                                                tao::json::value result) {
    completion(completion_signal::callback, error, result);
    if (original) {
      original(std::move(error), std::move(result));
    }
  };

  const tracing::context_frame::scope scope{ tracing::tracer::bind(tx) };
  try {
    user_handler(event, std::move(instrumented_context), std::move(instrumented_callback));
  } catch (...) {
    completion.notice_exception(std::current_exception());
    throw;
  }
}
} // namespace

invocation_wrapper::invocation_wrapper(std::shared_ptr<agent> agent)
  : agent_{ std::move(agent) }
{
}

auto
invocation_wrapper::wrap(handler user_handler) const -> handler
{
  if (!user_handler) {
    LT_LOG_DEBUG("handler is not invocable, return it as is");
    return user_handler;
  }

  agent_->metrics().increment(metrics::names::supportability_record_lambda);
  return [agent = agent_, user_handler = std::move(user_handler)](
           const tao::json::value& event,
           std::shared_ptr<invocation_context> context,
           completion_callback callback) {
    invoke(agent, user_handler, event, std::move(context), std::move(callback));
  };
}
} // namespace lambdatrace::core::lambda
