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

#include <lambdatrace/api.hxx>
#include <lambdatrace/error_codes.hxx>

#include "core/agent.hxx"
#include "core/lambda/invocation_wrapper.hxx"
#include "core/logger/logger.hxx"
#include "core/tracing/tracer.hxx"
#include "core/transaction.hxx"

#include <gsl/assert>

namespace lambdatrace
{
api::api(std::shared_ptr<core::agent> agent)
  : agent_{ std::move(agent) }
{
  Expects(agent_ != nullptr);
}

auto
api::record_lambda(handler user_handler) const -> handler
{
  return core::lambda::invocation_wrapper{ agent_ }.wrap(std::move(user_handler));
}

auto
api::notice_error(handler_error error) const -> std::error_code
{
  if (auto tx = core::tracing::tracer::get_transaction(); tx != nullptr) {
    tx->notice_error(std::move(error));
    return {};
  }
  auto ec = agent_->errors().add(nullptr, error);
  if (ec) {
    LT_LOG_DEBUG("error \"{}\" noticed outside of a transaction has not been retained: {}",
                 error.class_name(),
                 ec.message());
  }
  return ec;
}

auto
api::add_custom_attribute(const std::string& key, tao::json::value value) const -> std::error_code
{
  if (key.empty()) {
    return errc::agent::invalid_argument;
  }
  auto tx = core::tracing::tracer::get_transaction();
  if (tx == nullptr) {
    return errc::agent::transaction_not_active;
  }
  tx->add_custom_attribute(key, std::move(value));
  return {};
}
} // namespace lambdatrace
