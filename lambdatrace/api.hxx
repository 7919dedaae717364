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

#include <lambdatrace/handler.hxx>
#include <lambdatrace/handler_error.hxx>

#include <tao/json/value.hpp>

#include <memory>
#include <string>
#include <system_error>

namespace lambdatrace
{
namespace core
{
class agent;
} // namespace core

/**
 * Entry points of the instrumentation used by application code.
 */
class api
{
public:
  explicit api(std::shared_ptr<core::agent> agent);

  /**
   * Instruments a function handler, so that each of its invocations is recorded as a
   * transaction.
   *
   * @return the instrumented handler, or `user_handler` itself if it is empty
   */
  [[nodiscard]] auto record_lambda(handler user_handler) const -> handler;

  /**
   * Notices an error. Inside of an instrumented invocation the error is attached to its
   * transaction and captured when it ends, otherwise it is captured immediately.
   */
  auto notice_error(handler_error error) const -> std::error_code;

  /**
   * Adds a user attribute to the transaction of the current invocation.
   *
   * @return errc::agent::transaction_not_active outside of an active transaction
   */
  auto add_custom_attribute(const std::string& key, tao::json::value value) const
    -> std::error_code;

private:
  std::shared_ptr<core::agent> agent_;
};
} // namespace lambdatrace
