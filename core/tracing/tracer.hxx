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

#include "context_frame.hxx"

#include <lambdatrace/transaction_kind.hxx>

#include <memory>
#include <string>
#include <utility>

namespace lambdatrace::core
{
class agent;
class transaction;
} // namespace lambdatrace::core

namespace lambdatrace::core::tracing
{
/**
 * Creates transactions and exposes the one the calling continuation runs under.
 */
class tracer
{
public:
  explicit tracer(agent& agent);

  /**
   * Creates a transaction, consuming the cold start flag of the agent, and moves it to ACTIVE.
   *
   * The transaction is not current anywhere until it is entered through bind().
   */
  auto begin(transaction_kind kind, std::string group, std::string name)
    -> std::shared_ptr<transaction>;

  /**
   * Creates a new frame bound to the transaction. Continuations scheduled while the frame is
   * current observe the transaction through get_transaction().
   */
  static auto bind(std::shared_ptr<transaction> tx) -> std::shared_ptr<context_frame>;

  /**
   * @return the transaction of the current frame while it is active, nullptr otherwise
   */
  static auto get_transaction() -> std::shared_ptr<transaction>;

  /**
   * Wraps a continuation so that it runs inside the frame current at the time of the call.
   */
  template<typename Function>
  static auto bind_function(Function&& fn)
  {
    return context_frame::wrap(std::forward<Function>(fn));
  }

private:
  agent& agent_;
};
} // namespace lambdatrace::core::tracing
