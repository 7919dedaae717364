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

#include "tracer.hxx"

#include "core/agent.hxx"
#include "core/transaction.hxx"

namespace lambdatrace::core::tracing
{
tracer::tracer(agent& agent)
  : agent_{ agent }
{
}

auto
tracer::begin(transaction_kind kind, std::string group, std::string name)
  -> std::shared_ptr<transaction>
{
  const bool cold_start = agent_.state().consume_cold_start();
  auto tx = std::make_shared<transaction>(
    agent_.shared_from_this(), kind, std::move(group), std::move(name), cold_start);
  tx->begin();
  return tx;
}

auto
tracer::bind(std::shared_ptr<transaction> tx) -> std::shared_ptr<context_frame>
{
  return std::make_shared<context_frame>(std::move(tx));
}

auto
tracer::get_transaction() -> std::shared_ptr<transaction>
{
  auto tx = context_frame::current_transaction();
  if (tx == nullptr || !tx->is_active()) {
    return nullptr;
  }
  return tx;
}
} // namespace lambdatrace::core::tracing
