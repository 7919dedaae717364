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

#include "context_frame.hxx"

namespace lambdatrace::core::tracing
{
namespace
{
thread_local std::shared_ptr<context_frame> current_frame{};
} // namespace

context_frame::context_frame(std::shared_ptr<transaction> tx)
  : transaction_{ std::move(tx) }
{
}

auto
context_frame::current() -> std::shared_ptr<context_frame>
{
  return current_frame;
}

auto
context_frame::current_transaction() -> std::shared_ptr<transaction>
{
  if (current_frame == nullptr) {
    return nullptr;
  }
  return current_frame->transaction_;
}

auto
context_frame::get_transaction() const -> const std::shared_ptr<transaction>&
{
  return transaction_;
}

context_frame::scope::scope(std::shared_ptr<context_frame> frame)
  : previous_{ std::exchange(current_frame, std::move(frame)) }
{
}

context_frame::scope::~scope()
{
  current_frame = std::move(previous_);
}
} // namespace lambdatrace::core::tracing
