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

#include "agent_state.hxx"

namespace lambdatrace::core
{
auto
agent_state::consume_cold_start() -> bool
{
  return cold_start_.exchange(false);
}

auto
agent_state::is_cold_start() const -> bool
{
  return cold_start_.load();
}

auto
agent_state::cache_lambda_arn(const std::string& arn) -> bool
{
  if (arn.empty()) {
    return false;
  }
  const std::scoped_lock lock(arn_mutex_);
  if (lambda_arn_.has_value()) {
    return false;
  }
  lambda_arn_ = arn;
  return true;
}

auto
agent_state::lambda_arn() const -> std::optional<std::string>
{
  const std::scoped_lock lock(arn_mutex_);
  return lambda_arn_;
}

void
agent_state::reset()
{
  cold_start_ = true;
  const std::scoped_lock lock(arn_mutex_);
  lambda_arn_.reset();
}
} // namespace lambdatrace::core
