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

#include <system_error>

namespace lambdatrace
{
namespace core::impl
{
const std::error_category&
agent_category() noexcept;
} // namespace core::impl

namespace errc
{
/**
 * Error codes reported by the instrumentation core itself. They never reach the instrumented
 * handler, but are returned to the host (and to tests) to explain why something was not
 * recorded.
 */
enum class agent {
  /**
   * An argument passed to the agent API is not usable (for example an empty handler).
   */
  invalid_argument = 1,

  /**
   * The options document could not be decoded, or contains a value of the wrong type.
   */
  invalid_configuration = 2,

  /**
   * The operation requires an active transaction, but there is none in the current context, or
   * the transaction has already ended.
   */
  transaction_not_active = 3,

  /**
   * Error capture has been disabled by configuration.
   */
  capture_disabled = 4,

  /**
   * The error class is listed in the ignored classes.
   */
  error_ignored = 5,

  /**
   * The same error has already been noticed for the transaction.
   */
  duplicate_error = 6,

  /**
   * The error aggregator reached its retention cap and the overflow policy rejected the error.
   */
  retention_cap_reached = 7,

  /**
   * The collector transport reported a failure, the payload has been kept for the next harvest.
   */
  transport_failure = 8,

  /**
   * The invocation event does not have the expected shape.
   */
  malformed_event = 9,
};

inline auto
make_error_code(agent e) noexcept -> std::error_code
{
  return { static_cast<int>(e), core::impl::agent_category() };
}
} // namespace errc
} // namespace lambdatrace

template<>
struct std::is_error_code_enum<lambdatrace::errc::agent> : std::true_type {
};
