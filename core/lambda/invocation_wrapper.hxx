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

#include <memory>

namespace lambdatrace::core
{
class agent;
} // namespace lambdatrace::core

namespace lambdatrace::core::lambda
{
/**
 * Instruments serverless function handlers.
 *
 * Every call of an instrumented handler runs under its own transaction: it is started before the
 * user handler, populated with attributes of the invocation, and ended by whichever completion
 * signal fires first (the trailing callback, `context->done`, `context->succeed` or
 * `context->fail`), or by an exception escaping the handler. The handler observes exactly the
 * same arguments, callbacks and exceptions as without instrumentation.
 */
class invocation_wrapper
{
public:
  explicit invocation_wrapper(std::shared_ptr<agent> agent);

  /**
   * @return the instrumented handler, or `user_handler` itself if it is empty
   */
  [[nodiscard]] auto wrap(handler user_handler) const -> handler;

private:
  std::shared_ptr<agent> agent_;
};
} // namespace lambdatrace::core::lambda
