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

#include <memory>
#include <type_traits>
#include <utility>

namespace lambdatrace::core
{
class transaction;
} // namespace lambdatrace::core

namespace lambdatrace::core::tracing
{
/**
 * Continuation-scoped binding of the transaction an invocation runs under.
 *
 * At any point in time a thread has at most one current frame. A frame is made current for a
 * synchronous extent with context_frame::scope, and every continuation that captured the frame
 * (with wrap() or through context_executor) re-enters it when it runs, even if it runs on
 * another call stack. Frames are immutable, and two invocations never share one.
 */
class context_frame
{
public:
  explicit context_frame(std::shared_ptr<transaction> tx);

  context_frame(const context_frame&) = delete;
  context_frame(context_frame&&) = delete;
  auto operator=(const context_frame&) -> context_frame& = delete;
  auto operator=(context_frame&&) -> context_frame& = delete;
  ~context_frame() = default;

  /**
   * @return the frame current on this thread, or nullptr outside of any frame
   */
  static auto current() -> std::shared_ptr<context_frame>;

  /**
   * @return the transaction of the current frame (regardless of its state), or nullptr
   */
  static auto current_transaction() -> std::shared_ptr<transaction>;

  [[nodiscard]] auto get_transaction() const -> const std::shared_ptr<transaction>&;

  /**
   * Makes the frame current until the scope is destroyed, then restores the previous one.
   * Entering a null frame hides the enclosing frame.
   */
  class scope
  {
  public:
    explicit scope(std::shared_ptr<context_frame> frame);
    scope(const scope&) = delete;
    scope(scope&&) = delete;
    auto operator=(const scope&) -> scope& = delete;
    auto operator=(scope&&) -> scope& = delete;
    ~scope();

  private:
    std::shared_ptr<context_frame> previous_;
  };

  /**
   * Captures the current frame and returns a function object that invokes `fn` inside of it.
   */
  template<typename Function>
  static auto wrap(Function&& fn)
  {
    return wrap(current(), std::forward<Function>(fn));
  }

  template<typename Function>
  static auto wrap(std::shared_ptr<context_frame> frame, Function&& fn)
  {
    return [frame = std::move(frame), fn = std::forward<Function>(fn)](auto&&... args) mutable {
      const scope guard{ frame };
      return fn(std::forward<decltype(args)>(args)...);
    };
  }

private:
  std::shared_ptr<transaction> transaction_;
};
} // namespace lambdatrace::core::tracing
