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

#include <asio/execution.hpp>
#include <asio/prefer.hpp>
#include <asio/query.hpp>
#include <asio/require.hpp>

#include <memory>
#include <type_traits>
#include <utility>

namespace lambdatrace::core::tracing
{
/**
 * Executor adapter that propagates a context frame to every function it executes.
 *
 * The frame is captured when the executor is created (by default the frame current at that
 * moment). Handlers bound to the executor, posted to it, or used as completion handlers of timers
 * with asio::bind_executor() run inside that frame. Properties are forwarded to the inner
 * executor, so the adapter can be used wherever the inner executor can.
 */
template<typename Executor>
class context_executor
{
public:
  using inner_executor_type = Executor;

  explicit context_executor(Executor inner)
    : inner_{ std::move(inner) }
    , frame_{ context_frame::current() }
  {
  }

  context_executor(Executor inner, std::shared_ptr<context_frame> frame)
    : inner_{ std::move(inner) }
    , frame_{ std::move(frame) }
  {
  }

  [[nodiscard]] auto inner_executor() const noexcept -> const Executor&
  {
    return inner_;
  }

  [[nodiscard]] auto frame() const noexcept -> const std::shared_ptr<context_frame>&
  {
    return frame_;
  }

  template<typename Property>
  auto query(const Property& property) const
    -> decltype(asio::query(std::declval<const Executor&>(), property))
  {
    return asio::query(inner_, property);
  }

  template<typename Property>
  auto require(const Property& property) const -> context_executor<
    std::decay_t<decltype(asio::require(std::declval<const Executor&>(), property))>>
  {
    return { asio::require(inner_, property), frame_ };
  }

  template<typename Property>
  auto prefer(const Property& property) const -> context_executor<
    std::decay_t<decltype(asio::prefer(std::declval<const Executor&>(), property))>>
  {
    return { asio::prefer(inner_, property), frame_ };
  }

  template<typename Function>
  void execute(Function&& fn) const
  {
    inner_.execute(
      [frame = frame_, fn = std::decay_t<Function>(std::forward<Function>(fn))]() mutable {
        const context_frame::scope guard{ frame };
        fn();
      });
  }

  friend auto operator==(const context_executor& lhs, const context_executor& rhs) noexcept -> bool
  {
    return lhs.inner_ == rhs.inner_ && lhs.frame_ == rhs.frame_;
  }

  friend auto operator!=(const context_executor& lhs, const context_executor& rhs) noexcept -> bool
  {
    return !(lhs == rhs);
  }

private:
  Executor inner_;
  std::shared_ptr<context_frame> frame_;
};

/**
 * Creates an executor that runs functions on `inner` inside the current context frame.
 */
template<typename Executor>
auto
make_context_executor(Executor inner) -> context_executor<Executor>
{
  return context_executor<Executor>{ std::move(inner) };
}
} // namespace lambdatrace::core::tracing
