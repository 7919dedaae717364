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

#include <atomic>
#include <optional>

namespace lambdatrace::core::lambda
{
/**
 * The conventions by which a handler reports that it is done.
 */
enum class completion_signal {
  callback,
  done,
  succeed,
  fail,

  /**
   * Not a convention: the handler threw before reporting completion.
   */
  exception,
};

/**
 * One-shot latch shared by all completion signals of an invocation. The first signal to fire
 * wins, every later one is rejected.
 */
class completion_latch
{
public:
  completion_latch() = default;
  completion_latch(const completion_latch&) = delete;
  completion_latch(completion_latch&&) = delete;
  auto operator=(const completion_latch&) -> completion_latch& = delete;
  auto operator=(completion_latch&&) -> completion_latch& = delete;
  ~completion_latch() = default;

  /**
   * @return true if this call fired the latch
   */
  auto try_fire(completion_signal signal) -> bool
  {
    auto expected = unfired;
    return state_.compare_exchange_strong(expected, static_cast<int>(signal));
  }

  [[nodiscard]] auto is_fired() const -> bool
  {
    return state_.load() != unfired;
  }

  /**
   * @return the signal that fired the latch, if any
   */
  [[nodiscard]] auto fired_by() const -> std::optional<completion_signal>
  {
    const auto state = state_.load();
    if (state == unfired) {
      return {};
    }
    return static_cast<completion_signal>(state);
  }

private:
  static constexpr int unfired{ -1 };

  std::atomic_int state_{ unfired };
};
} // namespace lambdatrace::core::lambda
