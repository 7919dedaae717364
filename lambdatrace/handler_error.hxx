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

#include <exception>
#include <optional>
#include <string>

namespace lambdatrace
{
/**
 * The failure reported by an instrumented handler through one of its completion signals.
 *
 * A handler either fails with a typed error (it has a class name, a message and usually a stack)
 * or with a raw string, in which case the class name is always `"Error"` and the message is the
 * string itself.
 */
class handler_error
{
public:
  /**
   * Creates an error from a raw string.
   */
  explicit handler_error(std::string message);

  handler_error(std::string class_name,
                std::string message,
                std::optional<std::string> stack = std::nullopt);

  /**
   * Creates a typed error from a caught exception. The class name is the unqualified name of the
   * dynamic type of the exception.
   */
  static auto from_exception(const std::exception& e) -> handler_error;

  /**
   * Same as from_exception(), but also accepts exception pointers that do not hold a
   * std::exception.
   */
  static auto from_exception_ptr(const std::exception_ptr& e) -> handler_error;

  [[nodiscard]] auto class_name() const -> const std::string&;
  [[nodiscard]] auto message() const -> const std::string&;
  [[nodiscard]] auto stack() const -> const std::optional<std::string>&;

  /**
   * @return true if the error has been created from a raw string
   */
  [[nodiscard]] auto is_raw_string() const -> bool;

  auto operator==(const handler_error& other) const -> bool;
  auto operator!=(const handler_error& other) const -> bool;

private:
  std::string class_name_{ "Error" };
  std::string message_{};
  std::optional<std::string> stack_{};
  bool raw_string_{ false };
};
} // namespace lambdatrace
