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

#include <lambdatrace/handler_error.hxx>

#include <cstdlib>
#include <memory>
#include <string>
#include <typeinfo>

#if defined(__GNUC__) || defined(__clang__)
#include <cxxabi.h>
#endif

namespace lambdatrace
{
namespace
{
auto
demangle(const char* mangled) -> std::string
{
  std::string name{ mangled };
#if defined(__GNUC__) || defined(__clang__)
  int status = 0;
  std::unique_ptr<char, void (*)(void*)> demangled{
    abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free
  };
  if (status == 0 && demangled) {
    name = demangled.get();
  }
#endif
  // drop template arguments and namespace qualifiers, "ns::syntax_error" -> "syntax_error"
  if (auto angle = name.find('<'); angle != std::string::npos) {
    name.erase(angle);
  }
  if (auto colon = name.rfind("::"); colon != std::string::npos) {
    name.erase(0, colon + 2);
  }
  return name;
}
} // namespace

handler_error::handler_error(std::string message)
  : message_{ std::move(message) }
  , raw_string_{ true }
{
}

handler_error::handler_error(std::string class_name,
                             std::string message,
                             std::optional<std::string> stack)
  : class_name_{ std::move(class_name) }
  , message_{ std::move(message) }
  , stack_{ std::move(stack) }
{
}

auto
handler_error::from_exception(const std::exception& e) -> handler_error
{
  return { demangle(typeid(e).name()), e.what() };
}

auto
handler_error::from_exception_ptr(const std::exception_ptr& e) -> handler_error
{
  try {
    std::rethrow_exception(e);
  } catch (const std::exception& ex) {
    return from_exception(ex);
  } catch (const std::string& str) {
    return handler_error{ str };
  } catch (const char* str) {
    return handler_error{ std::string{ str } };
  } catch (...) {
    return { "Error", "unknown exception" };
  }
}

auto
handler_error::class_name() const -> const std::string&
{
  return class_name_;
}

auto
handler_error::message() const -> const std::string&
{
  return message_;
}

auto
handler_error::stack() const -> const std::optional<std::string>&
{
  return stack_;
}

auto
handler_error::is_raw_string() const -> bool
{
  return raw_string_;
}

auto
handler_error::operator==(const handler_error& other) const -> bool
{
  return class_name_ == other.class_name_ && message_ == other.message_ &&
         stack_ == other.stack_ && raw_string_ == other.raw_string_;
}

auto
handler_error::operator!=(const handler_error& other) const -> bool
{
  return !(*this == other);
}
} // namespace lambdatrace
