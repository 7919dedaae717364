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

#include <lambdatrace/error_codes.hxx>

#include <string>

namespace lambdatrace::core::impl
{
struct agent_error_category : std::error_category {
  [[nodiscard]] auto name() const noexcept -> const char* override
  {
    return "lambdatrace.agent";
  }

  [[nodiscard]] auto message(int ev) const noexcept -> std::string override
  {
    switch (static_cast<errc::agent>(ev)) {
      case errc::agent::invalid_argument:
        return "invalid_argument (1)";
      case errc::agent::invalid_configuration:
        return "invalid_configuration (2)";
      case errc::agent::transaction_not_active:
        return "transaction_not_active (3)";
      case errc::agent::capture_disabled:
        return "capture_disabled (4)";
      case errc::agent::error_ignored:
        return "error_ignored (5)";
      case errc::agent::duplicate_error:
        return "duplicate_error (6)";
      case errc::agent::retention_cap_reached:
        return "retention_cap_reached (7)";
      case errc::agent::transport_failure:
        return "transport_failure (8)";
      case errc::agent::malformed_event:
        return "malformed_event (9)";
    }
    return "FIXME: unknown error code (recompile with newer library): lambdatrace.agent." +
           std::to_string(ev);
  }
};

const inline static agent_error_category category_instance;

auto
agent_category() noexcept -> const std::error_category&
{
  return category_instance;
}
} // namespace lambdatrace::core::impl
