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

#include <lambdatrace/agent_options.hxx>

#include <tao/json/value.hpp>

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace lambdatrace::core::attributes
{
enum class destination : std::uint8_t {
  trans_event = 0x01,
  trans_trace = 0x02,
  error_event = 0x04,
};

using destination_mask = std::uint8_t;

constexpr destination_mask no_destinations{ 0x00 };
constexpr destination_mask all_destinations{ 0x07 };
constexpr destination_mask limited_destinations{ 0x06 };

constexpr auto
has_destination(destination_mask mask, destination dest) -> bool
{
  return (mask & static_cast<destination_mask>(dest)) != 0;
}

using attribute_map = std::map<std::string, tao::json::value>;

/**
 * Result of projecting a flat set of candidate attributes onto the three destinations.
 */
struct attribute_projection {
  attribute_map trans_event{};
  attribute_map trans_trace{};
  attribute_map error_event{};

  [[nodiscard]] auto get(destination dest) const -> const attribute_map&;
};

/**
 * Applies enable/include/exclude policy to attribute keys.
 *
 * Rules are matched against the canonical form of a key (see normalize_key()), either exactly or,
 * when the rule ends with '*', by prefix.
 */
class attribute_filter
{
public:
  explicit attribute_filter(attribute_options options);

  /**
   * Replaces the policy. Projections computed before the call are not affected.
   */
  void reconfigure(attribute_options options);

  /**
   * Canonical form of an attribute key. Keys under `request.headers.` and `response.headers.`
   * have the header name converted to lowerCamel case, so that `X-Forwarded-For`,
   * `xForwardedFor` and `XForwardedFor` all become `xForwardedFor`. Other keys are returned as is.
   */
  static auto normalize_key(std::string_view key) -> std::string;

  /**
   * Default destinations of a canonical key, before include and exclude rules are applied.
   */
  static auto default_destinations(std::string_view key) -> destination_mask;

  /**
   * Destinations a canonical key is visible in under the current policy.
   */
  [[nodiscard]] auto destinations_for(std::string_view key) const -> destination_mask;

  [[nodiscard]] auto project(const attribute_map& candidates) const -> attribute_projection;

private:
  struct rule {
    std::string pattern;
    bool wildcard;

    [[nodiscard]] auto matches(std::string_view key) const -> bool;
  };

  static auto compile(const std::vector<std::string>& patterns) -> std::vector<rule>;

  [[nodiscard]] auto destinations_locked(std::string_view key) const -> destination_mask;

  mutable std::mutex mutex_{};
  bool enabled_{ true };
  std::vector<rule> include_{};
  std::vector<rule> exclude_{};
};
} // namespace lambdatrace::core::attributes
