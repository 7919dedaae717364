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

#include "attribute_filter.hxx"

#include "attribute_names.hxx"

#include <cctype>

namespace lambdatrace::core::attributes
{
namespace
{
auto
starts_with(std::string_view str, std::string_view prefix) -> bool
{
  return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

auto
to_lower_camel(std::string_view name) -> std::string
{
  std::string result;
  result.reserve(name.size());
  bool first_segment = true;
  std::size_t pos = 0;
  while (pos <= name.size()) {
    auto next = name.find('-', pos);
    if (next == std::string_view::npos) {
      next = name.size();
    }
    auto segment = name.substr(pos, next - pos);
    if (!segment.empty()) {
      auto initial = static_cast<unsigned char>(segment.front());
      result.push_back(static_cast<char>(first_segment ? std::tolower(initial)
                                                       : std::toupper(initial)));
      result.append(segment.substr(1));
      first_segment = false;
    }
    pos = next + 1;
  }
  return result;
}
} // namespace

auto
attribute_projection::get(destination dest) const -> const attribute_map&
{
  switch (dest) {
    case destination::trans_event:
      return trans_event;
    case destination::trans_trace:
      return trans_trace;
    case destination::error_event:
      return error_event;
  }
  return trans_trace;
}

auto
attribute_filter::rule::matches(std::string_view key) const -> bool
{
  if (wildcard) {
    return starts_with(key, pattern);
  }
  return key == pattern;
}

attribute_filter::attribute_filter(attribute_options options)
{
  reconfigure(std::move(options));
}

auto
attribute_filter::compile(const std::vector<std::string>& patterns) -> std::vector<rule>
{
  std::vector<rule> rules;
  rules.reserve(patterns.size());
  for (const auto& pattern : patterns) {
    if (pattern.empty()) {
      continue;
    }
    if (pattern.back() == '*') {
      rules.push_back({ normalize_key(pattern.substr(0, pattern.size() - 1)), true });
    } else {
      rules.push_back({ normalize_key(pattern), false });
    }
  }
  return rules;
}

void
attribute_filter::reconfigure(attribute_options options)
{
  auto include = compile(options.include);
  auto exclude = compile(options.exclude);

  const std::scoped_lock lock(mutex_);
  enabled_ = options.enabled;
  include_ = std::move(include);
  exclude_ = std::move(exclude);
}

auto
attribute_filter::normalize_key(std::string_view key) -> std::string
{
  for (const std::string_view prefix : { http::request_headers_prefix, http::response_headers_prefix }) {
    if (starts_with(key, prefix)) {
      return std::string{ prefix } + to_lower_camel(key.substr(prefix.size()));
    }
  }
  return std::string{ key };
}

auto
attribute_filter::default_destinations(std::string_view key) -> destination_mask
{
  if (starts_with(key, http::request_parameters_prefix)) {
    return no_destinations;
  }
  if (key == lambda::function_name || key == lambda::function_version ||
      key == lambda::memory_limit || key == lambda::event_source_arn) {
    return limited_destinations;
  }
  return all_destinations;
}

auto
attribute_filter::destinations_for(std::string_view key) const -> destination_mask
{
  const std::scoped_lock lock(mutex_);
  return destinations_locked(key);
}

auto
attribute_filter::destinations_locked(std::string_view key) const -> destination_mask
{
  if (!enabled_) {
    return no_destinations;
  }
  for (const auto& r : exclude_) {
    if (r.matches(key)) {
      return no_destinations;
    }
  }
  for (const auto& r : include_) {
    if (r.matches(key)) {
      return all_destinations;
    }
  }
  return default_destinations(key);
}

auto
attribute_filter::project(const attribute_map& candidates) const -> attribute_projection
{
  attribute_projection projection{};

  const std::scoped_lock lock(mutex_);
  if (!enabled_) {
    return projection;
  }
  for (const auto& [raw_key, value] : candidates) {
    auto key = normalize_key(raw_key);
    const auto mask = destinations_locked(key);
    if (has_destination(mask, destination::trans_event)) {
      projection.trans_event.insert_or_assign(key, value);
    }
    if (has_destination(mask, destination::trans_trace)) {
      projection.trans_trace.insert_or_assign(key, value);
    }
    if (has_destination(mask, destination::error_event)) {
      projection.error_event.insert_or_assign(key, value);
    }
  }
  return projection;
}
} // namespace lambdatrace::core::attributes
