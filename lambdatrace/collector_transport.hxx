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

#include <functional>
#include <string>
#include <system_error>

namespace lambdatrace
{
/**
 * Uploads serialized payloads to the remote collector.
 *
 * The transport is owned by the host, the agent only hands it payloads during harvest.
 */
class collector_transport
{
public:
  collector_transport() = default;
  collector_transport(const collector_transport& other) = default;
  collector_transport(collector_transport&& other) = default;
  auto operator=(const collector_transport& other) -> collector_transport& = default;
  auto operator=(collector_transport&& other) -> collector_transport& = default;
  virtual ~collector_transport() = default;

  /**
   * Sends the payload to the given collector method (for example `error_data`). The handler must
   * be invoked exactly once, with an empty error code if the collector accepted the payload.
   */
  virtual void send(const std::string& method,
                    std::string payload,
                    std::function<void(std::error_code)>&& handler) = 0;
};
} // namespace lambdatrace
