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

#include "noticed_error.hxx"

#include <cstdint>
#include <string>
#include <vector>

namespace lambdatrace::core::errors
{
/**
 * Produces the `error_data` payload of the collector:
 *
 * [run_id,[[timestamp,transactionName,message,className,{"userAttributes":{...},
 * "agentAttributes":{...},"intrinsics":{...},"stack_trace":[...]}],...]]
 *
 * Members are emitted in exactly this order, and `stack_trace` only when the error has a stack.
 */
class error_trace_serializer
{
public:
  static auto serialize(std::int64_t run_id, const std::vector<noticed_error>& errors) -> std::string;
};
} // namespace lambdatrace::core::errors
