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

namespace lambdatrace::core::attributes
{
namespace aws
{
constexpr auto region = "aws.region";
constexpr auto request_id = "aws.requestId";
} // namespace aws

namespace lambda
{
constexpr auto arn = "aws.lambda.arn";
constexpr auto cold_start = "aws.lambda.coldStart";
constexpr auto function_name = "aws.lambda.functionName";
constexpr auto function_version = "aws.lambda.functionVersion";
constexpr auto memory_limit = "aws.lambda.memoryLimit";
constexpr auto event_source_arn = "aws.lambda.eventSource.arn";
} // namespace lambda

namespace http
{
constexpr auto request_method = "request.method";
constexpr auto request_uri = "request.uri";
constexpr auto request_parameters_prefix = "request.parameters.";
constexpr auto request_headers_prefix = "request.headers.";
constexpr auto response_headers_prefix = "response.headers.";

// legacy key, kept next to response.status for older consumers
constexpr auto response_code = "httpResponseCode";
constexpr auto response_status = "response.status";
} // namespace http

namespace intrinsics
{
constexpr auto error_expected = "error.expected";
} // namespace intrinsics
} // namespace lambdatrace::core::attributes
