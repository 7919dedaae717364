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

#include "error_trace_serializer.hxx"

#include <tao/json/events/from_value.hpp>
#include <tao/json/events/to_string.hpp>

namespace lambdatrace::core::errors
{
namespace
{
template<typename Consumer>
void
emit_object(Consumer& consumer, const tao::json::value& object)
{
  if (object.is_object()) {
    tao::json::events::from_value(consumer, object);
    return;
  }
  consumer.begin_object(0);
  consumer.end_object(0);
}

template<typename Consumer>
void
emit_error(Consumer& consumer, const noticed_error& error)
{
  consumer.begin_array(5);
  consumer.number(error.timestamp);
  consumer.element();
  consumer.string(error.transaction_name);
  consumer.element();
  consumer.string(error.message);
  consumer.element();
  consumer.string(error.class_name);
  consumer.element();

  const std::size_t members = error.stack_trace ? 4 : 3;
  consumer.begin_object(members);
  consumer.key("userAttributes");
  emit_object(consumer, error.user_attributes);
  consumer.member();
  consumer.key("agentAttributes");
  emit_object(consumer, error.agent_attributes);
  consumer.member();
  consumer.key("intrinsics");
  emit_object(consumer, error.intrinsics);
  consumer.member();
  if (error.stack_trace) {
    consumer.key("stack_trace");
    consumer.begin_array(error.stack_trace->size());
    for (const auto& line : error.stack_trace.value()) {
      consumer.string(line);
      consumer.element();
    }
    consumer.end_array(error.stack_trace->size());
    consumer.member();
  }
  consumer.end_object(members);
  consumer.element();

  consumer.end_array(5);
}
} // namespace

auto
error_trace_serializer::serialize(std::int64_t run_id, const std::vector<noticed_error>& errors)
  -> std::string
{
  tao::json::events::to_string consumer;
  consumer.begin_array(2);
  consumer.number(run_id);
  consumer.element();
  consumer.begin_array(errors.size());
  for (const auto& error : errors) {
    emit_error(consumer, error);
    consumer.element();
  }
  consumer.end_array(errors.size());
  consumer.element();
  consumer.end_array(2);
  return consumer.value();
}
} // namespace lambdatrace::core::errors
