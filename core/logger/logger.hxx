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

/*
 *   A note on the thread safety of the logger API:
 *
 *   The API is thread safe unless the underlying logger object is changed
 * during runtime. Switching loggers (console, file, blackhole) is expected to
 * happen while the agent is initialized, before the first invocation is
 * instrumented.
 */

#pragma once

#include "level.hxx"

#include <fmt/core.h>
#include <spdlog/fwd.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace lambdatrace::core::logger
{
struct configuration;

auto
level_from_str(const std::string& str) -> level;

/**
 * Initialize the logger.
 *
 * The default level for the created logger is set to INFO
 *
 * @param logger_settings the configuration for the logger
 * @return optional error message if something goes wrong
 */
auto
create_file_logger(const configuration& logger_settings) -> std::optional<std::string>;

/**
 * Initialize the logger with the blackhole logger object
 *
 * This method is intended to be used by unit tests which don't need any output (but may call
 * methods who tries to fetch the logger)
 */
void
create_blackhole_logger();

/**
 * Initialize the logger with the logger which logs to the console
 */
void
create_console_logger();

/**
 * Get the underlying logger object, or null when none has been created.
 */
auto
get() -> spdlog::logger*;

/**
 * Reset the underlying logger object
 */
void
reset();

/**
 * Set the log level of all registered spdLoggers
 * @param log severity level
 */
void
set_log_levels(level lvl);

/**
 * Checks whether a specific level should be logged based on the current
 * configuration.
 * @param level severity level to check
 * @return true if we should log at this level
 */
auto
should_log(level lvl) -> bool;

namespace detail
{
void
log(const char* file, int line, const char* function, level lvl, std::string_view msg);
} // namespace detail

/**
 * Logs a formatted message at a specific severity level.
 */
template<typename String, typename... Args>
inline void
log(const char* file, int line, const char* function, level lvl, const String& msg, Args&&... args)
{
  detail::log(file, line, function, lvl, fmt::format(msg, std::forward<Args>(args)...));
}

/**
 * Tell the logger to flush its buffers
 */
void
flush();

/**
 * Tell the logger to shut down (flush buffers) and release _ALL_
 * loggers (you'd need to create new loggers after this method)
 */
void
shutdown();

/**
 * @return whether or not the logger has been initialized
 */
auto
is_initialized() -> bool;

} // namespace lambdatrace::core::logger

#if defined(__GNUC__) || defined(__clang__)
#define LAMBDATRACE_LOGGER_FUNCTION __PRETTY_FUNCTION__
#else
#define LAMBDATRACE_LOGGER_FUNCTION __FUNCTION__
#endif

/**
 * We implement this macro to avoid having argument evaluation performed
 * on log messages which likely will not actually be logged due to their
 * severity value not matching the logger.
 */
#define LAMBDATRACE_LOG(file, line, function, severity, ...)                                       \
  do {                                                                                             \
    if (lambdatrace::core::logger::should_log(severity)) {                                         \
      lambdatrace::core::logger::log(file, line, function, severity, __VA_ARGS__);                 \
    }                                                                                              \
  } while (false)

#define LT_LOG_TRACE(...)                                                                          \
  LAMBDATRACE_LOG(__FILE__,                                                                        \
                  __LINE__,                                                                        \
                  LAMBDATRACE_LOGGER_FUNCTION,                                                     \
                  lambdatrace::core::logger::level::trace,                                         \
                  __VA_ARGS__)
#define LT_LOG_DEBUG(...)                                                                          \
  LAMBDATRACE_LOG(__FILE__,                                                                        \
                  __LINE__,                                                                        \
                  LAMBDATRACE_LOGGER_FUNCTION,                                                     \
                  lambdatrace::core::logger::level::debug,                                         \
                  __VA_ARGS__)
#define LT_LOG_INFO(...)                                                                           \
  LAMBDATRACE_LOG(__FILE__,                                                                        \
                  __LINE__,                                                                        \
                  LAMBDATRACE_LOGGER_FUNCTION,                                                     \
                  lambdatrace::core::logger::level::info,                                          \
                  __VA_ARGS__)
#define LT_LOG_WARNING(...)                                                                        \
  LAMBDATRACE_LOG(__FILE__,                                                                        \
                  __LINE__,                                                                        \
                  LAMBDATRACE_LOGGER_FUNCTION,                                                     \
                  lambdatrace::core::logger::level::warn,                                          \
                  __VA_ARGS__)
#define LT_LOG_ERROR(...)                                                                          \
  LAMBDATRACE_LOG(__FILE__,                                                                        \
                  __LINE__,                                                                        \
                  LAMBDATRACE_LOGGER_FUNCTION,                                                     \
                  lambdatrace::core::logger::level::err,                                           \
                  __VA_ARGS__)
#define LT_LOG_CRITICAL(...)                                                                       \
  LAMBDATRACE_LOG(__FILE__,                                                                        \
                  __LINE__,                                                                        \
                  LAMBDATRACE_LOGGER_FUNCTION,                                                     \
                  lambdatrace::core::logger::level::critical,                                      \
                  __VA_ARGS__)
