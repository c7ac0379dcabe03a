//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "patricia/config.hpp"
#include "patricia/detail/discard.hpp"

#include <caf/detail/scope_guard.hpp>
#include <caf/expected.hpp>
#include <caf/fwd.hpp>

#include <string>

// PATRICIA_INFO -> spdlog::info
// PATRICIA_VERBOSE -> spdlog::debug
// PATRICIA_DEBUG -> spdlog::trace
// PATRICIA_TRACE -> spdlog::trace

#if PATRICIA_LOG_LEVEL == PATRICIA_LOG_LEVEL_TRACE
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#elif PATRICIA_LOG_LEVEL == PATRICIA_LOG_LEVEL_DEBUG
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#elif PATRICIA_LOG_LEVEL == PATRICIA_LOG_LEVEL_VERBOSE
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#elif PATRICIA_LOG_LEVEL == PATRICIA_LOG_LEVEL_INFO
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#elif PATRICIA_LOG_LEVEL == PATRICIA_LOG_LEVEL_WARNING
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_WARN
#elif PATRICIA_LOG_LEVEL == PATRICIA_LOG_LEVEL_ERROR
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_ERROR
#elif PATRICIA_LOG_LEVEL == PATRICIA_LOG_LEVEL_CRITICAL
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_CRITICAL
#elif PATRICIA_LOG_LEVEL == PATRICIA_LOG_LEVEL_QUIET
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_OFF
#endif

// Important: keep that below the log level mapping
#include "patricia/detail/logger.hpp"

#if PATRICIA_LOG_LEVEL >= PATRICIA_LOG_LEVEL_TRACE

#  define PATRICIA_TRACE(...)                                                  \
    SPDLOG_LOGGER_TRACE(::patricia::detail::logger(), __VA_ARGS__)

#else // PATRICIA_LOG_LEVEL < PATRICIA_LOG_LEVEL_TRACE

#  define PATRICIA_TRACE(...) PATRICIA_DISCARD_ARGS(__VA_ARGS__)

#endif // PATRICIA_LOG_LEVEL < PATRICIA_LOG_LEVEL_TRACE

#if PATRICIA_LOG_LEVEL >= PATRICIA_LOG_LEVEL_DEBUG

#  define PATRICIA_DEBUG(...)                                                  \
    SPDLOG_LOGGER_TRACE(::patricia::detail::logger(), __VA_ARGS__)

#else // PATRICIA_LOG_LEVEL < PATRICIA_LOG_LEVEL_DEBUG

#  define PATRICIA_DEBUG(...) PATRICIA_DISCARD_ARGS(__VA_ARGS__)

#endif // PATRICIA_LOG_LEVEL < PATRICIA_LOG_LEVEL_DEBUG

#if PATRICIA_LOG_LEVEL >= PATRICIA_LOG_LEVEL_VERBOSE

#  define PATRICIA_VERBOSE(...)                                                \
    SPDLOG_LOGGER_DEBUG(::patricia::detail::logger(), __VA_ARGS__)

#else // PATRICIA_LOG_LEVEL < PATRICIA_LOG_LEVEL_VERBOSE

#  define PATRICIA_VERBOSE(...) PATRICIA_DISCARD_ARGS(__VA_ARGS__)

#endif // PATRICIA_LOG_LEVEL < PATRICIA_LOG_LEVEL_VERBOSE

#if PATRICIA_LOG_LEVEL >= PATRICIA_LOG_LEVEL_INFO

#  define PATRICIA_INFO(...)                                                   \
    SPDLOG_LOGGER_INFO(::patricia::detail::logger(), __VA_ARGS__)

#else // PATRICIA_LOG_LEVEL < PATRICIA_LOG_LEVEL_INFO

#  define PATRICIA_INFO(...) PATRICIA_DISCARD_ARGS(__VA_ARGS__)

#endif // PATRICIA_LOG_LEVEL < PATRICIA_LOG_LEVEL_INFO

#if PATRICIA_LOG_LEVEL >= PATRICIA_LOG_LEVEL_WARNING

#  define PATRICIA_WARN(...)                                                   \
    SPDLOG_LOGGER_WARN(::patricia::detail::logger(), __VA_ARGS__)

#else // PATRICIA_LOG_LEVEL < PATRICIA_LOG_LEVEL_WARNING

#  define PATRICIA_WARN(...) PATRICIA_DISCARD_ARGS(__VA_ARGS__)

#endif // PATRICIA_LOG_LEVEL < PATRICIA_LOG_LEVEL_WARNING

#if PATRICIA_LOG_LEVEL >= PATRICIA_LOG_LEVEL_ERROR

#  define PATRICIA_ERROR(...)                                                  \
    SPDLOG_LOGGER_ERROR(::patricia::detail::logger(), __VA_ARGS__)

#else // PATRICIA_LOG_LEVEL < PATRICIA_LOG_LEVEL_ERROR

#  define PATRICIA_ERROR(...) PATRICIA_DISCARD_ARGS(__VA_ARGS__)

#endif // PATRICIA_LOG_LEVEL < PATRICIA_LOG_LEVEL_ERROR

#if PATRICIA_LOG_LEVEL >= PATRICIA_LOG_LEVEL_CRITICAL

#  define PATRICIA_CRITICAL(...)                                               \
    SPDLOG_LOGGER_CRITICAL(::patricia::detail::logger(), __VA_ARGS__)

#else // PATRICIA_LOG_LEVEL < PATRICIA_LOG_LEVEL_CRITICAL

#  define PATRICIA_CRITICAL(...) PATRICIA_DISCARD_ARGS(__VA_ARGS__)

#endif // PATRICIA_LOG_LEVEL < PATRICIA_LOG_LEVEL_CRITICAL

namespace patricia {

/// Converts a verbosity to its integer counterpart. For unknown values,
/// the `default_value` parameter will be returned.
/// Used to make log level strings from config, like 'debug', to a log level int.
int loglevel_to_int(std::string c, int default_value = PATRICIA_LOG_LEVEL_QUIET);

/// Installs the sinks configured in `cfg` on the global logger.
/// @returns a guard that shuts down logging when it goes out of scope.
[[nodiscard]] caf::expected<caf::detail::scope_guard<void (*)()>>
create_log_context(const caf::settings& cfg);

} // namespace patricia
