//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "patricia/logger.hpp"

#include "patricia/config.hpp"
#include "patricia/defaults.hpp"
#include "patricia/detail/assert.hpp"
#include "patricia/error.hpp"

#include <caf/settings.hpp>
#include <fmt/format.h>
#include <spdlog/async.h>
#include <spdlog/common.h>
#include <spdlog/sinks/ansicolor_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>
#include <string_view>
#include <vector>

namespace patricia {

caf::expected<caf::detail::scope_guard<void (*)()>>
create_log_context(const caf::settings& cfg) {
  if (!patricia::detail::setup_spdlog(cfg))
    return caf::make_error(ec::invalid_configuration,
                           "failed to set up the logger");
  return {caf::detail::make_scope_guard(
    std::addressof(patricia::detail::shutdown_spdlog))};
}

/// Convert a log level to an int.
/// @note x is passed by value because it is modified.
int loglevel_to_int(std::string x, int default_value) {
  for (auto& ch : x)
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  if (x == "quiet")
    return PATRICIA_LOG_LEVEL_QUIET;
  if (x == "critical")
    return PATRICIA_LOG_LEVEL_CRITICAL;
  if (x == "error")
    return PATRICIA_LOG_LEVEL_ERROR;
  if (x == "warning")
    return PATRICIA_LOG_LEVEL_WARNING;
  if (x == "info")
    return PATRICIA_LOG_LEVEL_INFO;
  if (x == "verbose")
    return PATRICIA_LOG_LEVEL_VERBOSE;
  if (x == "debug")
    return PATRICIA_LOG_LEVEL_DEBUG;
  if (x == "trace")
    return PATRICIA_LOG_LEVEL_TRACE;
  return default_value;
}

namespace {

/// Converts a patricia log level to spdlog level
spdlog::level::level_enum patricia_loglevel_to_spd(const int value) {
  spdlog::level::level_enum level = spdlog::level::off;
  switch (value) {
    case PATRICIA_LOG_LEVEL_QUIET:
      break;
    case PATRICIA_LOG_LEVEL_CRITICAL:
      level = spdlog::level::critical;
      break;
    case PATRICIA_LOG_LEVEL_ERROR:
      level = spdlog::level::err;
      break;
    case PATRICIA_LOG_LEVEL_WARNING:
      level = spdlog::level::warn;
      break;
    case PATRICIA_LOG_LEVEL_INFO:
      level = spdlog::level::info;
      break;
    case PATRICIA_LOG_LEVEL_VERBOSE:
      level = spdlog::level::debug;
      break;
    case PATRICIA_LOG_LEVEL_DEBUG:
      level = spdlog::level::trace;
      break;
    case PATRICIA_LOG_LEVEL_TRACE:
      level = spdlog::level::trace;
      break;
    default:
      PATRICIA_ASSERT_ALWAYS(false, "unhandled log level");
  }
  return level;
}

/// Reads a verbosity setting and validates it.
/// @returns the numeric level, or -1 for invalid values.
int get_verbosity(const caf::settings& cfg, std::string_view key,
                  std::string_view fallback) {
  auto value = std::string{fallback};
  if (auto configured = caf::get_if<std::string>(&cfg, key))
    value = *configured;
  auto result = loglevel_to_int(value, -1);
  if (result < 0)
    fmt::print(stderr, "failed to start logger; {} '{}' is invalid\n", key,
               value);
  return result;
}

} // namespace

namespace detail {

bool setup_spdlog(const caf::settings& cfg) try {
  if (patricia::detail::logger()->name() != "/dev/null") {
    PATRICIA_ERROR("Log already up");
    return false;
  }
  auto console_verbosity
    = get_verbosity(cfg, "patricia.console-verbosity",
                    defaults::logger::console_verbosity);
  auto file_verbosity = get_verbosity(cfg, "patricia.file-verbosity",
                                      defaults::logger::file_verbosity);
  if (console_verbosity < 0 || file_verbosity < 0)
    return false;
  auto verbosity = std::max(file_verbosity, console_verbosity);
  // Helper to set the color mode
  spdlog::color_mode log_color = [&]() -> spdlog::color_mode {
    auto config_value
      = caf::get_or(cfg, "patricia.console", std::string{"automatic"});
    if (config_value == "automatic")
      return spdlog::color_mode::automatic;
    if (config_value == "always")
      return spdlog::color_mode::always;
    return spdlog::color_mode::never;
  }();
  spdlog::init_thread_pool(defaults::logger::queue_size,
                           defaults::logger::logger_threads);
  std::vector<spdlog::sink_ptr> sinks;
  // Add console sink.
  auto console_sink
    = std::make_shared<spdlog::sinks::ansicolor_stderr_sink_mt>(log_color);
  auto console_format
    = caf::get_or(cfg, "patricia.console-format",
                  std::string{defaults::logger::console_format});
  console_sink->set_pattern(console_format);
  console_sink->set_level(patricia_loglevel_to_spd(console_verbosity));
  sinks.push_back(console_sink);
  // Add file sink.
  if (file_verbosity != PATRICIA_LOG_LEVEL_QUIET) {
    auto log_file = caf::get_or(cfg, "patricia.log-file",
                                std::string{defaults::logger::log_file});
    auto file_sink
      = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file);
    file_sink->set_level(patricia_loglevel_to_spd(file_verbosity));
    auto file_format = caf::get_or(cfg, "patricia.file-format",
                                   std::string{defaults::logger::file_format});
    file_sink->set_pattern(file_format);
    sinks.push_back(file_sink);
  }
  // Replace the /dev/null logger that was created during init.
  logger() = std::make_shared<spdlog::async_logger>(
    "patricia", sinks.begin(), sinks.end(), spdlog::thread_pool(),
    spdlog::async_overflow_policy::block);
  logger()->set_level(patricia_loglevel_to_spd(verbosity));
  spdlog::register_logger(logger());
  return true;
} catch (const spdlog::spdlog_ex& err) {
  std::cerr << err.what() << "\n";
  return false;
}

void shutdown_spdlog() {
  PATRICIA_DEBUG("shut down logging");
  spdlog::shutdown();
}

std::shared_ptr<spdlog::logger>& logger() {
  static std::shared_ptr<spdlog::logger> patricia_logger
    = spdlog::async_factory::template create<spdlog::sinks::null_sink_mt>(
      "/dev/null");
  return patricia_logger;
}

} // namespace detail
} // namespace patricia
