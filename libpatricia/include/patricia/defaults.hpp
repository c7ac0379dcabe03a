//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <cstddef>
#include <string_view>

namespace patricia::defaults {

// -- global constants ---------------------------------------------------------

/// The prefix of environment variables that map onto configuration keys.
inline constexpr std::string_view env_prefix = "PATRICIA";

/// The environment variable that names a configuration file.
inline constexpr std::string_view config_env = "PATRICIA_CONFIG";

// -- constants for the logger -------------------------------------------------

namespace logger {

/// Log file name.
inline constexpr std::string_view log_file = "patricia.log";

/// Format for printing individual log entries to the log file.
inline constexpr std::string_view file_format
  = "[%Y-%m-%dT%T.%e%z] [%n] [%l] [%s:%#] %v";

/// Format for printing individual log entries to the console.
inline constexpr std::string_view console_format = "%^[%T.%e] %v%$";

/// Verbosity for writing to console.
inline constexpr std::string_view console_verbosity = "info";

/// Verbosity for writing to file.
inline constexpr std::string_view file_verbosity = "quiet";

/// Maximum number of log messages in the logger queue.
inline constexpr size_t queue_size = 100;

/// Number of logger threads.
inline constexpr size_t logger_threads = 1;

} // namespace logger

} // namespace patricia::defaults
