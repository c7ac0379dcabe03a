//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "patricia/fwd.hpp"

#include <caf/config_value.hpp>
#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <caf/settings.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace patricia {

/// Translates an environment variable to a config key. All keys follow the
/// pattern PREFIX_SUFFIX, where PREFIX is the application-specific prefix
/// that gets stripped. Thereafter, SUFFIX adheres to the following
/// substitution rules:
/// 1. A '_' translates into '-'
/// 2. A "__" translates into the record separator '.'
/// For example, `PATRICIA_LOG_FILE` becomes `log-file`.
/// @pre `!prefix.empty()`
auto to_config_key(std::string_view key, std::string_view prefix)
  -> std::optional<std::string>;

/// Parses the value of an environment variable. Values that do not parse as
/// a config value are taken as plain strings.
auto to_config_value(std::string_view value) -> caf::config_value;

/// Merges `PATRICIA_*` environment variables into a configuration. Keys end
/// up below `patricia.`, e.g., `PATRICIA_CONSOLE_VERBOSITY=debug` sets
/// `patricia.console-verbosity`.
auto merge_environment(caf::settings& config) -> caf::error;

/// Reads a YAML configuration file into settings. Nested mappings become
/// nested dictionaries.
auto load_config_file(const std::filesystem::path& path)
  -> caf::expected<caf::settings>;

/// Assembles the effective configuration from the defaults, a configuration
/// file, and the environment, with later layers taking precedence.
/// @param file The configuration file; if absent, the file named by the
/// `PATRICIA_CONFIG` environment variable, if any.
auto make_configuration(std::optional<std::filesystem::path> file = {})
  -> caf::expected<caf::settings>;

} // namespace patricia
