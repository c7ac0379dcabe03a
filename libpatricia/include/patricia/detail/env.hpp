//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <caf/error.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace patricia::detail {

/// A thread-safe wrapper around `::getenv`.
/// @param var The environment variable.
/// @returns The copied environment variable contents, or `std::nullopt`.
auto getenv(std::string_view var) -> std::optional<std::string>;

/// A thread-safe wrapper around `::setenv`.
auto setenv(std::string_view key, std::string_view value, int overwrite = 1)
  -> caf::error;

/// A thread-safe wrapper around `::unsetenv`.
auto unsetenv(std::string_view var) -> caf::error;

/// Retrieves all environment variables as list of key-value pairs.
auto environment() -> std::vector<std::pair<std::string, std::string>>;

} // namespace patricia::detail
