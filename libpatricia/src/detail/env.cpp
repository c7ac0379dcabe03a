//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "patricia/detail/env.hpp"

#include "patricia/error.hpp"

#include <caf/make_message.hpp>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <mutex>

extern char** environ;

namespace patricia::detail {

namespace {

auto env_mutex() -> std::mutex& {
  static auto mutex = std::mutex{};
  return mutex;
}

} // namespace

auto getenv(std::string_view var) -> std::optional<std::string> {
  auto lock = std::scoped_lock{env_mutex()};
  // The string_view may not be null-terminated.
  auto key = std::string{var};
  if (const char* result = ::getenv(key.c_str()))
    return std::string{result};
  return std::nullopt;
}

auto setenv(std::string_view key, std::string_view value, int overwrite)
  -> caf::error {
  auto lock = std::scoped_lock{env_mutex()};
  auto key_str = std::string{key};
  auto value_str = std::string{value};
  if (::setenv(key_str.c_str(), value_str.c_str(), overwrite) == 0)
    return caf::none;
  return caf::make_error(ec::unspecified,
                         fmt::format("failed to set {}: {}", key_str,
                                     std::strerror(errno)));
}

auto unsetenv(std::string_view var) -> caf::error {
  auto lock = std::scoped_lock{env_mutex()};
  auto key = std::string{var};
  if (::unsetenv(key.c_str()) == 0)
    return caf::none;
  return caf::make_error(ec::unspecified,
                         fmt::format("failed to unset {}: {}", key,
                                     std::strerror(errno)));
}

auto environment() -> std::vector<std::pair<std::string, std::string>> {
  auto lock = std::scoped_lock{env_mutex()};
  auto result = std::vector<std::pair<std::string, std::string>>{};
  for (auto** env = environ; *env != nullptr; ++env) {
    auto str = std::string_view{*env};
    auto i = str.find('=');
    if (i == std::string_view::npos)
      continue;
    result.emplace_back(std::string{str.substr(0, i)},
                        std::string{str.substr(i + 1)});
  }
  return result;
}

} // namespace patricia::detail
