//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "patricia/fwd.hpp"

#include "patricia/detail/assert.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <caf/is_error_code_enum.hpp>
#include <fmt/format.h>

#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>

namespace patricia {

/// The error codes of this library.
enum class ec : uint8_t {
  /// No error.
  no_error = 0,
  /// The unspecified default error code.
  unspecified,
  /// A key is not stored in the trie, or no stored key is a prefix of the
  /// scanned text. The error context holds the path matched so far.
  key_not_found,
  /// Failure during parsing.
  parse_error,
  /// A configuration value or file is invalid.
  invalid_configuration,
  /// An error while accessing the filesystem.
  filesystem_error,
  /// An error caused by wrong internal application logic.
  logic_error,
  /// No error; number of error codes.
  ec_count,
};

/// @relates ec
auto to_string(ec x) -> const char*;

/// A formatting function that converts an error into a human-readable string.
/// @relates ec
auto render(const caf::error& err) -> std::string;

/// Retrieves the structurally matched path that a `key_not_found` error
/// carries in its context.
/// @returns the matched path, or `std::nullopt` for other errors.
/// @relates ec
auto matched_prefix(const caf::error& err) -> std::optional<std::string>;

template <class Inspector>
auto inspect(Inspector& f, ec& x) {
  using underlying = std::underlying_type_t<ec>;
  auto get = [&] {
    return static_cast<underlying>(x);
  };
  auto set = [&](underlying value) {
    if (value >= static_cast<underlying>(ec::ec_count)) {
      return false;
    }
    x = static_cast<ec>(value);
    return true;
  };
  return f.apply(get, set);
}

auto add_context_impl(const caf::error& error, std::string str) -> caf::error;

template <class... Ts>
auto add_context(const caf::error& error, fmt::format_string<Ts...> fmt,
                 Ts&&... args) -> caf::error {
  return add_context_impl(error, fmt::format(std::move(fmt),
                                             std::forward<Ts>(args)...));
}

inline void check(const caf::error& err, std::source_location location
                                         = std::source_location::current()) {
  if (err) [[unlikely]] {
    detail::panic_impl(render(err), location);
  }
}

template <class T>
[[nodiscard]] auto
check(caf::expected<T> result, std::source_location location
                               = std::source_location::current()) -> T {
  if (not result) [[unlikely]] {
    detail::panic_impl(render(result.error()), location);
  }
  return std::move(*result);
}

} // namespace patricia

CAF_ERROR_CODE_ENUM(patricia::ec)

template <>
struct fmt::formatter<patricia::ec> : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(patricia::ec x, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(patricia::to_string(x),
                                                    ctx);
  }
};
