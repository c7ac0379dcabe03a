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
#include "patricia/detail/pp.hpp"

#include <source_location>
#include <string>
#include <string_view>

namespace patricia::detail {

/// Logs `message` and throws a `panic_exception`.
[[noreturn]] void panic_impl(std::string message, std::source_location source);

[[noreturn]] void
fail_assertion_impl(const char* expr, std::string_view explanation,
                    std::source_location source);

} // namespace patricia::detail

// NOLINTBEGIN

#define PATRICIA_ASSERT_ALWAYS_1(expr)                                         \
  do {                                                                         \
    if (not static_cast<bool>(expr)) [[unlikely]] {                            \
      ::patricia::detail::fail_assertion_impl(                                 \
        #expr, {}, std::source_location::current());                           \
    }                                                                          \
  } while (false)

#define PATRICIA_ASSERT_ALWAYS_2(expr, explanation)                            \
  do {                                                                         \
    if (not static_cast<bool>(expr)) [[unlikely]] {                            \
      ::patricia::detail::fail_assertion_impl(                                 \
        #expr, explanation, std::source_location::current());                  \
    }                                                                          \
  } while (false)

/// Checks an invariant regardless of the build configuration.
#define PATRICIA_ASSERT_ALWAYS(...)                                            \
  PATRICIA_PP_OVERLOAD(PATRICIA_ASSERT_ALWAYS_, __VA_ARGS__)(__VA_ARGS__)

#if PATRICIA_ENABLE_ASSERTIONS
#  define PATRICIA_ASSERT(...) PATRICIA_ASSERT_ALWAYS(__VA_ARGS__)
#else
#  define PATRICIA_ASSERT(...) PATRICIA_DISCARD_ARGS(__VA_ARGS__)
#endif

// NOLINTEND
