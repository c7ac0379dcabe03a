//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

namespace patricia::detail {

/// Swallows any number of arguments without evaluating side effects twice.
template <class... Ts>
constexpr void discard(Ts&&...) noexcept {
  // nop
}

} // namespace patricia::detail

// Unevaluated usage of arguments, which silences unused-variable warnings for
// log statements that are compiled out.
#define PATRICIA_DISCARD_ARGS(...)                                             \
  do {                                                                         \
    if (false) {                                                               \
      ::patricia::detail::discard(__VA_ARGS__);                                \
    }                                                                          \
  } while (false)

#define PATRICIA_UNUSED(...) ::patricia::detail::discard(__VA_ARGS__)
