//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

// NOLINTBEGIN

#define PATRICIA_PP_PASTE(x, y) x##y
#define PATRICIA_PP_PASTE2(x, y) PATRICIA_PP_PASTE(x, y)

#define PATRICIA_PP_SIZE(...)                                                  \
  PATRICIA_PP_SIZE_IMPL(__VA_ARGS__, 9, 8, 7, 6, 5, 4, 3, 2, 1, )
#define PATRICIA_PP_SIZE_IMPL(e1, e2, e3, e4, e5, e6, e7, e8, e9, size, ...)   \
  size

/// Dispatches a variadic macro to `prefix` followed by the argument count,
/// e.g., `PATRICIA_PP_OVERLOAD(FOO_, a, b)` expands to `FOO_2`.
#define PATRICIA_PP_OVERLOAD(prefix, ...)                                      \
  PATRICIA_PP_PASTE2(prefix, PATRICIA_PP_SIZE(__VA_ARGS__))

// NOLINTEND
