//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "patricia/detail/discard.hpp"
#include "patricia/detail/pp.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>

#include <optional>

namespace patricia {

/// Trait to customize the behavior of `PATRICIA_TRY(...)`.
template <class T>
struct tryable;

} // namespace patricia

template <class T>
struct patricia::tryable<std::optional<T>> {
  static auto is_success(const std::optional<T>& x) -> bool {
    return x.has_value();
  }

  static auto get_success(std::optional<T>&& x) -> T {
    return std::move(*x);
  }

  static auto get_error(std::optional<T>&&) -> std::nullopt_t {
    return std::nullopt;
  }
};

template <class T>
struct patricia::tryable<caf::expected<T>> {
  static auto is_success(const caf::expected<T>& x) -> bool {
    return x.engaged();
  }

  static auto get_success(caf::expected<T>&& x) -> T {
    return std::move(*x);
  }

  static auto get_error(caf::expected<T>&& x) -> caf::error {
    return std::move(x.error());
  }
};

template <>
struct patricia::tryable<caf::error> {
  static auto is_success(const caf::error& x) -> bool {
    return not x;
  }

  static void get_success(caf::error&& x) {
    PATRICIA_UNUSED(x);
  }

  static auto get_error(caf::error&& x) -> caf::error {
    return std::move(x);
  }
};

#define PATRICIA_TRY_COMMON(var, expr)                                         \
  auto var = (expr);                                                           \
  if (not patricia::tryable<decltype(var)>::is_success(var)) [[unlikely]] {    \
    return patricia::tryable<decltype(var)>::get_error(std::move(var));        \
  }

#define PATRICIA_TRY_EXTRACT(decl, var, expr)                                  \
  PATRICIA_TRY_COMMON(var, expr);                                              \
  decl = patricia::tryable<decltype(var)>::get_success(std::move(var))

#define PATRICIA_TRY_DISCARD(var, expr)                                        \
  PATRICIA_TRY_COMMON(var, expr)                                               \
  if (false) {                                                                 \
    /* trigger [[nodiscard]] */                                                \
    patricia::tryable<decltype(var)>::get_success(std::move(var));             \
  }

#define PATRICIA_TRY_1(expr)                                                   \
  PATRICIA_TRY_DISCARD(PATRICIA_PP_PASTE2(_try, __COUNTER__), expr)

#define PATRICIA_TRY_2(decl, expr)                                             \
  PATRICIA_TRY_EXTRACT(decl, PATRICIA_PP_PASTE2(_try, __COUNTER__), expr)

#define PATRICIA_TRY(...)                                                      \
  PATRICIA_PP_OVERLOAD(PATRICIA_TRY_, __VA_ARGS__)(__VA_ARGS__)
