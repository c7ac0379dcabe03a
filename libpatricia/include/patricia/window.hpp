//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "patricia/fwd.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <limits>
#include <utility>

namespace patricia {

/// A half-open range `[begin, end)` of offsets into a scanned text. Negative
/// offsets count from the end of the text.
struct window {
  std::ptrdiff_t begin = 0;
  std::ptrdiff_t end = std::numeric_limits<std::ptrdiff_t>::max();

  friend auto operator==(const window&, const window&) -> bool = default;
};

/// Resolves a window against a text of length `size`. A negative offset `x`
/// becomes `max(0, size + x)`, offsets past the end become `size`, and an
/// end before the begin yields an empty range at the begin.
/// @returns the absolute offsets `[first, last)` with
/// `first <= last <= size`.
auto clamp(window w, size_t size) -> std::pair<size_t, size_t>;

} // namespace patricia

template <>
struct fmt::formatter<patricia::window> {
  constexpr auto parse(format_parse_context& ctx) {
    return ctx.begin();
  }

  template <class FormatContext>
  auto format(const patricia::window& x, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "[{}, {})", x.begin, x.end);
  }
};
