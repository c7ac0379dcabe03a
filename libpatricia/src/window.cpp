//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "patricia/window.hpp"

#include <algorithm>

namespace patricia {

namespace {

auto resolve(std::ptrdiff_t offset, size_t size) -> size_t {
  auto n = static_cast<std::ptrdiff_t>(size);
  if (offset < 0)
    return static_cast<size_t>(std::max(std::ptrdiff_t{0}, n + offset));
  return static_cast<size_t>(std::min(offset, n));
}

} // namespace

auto clamp(window w, size_t size) -> std::pair<size_t, size_t> {
  auto first = resolve(w.begin, size);
  auto last = resolve(w.end, size);
  return {first, std::max(first, last)};
}

} // namespace patricia
