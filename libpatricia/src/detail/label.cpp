//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "patricia/detail/label.hpp"

#include "patricia/detail/assert.hpp"

#include <algorithm>

namespace patricia::detail {

auto common_prefix_length(std::string_view x, std::string_view y) -> size_t {
  auto n = std::min(x.size(), y.size());
  auto [i, _] = std::mismatch(x.begin(), x.begin() + n, y.begin());
  return static_cast<size_t>(i - x.begin());
}

auto matches_at(std::string_view label, std::string_view text, size_t offset,
                size_t end) -> bool {
  PATRICIA_ASSERT(offset <= end);
  PATRICIA_ASSERT(end <= text.size());
  if (label.size() > end - offset)
    return false;
  return text.substr(offset, label.size()) == label;
}

auto overlaps(std::string_view x, std::string_view y) -> bool {
  auto n = std::min(x.size(), y.size());
  return x.substr(0, n) == y.substr(0, n);
}

} // namespace patricia::detail
