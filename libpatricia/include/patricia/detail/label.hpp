//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <cstddef>
#include <string_view>

namespace patricia::detail {

/// @returns the number of leading symbols that `x` and `y` share.
auto common_prefix_length(std::string_view x, std::string_view y) -> size_t;

/// Checks whether `label` occurs in `text` at `offset` without reaching past
/// `end`.
/// @pre `offset <= end <= text.size()`
auto matches_at(std::string_view label, std::string_view text, size_t offset,
                size_t end) -> bool;

/// Checks whether `x` and `y` agree on their first `min(x.size(), y.size())`
/// symbols, i.e., whether one is a prefix of the other.
auto overlaps(std::string_view x, std::string_view y) -> bool;

} // namespace patricia::detail
