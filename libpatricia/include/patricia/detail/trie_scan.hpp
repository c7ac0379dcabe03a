//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "patricia/detail/trie_node.hpp"
#include "patricia/detail/trie_walk.hpp"
#include "patricia/error.hpp"
#include "patricia/generator.hpp"
#include "patricia/window.hpp"

#include <caf/expected.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace patricia::detail {

/// A stored key found in a scanned text, as a view into the text, together
/// with its value.
template <class T>
using scan_match = std::pair<std::string_view, const T*>;

/// Finds the longest stored key that is a prefix of the window `w` of
/// `text`. A value on `root` matches with length zero.
/// @returns the match, or `ec::key_not_found` with the path matched so far.
template <class T>
auto longest_match(const trie_node<T>& root, std::string_view text, window w)
  -> caf::expected<scan_match<T>> {
  auto [first, last] = clamp(w, text.size());
  auto best = std::optional<scan_match<T>>{};
  auto reached = first;
  for (auto [node, offset] : walk(root, text, first, last)) {
    reached = offset;
    if (node->is_terminal())
      best.emplace(text.substr(first, offset - first), &*node->value);
  }
  if (not best)
    return caf::make_error(ec::key_not_found,
                           std::string{text.substr(first, reached - first)});
  return *best;
}

/// Yields all stored keys that are a prefix of the window `w` of `text`,
/// shortest first.
/// @note `root` and the data behind `text` must outlive the generator.
template <class T>
auto all_matches(const trie_node<T>& root, std::string_view text, window w)
  -> generator<scan_match<T>> {
  auto [first, last] = clamp(w, text.size());
  for (auto [node, offset] : walk(root, text, first, last))
    if (node->is_terminal())
      co_yield scan_match<T>{text.substr(first, offset - first),
                             &*node->value};
}

} // namespace patricia::detail
