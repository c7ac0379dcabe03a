//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "patricia/detail/assert.hpp"
#include "patricia/detail/label.hpp"
#include "patricia/detail/trie_node.hpp"
#include "patricia/detail/trie_walk.hpp"
#include "patricia/error.hpp"
#include "patricia/logger.hpp"

#include <caf/error.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace patricia::detail {

/// Stores `value` under `key` below `root`, splitting an edge where `key`
/// leaves its label.
/// @returns `true` if `key` was not stored before.
template <class T>
auto insert(trie_node<T>& root, std::string_view key, T value) -> bool {
  using edge = typename trie_node<T>::edge;
  auto* node = &root;
  auto rest = key;
  while (not rest.empty()) {
    auto* e = node->find_edge(rest.front());
    if (not e) {
      node->edges.emplace(
        rest.front(),
        edge{std::string{rest},
             std::make_unique<trie_node<T>>(std::move(value))});
      return true;
    }
    auto p = common_prefix_length(e->label, rest);
    PATRICIA_ASSERT(p > 0);
    if (p < e->label.size()) {
      PATRICIA_TRACE("splitting edge '{}' at {} for key '{}'", e->label, p,
                     key);
      auto middle = std::make_unique<trie_node<T>>();
      auto tail = e->label.substr(p);
      auto symbol = tail.front();
      middle->edges.emplace(symbol, edge{std::move(tail), std::move(e->child)});
      // The leading symbol stays the same, so the edge keeps its slot.
      auto replacement = edge{e->label.substr(0, p), std::move(middle)};
      *e = std::move(replacement);
    }
    rest.remove_prefix(p);
    node = e->child.get();
  }
  auto fresh = not node->is_terminal();
  node->value = std::move(value);
  return fresh;
}

/// Removes the value stored under `key`. The nodes on the path stay in place.
template <class T>
auto erase(trie_node<T>& root, std::string_view key) -> caf::error {
  auto [node, consumed] = descend(root, key);
  if (not node or not node->is_terminal())
    return caf::make_error(ec::key_not_found,
                           std::string{key.substr(0, consumed)});
  node->value.reset();
  return {};
}

} // namespace patricia::detail
