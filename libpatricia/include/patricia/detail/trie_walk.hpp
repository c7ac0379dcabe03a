//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "patricia/detail/label.hpp"
#include "patricia/detail/trie_node.hpp"
#include "patricia/error.hpp"
#include "patricia/generator.hpp"

#include <caf/expected.hpp>

#include <string>
#include <string_view>
#include <utility>

namespace patricia::detail {

/// Follows the edges of `root` along `text`, starting at `begin` and never
/// reading at or past `end`. Yields the start node at `begin` and then every
/// node reached, each together with the offset behind its label.
/// @pre `begin <= end <= text.size()`
/// @note `root` and the data behind `text` must outlive the generator.
template <class T>
auto walk(const trie_node<T>& root, std::string_view text, size_t begin,
          size_t end) -> generator<std::pair<const trie_node<T>*, size_t>> {
  const auto* node = &root;
  auto offset = begin;
  co_yield std::pair{node, offset};
  while (offset < end) {
    const auto* e = node->find_edge(text[offset]);
    if (not e or not matches_at(e->label, text, offset, end))
      co_return;
    offset += e->label.size();
    node = e->child.get();
    co_yield std::pair{node, offset};
  }
}

/// Follows the edges that spell out `key` exactly.
/// @returns the node reached, or `nullptr` if no edge continues the walk
/// before `key` is consumed, and the number of symbols consumed.
template <class Node>
auto descend(Node& root, std::string_view key) -> std::pair<Node*, size_t> {
  auto* node = &root;
  auto consumed = size_t{0};
  while (consumed < key.size()) {
    auto* e = node->find_edge(key[consumed]);
    if (not e or not key.substr(consumed).starts_with(e->label))
      return {nullptr, consumed};
    consumed += e->label.size();
    node = e->child.get();
  }
  return {node, consumed};
}

template <class Node>
auto lookup(Node& root, std::string_view key) -> decltype(&*root.value) {
  auto [node, _] = descend(root, key);
  if (not node or not node->value)
    return nullptr;
  return &*node->value;
}

template <class T>
auto get(const trie_node<T>& root, std::string_view key) -> caf::expected<T> {
  auto [node, consumed] = descend(root, key);
  if (not node or not node->value)
    return caf::make_error(ec::key_not_found,
                           std::string{key.substr(0, consumed)});
  return *node->value;
}

template <class T>
auto contains(const trie_node<T>& root, std::string_view key) -> bool {
  return lookup(root, key) != nullptr;
}

} // namespace patricia::detail
