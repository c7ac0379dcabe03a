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
#include "patricia/generator.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace patricia::detail {

/// Yields every stored key below `start`, prepended with `path`, together
/// with its value. A node comes before its children, and children come in
/// the order their edges were created.
/// @note `start` must outlive the generator.
template <class T>
auto enumerate(const trie_node<T>& start, std::string path)
  -> generator<std::pair<std::string, const T*>> {
  using item = std::pair<std::string, const T*>;
  struct frame {
    const trie_node<T>* node;
    size_t next;
    size_t label_size;
  };
  if (start.is_terminal())
    co_yield item{path, &*start.value};
  auto stack = std::vector<frame>{};
  stack.push_back(frame{&start, 0, 0});
  while (not stack.empty()) {
    auto& top = stack.back();
    if (top.next == top.node->edges.size()) {
      path.resize(path.size() - top.label_size);
      stack.pop_back();
      continue;
    }
    const auto& e = as_vector(top.node->edges)[top.next++].second;
    const auto* child = e.child.get();
    path += e.label;
    stack.push_back(frame{child, 0, e.label.size()});
    if (child->is_terminal())
      co_yield item{path, &*child->value};
  }
}

/// Descends from `root` along `prefix`, where the last label followed may
/// reach past the end of `prefix`.
/// @returns the node below which every key starts with `prefix` and the path
/// that leads to it, or `nullptr` if no structural path starts with
/// `prefix`.
template <class T>
auto descend_prefix(const trie_node<T>& root, std::string_view prefix)
  -> std::pair<const trie_node<T>*, std::string> {
  const auto* node = &root;
  auto path = std::string{};
  while (path.size() < prefix.size()) {
    auto rest = prefix.substr(path.size());
    const auto* e = node->find_edge(rest.front());
    if (not e or not overlaps(e->label, rest))
      return {nullptr, {}};
    path += e->label;
    node = e->child.get();
  }
  return {node, std::move(path)};
}

/// Yields every stored key that starts with `prefix`, with its value.
/// @note The generator owns `prefix`, but `root` must outlive it.
template <class T>
auto enumerate_prefix(const trie_node<T>& root, std::string prefix)
  -> generator<std::pair<std::string, const T*>> {
  auto [node, path] = descend_prefix(root, prefix);
  if (not node)
    co_return;
  for (auto&& x : enumerate(*node, std::move(path)))
    co_yield std::move(x);
}

/// Counts all nodes below and including `root`.
template <class T>
auto count_nodes(const trie_node<T>& root) -> size_t {
  auto result = size_t{0};
  auto stack = std::vector<const trie_node<T>*>{&root};
  while (not stack.empty()) {
    const auto* node = stack.back();
    stack.pop_back();
    ++result;
    for (const auto& [_, e] : node->edges)
      stack.push_back(e.child.get());
  }
  return result;
}

} // namespace patricia::detail
