//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "patricia/fwd.hpp"

#include "patricia/detail/stable_map.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace patricia::detail {

/// A node of a compressed prefix tree. The value slot is disengaged for
/// nodes that only exist to branch. Edges are keyed by the leading symbol of
/// their label, so two labels of one node never share that symbol.
template <class T>
struct trie_node {
  struct edge {
    std::string label;
    std::unique_ptr<trie_node> child;
  };

  using edge_map = stable_map<char, edge>;

  trie_node() = default;

  explicit trie_node(T x) : value{std::move(x)} {
  }

  trie_node(const trie_node&) = delete;
  auto operator=(const trie_node&) -> trie_node& = delete;
  trie_node(trie_node&&) noexcept = default;
  auto operator=(trie_node&&) noexcept -> trie_node& = default;

  /// Tears down the subtree without recursing, so that long chains of nodes
  /// cannot exhaust the stack.
  ~trie_node() {
    auto pending = std::vector<std::unique_ptr<trie_node>>{};
    auto detach = [&](trie_node& node) {
      for (auto& [_, e] : node.edges)
        if (e.child)
          pending.push_back(std::move(e.child));
      node.edges.clear();
    };
    detach(*this);
    while (not pending.empty()) {
      auto node = std::move(pending.back());
      pending.pop_back();
      detach(*node);
    }
  }

  /// @returns the edge whose label starts with `symbol`, or `nullptr`.
  auto find_edge(char symbol) -> edge* {
    auto i = edges.find(symbol);
    return i == edges.end() ? nullptr : &i->second;
  }

  auto find_edge(char symbol) const -> const edge* {
    auto i = edges.find(symbol);
    return i == edges.end() ? nullptr : &i->second;
  }

  auto is_terminal() const -> bool {
    return value.has_value();
  }

  std::optional<T> value = {};
  edge_map edges = {};
};

} // namespace patricia::detail
