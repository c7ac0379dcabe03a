//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "patricia/detail/trie_mutate.hpp"

#include "patricia/error.hpp"
#include "patricia/test/test.hpp"

#include <string>
#include <vector>

using namespace patricia;
using namespace patricia::detail;

namespace {

template <class T>
auto labels(const trie_node<T>& node) {
  auto result = std::vector<std::string>{};
  for (const auto& [_, e] : node.edges)
    result.push_back(e.label);
  return result;
}

} // namespace

TEST("insert splits edges") {
  auto root = trie_node<int>{};
  CHECK(insert(root, "foobar", 1));
  CHECK_EQUAL(labels(root), (std::vector<std::string>{"foobar"}));
  CHECK(insert(root, "foo", 2));
  CHECK_EQUAL(labels(root), (std::vector<std::string>{"foo"}));
  const auto* foo = root.find_edge('f')->child.get();
  CHECK(foo->is_terminal());
  CHECK_EQUAL(labels(*foo), (std::vector<std::string>{"bar"}));
  CHECK(insert(root, "fa", 3));
  CHECK_EQUAL(labels(root), (std::vector<std::string>{"f"}));
  const auto* f = root.find_edge('f')->child.get();
  CHECK(not f->is_terminal());
  CHECK_EQUAL(labels(*f), (std::vector<std::string>{"oo", "a"}));
}

TEST("split edges keep their position") {
  auto root = trie_node<int>{};
  insert(root, "foo", 1);
  insert(root, "bar", 2);
  insert(root, "fa", 3);
  CHECK_EQUAL(labels(root), (std::vector<std::string>{"f", "bar"}));
}

TEST("edges of a node have distinct leading symbols") {
  auto root = trie_node<int>{};
  for (auto key : {"a", "ab", "abc", "b", "ba", "bac", "bad", "c"})
    insert(root, key, 0);
  auto leading = std::vector<char>{};
  for (const auto& [symbol, e] : root.edges) {
    CHECK_EQUAL(symbol, e.label.front());
    leading.push_back(symbol);
  }
  CHECK_EQUAL(leading, (std::vector<char>{'a', 'b', 'c'}));
}

TEST("insert overwrites") {
  auto root = trie_node<int>{};
  CHECK(insert(root, "", 1));
  CHECK(not insert(root, "", 2));
  CHECK_EQUAL(*root.value, 2);
  CHECK(root.edges.empty());
}

TEST("erase is logical") {
  auto root = trie_node<int>{};
  insert(root, "ab", 1);
  insert(root, "abc", 2);
  CHECK_SUCCESS(erase(root, "abc"));
  const auto* ab = root.find_edge('a')->child.get();
  CHECK(ab->is_terminal());
  REQUIRE(ab->find_edge('c') != nullptr);
  CHECK(not ab->find_edge('c')->child->is_terminal());
  CHECK_EQUAL(erase(root, "abc"), ec::key_not_found);
  CHECK_EQUAL(erase(root, "a"), ec::key_not_found);
  CHECK_SUCCESS(erase(root, "ab"));
  CHECK_EQUAL(root.edges.size(), 1u);
}
