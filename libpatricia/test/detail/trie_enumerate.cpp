//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "patricia/detail/trie_enumerate.hpp"

#include "patricia/test/collect.hpp"
#include "patricia/test/test.hpp"
#include "patricia/trie.hpp"

#include <string>
#include <vector>

using namespace patricia;

TEST("is_prefix") {
  auto xs = trie<int>{{"bar", 2}, {"baz", 3}, {"fool", 1}};
  CHECK(xs.is_prefix("ba"));
  CHECK(xs.is_prefix("b"));
  CHECK(xs.is_prefix("foo"));
  CHECK(xs.is_prefix("fool"));
  CHECK(xs.is_prefix(""));
  CHECK(not xs.is_prefix("fools"));
  CHECK(not xs.is_prefix("bax"));
  CHECK(not xs.is_prefix("x"));
  CHECK(trie<int>{}.is_prefix(""));
  CHECK(not trie<int>{}.is_prefix("a"));
}

TEST("keys with prefix") {
  auto xs = trie<int>{{"b", 1}, {"baar", 2}, {"baahus", 3}};
  CHECK_EQUAL(collect(xs.keys_with_prefix("ba")),
              (std::vector<std::string>{"baar", "baahus"}));
  CHECK_EQUAL(collect(xs.keys_with_prefix("baa")),
              (std::vector<std::string>{"baar", "baahus"}));
  CHECK_EQUAL(collect(xs.keys_with_prefix("b")),
              (std::vector<std::string>{"b", "baar", "baahus"}));
  CHECK_EQUAL(collect(xs.keys_with_prefix("baah")),
              (std::vector<std::string>{"baahus"}));
  CHECK_EQUAL(collect(xs.keys_with_prefix("")),
              (std::vector<std::string>{"b", "baar", "baahus"}));
  CHECK(collect(xs.keys_with_prefix("others")).empty());
  CHECK(collect(xs.keys_with_prefix("baarx")).empty());
}

TEST("items with prefix") {
  auto xs = trie<int>{{"b", 1}, {"baar", 2}, {"baahus", 3}};
  auto items = collect(xs.items_with_prefix("baar"));
  REQUIRE_EQUAL(items.size(), 1u);
  CHECK_EQUAL(items[0].first, "baar");
  CHECK_EQUAL(*items[0].second, 2);
}

TEST("prefix queries own their prefix") {
  auto xs = trie<int>{{"b", 1}, {"baar", 2}, {"baahus", 3}};
  auto make_prefix = [] {
    return std::string{"baarhus"}.substr(0, 3);
  };
  auto keys = std::vector<std::string>{};
  for (auto&& key : xs.keys_with_prefix(make_prefix()))
    keys.push_back(key);
  CHECK_EQUAL(keys, (std::vector<std::string>{"baar", "baahus"}));
  auto values = std::vector<int>{};
  for (auto&& [_, value] : xs.items_with_prefix(std::string{"baa"} + "r"))
    values.push_back(*value);
  CHECK_EQUAL(values, (std::vector<int>{2}));
  auto pending = xs.keys_with_prefix(make_prefix());
  CHECK_EQUAL(collect(std::move(pending)),
              (std::vector<std::string>{"baar", "baahus"}));
}

TEST("enumeration skips erased keys") {
  auto xs = trie<int>{{"b", 1}, {"baar", 2}, {"baahus", 3}};
  CHECK_SUCCESS(xs.erase("baar"));
  CHECK_EQUAL(collect(xs.keys()),
              (std::vector<std::string>{"b", "baahus"}));
  // The structure stays in place.
  CHECK(xs.is_prefix("baar"));
  CHECK(collect(xs.keys_with_prefix("baar")).empty());
}

TEST("enumeration of deep tries") {
  auto xs = trie<int>{};
  auto key = std::string{};
  for (auto i = 0; i < 10'000; ++i) {
    key += static_cast<char>('a' + i % 2);
    xs.insert(key, i);
  }
  CHECK_EQUAL(xs.size(), 10'000u);
  CHECK_EQUAL(xs.node_count(), 10'001u);
  auto last = std::string{};
  for (auto&& k : xs.keys())
    last = std::move(k);
  CHECK_EQUAL(last, key);
  auto copy = xs;
  CHECK_EQUAL(copy.size(), 10'000u);
}

TEST("enumerating a subtree with a seeded path") {
  auto root = detail::trie_node<int>{};
  detail::insert(root, "xy", 1);
  detail::insert(root, "xyz", 2);
  auto [node, path] = detail::descend_prefix(root, "x");
  REQUIRE(node != nullptr);
  CHECK_EQUAL(path, "xy");
  auto keys = std::vector<std::string>{};
  for (auto&& [key, _] : detail::enumerate(*node, path))
    keys.push_back(key);
  CHECK_EQUAL(keys, (std::vector<std::string>{"xy", "xyz"}));
  CHECK_EQUAL(detail::count_nodes(root), 3u);
}
