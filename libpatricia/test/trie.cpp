//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "patricia/trie.hpp"

#include "patricia/error.hpp"
#include "patricia/test/collect.hpp"
#include "patricia/test/test.hpp"

#include <algorithm>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace patricia;

namespace {

auto sorted(std::vector<std::string> xs) {
  std::sort(xs.begin(), xs.end());
  return xs;
}

struct fixture {
  fixture() {
    xs.insert("foo", 1);
    xs.insert("bar", 2);
    xs.insert("baz", 3);
  }

  trie<int> xs;
};

} // namespace

WITH_FIXTURE(fixture) {
  TEST("trie get") {
    CHECK(xs.contains("foo"));
    CHECK(xs.contains("bar"));
    CHECK(xs.contains("baz"));
    CHECK_EQUAL(unbox(xs.get("foo")), 1);
    CHECK_EQUAL(unbox(xs.get("bar")), 2);
    CHECK_EQUAL(unbox(xs.get("baz")), 3);
    CHECK_NOT_FOUND(xs.get("ba"), "ba");
    CHECK_NOT_FOUND(xs.get("fool"), "foo");
  }

  TEST("trie lookup") {
    auto* x = xs.lookup("bar");
    REQUIRE(x != nullptr);
    CHECK_EQUAL(*x, 2);
    *x = 42;
    CHECK_EQUAL(unbox(xs.get("bar")), 42);
    CHECK(xs.lookup("ba") == nullptr);
    CHECK(xs.lookup("barn") == nullptr);
    const auto& ys = xs;
    CHECK_EQUAL(unbox(ys.lookup("baz")), 3);
  }

  TEST("trie overwrite") {
    CHECK_EQUAL(xs.size(), 3u);
    CHECK(not xs.insert("foo", 10));
    CHECK_EQUAL(unbox(xs.get("foo")), 10);
    CHECK_EQUAL(xs.size(), 3u);
    CHECK(xs.insert("fo", 11));
    CHECK_EQUAL(xs.size(), 4u);
  }

  TEST("trie erase") {
    CHECK_SUCCESS(xs.erase("bar"));
    CHECK(not xs.contains("bar"));
    CHECK_EQUAL(xs.get("bar").error(), ec::key_not_found);
    CHECK_EQUAL(unbox(xs.get("baz")), 3);
    CHECK_EQUAL(xs.size(), 2u);
    // Erasing twice fails.
    CHECK_NOT_FOUND(xs.erase("bar"), "bar");
    // Unknown keys fail with the path matched so far.
    CHECK_NOT_FOUND(xs.erase("bat"), "ba");
    CHECK_EQUAL(xs.size(), 2u);
    // Putting the key back restores the old state.
    CHECK(xs.insert("bar", 2));
    CHECK_EQUAL(unbox(xs.get("bar")), 2);
    CHECK_EQUAL(unbox(xs.get("baz")), 3);
    CHECK_EQUAL(xs.size(), 3u);
  }

  TEST("trie keys") {
    CHECK_EQUAL(sorted(collect(xs.keys())),
                (std::vector<std::string>{"bar", "baz", "foo"}));
    xs.insert("", 0);
    CHECK_EQUAL(sorted(collect(xs.keys())),
                (std::vector<std::string>{"", "bar", "baz", "foo"}));
  }

  TEST("trie values") {
    auto values = std::vector<int>{};
    for (const auto* x : xs.values())
      values.push_back(*x);
    std::sort(values.begin(), values.end());
    CHECK_EQUAL(values, (std::vector<int>{1, 2, 3}));
  }

  TEST("trie copy") {
    auto ys = xs;
    CHECK_EQUAL(to_string(ys), to_string(xs));
    CHECK_EQUAL(ys.node_count(), xs.node_count());
    ys.insert("qux", 4);
    CHECK_SUCCESS(ys.erase("foo"));
    CHECK(not xs.contains("qux"));
    CHECK(xs.contains("foo"));
    CHECK(ys.contains("qux"));
    auto zs = trie<int>{};
    zs = ys;
    CHECK_EQUAL(to_string(zs), to_string(ys));
  }

  TEST("trie move") {
    auto ys = std::move(xs);
    CHECK_EQUAL(ys.size(), 3u);
    CHECK_EQUAL(unbox(ys.get("baz")), 3);
  }

  TEST("trie clear") {
    xs.clear();
    CHECK(xs.empty());
    CHECK_EQUAL(xs.size(), 0u);
    CHECK_EQUAL(xs.node_count(), 1u);
    CHECK(not xs.contains("foo"));
  }
}

TEST("trie empty key") {
  auto xs = trie<int>{};
  CHECK(xs.empty());
  xs.insert("foo", 1);
  xs.insert("", 2);
  CHECK(xs.contains("foo"));
  CHECK(xs.contains(""));
  CHECK_EQUAL(unbox(xs.get("")), 2);
  CHECK_SUCCESS(xs.erase(""));
  CHECK(not xs.contains(""));
  CHECK_EQUAL(xs.get("").error(), ec::key_not_found);
  CHECK_EQUAL(xs.erase(""), ec::key_not_found);
}

TEST("trie root value") {
  auto xs = trie<std::pair<int, int>>(std::pair{1, 2});
  CHECK(xs.contains(""));
  CHECK_EQUAL(unbox(xs.get("")), std::pair(1, 2));
  CHECK_EQUAL(xs.size(), 1u);
}

TEST("trie bulk load") {
  auto pairs = std::vector<std::pair<std::string, int>>{
    {"key", 1},
    {"king", 2},
    {"kong", 3},
  };
  auto xs = trie<int>{0, pairs};
  CHECK_EQUAL(xs.size(), 4u);
  CHECK_EQUAL(unbox(xs.get("")), 0);
  CHECK_EQUAL(unbox(xs.get("king")), 2);
  auto ordered = std::map<std::string, int>{{"b", 1}, {"a", 2}};
  auto ys = trie<int>{std::nullopt, ordered};
  CHECK(not ys.contains(""));
  CHECK_EQUAL(collect(ys.keys()), (std::vector<std::string>{"a", "b"}));
}

TEST("trie rebuild from own contents") {
  auto xs = trie<std::string>{};
  xs.insert("key", "value");
  auto items = std::vector<std::pair<std::string, std::string>>{};
  for (auto&& [key, value] : xs.items())
    items.emplace_back(key, *value);
  auto ys = trie<std::string>{std::nullopt, items};
  CHECK(ys.contains("key"));
  CHECK(not ys.contains("keys"));
  CHECK(not ys.contains("ke"));
  CHECK(not ys.contains("kex"));
}

TEST("trie initializer list") {
  auto xs = trie<int>{{"foo", 1}, {"foobar", 2}};
  CHECK_EQUAL(xs.size(), 2u);
  CHECK_EQUAL(unbox(xs.get("foobar")), 2);
}

TEST("trie compression") {
  auto xs = trie<int>{};
  xs.insert("foobar", 1);
  CHECK_EQUAL(xs.node_count(), 2u);
  // Splits the edge "foobar" into "foo" and "bar".
  xs.insert("foo", 2);
  CHECK_EQUAL(xs.node_count(), 3u);
  // Splits the edge "foo" into "fo" and "o", and adds a leaf for "x".
  xs.insert("fox", 3);
  CHECK_EQUAL(xs.node_count(), 5u);
  // An existing inner node receives the value.
  xs.insert("fo", 4);
  CHECK_EQUAL(xs.node_count(), 5u);
  CHECK_EQUAL(xs.size(), 4u);
  CHECK_EQUAL(unbox(xs.get("foobar")), 1);
  CHECK_EQUAL(unbox(xs.get("foo")), 2);
  CHECK_EQUAL(unbox(xs.get("fox")), 3);
  CHECK_EQUAL(unbox(xs.get("fo")), 4);
}

TEST("trie logical deletion") {
  auto xs = trie<int>{{"foobar", 1}, {"foo", 2}, {"fox", 3}, {"fo", 4}};
  CHECK_SUCCESS(xs.erase("foobar"));
  CHECK_EQUAL(xs.size(), 3u);
  CHECK_EQUAL(xs.node_count(), 5u);
  CHECK(xs.is_prefix("foob"));
  auto ys = xs.compacted();
  CHECK_EQUAL(ys.size(), 3u);
  CHECK_EQUAL(ys.node_count(), 4u);
  CHECK(not ys.is_prefix("foob"));
  CHECK_EQUAL(to_string(ys), to_string(xs));
}

TEST("trie enumeration order") {
  auto xs = trie<int>{};
  xs.insert("foo", 1);
  xs.insert("bar", 2);
  xs.insert("fa", 3);
  // The split of "foo" keeps the edge in front of "bar".
  CHECK_EQUAL(collect(xs.keys()),
              (std::vector<std::string>{"foo", "fa", "bar"}));
}

TEST("trie formatting") {
  auto xs = trie<int>{};
  CHECK_EQUAL(to_string(xs), "trie({})");
  xs.insert("ba", 2);
  xs.insert("baz", 3);
  xs.insert("fool", 1);
  CHECK_EQUAL(to_string(xs), R"(trie({"ba": 2, "baz": 3, "fool": 1}))");
  auto ys = trie<std::string>{};
  ys.insert("ba", "2");
  ys.insert("baz", "hey's");
  CHECK_EQUAL(fmt::format("{}", ys), R"(trie({"ba": "2", "baz": "hey's"}))");
  auto zs = trie<double>{{"fool", 1.5}};
  CHECK_EQUAL(to_string(zs), R"(trie({"fool": 1.5}))");
}
