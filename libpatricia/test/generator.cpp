//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "patricia/generator.hpp"

#include "patricia/test/collect.hpp"
#include "patricia/test/test.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace patricia;

namespace {

auto iota(int n) -> generator<int> {
  for (auto i = 0; i < n; ++i)
    co_yield i;
}

auto words() -> generator<std::string> {
  auto word = std::string{"a"};
  co_yield word;
  word += "b";
  co_yield word;
}

auto failing() -> generator<int> {
  co_yield 1;
  throw std::runtime_error{"failed"};
}

} // namespace

TEST("generators yield lazily") {
  CHECK_EQUAL(collect(iota(4)), (std::vector<int>{0, 1, 2, 3}));
  CHECK(collect(iota(0)).empty());
  CHECK(collect(generator<int>{}).empty());
}

TEST("generators yield lvalues") {
  // The yielded reference points into the coroutine frame, so copy it.
  auto result = std::vector<std::string>{};
  for (const auto& word : words())
    result.push_back(word);
  CHECK_EQUAL(result, (std::vector<std::string>{"a", "ab"}));
}

TEST("generators propagate exceptions") {
  auto g = failing();
  auto it = g.begin();
  CHECK_EQUAL(*it, 1);
  auto what = std::string{};
  try {
    ++it;
  } catch (const std::runtime_error& e) {
    what = e.what();
  }
  CHECK_EQUAL(what, "failed");
}

TEST("generators are movable") {
  auto g = iota(3);
  auto h = std::move(g);
  CHECK(collect(std::move(g)).empty());
  CHECK_EQUAL(collect(std::move(h)), (std::vector<int>{0, 1, 2}));
}
