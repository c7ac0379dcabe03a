//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "patricia/window.hpp"

#include "patricia/test/test.hpp"

#include <utility>

using namespace patricia;

namespace {

auto resolved(window w, size_t size) {
  return clamp(w, size);
}

using range = std::pair<size_t, size_t>;

} // namespace

TEST("the default window spans the text") {
  CHECK_EQUAL(resolved({}, 9), range(0, 9));
  CHECK_EQUAL(resolved({}, 0), range(0, 0));
}

TEST("offsets past the end clamp to the size") {
  CHECK_EQUAL(resolved({3}, 9), range(3, 9));
  CHECK_EQUAL(resolved({20, 30}, 9), range(9, 9));
  CHECK_EQUAL(resolved({2, 30}, 9), range(2, 9));
}

TEST("negative offsets count from the end") {
  CHECK_EQUAL(resolved({-7}, 9), range(2, 9));
  CHECK_EQUAL(resolved({-9}, 9), range(0, 9));
  CHECK_EQUAL(resolved({-100}, 9), range(0, 9));
  CHECK_EQUAL(resolved({2, -1}, 9), range(2, 8));
  CHECK_EQUAL(resolved({-3, -1}, 9), range(6, 8));
}

TEST("an end before the begin yields an empty window") {
  CHECK_EQUAL(resolved({5, 3}, 9), range(5, 5));
  CHECK_EQUAL(resolved({-1, -3}, 9), range(8, 8));
}

TEST("window formatting") {
  CHECK_EQUAL(fmt::format("{}", window{2, 8}), "[2, 8)");
}
