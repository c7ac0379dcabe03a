//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "patricia/fwd.hpp"

#include "patricia/detail/trie_enumerate.hpp"
#include "patricia/detail/trie_mutate.hpp"
#include "patricia/detail/trie_node.hpp"
#include "patricia/detail/trie_scan.hpp"
#include "patricia/detail/trie_walk.hpp"
#include "patricia/error.hpp"
#include "patricia/generator.hpp"
#include "patricia/logger.hpp"
#include "patricia/try.hpp"
#include "patricia/window.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <fmt/format.h>

#include <concepts>
#include <initializer_list>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace patricia {

/// A compressed prefix tree (PATRICIA trie) that maps strings to values.
///
/// Besides dictionary-style access by exact key, the trie answers which of
/// its keys occur at a given position of a longer text: `longest_match`
/// reports the longest stored key that is a prefix of a window of the text,
/// and `all_matches` reports every such key. Scans take a `window` so that
/// callers can step through a text without copying substrings.
///
/// Erasing a key only clears its value; the nodes stay in place until the
/// trie is rebuilt with `compacted()`.
///
/// Generators returned by a trie refer to its nodes and to the scanned text.
/// Both must outlive the generator, and the trie must not be modified while
/// a generator is in use. Prefixes passed to the prefix queries are copied.
template <class T>
class trie {
public:
  using key_type = std::string;
  using mapped_type = T;
  using node_type = detail::trie_node<T>;
  using match = detail::scan_match<T>;

  // -- construction ---------------------------------------------------------

  trie() = default;

  /// Constructs a trie that stores `root_value` under the empty key.
  explicit trie(T root_value) {
    root_.value.emplace(std::move(root_value));
  }

  trie(std::initializer_list<std::pair<std::string_view, T>> xs) {
    for (const auto& [key, value] : xs)
      insert(key, value);
  }

  /// Bulk-loads a range of key-value pairs, as if by calling `insert` for
  /// each of them in order.
  template <std::ranges::input_range Range>
    requires requires(std::ranges::range_reference_t<Range> x) {
      { std::get<0>(x) } -> std::convertible_to<std::string_view>;
      { std::get<1>(x) } -> std::convertible_to<T>;
    }
  trie(std::optional<T> root_value, Range&& xs) {
    root_.value = std::move(root_value);
    auto n = size_t{0};
    for (auto&& x : xs) {
      insert(std::get<0>(x), std::get<1>(x));
      ++n;
    }
    PATRICIA_DEBUG("bulk-loaded {} keys into {} nodes", n, node_count());
  }

  trie(const trie& other) {
    copy_from(other.root_);
  }

  trie(trie&&) noexcept = default;

  auto operator=(const trie& other) -> trie& {
    if (this != &other) {
      auto copy = trie{other};
      *this = std::move(copy);
    }
    return *this;
  }

  auto operator=(trie&&) noexcept -> trie& = default;

  ~trie() = default;

  // -- modifiers ------------------------------------------------------------

  /// Stores `value` under `key`, replacing a previous value.
  /// @returns `true` if `key` was not stored before.
  auto insert(std::string_view key, T value) -> bool {
    return detail::insert(root_, key, std::move(value));
  }

  /// Removes `key`. Fails with `ec::key_not_found` if it is not stored.
  auto erase(std::string_view key) -> caf::error {
    return detail::erase(root_, key);
  }

  void clear() {
    root_ = node_type{};
  }

  // -- exact lookup ---------------------------------------------------------

  /// @returns the value stored under `key`, or `ec::key_not_found` with the
  /// longest prefix of `key` that exists as a path.
  auto get(std::string_view key) const -> caf::expected<T> {
    return detail::get(root_, key);
  }

  auto lookup(std::string_view key) -> T* {
    return detail::lookup(root_, key);
  }

  auto lookup(std::string_view key) const -> const T* {
    return detail::lookup(root_, key);
  }

  auto contains(std::string_view key) const -> bool {
    return detail::contains(root_, key);
  }

  // -- capacity -------------------------------------------------------------

  /// Counts the stored keys. This visits every node.
  auto size() const -> size_t {
    auto result = size_t{0};
    for ([[maybe_unused]] auto* x : values())
      ++result;
    return result;
  }

  auto empty() const -> bool {
    for ([[maybe_unused]] auto* x : values())
      return false;
    return true;
  }

  /// Counts all nodes including the root and those left behind by `erase`.
  auto node_count() const -> size_t {
    return detail::count_nodes(root_);
  }

  /// @returns a trie with the same contents and no dead nodes.
  auto compacted() const -> trie {
    auto result = trie{};
    for (auto&& [key, value] : items())
      result.insert(key, *value);
    PATRICIA_DEBUG("compacted trie from {} to {} nodes", node_count(),
                   result.node_count());
    return result;
  }

  // -- enumeration ----------------------------------------------------------

  /// Yields all stored keys with their values, depth first. Siblings appear
  /// in the order they were created.
  auto items() const -> generator<std::pair<std::string, const T*>> {
    return detail::enumerate(root_, std::string{});
  }

  auto keys() const -> generator<std::string> {
    for (auto&& [key, _] : items())
      co_yield std::move(key);
  }

  auto values() const -> generator<const T*> {
    for (auto&& [_, value] : items())
      co_yield std::move(value);
  }

  /// Yields all stored keys that start with `prefix`, with their values.
  /// The generator keeps its own copy of `prefix`.
  auto items_with_prefix(std::string prefix) const
    -> generator<std::pair<std::string, const T*>> {
    return detail::enumerate_prefix(root_, std::move(prefix));
  }

  auto keys_with_prefix(std::string prefix) const -> generator<std::string> {
    for (auto&& [key, _] : items_with_prefix(std::move(prefix)))
      co_yield std::move(key);
  }

  /// Checks whether any path of the trie starts with `prefix`, whether or
  /// not a key ends there. The empty string is a prefix of every trie.
  auto is_prefix(std::string_view prefix) const -> bool {
    return detail::descend_prefix(root_, prefix).first != nullptr;
  }

  // -- scanning -------------------------------------------------------------

  /// Finds the longest stored key that is a prefix of the window `w` of
  /// `text`. A value under the empty key always matches.
  auto longest_match(std::string_view text, window w = {}) const
    -> caf::expected<match> {
    return detail::longest_match(root_, text, w);
  }

  /// Like `longest_match`, but returns `(std::nullopt, &fallback)` instead of
  /// an error if no key matches.
  auto longest_match_or(std::string_view text, const T& fallback,
                        window w = {}) const
    -> std::pair<std::optional<std::string_view>, const T*> {
    auto result = longest_match(text, w);
    if (not result)
      return {std::nullopt, &fallback};
    return {result->first, result->second};
  }

  /// The result may point to `fallback`, which must outlive it.
  auto longest_match_or(std::string_view text, const T&& fallback,
                        window w = {}) const
    -> std::pair<std::optional<std::string_view>, const T*>
    = delete;

  /// Yields every stored key that is a prefix of the window `w` of `text`,
  /// shortest first.
  auto all_matches(std::string_view text, window w = {}) const
    -> generator<match> {
    return detail::all_matches(root_, text, w);
  }

  auto items(std::string_view text, window w = {}) const -> generator<match> {
    return all_matches(text, w);
  }

  auto keys(std::string_view text, window w = {}) const
    -> generator<std::string_view> {
    for (auto&& [key, _] : all_matches(text, w))
      co_yield std::move(key);
  }

  auto values(std::string_view text, window w = {}) const
    -> generator<const T*> {
    for (auto&& [_, value] : all_matches(text, w))
      co_yield std::move(value);
  }

  /// @returns the longest stored key that is a prefix of the window.
  auto key(std::string_view text, window w = {}) const
    -> caf::expected<std::string_view> {
    PATRICIA_TRY(auto result, longest_match(text, w));
    return result.first;
  }

  /// @returns the value of the longest stored key that is a prefix of the
  /// window.
  auto value(std::string_view text, window w = {}) const -> caf::expected<T> {
    PATRICIA_TRY(auto result, longest_match(text, w));
    return *result.second;
  }

  /// @returns the longest matching key, or `fallback` if none matches.
  auto key_or(std::string_view text, std::string_view fallback,
              window w = {}) const -> std::string_view {
    auto result = longest_match(text, w);
    return result ? result->first : fallback;
  }

  /// @returns the value of the longest matching key, or `fallback` if none
  /// matches.
  auto value_or(std::string_view text, T fallback, window w = {}) const -> T {
    auto result = longest_match(text, w);
    return result ? *result->second : std::move(fallback);
  }

private:
  void copy_from(const node_type& other) {
    using edge = typename node_type::edge;
    auto stack = std::vector<std::pair<const node_type*, node_type*>>{};
    stack.emplace_back(&other, &root_);
    while (not stack.empty()) {
      auto [from, to] = stack.back();
      stack.pop_back();
      to->value = from->value;
      to->edges.reserve(from->edges.size());
      for (const auto& [symbol, e] : from->edges) {
        auto child = std::make_unique<node_type>();
        stack.emplace_back(e.child.get(), child.get());
        to->edges.emplace(symbol, edge{e.label, std::move(child)});
      }
    }
  }

  node_type root_ = {};
};

} // namespace patricia

/// Renders a trie as `trie({"ba": 2, "baz": 3})` in enumeration order.
template <class T>
struct fmt::formatter<patricia::trie<T>> {
  constexpr auto parse(format_parse_context& ctx) {
    return ctx.begin();
  }

  template <class FormatContext>
  auto format(const patricia::trie<T>& x, FormatContext& ctx) const {
    auto out = fmt::format_to(ctx.out(), "trie({{");
    auto first = true;
    for (auto&& [key, value] : x.items()) {
      if (not std::exchange(first, false))
        out = fmt::format_to(out, ", ");
      if constexpr (std::is_convertible_v<const T&, std::string_view>)
        out = fmt::format_to(out, "{:?}: {:?}", key, std::string_view{*value});
      else
        out = fmt::format_to(out, "{:?}: {}", key, *value);
    }
    return fmt::format_to(out, "}})");
  }
};

namespace patricia {

template <class T>
auto to_string(const trie<T>& x) -> std::string {
  return fmt::to_string(x);
}

} // namespace patricia
