//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <algorithm>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <stdexcept>
#include <utility>
#include <vector>

namespace patricia::detail {

/// An associative container on top of a vector that keeps its entries in
/// insertion order. Lookups are linear, which beats tree or hash based maps
/// for the handful of entries this is meant for.
template <class Key, class T>
class stable_map {
public:
  // -- types ----------------------------------------------------------------

  using key_type = Key;
  using mapped_type = T;
  using value_type = std::pair<Key, T>;
  using vector_type = std::vector<value_type>;
  using allocator_type = typename vector_type::allocator_type;
  using size_type = typename vector_type::size_type;
  using difference_type = typename vector_type::difference_type;
  using reference = typename vector_type::reference;
  using const_reference = typename vector_type::const_reference;
  using iterator = typename vector_type::iterator;
  using const_iterator = typename vector_type::const_iterator;
  using reverse_iterator = typename vector_type::reverse_iterator;
  using const_reverse_iterator = typename vector_type::const_reverse_iterator;

  // -- construction ---------------------------------------------------------

  stable_map() = default;

  stable_map(std::initializer_list<value_type> xs) {
    xs_.reserve(xs.size());
    for (const auto& x : xs)
      insert(x);
  }

  template <class InputIterator>
  stable_map(InputIterator first, InputIterator last) {
    insert(first, last);
  }

  // -- iterators ------------------------------------------------------------

  auto begin() -> iterator {
    return xs_.begin();
  }

  auto begin() const -> const_iterator {
    return xs_.begin();
  }

  auto end() -> iterator {
    return xs_.end();
  }

  auto end() const -> const_iterator {
    return xs_.end();
  }

  auto rbegin() -> reverse_iterator {
    return xs_.rbegin();
  }

  auto rbegin() const -> const_reverse_iterator {
    return xs_.rbegin();
  }

  auto rend() -> reverse_iterator {
    return xs_.rend();
  }

  auto rend() const -> const_reverse_iterator {
    return xs_.rend();
  }

  // -- capacity -------------------------------------------------------------

  auto empty() const -> bool {
    return xs_.empty();
  }

  auto size() const -> size_type {
    return xs_.size();
  }

  void reserve(size_type n) {
    xs_.reserve(n);
  }

  // -- modifiers ------------------------------------------------------------

  void clear() {
    xs_.clear();
  }

  auto insert(value_type x) -> std::pair<iterator, bool> {
    auto i = find(x.first);
    if (i != end())
      return {i, false};
    xs_.push_back(std::move(x));
    return {std::prev(xs_.end()), true};
  }

  template <class InputIterator>
  void insert(InputIterator first, InputIterator last) {
    for (; first != last; ++first)
      insert(*first);
  }

  template <class... Ts>
  auto emplace(Ts&&... xs) -> std::pair<iterator, bool> {
    return insert(value_type{std::forward<Ts>(xs)...});
  }

  auto erase(const key_type& x) -> size_type {
    auto i = find(x);
    if (i == end())
      return 0;
    xs_.erase(i);
    return 1;
  }

  auto erase(const_iterator i) -> iterator {
    return xs_.erase(i);
  }

  auto erase(const_iterator first, const_iterator last) -> iterator {
    return xs_.erase(first, last);
  }

  void swap(stable_map& other) noexcept {
    xs_.swap(other.xs_);
  }

  // -- lookup ---------------------------------------------------------------

  auto at(const key_type& key) -> mapped_type& {
    auto i = find(key);
    if (i == end())
      throw std::out_of_range{"patricia::detail::stable_map::at out of range"};
    return i->second;
  }

  auto at(const key_type& key) const -> const mapped_type& {
    auto i = find(key);
    if (i == end())
      throw std::out_of_range{"patricia::detail::stable_map::at out of range"};
    return i->second;
  }

  auto operator[](const key_type& key) -> mapped_type& {
    auto i = find(key);
    if (i != end())
      return i->second;
    return xs_.emplace_back(key, mapped_type{}).second;
  }

  template <class L>
  auto find(const L& x) -> iterator {
    return std::find_if(begin(), end(), [&](const auto& y) {
      return std::equal_to<>{}(y.first, x);
    });
  }

  template <class L>
  auto find(const L& x) const -> const_iterator {
    return std::find_if(begin(), end(), [&](const auto& y) {
      return std::equal_to<>{}(y.first, x);
    });
  }

  template <class L>
  auto count(const L& x) const -> size_type {
    return find(x) == end() ? 0 : 1;
  }

  template <class L>
  auto contains(const L& x) const -> bool {
    return find(x) != end();
  }

  // -- comparison -----------------------------------------------------------

  /// Two maps are equal if they hold the same entries in the same order.
  friend auto operator==(const stable_map& lhs, const stable_map& rhs)
    -> bool {
    return lhs.xs_ == rhs.xs_;
  }

  friend auto as_vector(const stable_map& xs) -> const vector_type& {
    return xs.xs_;
  }

private:
  vector_type xs_ = {};
};

} // namespace patricia::detail
