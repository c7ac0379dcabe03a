//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <coroutine>
#include <exception>
#include <iterator>
#include <memory>
#include <type_traits>
#include <utility>

namespace patricia {

template <class T>
class generator;

namespace detail {

template <class T>
class generator_promise {
public:
  using value_type = std::remove_reference_t<T>;
  using reference_type = std::conditional_t<std::is_reference_v<T>, T, T&>;
  using pointer_type = value_type*;

  generator_promise() = default;

  auto get_return_object() noexcept -> generator<T>;

  constexpr auto initial_suspend() const noexcept -> std::suspend_always {
    return {};
  }

  constexpr auto final_suspend() const noexcept -> std::suspend_always {
    return {};
  }

  template <class U = T>
    requires(not std::is_rvalue_reference_v<U>)
  auto yield_value(std::remove_reference_t<T>& value) noexcept
    -> std::suspend_always {
    value_ = std::addressof(value);
    return {};
  }

  auto yield_value(std::remove_reference_t<T>&& value) noexcept
    -> std::suspend_always {
    value_ = std::addressof(value);
    return {};
  }

  void unhandled_exception() {
    exception_ = std::current_exception();
  }

  void return_void() {
  }

  auto value() const noexcept -> reference_type {
    return static_cast<reference_type>(*value_);
  }

  // Don't allow any use of 'co_await' inside the generator coroutine.
  template <class U>
  auto await_transform(U&& value) -> std::suspend_never = delete;

  void rethrow_if_exception() {
    if (exception_)
      std::rethrow_exception(std::move(exception_));
  }

private:
  pointer_type value_ = nullptr;
  std::exception_ptr exception_ = {};
};

struct generator_sentinel {};

template <class T>
class generator_iterator {
  using coroutine_handle = std::coroutine_handle<generator_promise<T>>;

public:
  using iterator_category = std::input_iterator_tag;
  using difference_type = std::ptrdiff_t;
  using value_type = typename generator_promise<T>::value_type;
  using reference = typename generator_promise<T>::reference_type;
  using pointer = typename generator_promise<T>::pointer_type;

  generator_iterator() noexcept = default;

  explicit generator_iterator(coroutine_handle coroutine) noexcept
    : coroutine_{coroutine} {
  }

  friend auto operator==(const generator_iterator& it,
                         generator_sentinel) noexcept -> bool {
    return not it.coroutine_ or it.coroutine_.done();
  }

  auto operator++() -> generator_iterator& {
    coroutine_.resume();
    if (coroutine_.done())
      coroutine_.promise().rethrow_if_exception();
    return *this;
  }

  void operator++(int) {
    (void)operator++();
  }

  auto operator*() const noexcept -> reference {
    return coroutine_.promise().value();
  }

  auto operator->() const noexcept -> pointer {
    return std::addressof(operator*());
  }

private:
  coroutine_handle coroutine_ = nullptr;
};

} // namespace detail

/// A lazy, single-pass sequence of values produced by a coroutine that uses
/// `co_yield`. Iterating a generator resumes the coroutine until it yields
/// the next value or returns. A generator cannot be restarted; iterate the
/// result of a fresh call instead.
template <class T>
class [[nodiscard]] generator {
public:
  using promise_type = detail::generator_promise<T>;
  using iterator = detail::generator_iterator<T>;

  generator() noexcept = default;

  generator(generator&& other) noexcept
    : coroutine_{std::exchange(other.coroutine_, nullptr)} {
  }

  generator(const generator& other) = delete;

  ~generator() {
    if (coroutine_)
      coroutine_.destroy();
  }

  auto operator=(generator other) noexcept -> generator& {
    std::swap(coroutine_, other.coroutine_);
    return *this;
  }

  auto begin() -> iterator {
    if (coroutine_) {
      coroutine_.resume();
      if (coroutine_.done())
        coroutine_.promise().rethrow_if_exception();
    }
    return iterator{coroutine_};
  }

  auto end() noexcept -> detail::generator_sentinel {
    return {};
  }

  void swap(generator& other) noexcept {
    std::swap(coroutine_, other.coroutine_);
  }

private:
  friend class detail::generator_promise<T>;

  explicit generator(std::coroutine_handle<promise_type> coroutine) noexcept
    : coroutine_{coroutine} {
  }

  std::coroutine_handle<promise_type> coroutine_ = nullptr;
};

template <class T>
void swap(generator<T>& a, generator<T>& b) {
  a.swap(b);
}

namespace detail {

template <class T>
auto generator_promise<T>::get_return_object() noexcept -> generator<T> {
  using coroutine_handle = std::coroutine_handle<generator_promise<T>>;
  return generator<T>{coroutine_handle::from_promise(*this)};
}

} // namespace detail

} // namespace patricia
