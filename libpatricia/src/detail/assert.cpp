//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "patricia/detail/assert.hpp"

#include "patricia/config.hpp"
#include "patricia/logger.hpp"
#include "patricia/panic.hpp"

#include <fmt/format.h>

namespace patricia::detail {

void panic_impl(std::string message, std::source_location source) {
  PATRICIA_ERROR("panic: {}", message);
  PATRICIA_ERROR("version: {}", version::version);
  PATRICIA_ERROR("source: {}:{}", source.file_name(), source.line());
  PATRICIA_ERROR("this is a bug, we would appreciate a report - thank you!");
  panic_at<1>(source, "{}", std::move(message));
}

[[noreturn]] void
fail_assertion_impl(const char* expr, std::string_view explanation,
                    std::source_location source) {
  auto message = fmt::format("assertion `{}` failed", expr);
  if (not explanation.empty()) {
    message += ": ";
    message += explanation;
  }
  panic_impl(std::move(message), source);
}

} // namespace patricia::detail
