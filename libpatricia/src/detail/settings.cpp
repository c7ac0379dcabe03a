//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "patricia/detail/settings.hpp"

#include "patricia/logger.hpp"

namespace patricia::detail {

namespace {

void merge_settings_impl(const caf::settings& src, caf::settings& dst,
                         enum policy::merge_lists merge_lists, size_t depth) {
  if (depth > 100) {
    PATRICIA_ERROR("Exceeded maximum nesting depth in settings.");
    return;
  }
  for (auto& [key, value] : src) {
    if (caf::holds_alternative<caf::settings>(value)) {
      merge_settings_impl(caf::get<caf::settings>(value),
                          dst[key].as_dictionary(), merge_lists, depth + 1);
      continue;
    }
    if (merge_lists == policy::merge_lists::yes
        && caf::holds_alternative<caf::config_value::list>(value)
        && caf::holds_alternative<caf::config_value::list>(dst[key])) {
      const auto& src_list = caf::get<caf::config_value::list>(value);
      auto& dst_list = dst[key].as_list();
      dst_list.insert(dst_list.end(), src_list.begin(), src_list.end());
    } else {
      dst.insert_or_assign(key, value);
    }
  }
}

} // namespace

void merge_settings(const caf::settings& src, caf::settings& dst,
                    enum policy::merge_lists merge_lists) {
  merge_settings_impl(src, dst, merge_lists, 0);
}

} // namespace patricia::detail
