//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <caf/settings.hpp>

namespace patricia::policy {

enum class merge_lists { no, yes };

} // namespace patricia::policy

namespace patricia::detail {

/// Merge settings of `src` into `dst`, overwriting existing values
/// from `dst` if necessary. Passing `merge_lists::yes` for `merge_lists`
/// appends lists instead of replacing them.
void merge_settings(const caf::settings& src, caf::settings& dst,
                    enum policy::merge_lists merge_lists
                    = policy::merge_lists::no);

} // namespace patricia::detail
