//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "patricia/detail/add_message_types.hpp"

#include "patricia/error.hpp"
#include "patricia/fwd.hpp"

#include <caf/init_global_meta_objects.hpp>
#include <caf/inspector_access.hpp>

namespace patricia::detail {

void add_message_types() {
  caf::core::init_global_meta_objects();
  caf::init_global_meta_objects<caf::id_block::patricia_types>();
}

} // namespace patricia::detail
