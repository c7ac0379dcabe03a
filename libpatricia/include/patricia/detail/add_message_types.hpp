//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

namespace patricia::detail {

/// Registers the CAF meta objects of all types in the `patricia_types` block,
/// which makes `patricia::ec` errors printable and comparable through CAF.
void add_message_types();

} // namespace patricia::detail
