//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "patricia/config.hpp" // IWYU pragma: export

#include <caf/config.hpp>
#include <caf/fwd.hpp>
#include <caf/type_id.hpp>

#include <cstddef>
#include <cstdint>

#define PATRICIA_ADD_TYPE_ID(type) CAF_ADD_TYPE_ID(patricia_types, type)

namespace patricia {

// -- enums --------------------------------------------------------------------

enum class ec : uint8_t;

// -- structs ------------------------------------------------------------------

struct window;

// -- templates ----------------------------------------------------------------

template <class T>
class generator;

template <class T>
class trie;

namespace detail {

template <class Key, class T>
class stable_map;

template <class T>
struct trie_node;

} // namespace detail

} // namespace patricia

// -- type announcements -------------------------------------------------------

constexpr inline caf::type_id_t first_patricia_type_id = 800;

CAF_BEGIN_TYPE_ID_BLOCK(patricia_types, first_patricia_type_id)

  PATRICIA_ADD_TYPE_ID((patricia::ec))

CAF_END_TYPE_ID_BLOCK(patricia_types)

#undef PATRICIA_ADD_TYPE_ID
