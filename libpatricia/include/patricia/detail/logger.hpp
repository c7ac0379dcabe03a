//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "patricia/config.hpp"

#include <caf/fwd.hpp>
#include <spdlog/spdlog.h>

#include <memory>

namespace patricia::detail {

/// Sets up the sinks of the global logger from the `patricia.*` settings.
/// @returns `false` if the configuration is invalid or the logger was
/// already set up.
bool setup_spdlog(const caf::settings& cfg);

/// Flushes and drops all loggers.
void shutdown_spdlog();

/// Retrieves the global logger, which discards all messages until
/// `setup_spdlog` replaces it.
std::shared_ptr<spdlog::logger>& logger();

} // namespace patricia::detail
