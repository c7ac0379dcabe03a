//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "patricia/error.hpp"

#include "patricia/detail/assert.hpp"

#include <caf/detail/message_data.hpp>
#include <caf/detail/meta_object.hpp>
#include <caf/message.hpp>
#include <caf/pec.hpp>
#include <caf/sec.hpp>
#include <fmt/format.h>

#include <string>

namespace patricia {
namespace {

const char* descriptions[] = {
  "no_error",
  "unspecified",
  "key_not_found",
  "parse_error",
  "invalid_configuration",
  "filesystem_error",
  "logic_error",
};

static_assert(ec{std::size(descriptions)} == ec::ec_count,
              "Mismatch between number of error codes and descriptions");

auto code_name(const caf::error& err) -> std::string {
  switch (err.category()) {
    case caf::type_id_v<patricia::ec>:
      return to_string(static_cast<patricia::ec>(err.code()));
    case caf::type_id_v<caf::pec>:
      return to_string(static_cast<caf::pec>(err.code()));
    case caf::type_id_v<caf::sec>:
      return to_string(static_cast<caf::sec>(err.code()));
    default:
      return "unknown";
  }
}

/// Strings print verbatim, everything else as CAF stringifies the element.
auto render_element(const caf::message& ctx, size_t index) -> std::string {
  if (ctx.match_element<std::string>(index))
    return ctx.get_as<std::string>(index);
  auto result = std::string{};
  const auto* meta = caf::detail::global_meta_object(ctx.types()[index]);
  if (meta == nullptr)
    return "<unknown>";
  meta->stringify(result, ctx.cdata().at(index));
  return result;
}

} // namespace

auto to_string(ec x) -> const char* {
  auto index = static_cast<size_t>(x);
  PATRICIA_ASSERT(index < std::size(descriptions));
  return descriptions[index];
}

auto render(const caf::error& err) -> std::string {
  if (not err)
    return {};
  auto result = fmt::format("!! {}", code_name(err));
  const auto& ctx = err.context();
  if (ctx.size() == 0)
    return result;
  result += ':';
  for (size_t i = 0; i < ctx.size(); ++i) {
    result += ' ';
    result += render_element(ctx, i);
  }
  return result;
}

auto matched_prefix(const caf::error& err) -> std::optional<std::string> {
  if (not err or err.category() != caf::type_id_v<patricia::ec>
      or static_cast<patricia::ec>(err.code()) != ec::key_not_found)
    return std::nullopt;
  const auto& ctx = err.context();
  if (ctx.size() == 0 or not ctx.match_element<std::string>(0))
    return std::nullopt;
  return ctx.get_as<std::string>(0);
}

auto add_context_impl(const caf::error& error, std::string str) -> caf::error {
  if (not error)
    return error;
  auto note = caf::make_message(std::move(str));
  auto ctx = error.context() ? caf::message::concat(error.context(),
                                                    std::move(note))
                             : std::move(note);
  return caf::error{error.code(), error.category(), std::move(ctx)};
}

} // namespace patricia
