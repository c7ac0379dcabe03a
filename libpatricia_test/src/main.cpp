//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2018 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "patricia/detail/add_message_types.hpp"
#include "patricia/error.hpp"
#include "patricia/logger.hpp"
#include "patricia/test/test.hpp"

#include <caf/config_option_set.hpp>
#include <caf/settings.hpp>
#include <caf/test/unit_test.hpp>

#include <algorithm>
#include <iostream>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace caf::test {

int main(int, char**);

} // namespace caf::test

namespace patricia::test {

extern std::set<std::string> config;

} // namespace patricia::test

namespace {

// Retrieves arguments after the '--' delimiter.
std::vector<std::string> get_test_args(int argc, const char* const* argv) {
  constexpr std::string_view delimiter = "--";
  auto start = argv + 1;
  auto end = argv + argc;
  auto args_start = std::find(start, end, delimiter);
  if (args_start == end)
    return {};
  return {args_start + 1, end};
}

} // namespace

int main(int argc, char** argv) {
  std::string patricia_loglevel = "quiet";
  auto test_args = get_test_args(argc, argv);
  if (!test_args.empty()) {
    auto options = caf::config_option_set{}
                     .add(patricia_loglevel, "patricia-verbosity",
                          "console verbosity for libpatricia")
                     .add<bool>("help", "print this help text");
    caf::settings cfg;
    auto res = options.parse(cfg, test_args);
    if (res.first != caf::pec::success) {
      std::cout << "error while parsing argument \"" << *res.second
                << "\": " << to_string(res.first) << "\n\n";
      std::cout << options.help_text() << std::endl;
      return 1;
    }
    if (caf::get_or(cfg, "help", false)) {
      std::cout << options.help_text() << std::endl;
      return 0;
    }
    patricia::test::config = {
      std::make_move_iterator(std::begin(test_args)),
      std::make_move_iterator(std::end(test_args)),
    };
  }
  patricia::detail::add_message_types();
  caf::settings log_settings;
  put(log_settings, "patricia.console-verbosity", patricia_loglevel);
  put(log_settings, "patricia.console-format", "%^[%s:%#] %v%$");
  auto log_context = patricia::create_log_context(log_settings);
  if (!log_context) {
    std::cerr << patricia::render(log_context.error()) << std::endl;
    return 1;
  }
  // Run the unit tests.
  return caf::test::main(argc, argv);
}
