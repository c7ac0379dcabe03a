//    _   _____   __________
//   | | / / _ | / __/_  __/     Visibility
//   | |/ / __ |_\ \  / /          Across
//   |___/_/ |_/___/ /_/       Space and Time
//
// SPDX-FileCopyrightText: (c) 2024 The Tenzir Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "patricia/configuration.hpp"

#include "patricia/defaults.hpp"
#include "patricia/detail/assert.hpp"
#include "patricia/detail/env.hpp"
#include "patricia/detail/settings.hpp"
#include "patricia/error.hpp"
#include "patricia/logger.hpp"
#include "patricia/try.hpp"

#include <fmt/format.h>
#include <fmt/std.h>
#include <yaml-cpp/yaml.h>

#include <cctype>
#include <cstdint>
#include <vector>

namespace patricia {

namespace {

auto from_yaml(const YAML::Node& node, std::string_view key)
  -> caf::expected<caf::config_value> {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      return caf::config_value{};
    case YAML::NodeType::Scalar: {
      auto b = false;
      if (YAML::convert<bool>::decode(node, b))
        return caf::config_value{b};
      auto i = int64_t{};
      if (YAML::convert<int64_t>::decode(node, i))
        return caf::config_value{i};
      auto d = 0.0;
      if (YAML::convert<double>::decode(node, d))
        return caf::config_value{d};
      return caf::config_value{node.Scalar()};
    }
    case YAML::NodeType::Sequence: {
      auto result = caf::config_value::list{};
      for (const auto& element : node) {
        auto x = from_yaml(element, key);
        if (not x)
          return x.error();
        result.push_back(std::move(*x));
      }
      return caf::config_value{std::move(result)};
    }
    case YAML::NodeType::Map: {
      auto result = caf::settings{};
      for (const auto& field : node) {
        auto name = field.first.as<std::string>();
        auto x = from_yaml(field.second, name);
        if (not x)
          return x.error();
        result.insert_or_assign(std::move(name), std::move(*x));
      }
      return caf::config_value{std::move(result)};
    }
  }
  return caf::make_error(ec::parse_error,
                         fmt::format("unsupported YAML node at key '{}'", key));
}

} // namespace

auto to_config_key(std::string_view key, std::string_view prefix)
  -> std::optional<std::string> {
  PATRICIA_ASSERT(!prefix.empty());
  // PREFIX_X is the shortest allowed key.
  if (prefix.size() + 2 > key.size())
    return std::nullopt;
  if (!key.starts_with(prefix) || key[prefix.size()] != '_')
    return std::nullopt;
  auto suffix = key.substr(prefix.size() + 1);
  // From here on, "__" is the record separator and '_' translates into '-'.
  auto result = std::string{};
  result.reserve(suffix.size());
  for (size_t i = 0; i < suffix.size(); ++i) {
    auto c = suffix[i];
    if (c == '_' && i + 1 < suffix.size() && suffix[i + 1] == '_') {
      result += '.';
      ++i;
    } else if (c == '_') {
      result += '-';
    } else {
      result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
  }
  return result;
}

auto to_config_value(std::string_view value) -> caf::config_value {
  if (auto result = caf::config_value::parse(value))
    return std::move(*result);
  return caf::config_value{std::string{value}};
}

auto merge_environment(caf::settings& config) -> caf::error {
  for (const auto& [key, value] : detail::environment()) {
    if (value.empty())
      continue;
    auto config_key = to_config_key(key, defaults::env_prefix);
    if (!config_key)
      continue;
    config_key->insert(0, "patricia.");
    // The configuration file has been resolved already.
    if (*config_key == "patricia.config")
      continue;
    PATRICIA_DEBUG("using environment variable {} for {}", key, *config_key);
    caf::put(config, *config_key, to_config_value(value));
  }
  return caf::none;
}

auto load_config_file(const std::filesystem::path& path)
  -> caf::expected<caf::settings> {
  auto err = std::error_code{};
  if (!std::filesystem::exists(path, err)) {
    if (err)
      return caf::make_error(ec::filesystem_error,
                             fmt::format("failed to check if {} exists: {}",
                                         path, err.message()));
    return caf::make_error(ec::filesystem_error,
                           fmt::format("no such file: {}", path));
  }
  auto root = YAML::Node{};
  try {
    root = YAML::LoadFile(path.string());
  } catch (const YAML::Exception& ex) {
    return caf::make_error(ec::parse_error,
                           fmt::format("failed to parse {}: {}", path,
                                       ex.what()));
  }
  if (root.IsNull())
    return caf::settings{};
  if (!root.IsMap())
    return caf::make_error(ec::invalid_configuration,
                           fmt::format("{} must contain a mapping", path));
  auto result = from_yaml(root, "");
  if (!result)
    return add_context(result.error(), "while loading {}", path);
  PATRICIA_VERBOSE("loaded configuration file {}", path);
  return caf::get<caf::settings>(*result);
}

auto make_configuration(std::optional<std::filesystem::path> file)
  -> caf::expected<caf::settings> {
  auto result = caf::settings{};
  caf::put(result, "patricia.console-verbosity",
           std::string{defaults::logger::console_verbosity});
  caf::put(result, "patricia.console-format",
           std::string{defaults::logger::console_format});
  caf::put(result, "patricia.file-verbosity",
           std::string{defaults::logger::file_verbosity});
  caf::put(result, "patricia.file-format",
           std::string{defaults::logger::file_format});
  caf::put(result, "patricia.log-file",
           std::string{defaults::logger::log_file});
  if (!file) {
    if (auto path = detail::getenv(defaults::config_env))
      file = std::move(*path);
  }
  if (file) {
    PATRICIA_TRY(auto from_file, load_config_file(*file));
    detail::merge_settings(from_file, result);
  }
  PATRICIA_TRY(merge_environment(result));
  return result;
}

} // namespace patricia
