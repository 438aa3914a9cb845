// Copyright (C) 2019-2024 Joel Rosdahl and other contributors
// Copyright (C) 2026 The sweep authors
//
// This program is free software; you can redistribute it and/or modify it
// under the terms of the GNU General Public License as published by the Free
// Software Foundation; either version 3 of the License, or (at your option)
// any later version.
//
// This program is distributed in the hope that it will be useful, but WITHOUT
// ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for
// more details.
//
// You should have received a copy of the GNU General Public License along with
// this program; if not, write to the Free Software Foundation, Inc., 51
// Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA

#include "config.hpp"

#include <sweep/core/exceptions.hpp>
#include <sweep/util/file.hpp>
#include <sweep/util/format.hpp>
#include <sweep/util/string.hpp>

#include <tl/expected.hpp>

#include <cstdlib>
#include <initializer_list>
#include <string_view>

namespace fs = std::filesystem;

namespace {

enum class ConfigItem {
  debug,
  log_file,
  mode,
  report_child_errors,
  size_unit,
};

struct ItemInfo
{
  ConfigItem item;
  std::string_view key;      // name in the configuration file
  std::string_view env_name; // name after the SWEEP_ or SWEEP_NO prefix
  bool is_bool;
};

// Sorted by key.
const ItemInfo k_items[] = {
  {ConfigItem::debug, "debug", "DEBUG", true},
  {ConfigItem::log_file, "log_file", "LOGFILE", false},
  {ConfigItem::mode, "mode", "MODE", false},
  {ConfigItem::report_child_errors,
   "report_child_errors",
   "REPORT_CHILD_ERRORS",
   true},
  {ConfigItem::size_unit, "size_unit", "SIZE_UNIT", false},
};

const ItemInfo&
find_item(std::string_view key)
{
  for (const auto& info : k_items) {
    if (info.key == key) {
      return info;
    }
  }
  throw core::Error(FMT("unknown configuration option \"{}\"", key));
}

bool
parse_bool(const std::string& value)
{
  if (value == "true") {
    return true;
  } else if (value == "false") {
    return false;
  } else {
    throw core::Error(FMT("not a boolean value: \"{}\"", value));
  }
}

// Any value of a boolean environment variable means true, except for the
// false-looking ones, which are rejected since they most likely are mistakes.
bool
parse_env_bool(const std::string& value, std::string_view env_name, bool negate)
{
  const std::string lower_value = util::to_lowercase(value);
  if (value == "0" || lower_value == "false" || lower_value == "disable"
      || lower_value == "no") {
    throw core::Error(
      FMT("invalid boolean environment variable value \"{}\" (did you mean to"
          " set \"SWEEP_{}{}=true\"?)",
          value,
          negate ? "" : "NO",
          env_name));
  }
  return !negate;
}

std::string
format_bool(bool value)
{
  return value ? "true" : "false";
}

util::SizeUnitPrefixType
parse_size_unit(const std::string& value)
{
  if (value == "decimal") {
    return util::SizeUnitPrefixType::decimal;
  } else if (value == "binary") {
    return util::SizeUnitPrefixType::binary;
  } else {
    throw core::Error(FMT("unknown size unit: \"{}\"", value));
  }
}

struct KeyValue
{
  std::string key;
  std::string value;
};

// Parse one line of a configuration file. Blank lines and comments give
// std::nullopt.
tl::expected<std::optional<KeyValue>, std::string>
parse_line(std::string_view line)
{
  const std::string stripped = util::strip_whitespace(line);
  if (stripped.empty() || stripped[0] == '#') {
    return std::nullopt;
  }
  const size_t equal_pos = stripped.find('=');
  if (equal_pos == std::string::npos) {
    return tl::unexpected("missing equal sign");
  }
  return KeyValue{util::strip_whitespace(stripped.substr(0, equal_pos)),
                  util::strip_whitespace(stripped.substr(equal_pos + 1))};
}

std::optional<fs::path>
getenv_path(const char* name)
{
  const char* value = getenv(name);
  return value ? std::optional<fs::path>(value) : std::nullopt;
}

} // namespace

void
Config::read(const std::optional<fs::path>& config_path)
{
  if (config_path) {
    set_config_path(*config_path);
  } else if (auto env_config_path = getenv_path("SWEEP_CONFIGPATH")) {
    set_config_path(*env_config_path);
  } else {
    set_config_path(default_config_path());
  }

  // A missing configuration file is OK.
  if (!m_config_path.empty()) {
    update_from_file(m_config_path);
  }

  update_from_environment();
}

core::CleanOptions
Config::clean_options() const
{
  core::CleanOptions options;
  options.mode = m_mode;
  options.report_child_errors = m_report_child_errors;
  options.size_unit = m_size_unit;
  return options;
}

void
Config::set_config_path(const fs::path& path)
{
  m_config_path = path.lexically_normal();
}

bool
Config::update_from_file(const fs::path& path)
{
  const auto contents = util::read_file(path);
  if (!contents) {
    return false;
  }

  const std::string_view text = *contents;
  size_t line_number = 0;
  size_t start = 0;
  while (start < text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    const auto line = text.substr(start, end - start);
    start = end + 1;
    ++line_number;

    try {
      const auto key_value = parse_line(line);
      if (!key_value) {
        throw core::Error(key_value.error());
      }
      if (*key_value) {
        const auto& [key, value] = **key_value;
        set_item(key, value, std::nullopt, path.string());
      }
    } catch (const core::Error& e) {
      throw core::Error(FMT("{}:{}: {}", path, line_number, e.what()));
    }
  }
  return true;
}

void
Config::update_from_environment()
{
  for (const auto& info : k_items) {
    // SWEEP_NO<NAME> is applied last so that it wins over SWEEP_<NAME>.
    for (const bool negate : {false, true}) {
      if (negate && !info.is_bool) {
        continue;
      }
      const std::string env_var =
        FMT("SWEEP_{}{}", negate ? "NO" : "", info.env_name);
      const char* value = getenv(env_var.c_str());
      if (!value) {
        continue;
      }
      try {
        set_item(info.key, value, negate, "environment");
      } catch (const core::Error& e) {
        throw core::Error(FMT("{}: {}", env_var, e.what()));
      }
    }
  }
}

std::string
Config::get_string_value(const std::string& key) const
{
  switch (find_item(key).item) {
  case ConfigItem::debug:
    return format_bool(m_debug);

  case ConfigItem::log_file:
    return m_log_file.string();

  case ConfigItem::mode:
    return std::string(core::to_string(m_mode));

  case ConfigItem::report_child_errors:
    return format_bool(m_report_child_errors);

  case ConfigItem::size_unit:
    return m_size_unit == util::SizeUnitPrefixType::binary ? "binary"
                                                           : "decimal";
  }

  throw core::Error(FMT("unhandled configuration option \"{}\"", key));
}

void
Config::visit_items(const ItemVisitor& item_visitor) const
{
  for (const auto& info : k_items) {
    const std::string key(info.key);
    auto it = m_origins.find(key);
    item_visitor(key,
                 get_string_value(key),
                 it != m_origins.end() ? it->second : "default");
  }
}

void
Config::set_item(std::string_view key,
                 const std::string& value,
                 std::optional<bool> env_negate,
                 const std::string& origin)
{
  const auto& info = find_item(key);
  const auto parse_flag = [&] {
    return env_negate ? parse_env_bool(value, info.env_name, *env_negate)
                      : parse_bool(value);
  };

  switch (info.item) {
  case ConfigItem::debug:
    m_debug = parse_flag();
    break;

  case ConfigItem::log_file:
    m_log_file = value;
    break;

  case ConfigItem::mode: {
    auto mode = core::parse_mode(value);
    if (!mode) {
      throw core::Error(FMT("unknown mode: \"{}\"", value));
    }
    m_mode = *mode;
    break;
  }

  case ConfigItem::report_child_errors:
    m_report_child_errors = parse_flag();
    break;

  case ConfigItem::size_unit:
    m_size_unit = parse_size_unit(value);
    break;
  }

  m_origins.insert_or_assign(std::string(info.key), origin);
}

fs::path
Config::default_config_path()
{
  if (auto xdg_config_home = getenv_path("XDG_CONFIG_HOME")) {
    return *xdg_config_home / "sweep" / "sweep.conf";
  }
  if (auto home = getenv_path("HOME")) {
    return *home / ".config" / "sweep" / "sweep.conf";
  }
  return {};
}
