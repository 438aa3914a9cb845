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

#pragma once

#include <sweep/core/cleaner.hpp>
#include <sweep/util/noncopyable.hpp>
#include <sweep/util/string.hpp>

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

class Config : util::NonCopyable
{
public:
  Config() = default;

  // Read the configuration file and then the SWEEP_* environment variables.
  // `config_path` overrides $SWEEP_CONFIGPATH and the default location.
  void read(const std::optional<std::filesystem::path>& config_path = {});

  bool debug() const;
  const std::filesystem::path& log_file() const;
  core::Mode mode() const;
  bool report_child_errors() const;
  util::SizeUnitPrefixType size_unit() const;

  core::CleanOptions clean_options() const;

  void set_debug(bool value);
  void set_log_file(const std::filesystem::path& value);
  void set_mode(core::Mode value);

  const std::filesystem::path& config_path() const;
  void set_config_path(const std::filesystem::path& path);

  using ItemVisitor = std::function<void(const std::string& key,
                                         const std::string& value,
                                         const std::string& origin)>;

  // Set config values from a configuration file. Returns false if the file
  // can't be read. Throws core::Error on syntax errors and unknown keys.
  bool update_from_file(const std::filesystem::path& path);

  // Set config values from SWEEP_<NAME> environment variables. Boolean items
  // are also read from SWEEP_NO<NAME>, which wins if both are set.
  void update_from_environment();

  // Get a config value in string form given a key.
  std::string get_string_value(const std::string& key) const;

  // Call `item_visitor` for each item in the configuration, sorted by key.
  void visit_items(const ItemVisitor& item_visitor) const;

  // Default configuration file location, or an empty path if no home
  // directory can be determined.
  static std::filesystem::path default_config_path();

private:
  std::filesystem::path m_config_path;

  bool m_debug = false;
  std::filesystem::path m_log_file;
  core::Mode m_mode = core::Mode::every_path;
  bool m_report_child_errors = true;
  util::SizeUnitPrefixType m_size_unit = util::SizeUnitPrefixType::decimal;

  std::unordered_map<std::string /*key*/, std::string /*origin*/> m_origins;

  // `env_negate` is set for values from the environment and tells whether the
  // variable had the NO prefix.
  void set_item(std::string_view key,
                const std::string& value,
                std::optional<bool> env_negate,
                const std::string& origin);
};

// Inline implementations

inline bool
Config::debug() const
{
  return m_debug;
}

inline const std::filesystem::path&
Config::log_file() const
{
  return m_log_file;
}

inline core::Mode
Config::mode() const
{
  return m_mode;
}

inline bool
Config::report_child_errors() const
{
  return m_report_child_errors;
}

inline util::SizeUnitPrefixType
Config::size_unit() const
{
  return m_size_unit;
}

inline void
Config::set_debug(bool value)
{
  m_debug = value;
}

inline void
Config::set_log_file(const std::filesystem::path& value)
{
  m_log_file = value;
}

inline void
Config::set_mode(core::Mode value)
{
  m_mode = value;
}

inline const std::filesystem::path&
Config::config_path() const
{
  return m_config_path;
}
