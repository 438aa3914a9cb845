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

#include <tl/expected.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace util {

// A compiled file system glob pattern.
//
// Pattern syntax (per path component, components separated by '/'):
//
// - `*` matches any sequence of characters
// - `?` matches any single character
// - `[abc]`, `[a-z]` match a character in the set, `[!abc]` or `[^abc]` one
//   not in the set
// - `\` escapes the following character
// - `**` as a complete component matches zero or more directories
//
// Wildcards match a leading '.' like any other character, so `*` matches
// dotfiles and `**` descends into dot-directories. Symlinked directories are
// not descended into by `**`. Absolute patterns yield absolute paths and
// relative patterns yield paths relative to the current working directory.
class Glob
{
public:
  // Compile `pattern`. Returns an error message describing the syntax error if
  // the pattern is invalid.
  static tl::expected<Glob, std::string> compile(std::string_view pattern);

  const std::string& pattern() const;

  // Enumerate all file system entries matching the pattern. Directories are
  // listed in name order. Entries that vanish or can't be inspected during
  // enumeration and directories that can't be read are skipped.
  std::vector<std::filesystem::path> expand() const;

  // Return whether the single path component `name` matches the pattern
  // component `component_pattern`.
  static bool component_matches(const std::string& component_pattern,
                                const std::string& name);

private:
  enum class ComponentKind { literal, wildcard, recursive };

  struct Component
  {
    ComponentKind kind;
    std::string text;
  };

  std::string m_pattern;
  std::filesystem::path m_root;
  std::vector<Component> m_components;

  Glob() = default;

  void expand_from(const std::filesystem::path& base,
                   size_t index,
                   std::vector<std::filesystem::path>& result) const;
  void add_match(const std::filesystem::path& candidate,
                 size_t index,
                 std::vector<std::filesystem::path>& result) const;
};

inline const std::string&
Glob::pattern() const
{
  return m_pattern;
}

} // namespace util
