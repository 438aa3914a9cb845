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

#include <sweep/core/profile.hpp>
#include <sweep/core/prompt.hpp>
#include <sweep/util/format.hpp>
#include <sweep/util/string.hpp>

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace core {

enum class Mode {
  silent,      // no prompts
  every_entry, // confirm each profile entry before expanding it
  every_path,  // confirm each resolved path before removing it
};

std::optional<Mode> parse_mode(std::string_view value);
std::string_view to_string(Mode mode);

struct CleanOptions
{
  Mode mode = Mode::every_path;

  // Whether failures to remove children of a directory are reported in
  // CleanSummary::errors (they are always logged).
  bool report_child_errors = true;

  util::SizeUnitPrefixType size_unit = util::SizeUnitPrefixType::decimal;
};

struct CleanSummary
{
  // Number of resolved paths.
  size_t expanded = 0;

  // Number of resolved paths that were removed completely.
  size_t removed = 0;

  // Bytes reclaimed, including bytes freed below paths that could only be
  // removed partially.
  uint64_t reclaimed = 0;

  // Human-readable messages for entries that failed to expand and paths that
  // failed to be removed.
  std::vector<std::string> errors;
};

// Canonicalize `paths`, silently dropping paths that can't be canonicalized
// (e.g. nonexistent paths or broken symlinks). Duplicates are kept.
std::vector<std::filesystem::path>
resolve_paths(const std::vector<std::filesystem::path>& paths);

// Removes the paths described by a profile, one at a time.
class Cleaner
{
public:
  // `prompt` is only called in modes that confirm. Progress messages are
  // printed to `output` unless it is nullptr.
  Cleaner(const CleanOptions& options, Prompt prompt, FILE* output);

  CleanSummary clean(const Profile& profile);

private:
  CleanOptions m_options;
  Prompt m_prompt;
  FILE* m_output;

  std::vector<const Entry*> select_entries(const Profile& profile);
  std::vector<std::filesystem::path>
  expand_entries(const std::vector<const Entry*>& entries,
                 CleanSummary& summary);
  void remove_paths(const std::vector<std::filesystem::path>& paths,
                    CleanSummary& summary);

  template<typename... Args>
  void report(fmt::format_string<Args...> format, Args&&... args);
};

template<typename... Args>
inline void
Cleaner::report(fmt::format_string<Args...> format, Args&&... args)
{
  if (m_output) {
    fmt::print(m_output, format, std::forward<Args>(args)...);
  }
}

} // namespace core
