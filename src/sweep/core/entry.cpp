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

#include "entry.hpp"

#include <sweep/util/format.hpp>
#include <sweep/util/glob.hpp>
#include <sweep/util/logging.hpp>

namespace fs = std::filesystem;

namespace core {

tl::expected<std::vector<fs::path>, std::string>
expand(const Entry& entry)
{
  if (const auto* path_entry = std::get_if<PathEntry>(&entry)) {
    return std::vector<fs::path>{fs::path(path_entry->path)};
  }

  const auto& pattern_entry = std::get<PatternEntry>(entry);
  auto glob = util::Glob::compile(pattern_entry.pattern);
  if (!glob) {
    return tl::unexpected(FMT("failed to parse glob pattern \"{}\" [{}]",
                              pattern_entry.pattern,
                              glob.error()));
  }

  auto matches = glob->expand();
  LOG("Pattern {} matched {} path{}",
      pattern_entry.pattern,
      matches.size(),
      matches.size() == 1 ? "" : "s");

  if (!pattern_entry.retention) {
    return matches;
  }

  auto result = apply_retention(std::move(matches), *pattern_entry.retention);
  LOG("Retention {} left {} path{} of pattern {}",
      to_string(*pattern_entry.retention),
      result.size(),
      result.size() == 1 ? "" : "s",
      pattern_entry.pattern);
  return result;
}

std::string
to_string(const Entry& entry)
{
  if (const auto* path_entry = std::get_if<PathEntry>(&entry)) {
    return FMT("Path <{}>", path_entry->path);
  } else {
    return FMT("Pattern <{}>", std::get<PatternEntry>(entry).pattern);
  }
}

} // namespace core
