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

#include <sweep/core/retention.hpp>

#include <tl/expected.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace core {

// A single file or directory, used verbatim.
struct PathEntry
{
  std::string path;
};

// A glob pattern matching zero or more files or directories, optionally
// retaining some of the matches.
struct PatternEntry
{
  std::string pattern;
  std::optional<Retention> retention;
};

using Entry = std::variant<PathEntry, PatternEntry>;

// Expand `entry` to the paths it represents.
//
// A PathEntry expands to its path whether or not it exists. A PatternEntry
// expands to the current matches of its pattern minus retained matches. The
// only error is an invalid glob pattern; the message names the pattern.
tl::expected<std::vector<std::filesystem::path>, std::string>
expand(const Entry& entry);

// Format as "Path <path>" or "Pattern <pattern>".
std::string to_string(const Entry& entry);

} // namespace core
