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

#include <sweep/core/entry.hpp>

#include <tl/expected.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace core {

struct Profile
{
  // Display name.
  std::string name;

  // Entries to expand for removal, in document order.
  std::vector<Entry> entries;
};

// Deserialize a profile from a JSON document of the form
//
//   {
//     "name": "...",
//     "entries": [
//       {"type": "path", "path": "..."},
//       {"type": "pattern", "pattern": "...",
//        "retention": {"order": "fileName|created|modified", "count": N}},
//       {"type": "pattern", "pattern": "...",
//        "exception": "firstAscending|firstDescending|mostRecent"}
//     ]
//   }
//
// Unknown members are ignored. "retention" and "exception" are optional
// (null counts as absent) and mutually exclusive.
tl::expected<Profile, std::string> parse_profile(std::string_view document);

// Read and deserialize the profile at `path`.
//
// The error message is "failed to read file [<cause>]" or "failed to
// deserialise value [<cause>]".
tl::expected<Profile, std::string>
load_profile(const std::filesystem::path& path);

} // namespace core
