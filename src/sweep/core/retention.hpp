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

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace core {

// Sort key used to rank the matches of a pattern.
enum class RetentionOrder { file_name, created, modified };

// Keep the `count` highest ranked matches of a pattern: the latest for
// `created` and `modified` and the last in lexicographic order for
// `file_name`.
struct KeepRetention
{
  RetentionOrder order = RetentionOrder::modified;
  uint64_t count = 0;
};

// Legacy retention form which keeps exactly one match.
enum class PatternException {
  first_ascending,  // smallest file name
  first_descending, // largest file name
  most_recent,      // latest modification (or creation) time
};

using Retention = std::variant<KeepRetention, PatternException>;

std::optional<RetentionOrder> parse_retention_order(std::string_view value);
std::optional<PatternException> parse_pattern_exception(std::string_view value);

std::string_view to_string(RetentionOrder order);
std::string_view to_string(PatternException exception);
std::string to_string(const Retention& retention);

// Return the subset of `matches` that is not retained by `retention`, in
// ranking order for KeepRetention and in `matches` order for PatternException.
//
// Matches whose timestamp can't be read rank lowest. Matches with equal keys
// keep their relative order from `matches`. An empty `matches` yields an empty
// result for all retention forms.
std::vector<std::filesystem::path>
apply_retention(std::vector<std::filesystem::path> matches,
                const Retention& retention);

} // namespace core
