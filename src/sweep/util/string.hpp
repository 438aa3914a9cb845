// Copyright (C) 2021-2025 Joel Rosdahl and other contributors
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

#include <sweep/util/time.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace util {

enum class SizeUnitPrefixType { binary, decimal };

// Format `size` as e.g. "42 bytes", "1.9 kB" or "1.5 KiB".
std::string format_human_readable_size(uint64_t size,
                                       SizeUnitPrefixType prefix_type);

// Format `time` as an ISO 8601 timestamp in local time, without fraction.
std::string format_iso8601_timestamp(const TimePoint& time);

// Format `seconds` as a short human-readable duration, e.g. "512 µs",
// "1.25 ms" or "3.10 s".
std::string format_duration(double seconds);

inline bool
ends_with(std::string_view string, std::string_view suffix)
{
  return string.size() >= suffix.size()
         && string.substr(string.size() - suffix.size()) == suffix;
}

inline bool
starts_with(std::string_view string, std::string_view prefix)
{
  return string.substr(0, prefix.size()) == prefix;
}

[[nodiscard]] std::string strip_whitespace(std::string_view string);

[[nodiscard]] std::string to_lowercase(std::string_view string);

} // namespace util
