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

#include "string.hpp"

#include <sweep/util/format.hpp>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iterator>

namespace util {

std::string
format_human_readable_size(uint64_t size, SizeUnitPrefixType prefix_type)
{
  const bool binary = prefix_type == SizeUnitPrefixType::binary;
  const double base = binary ? 1024 : 1000;
  if (size < base) {
    return size == 1 ? "1 byte" : FMT("{} bytes", size);
  }

  // Kilo is "k" in SI but "Ki" in IEC.
  const char* const prefixes[] = {binary ? "K" : "k", "M", "G", "T"};
  double value = static_cast<double>(size) / base;
  size_t index = 0;
  while (value >= base && index + 1 < std::size(prefixes)) {
    value /= base;
    ++index;
  }
  return FMT("{:.1f} {}{}B", value, prefixes[index], binary ? "i" : "");
}

std::string
format_iso8601_timestamp(const TimePoint& time)
{
  const time_t seconds = util::sec(time);
  struct tm local;
  if (!localtime_r(&seconds, &local)) {
    return std::to_string(seconds);
  }
  char buffer[32];
  const size_t length =
    strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &local);
  return std::string(buffer, length);
}

std::string
format_duration(double seconds)
{
  if (seconds >= 1.0) {
    return FMT("{:.2f} s", seconds);
  } else if (seconds >= 0.001) {
    return FMT("{:.2f} ms", seconds * 1000);
  } else {
    return FMT("{:.0f} µs", seconds * 1'000'000);
  }
}

std::string
strip_whitespace(std::string_view string)
{
  const auto is_space = [](char ch) {
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
  };
  const auto start = std::find_if_not(string.begin(), string.end(), is_space);
  const auto end =
    std::find_if_not(string.rbegin(), string.rend(), is_space).base();
  return start < end ? std::string(start, end) : std::string();
}

std::string
to_lowercase(std::string_view string)
{
  std::string result(string);
  for (char& ch : result) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return result;
}

} // namespace util
