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

#include <fmt/core.h>
#include <fmt/format.h>

#include <filesystem>
#include <string_view>
#include <system_error>

// fmt::format with the format string checked at compile time.
#define FMT(format_, ...) fmt::format(FMT_STRING(format_), __VA_ARGS__)

// fmt::print with the format string checked at compile time.
#define PRINT(stream_, format_, ...)                                           \
  fmt::print(stream_, FMT_STRING(format_), __VA_ARGS__)

// Print `message_` as is.
#define PRINT_RAW(stream_, message_) fmt::print(stream_, "{}", message_)

// Paths are formatted as their native string, without quotes.
template<>
struct fmt::formatter<std::filesystem::path> : fmt::formatter<std::string_view>
{
  template<typename FormatContext>
  auto
  format(const std::filesystem::path& path, FormatContext& ctx) const
  {
    return formatter<std::string_view>::format(path.native(), ctx);
  }
};

// Error codes are formatted as their message, e.g. "Permission denied".
template<>
struct fmt::formatter<std::error_code> : fmt::formatter<std::string_view>
{
  template<typename FormatContext>
  auto
  format(const std::error_code& code, FormatContext& ctx) const
  {
    return formatter<std::string_view>::format(code.message(), ctx);
  }
};
