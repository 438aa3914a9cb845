// Copyright (C) 2020-2025 Joel Rosdahl and other contributors
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

// Log `message_` as one line. The message is only evaluated when logging is
// enabled.
#define LOG_RAW(message_)                                                      \
  do {                                                                         \
    if (util::logging::enabled()) {                                            \
      util::logging::log(std::string_view(message_));                          \
    }                                                                          \
  } while (false)

// Log one line formatted from `format_`, which is checked at compile time.
#define LOG(format_, ...) LOG_RAW(fmt::format(FMT_STRING(format_), __VA_ARGS__))

namespace util::logging {

// Set up the destinations. `debug` keeps the log in memory for dump_log().
// `log_file` is a path, "syslog" or empty for none. Call once, before logging.
void init(bool debug, const std::filesystem::path& log_file);

bool enabled();

void log(std::string_view message);

// Write the in-memory log to `path`. Does nothing unless in debug mode.
void dump_log(const std::filesystem::path& path);

} // namespace util::logging
