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

#include <tl/expected.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace util {

// Return the names of the entries in `directory` in sorted order, excluding
// "." and "..".
tl::expected<std::vector<std::string>, std::error_code>
list_directory(const std::filesystem::path& directory);

// Return the contents of the file at `path`.
tl::expected<std::string, std::string>
read_file(const std::filesystem::path& path);

// Set both atime and mtime of `path` to `mtime`.
tl::expected<void, std::string>
set_timestamps(const std::filesystem::path& path, TimePoint mtime);

// Replace the contents of the file at `path` with `data`.
tl::expected<void, std::string>
write_file(const std::filesystem::path& path, std::string_view data);

} // namespace util
