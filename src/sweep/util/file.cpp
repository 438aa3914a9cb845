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

#include "file.hpp"

#include <sweep/util/defer.hpp>
#include <sweep/util/filestream.hpp>
#include <sweep/util/format.hpp>

#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>

namespace fs = std::filesystem;

namespace util {

tl::expected<std::vector<std::string>, std::error_code>
list_directory(const fs::path& directory)
{
  DIR* dir = opendir(directory.c_str());
  if (!dir) {
    return tl::unexpected(std::error_code(errno, std::generic_category()));
  }
  DEFER(closedir(dir));

  std::vector<std::string> names;
  errno = 0;
  while (const dirent* entry = readdir(dir)) {
    const std::string_view name = entry->d_name;
    if (!name.empty() && name != "." && name != "..") {
      names.emplace_back(name);
    }
  }
  if (errno != 0) {
    return tl::unexpected(std::error_code(errno, std::generic_category()));
  }

  std::sort(names.begin(), names.end());
  return names;
}

tl::expected<std::string, std::string>
read_file(const fs::path& path)
{
  FileStream file(path, "rb");
  if (!file) {
    return tl::unexpected(strerror(errno));
  }

  std::string result;
  char buffer[16384];
  size_t count;
  while ((count = fread(buffer, 1, sizeof(buffer), *file)) > 0) {
    result.append(buffer, count);
  }
  if (ferror(*file)) {
    return tl::unexpected(strerror(errno));
  }
  return result;
}

tl::expected<void, std::string>
set_timestamps(const fs::path& path, TimePoint mtime)
{
  const timespec times[2] = {to_timespec(mtime), to_timespec(mtime)};
  if (utimensat(AT_FDCWD, path.c_str(), times, 0) != 0) {
    return tl::unexpected(
      FMT("failed to set timestamps of {}: {}", path, strerror(errno)));
  }
  return {};
}

tl::expected<void, std::string>
write_file(const fs::path& path, std::string_view data)
{
  FileStream file(path, "wb");
  if (!file) {
    return tl::unexpected(strerror(errno));
  }
  if (fwrite(data.data(), 1, data.size(), *file) != data.size()) {
    return tl::unexpected(FMT("failed to write {}", path));
  }
  return {};
}

} // namespace util
