// Copyright (C) 2019-2025 Joel Rosdahl and other contributors
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

#include <sys/stat.h>

#include <cerrno>
#include <cstdint>
#include <filesystem>
#include <optional>

namespace util {

// Snapshot of a path taken with lstat(2) when the entry is constructed. For a
// symlink the target is stat(2)-ed as well, and the type, size and mtime
// accessors then describe the target.
class DirEntry
{
public:
  enum class LogOnError : bool { no, yes };

  // Create an empty directory entry. operator bool() will return false and
  // error_number() will return ENOENT.
  DirEntry() = default;

  DirEntry(const std::filesystem::path& path,
           LogOnError log_on_error = LogOnError::no);

  // Whether lstat(2) succeeded, i.e. the entry exists without following
  // symlinks.
  operator bool() const;

  // Whether the entry exists when following symlinks.
  bool exists() const;

  const std::filesystem::path& path() const;

  // errno from lstat(2), or 0.
  int error_number() const;

  bool is_directory() const;
  bool is_regular_file() const;
  bool is_symlink() const;
  util::TimePoint mtime() const;
  uint64_t size() const;

  // Creation time following symlinks, or std::nullopt if the platform or file
  // system does not record one. Queried on each call.
  std::optional<util::TimePoint> birth_time() const;

private:
  std::filesystem::path m_path;
  LogOnError m_log_on_error = LogOnError::no;
  int m_errno = ENOENT;
  bool m_is_symlink = false;
  std::optional<struct stat> m_target;
};

inline DirEntry::operator bool() const
{
  return m_errno == 0;
}

inline bool
DirEntry::exists() const
{
  return m_target.has_value();
}

inline const std::filesystem::path&
DirEntry::path() const
{
  return m_path;
}

inline int
DirEntry::error_number() const
{
  return m_errno;
}

inline bool
DirEntry::is_directory() const
{
  return m_target && S_ISDIR(m_target->st_mode);
}

inline bool
DirEntry::is_regular_file() const
{
  return m_target && S_ISREG(m_target->st_mode);
}

inline bool
DirEntry::is_symlink() const
{
  return m_is_symlink;
}

inline util::TimePoint
DirEntry::mtime() const
{
  if (!m_target) {
    return {};
  }
#ifdef HAVE_STRUCT_STAT_ST_MTIM
  return util::timepoint_from_timespec(m_target->st_mtim);
#else
  return util::timepoint_from_sec_nsec(m_target->st_mtime, 0);
#endif
}

inline uint64_t
DirEntry::size() const
{
  return m_target ? static_cast<uint64_t>(m_target->st_size) : 0;
}

} // namespace util
