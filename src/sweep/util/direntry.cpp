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

#include "direntry.hpp"

#include <sweep/util/format.hpp>
#include <sweep/util/logging.hpp>

#ifdef HAVE_STATX
#  include <fcntl.h>
#endif

#include <cstring>

namespace util {

DirEntry::DirEntry(const std::filesystem::path& path, LogOnError log_on_error)
  : m_path(path),
    m_log_on_error(log_on_error)
{
  struct stat st;
  if (lstat(m_path.c_str(), &st) != 0) {
    m_errno = errno;
    if (m_log_on_error == LogOnError::yes) {
      LOG("Failed to lstat {}: {}", m_path, strerror(m_errno));
    }
    return;
  }

  m_errno = 0;
  m_is_symlink = S_ISLNK(st.st_mode);
  if (!m_is_symlink || stat(m_path.c_str(), &st) == 0) {
    m_target = st;
  }
}

std::optional<util::TimePoint>
DirEntry::birth_time() const
{
#ifdef HAVE_STATX
  struct statx stx;
  if (statx(AT_FDCWD, m_path.c_str(), 0, STATX_BTIME, &stx) != 0) {
    if (m_log_on_error == LogOnError::yes) {
      LOG("Failed to statx {}: {}", m_path, strerror(errno));
    }
    return std::nullopt;
  }
  if (!(stx.stx_mask & STATX_BTIME)) {
    return std::nullopt;
  }
  return util::timepoint_from_sec_nsec(stx.stx_btime.tv_sec,
                                       stx.stx_btime.tv_nsec);
#else
  return std::nullopt;
#endif
}

} // namespace util
