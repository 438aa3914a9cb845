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

#include <tl/expected.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <system_error>

namespace core {

struct RemoveError
{
  enum class Kind {
    inspect,          // lstat(2) of the path failed
    remove_file,      // unlink(2) of a file or symlink failed
    remove_directory, // rmdir(2) failed, typically since a child remained
    read_directory,   // the directory could not be listed
  };

  Kind kind;
  std::filesystem::path path;
  std::error_code error;

  // Bytes reclaimed below `path` before the failure.
  uint64_t reclaimed = 0;
};

// Format as e.g. "failed to remove file [<path>: Permission denied]".
std::string to_string(const RemoveError& error);

using RemoveErrorHandler = std::function<void(const RemoveError& error)>;

// Remove `path` and return the number of bytes reclaimed, i.e. the sum of the
// sizes of all regular files removed.
//
// - A regular file is unlinked and its size is returned.
// - A symlink is unlinked without following it and counts as zero bytes.
// - A directory is removed recursively, children before the directory itself.
//   A child that fails to be removed is reported to `on_child_error` and
//   skipped; its siblings are still removed. Bytes reclaimed by a failed
//   child subdirectory before its failure still count. If the directory itself
//   then fails to be removed the returned RemoveError carries the bytes
//   reclaimed below it.
// - Other entry types (FIFOs, sockets, devices) are left in place and count as
//   zero bytes. Their parent directory will consequently fail to be removed.
tl::expected<uint64_t, RemoveError>
remove(const std::filesystem::path& path,
       const RemoveErrorHandler& on_child_error = {});

} // namespace core
