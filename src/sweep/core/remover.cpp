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

#include "remover.hpp"

#include <sweep/util/direntry.hpp>
#include <sweep/util/file.hpp>
#include <sweep/util/format.hpp>
#include <sweep/util/logging.hpp>

#include <unistd.h>

#include <cerrno>

namespace fs = std::filesystem;

namespace {

std::error_code
last_error()
{
  return {errno, std::generic_category()};
}

core::RemoveError
make_error(core::RemoveError::Kind kind,
           const fs::path& path,
           std::error_code error,
           uint64_t reclaimed = 0)
{
  return core::RemoveError{kind, path, error, reclaimed};
}

tl::expected<uint64_t, core::RemoveError>
remove_directory(const fs::path& path,
                 const core::RemoveErrorHandler& on_child_error)
{
  // Names are collected up front so that the directory is not modified while
  // being read.
  const auto names = util::list_directory(path);
  if (!names) {
    return tl::unexpected(
      make_error(core::RemoveError::Kind::read_directory, path, names.error()));
  }

  uint64_t reclaimed = 0;
  for (const auto& name : *names) {
    const auto child = path / name;
    const auto result = core::remove(child, on_child_error);
    if (result) {
      reclaimed += *result;
    } else {
      LOG("Failed to remove {}: {}", child, to_string(result.error()));
      reclaimed += result.error().reclaimed;
      if (on_child_error) {
        on_child_error(result.error());
      }
    }
  }

  if (rmdir(path.c_str()) != 0) {
    return tl::unexpected(make_error(core::RemoveError::Kind::remove_directory,
                                     path,
                                     last_error(),
                                     reclaimed));
  }
  LOG("Removed directory {} ({} bytes)", path, reclaimed);
  return reclaimed;
}

} // namespace

namespace core {

std::string
to_string(const RemoveError& error)
{
  const char* what = "";
  switch (error.kind) {
  case RemoveError::Kind::inspect:
    what = "failed to inspect entry";
    break;
  case RemoveError::Kind::remove_file:
    what = "failed to remove file";
    break;
  case RemoveError::Kind::remove_directory:
    what = "failed to remove directory";
    break;
  case RemoveError::Kind::read_directory:
    what = "failed to read directory files";
    break;
  }
  return FMT("{} [{}: {}]", what, error.path, error.error);
}

tl::expected<uint64_t, RemoveError>
remove(const fs::path& path, const RemoveErrorHandler& on_child_error)
{
  util::DirEntry dir_entry(path);
  if (!dir_entry) {
    return tl::unexpected(
      make_error(RemoveError::Kind::inspect,
                 path,
                 {dir_entry.error_number(), std::generic_category()}));
  }

  if (dir_entry.is_symlink()) {
    if (unlink(path.c_str()) != 0) {
      return tl::unexpected(
        make_error(RemoveError::Kind::remove_file, path, last_error()));
    }
    LOG("Removed symlink {}", path);
    return 0;
  }

  if (dir_entry.is_regular_file()) {
    const uint64_t size = dir_entry.size();
    if (unlink(path.c_str()) != 0) {
      return tl::unexpected(
        make_error(RemoveError::Kind::remove_file, path, last_error()));
    }
    LOG("Removed file {} ({} bytes)", path, size);
    return size;
  }

  if (dir_entry.is_directory()) {
    return remove_directory(path, on_child_error);
  }

  LOG("Leaving {} in place since it is not a file, directory or symlink",
      path);
  return 0;
}

} // namespace core
