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

#include <cstdio>
#include <filesystem>
#include <memory>

namespace util {

// Owning stdio stream, closed on destruction.
class FileStream
{
public:
  FileStream() = default;
  FileStream(const std::filesystem::path& path, const char* mode);

  // Close the current stream, if any, and open `path`. Check operator bool and
  // errno for the result.
  void open(const std::filesystem::path& path, const char* mode);

  explicit operator bool() const;
  FILE* operator*() const;

private:
  struct Closer
  {
    void
    operator()(FILE* file) const
    {
      fclose(file);
    }
  };

  std::unique_ptr<FILE, Closer> m_file;
};

inline FileStream::FileStream(const std::filesystem::path& path,
                              const char* mode)
{
  open(path, mode);
}

inline void
FileStream::open(const std::filesystem::path& path, const char* mode)
{
  m_file.reset(fopen(path.c_str(), mode));
}

inline FileStream::operator bool() const
{
  return m_file != nullptr;
}

inline FILE*
FileStream::operator*() const
{
  return m_file.get();
}

} // namespace util
