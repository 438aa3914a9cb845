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

#include <cstddef>
#include <filesystem>

namespace TestUtil {

// Instantiate in each test case that creates files. The constructor changes
// to a fresh directory under testdir/<pid> and the destructor changes back.
class TestContext
{
public:
  TestContext();
  ~TestContext();

private:
  std::filesystem::path m_test_dir;
  static size_t m_subdir_counter;
};

} // namespace TestUtil
