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

#include "testutil.hpp"

#include <sweep/core/exceptions.hpp>
#include <sweep/util/format.hpp>

#include <system_error>

namespace fs = std::filesystem;

namespace TestUtil {

size_t TestContext::m_subdir_counter = 0;

TestContext::TestContext()
  : m_test_dir(fs::current_path())
{
  if (m_test_dir.parent_path().filename() != "testdir") {
    throw core::Error("TestContext instantiated outside test directory");
  }
  ++m_subdir_counter;
  const fs::path subtest_dir = m_test_dir / FMT("test_{}", m_subdir_counter);
  fs::create_directories(subtest_dir);
  fs::current_path(subtest_dir);
}

TestContext::~TestContext()
{
  std::error_code ec;
  fs::current_path(m_test_dir, ec);
}

} // namespace TestUtil
