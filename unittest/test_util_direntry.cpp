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

#include "testutil.hpp"

#include <sweep/util/direntry.hpp>
#include <sweep/util/file.hpp>
#include <sweep/util/time.hpp>

#include <doctest/doctest.h>

#include <cerrno>
#include <filesystem>
#include <ostream> // https://github.com/doctest/doctest/issues/618

namespace fs = std::filesystem;

using TestUtil::TestContext;
using util::DirEntry;

TEST_SUITE_BEGIN("util");

TEST_CASE("util::DirEntry")
{
  TestContext test_context;

  SUBCASE("default constructed")
  {
    DirEntry entry;
    CHECK(!entry);
    CHECK(!entry.exists());
    CHECK(entry.error_number() == ENOENT);
    CHECK(entry.size() == 0);
    CHECK(entry.mtime() == util::TimePoint());
    CHECK(!entry.is_directory());
    CHECK(!entry.is_regular_file());
    CHECK(!entry.is_symlink());
  }

  SUBCASE("nonexistent path")
  {
    DirEntry entry("does-not-exist");
    CHECK(!entry);
    CHECK(!entry.exists());
    CHECK(entry.error_number() == ENOENT);
    CHECK(entry.path() == "does-not-exist");
    CHECK(!entry.birth_time());
  }

  SUBCASE("regular file")
  {
    REQUIRE(util::write_file("file", "12345"));
    DirEntry entry("file");
    CHECK(entry);
    CHECK(entry.exists());
    CHECK(entry.error_number() == 0);
    CHECK(entry.is_regular_file());
    CHECK(!entry.is_directory());
    CHECK(!entry.is_symlink());
    CHECK(entry.size() == 5);
  }

  SUBCASE("directory")
  {
    REQUIRE(fs::create_directory("dir"));
    DirEntry entry("dir");
    CHECK(entry);
    CHECK(entry.is_directory());
    CHECK(!entry.is_regular_file());
  }

  SUBCASE("symlink to file")
  {
    REQUIRE(util::write_file("file", "123"));
    fs::create_symlink("file", "link");
    DirEntry entry("link");
    CHECK(entry);
    CHECK(entry.exists());
    CHECK(entry.is_symlink());
    CHECK(entry.is_regular_file());
    CHECK(entry.size() == 3);
  }

  SUBCASE("dangling symlink")
  {
    fs::create_symlink("missing", "link");
    DirEntry entry("link");
    CHECK(entry);
    CHECK(!entry.exists());
    CHECK(entry.is_symlink());
    CHECK(!entry.is_regular_file());
    CHECK(entry.size() == 0);
  }

  SUBCASE("modification time")
  {
    REQUIRE(util::write_file("file", ""));
    const auto mtime = util::timepoint_from_sec_nsec(1'000'000'000, 500);
    REQUIRE(util::set_timestamps("file", mtime));
    CHECK(DirEntry("file").mtime() == mtime);
  }
}

TEST_SUITE_END();
