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

#include <sweep/core/remover.hpp>
#include <sweep/util/direntry.hpp>
#include <sweep/util/file.hpp>

#include <doctest/doctest.h>

#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <filesystem>
#include <ostream> // https://github.com/doctest/doctest/issues/618
#include <vector>

namespace fs = std::filesystem;

using core::RemoveError;
using TestUtil::TestContext;
using util::DirEntry;

TEST_SUITE_BEGIN("core");

TEST_CASE("core::remove")
{
  TestContext test_context;

  SUBCASE("regular file")
  {
    REQUIRE(util::write_file("file", "12345"));

    const auto result = core::remove("file");
    REQUIRE(result);
    CHECK(*result == 5);
    CHECK(!DirEntry("file"));
  }

  SUBCASE("empty directory")
  {
    REQUIRE(fs::create_directory("dir"));

    const auto result = core::remove("dir");
    REQUIRE(result);
    CHECK(*result == 0);
    CHECK(!DirEntry("dir"));
  }

  SUBCASE("directory tree")
  {
    REQUIRE(fs::create_directories("dir/a/b"));
    REQUIRE(util::write_file("dir/top", "123"));
    REQUIRE(util::write_file("dir/a/middle", "12345"));
    REQUIRE(util::write_file("dir/a/b/bottom", "1234567"));
    REQUIRE(fs::create_directory("dir/empty"));

    const auto result = core::remove("dir");
    REQUIRE(result);
    CHECK(*result == 15);
    CHECK(!DirEntry("dir"));
  }

  SUBCASE("symlink to file is removed without following it")
  {
    REQUIRE(util::write_file("target", "12345"));
    fs::create_symlink("target", "link");

    const auto result = core::remove("link");
    REQUIRE(result);
    CHECK(*result == 0);
    CHECK(!DirEntry("link"));
    CHECK(DirEntry("target").size() == 5);
  }

  SUBCASE("symlink inside a directory is not followed")
  {
    REQUIRE(fs::create_directories("outside"));
    REQUIRE(util::write_file("outside/keep", "123"));
    REQUIRE(fs::create_directories("dir"));
    REQUIRE(util::write_file("dir/file", "12"));
    fs::create_symlink("../outside", "dir/link");

    const auto result = core::remove("dir");
    REQUIRE(result);
    CHECK(*result == 2);
    CHECK(!DirEntry("dir"));
    CHECK(DirEntry("outside/keep").is_regular_file());
  }

  SUBCASE("dangling symlink")
  {
    fs::create_symlink("missing", "link");

    const auto result = core::remove("link");
    REQUIRE(result);
    CHECK(*result == 0);
    CHECK(!DirEntry("link"));
  }

  SUBCASE("nonexistent path")
  {
    const auto result = core::remove("missing");
    REQUIRE(!result);
    CHECK(result.error().kind == RemoveError::Kind::inspect);
    CHECK(result.error().path == "missing");
    CHECK(result.error().error.value() == ENOENT);
    CHECK(result.error().reclaimed == 0);
    CHECK(core::to_string(result.error())
          == "failed to inspect entry [missing: No such file or directory]");
  }

  SUBCASE("special files are left in place")
  {
    REQUIRE(fs::create_directories("dir"));
    REQUIRE(util::write_file("dir/file", "1234"));
    REQUIRE(mkfifo("dir/fifo", 0600) == 0);

    std::vector<RemoveError> child_errors;
    const auto result = core::remove(
      "dir", [&](const RemoveError& error) { child_errors.push_back(error); });
    REQUIRE(!result);
    CHECK(result.error().kind == RemoveError::Kind::remove_directory);
    CHECK(result.error().path == "dir");
    CHECK(result.error().error.value() == ENOTEMPTY);
    CHECK(result.error().reclaimed == 4);
    CHECK(child_errors.empty());

    CHECK(!DirEntry("dir/file"));
    CHECK(DirEntry("dir/fifo"));
  }

  SUBCASE("unremovable child")
  {
    if (geteuid() == 0) {
      // Permissions are not enforced for root.
      return;
    }

    REQUIRE(fs::create_directories("dir/locked"));
    REQUIRE(util::write_file("dir/locked/file", "123"));
    REQUIRE(util::write_file("dir/other", "12345"));
    REQUIRE(chmod("dir/locked", 0555) == 0);

    std::vector<RemoveError> child_errors;
    const auto result = core::remove(
      "dir", [&](const RemoveError& error) { child_errors.push_back(error); });

    REQUIRE(chmod("dir/locked", 0755) == 0);

    REQUIRE(!result);
    CHECK(result.error().kind == RemoveError::Kind::remove_directory);
    CHECK(result.error().reclaimed == 5);

    REQUIRE(child_errors.size() == 2);
    CHECK(child_errors[0].kind == RemoveError::Kind::remove_file);
    CHECK(child_errors[0].path == "dir/locked/file");
    CHECK(child_errors[0].error.value() == EACCES);
    CHECK(child_errors[1].kind == RemoveError::Kind::remove_directory);
    CHECK(child_errors[1].path == "dir/locked");

    CHECK(DirEntry("dir/locked/file"));
    CHECK(!DirEntry("dir/other"));
  }
}

TEST_CASE("core::to_string(RemoveError)")
{
  RemoveError error{RemoveError::Kind::remove_file,
                    "/tmp/x",
                    std::error_code(EACCES, std::generic_category()),
                    0};
  CHECK(core::to_string(error)
        == "failed to remove file [/tmp/x: Permission denied]");

  error.kind = RemoveError::Kind::remove_directory;
  CHECK(core::to_string(error)
        == "failed to remove directory [/tmp/x: Permission denied]");

  error.kind = RemoveError::Kind::read_directory;
  CHECK(core::to_string(error)
        == "failed to read directory files [/tmp/x: Permission denied]");
}

TEST_SUITE_END();
