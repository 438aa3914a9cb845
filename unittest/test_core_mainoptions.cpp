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

#include <sweep/core/mainoptions.hpp>
#include <sweep/util/direntry.hpp>
#include <sweep/util/file.hpp>
#include <sweep/util/string.hpp>

#include <doctest/doctest.h>

#include <cstdio>
#include <cstdlib>
#include <ostream> // https://github.com/doctest/doctest/issues/618
#include <string>

using TestUtil::TestContext;
using util::DirEntry;

namespace {

struct RunResult
{
  int exit_code;
  std::string output;
};

RunResult
run_clean_profile(const std::string& profile_path)
{
  FILE* output = tmpfile();
  REQUIRE(output);

  core::CleanOptions options;
  options.mode = core::Mode::silent;
  const int exit_code = core::clean_profile(
    profile_path,
    options,
    [](const std::string& /*question*/) { return false; },
    output);

  rewind(output);
  std::string text;
  int ch;
  while ((ch = fgetc(output)) != EOF) {
    text += static_cast<char>(ch);
  }
  fclose(output);
  return {exit_code, text};
}

} // namespace

TEST_SUITE_BEGIN("core");

TEST_CASE("core::get_usage_text")
{
  const auto text = core::get_usage_text("sweep");
  CHECK(util::starts_with(text, "Usage:\n    sweep -p PATH [options]\n"));
  CHECK(text.find("--config-path PATH") != std::string::npos);
}

TEST_CASE("core::get_version_text")
{
  CHECK(util::starts_with(core::get_version_text("sweep"),
                          std::string("sweep version ") + SWEEP_VERSION));
}

TEST_CASE("core::clean_profile")
{
  TestContext test_context;

  SUBCASE("successful run")
  {
    REQUIRE(util::write_file("a.tmp", "12"));
    REQUIRE(util::write_file("b.tmp", "345"));
    REQUIRE(util::write_file("profile.json", R"({
  "name": "Temporary files",
  "entries": [
    {"type": "pattern", "pattern": "*.tmp"},
    {"type": "path", "path": "does-not-exist"}
  ]
})"));

    const auto result = run_clean_profile("profile.json");
    CHECK(result.exit_code == EXIT_SUCCESS);
    CHECK(util::starts_with(result.output,
                            "Loading profile from path <profile.json>...\n"
                            "Discovering paths using profile 'Temporary"
                            " files'...\n"));
    CHECK(result.output.find("reclaiming 5 bytes of space.\n")
          != std::string::npos);
    CHECK(util::ends_with(result.output, "Successfully cleaned items.\n"));
    CHECK(!DirEntry("a.tmp"));
    CHECK(!DirEntry("b.tmp"));
  }

  SUBCASE("missing profile")
  {
    const auto result = run_clean_profile("missing.json");
    CHECK(result.exit_code == EXIT_FAILURE);
    CHECK(result.output
          == "Loading profile from path <missing.json>...\n"
             "Failed to clean items: failed to load profile [failed to read"
             " file [No such file or directory]].\n");
  }

  SUBCASE("invalid profile")
  {
    REQUIRE(util::write_file("profile.json", R"({"name": "x"})"));

    const auto result = run_clean_profile("profile.json");
    CHECK(result.exit_code == EXIT_FAILURE);
    CHECK(util::ends_with(
      result.output,
      "Failed to clean items: failed to load profile [failed to deserialise"
      " value [missing field `entries` in profile]].\n"));
  }
}

TEST_SUITE_END();
