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

#include <sweep/core/profile.hpp>
#include <sweep/util/file.hpp>
#include <sweep/util/string.hpp>

#include <doctest/doctest.h>

#include <ostream> // https://github.com/doctest/doctest/issues/618
#include <string>
#include <variant>

using core::KeepRetention;
using core::PathEntry;
using core::PatternEntry;
using core::PatternException;
using core::RetentionOrder;
using TestUtil::TestContext;

TEST_SUITE_BEGIN("core");

TEST_CASE("core::parse_profile")
{
  SUBCASE("all entry forms")
  {
    const auto profile = core::parse_profile(R"({
  "name": "Build artifacts",
  "entries": [
    {"type": "path", "path": "/tmp/build"},
    {"type": "pattern", "pattern": "/tmp/*.log"},
    {"type": "pattern", "pattern": "/var/log/app-*",
     "retention": {"order": "modified", "count": 2}},
    {"type": "pattern", "pattern": "backups/*",
     "exception": "mostRecent", "retention": null},
    {"type": "path", "path": "/tmp/x", "comment": "ignored"}
  ]
})");
    REQUIRE(profile);
    CHECK(profile->name == "Build artifacts");
    REQUIRE(profile->entries.size() == 5);

    const auto* path = std::get_if<PathEntry>(&profile->entries[0]);
    REQUIRE(path);
    CHECK(path->path == "/tmp/build");

    const auto* plain = std::get_if<PatternEntry>(&profile->entries[1]);
    REQUIRE(plain);
    CHECK(plain->pattern == "/tmp/*.log");
    CHECK(!plain->retention);

    const auto* kept = std::get_if<PatternEntry>(&profile->entries[2]);
    REQUIRE(kept);
    REQUIRE(kept->retention);
    const auto* keep = std::get_if<KeepRetention>(&*kept->retention);
    REQUIRE(keep);
    CHECK(keep->order == RetentionOrder::modified);
    CHECK(keep->count == 2);

    const auto* excepted = std::get_if<PatternEntry>(&profile->entries[3]);
    REQUIRE(excepted);
    REQUIRE(excepted->retention);
    CHECK(std::get<PatternException>(*excepted->retention)
          == PatternException::most_recent);

    CHECK(std::holds_alternative<PathEntry>(profile->entries[4]));
  }

  SUBCASE("empty entry list")
  {
    const auto profile =
      core::parse_profile(R"({"name": "Nothing", "entries": []})");
    REQUIRE(profile);
    CHECK(profile->entries.empty());
  }

  SUBCASE("missing name")
  {
    const auto profile = core::parse_profile(R"({"entries": []})");
    REQUIRE(!profile);
    CHECK(!profile.error().empty());
  }

  SUBCASE("wrong type of entries")
  {
    const auto profile =
      core::parse_profile(R"({"name": "x", "entries": {}})");
    REQUIRE(!profile);
    CHECK(!profile.error().empty());
  }

  SUBCASE("not an object")
  {
    CHECK(!core::parse_profile("[]"));
  }

  SUBCASE("entry without type")
  {
    CHECK(!core::parse_profile(
      R"({"name": "x", "entries": [{"path": "/a"}]})"));
  }

  SUBCASE("unknown entry type")
  {
    const auto profile = core::parse_profile(
      R"({"name": "x", "entries": [{"type": "file", "path": "/a"}]})");
    REQUIRE(!profile);
    CHECK(profile.error()
          == "unknown entry type `file` in entry 0, expected `path` or"
             " `pattern`");
  }

  SUBCASE("path entry without path")
  {
    const auto profile = core::parse_profile(
      R"({"name": "x", "entries": [{"type": "path"}]})");
    REQUIRE(!profile);
    CHECK(profile.error() == "missing field `path` in entry 0");
  }

  SUBCASE("pattern entry without pattern")
  {
    const auto profile = core::parse_profile(
      R"({"name": "x", "entries": [{"type": "pattern", "path": "/a"}]})");
    REQUIRE(!profile);
    CHECK(profile.error() == "missing field `pattern` in entry 0");
  }

  SUBCASE("both retention and exception")
  {
    const auto profile = core::parse_profile(R"({"name": "x", "entries": [
  {"type": "path", "path": "/a"},
  {"type": "pattern", "pattern": "*", "exception": "mostRecent",
   "retention": {"order": "created", "count": 1}}]})");
    REQUIRE(!profile);
    CHECK(profile.error()
          == "entry 1 has both `retention` and `exception`, use only one");
  }

  SUBCASE("unknown retention order")
  {
    const auto profile = core::parse_profile(R"({"name": "x", "entries": [
  {"type": "pattern", "pattern": "*",
   "retention": {"order": "size", "count": 1}}]})");
    REQUIRE(!profile);
    CHECK(util::starts_with(profile.error(),
                            "unknown retention order `size` in entry 0"));
  }

  SUBCASE("negative retention count")
  {
    const auto profile = core::parse_profile(R"({"name": "x", "entries": [
  {"type": "pattern", "pattern": "*",
   "retention": {"order": "fileName", "count": -1}}]})");
    CHECK(!profile);
  }

  SUBCASE("unknown exception")
  {
    const auto profile = core::parse_profile(R"({"name": "x", "entries": [
  {"type": "pattern", "pattern": "*", "exception": "newest"}]})");
    REQUIRE(!profile);
    CHECK(util::starts_with(profile.error(),
                            "unknown exception `newest` in entry 0"));
  }

  SUBCASE("malformed JSON")
  {
    const auto profile = core::parse_profile(R"({"name": "x",)");
    REQUIRE(!profile);
    CHECK(!profile.error().empty());
  }

  SUBCASE("escaped strings")
  {
    const auto profile = core::parse_profile(
      R"({"name": "a \"b\"", "entries": [{"type": "path", "path": "c\\d"}]})");
    REQUIRE(profile);
    CHECK(profile->name == "a \"b\"");
    CHECK(std::get<PathEntry>(profile->entries[0]).path == "c\\d");
  }
}

TEST_CASE("core::load_profile")
{
  TestContext test_context;

  SUBCASE("valid file")
  {
    REQUIRE(util::write_file(
      "profile.json",
      R"({"name": "Logs", "entries": [{"type": "path", "path": "x"}]})"));
    const auto profile = core::load_profile("profile.json");
    REQUIRE(profile);
    CHECK(profile->name == "Logs");
    CHECK(profile->entries.size() == 1);
  }

  SUBCASE("missing file")
  {
    const auto profile = core::load_profile("missing.json");
    REQUIRE(!profile);
    CHECK(profile.error() == "failed to read file [No such file or directory]");
  }

  SUBCASE("invalid content")
  {
    REQUIRE(util::write_file("profile.json", R"({"name": 1, "entries": []})"));
    const auto profile = core::load_profile("profile.json");
    REQUIRE(!profile);
    CHECK(util::starts_with(profile.error(), "failed to deserialise value ["));
    CHECK(util::ends_with(profile.error(), "]"));
  }
}

TEST_SUITE_END();
