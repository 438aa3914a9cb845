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

#include "profile.hpp"

#include <sweep/util/expected.hpp>
#include <sweep/util/file.hpp>
#include <sweep/util/format.hpp>
#include <sweep/util/json.hpp>

#include <cstdint>
#include <optional>

namespace fs = std::filesystem;

namespace {

// Raw document shapes, validated and converted by parse_entry.

struct RetentionDocument
{
  std::string order;
  uint64_t count = 0;
};

struct EntryDocument
{
  std::string type;
  std::optional<std::string> path;
  std::optional<std::string> pattern;
  std::optional<RetentionDocument> retention;
  std::optional<std::string> exception;
};

struct ProfileDocument
{
  std::string name;
  std::vector<EntryDocument> entries;
};

} // namespace

// clang-format off
template<>
struct glz::meta<RetentionDocument>
{
  using T = RetentionDocument;
  static constexpr auto value = glz::object(
    "order", &T::order,
    "count", &T::count
  );
};
// clang-format on

// clang-format off
template<>
struct glz::meta<EntryDocument>
{
  using T = EntryDocument;
  static constexpr auto value = glz::object(
    "type", &T::type,
    "path", &T::path,
    "pattern", &T::pattern,
    "retention", &T::retention,
    "exception", &T::exception
  );
};
// clang-format on

// clang-format off
template<>
struct glz::meta<ProfileDocument>
{
  using T = ProfileDocument;
  static constexpr auto value = glz::object(
    "name", &T::name,
    "entries", &T::entries
  );
};
// clang-format on

namespace {

tl::expected<core::Retention, std::string>
parse_retention(const RetentionDocument& retention, std::string_view context)
{
  const auto order = core::parse_retention_order(retention.order);
  if (!order) {
    return tl::unexpected(
      FMT("unknown retention order `{}` in {}, expected one of `fileName`,"
          " `created`, `modified`",
          retention.order,
          context));
  }
  return core::KeepRetention{*order, retention.count};
}

tl::expected<core::Retention, std::string>
parse_exception(const std::string& exception, std::string_view context)
{
  const auto parsed = core::parse_pattern_exception(exception);
  if (!parsed) {
    return tl::unexpected(
      FMT("unknown exception `{}` in {}, expected one of `firstAscending`,"
          " `firstDescending`, `mostRecent`",
          exception,
          context));
  }
  return *parsed;
}

tl::expected<core::Entry, std::string>
parse_entry(const EntryDocument& document, size_t index)
{
  const auto context = FMT("entry {}", index);

  if (document.type == "path") {
    if (!document.path) {
      return tl::unexpected(FMT("missing field `path` in {}", context));
    }
    return core::PathEntry{*document.path};
  }

  if (document.type == "pattern") {
    if (!document.pattern) {
      return tl::unexpected(FMT("missing field `pattern` in {}", context));
    }
    if (document.retention && document.exception) {
      return tl::unexpected(FMT(
        "{} has both `retention` and `exception`, use only one", context));
    }

    core::PatternEntry entry{*document.pattern, std::nullopt};
    if (document.retention) {
      TRY_ASSIGN(entry.retention,
                 parse_retention(*document.retention, context));
    } else if (document.exception) {
      TRY_ASSIGN(entry.retention,
                 parse_exception(*document.exception, context));
    }
    return entry;
  }

  return tl::unexpected(
    FMT("unknown entry type `{}` in {}, expected `path` or `pattern`",
        document.type,
        context));
}

} // namespace

namespace core {

tl::expected<Profile, std::string>
parse_profile(std::string_view document)
{
  TRY_ASSIGN(const auto parsed, util::json::parse<ProfileDocument>(document));

  Profile profile;
  profile.name = parsed.name;
  profile.entries.reserve(parsed.entries.size());
  for (size_t i = 0; i < parsed.entries.size(); ++i) {
    TRY_ASSIGN(auto entry, parse_entry(parsed.entries[i], i));
    profile.entries.push_back(std::move(entry));
  }
  return profile;
}

tl::expected<Profile, std::string>
load_profile(const fs::path& path)
{
  const auto document = util::read_file(path);
  if (!document) {
    return tl::unexpected(FMT("failed to read file [{}]", document.error()));
  }
  auto profile = parse_profile(*document);
  if (!profile) {
    return tl::unexpected(
      FMT("failed to deserialise value [{}]", profile.error()));
  }
  return profile;
}

} // namespace core
