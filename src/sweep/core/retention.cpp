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

#include "retention.hpp"

#include <sweep/util/direntry.hpp>
#include <sweep/util/format.hpp>
#include <sweep/util/logging.hpp>
#include <sweep/util/time.hpp>

#include <algorithm>

namespace fs = std::filesystem;

namespace {

using Timestamp = std::optional<util::TimePoint>;

// std::nullopt compares less than any timestamp, so unreadable entries rank
// lowest in a descending sort.
Timestamp
modification_time(const fs::path& path)
{
  util::DirEntry dir_entry(path, util::DirEntry::LogOnError::yes);
  return dir_entry.exists() ? Timestamp(dir_entry.mtime()) : std::nullopt;
}

Timestamp
creation_time(const fs::path& path)
{
  return util::DirEntry(path, util::DirEntry::LogOnError::yes).birth_time();
}

std::string
file_name(const fs::path& path)
{
  return path.filename().string();
}

struct RankedPath
{
  fs::path path;
  std::string name;
  Timestamp time;
};

std::vector<fs::path>
apply_keep_retention(std::vector<fs::path> matches,
                     const core::KeepRetention& retention)
{
  std::vector<RankedPath> ranked;
  ranked.reserve(matches.size());
  for (auto& path : matches) {
    RankedPath entry;
    switch (retention.order) {
    case core::RetentionOrder::file_name:
      entry.name = file_name(path);
      break;
    case core::RetentionOrder::created:
      entry.time = creation_time(path);
      break;
    case core::RetentionOrder::modified:
      entry.time = modification_time(path);
      break;
    }
    entry.path = std::move(path);
    ranked.push_back(std::move(entry));
  }

  const bool by_name = retention.order == core::RetentionOrder::file_name;
  std::stable_sort(ranked.begin(),
                   ranked.end(),
                   [&](const RankedPath& a, const RankedPath& b) {
                     return by_name ? a.name > b.name : a.time > b.time;
                   });

  const size_t keep =
    static_cast<size_t>(std::min<uint64_t>(retention.count, ranked.size()));
  for (size_t i = 0; i < keep; ++i) {
    LOG("Retaining {}", ranked[i].path);
  }

  std::vector<fs::path> result;
  result.reserve(ranked.size() - keep);
  for (size_t i = keep; i < ranked.size(); ++i) {
    result.push_back(std::move(ranked[i].path));
  }
  return result;
}

// Index of the first smallest (`largest` false) or last largest (`largest`
// true) element of `keys`, which must not be empty.
template<typename T>
size_t
select_index(const std::vector<T>& keys, bool largest)
{
  size_t selected = 0;
  for (size_t i = 1; i < keys.size(); ++i) {
    if (largest ? keys[i] >= keys[selected] : keys[i] < keys[selected]) {
      selected = i;
    }
  }
  return selected;
}

std::vector<fs::path>
apply_pattern_exception(std::vector<fs::path> matches,
                        core::PatternException exception)
{
  if (matches.empty()) {
    return {};
  }

  size_t excluded_index = 0;
  switch (exception) {
  case core::PatternException::first_ascending:
  case core::PatternException::first_descending: {
    std::vector<std::string> names;
    names.reserve(matches.size());
    for (const auto& path : matches) {
      names.push_back(file_name(path));
    }
    excluded_index = select_index(
      names, exception == core::PatternException::first_descending);
    break;
  }
  case core::PatternException::most_recent: {
    std::vector<Timestamp> times;
    times.reserve(matches.size());
    for (const auto& path : matches) {
      auto time = modification_time(path);
      times.push_back(time ? time : creation_time(path));
    }
    excluded_index = select_index(times, true);
    break;
  }
  }

  const fs::path excluded = matches[excluded_index];
  LOG("Retaining {}", excluded);

  std::vector<fs::path> result;
  result.reserve(matches.size() - 1);
  for (auto& path : matches) {
    if (path != excluded) {
      result.push_back(std::move(path));
    }
  }
  return result;
}

} // namespace

namespace core {

std::optional<RetentionOrder>
parse_retention_order(std::string_view value)
{
  if (value == "fileName") {
    return RetentionOrder::file_name;
  } else if (value == "created") {
    return RetentionOrder::created;
  } else if (value == "modified") {
    return RetentionOrder::modified;
  } else {
    return std::nullopt;
  }
}

std::optional<PatternException>
parse_pattern_exception(std::string_view value)
{
  if (value == "firstAscending") {
    return PatternException::first_ascending;
  } else if (value == "firstDescending") {
    return PatternException::first_descending;
  } else if (value == "mostRecent") {
    return PatternException::most_recent;
  } else {
    return std::nullopt;
  }
}

std::string_view
to_string(RetentionOrder order)
{
  switch (order) {
  case RetentionOrder::file_name:
    return "fileName";
  case RetentionOrder::created:
    return "created";
  case RetentionOrder::modified:
    return "modified";
  }
  return "unknown";
}

std::string_view
to_string(PatternException exception)
{
  switch (exception) {
  case PatternException::first_ascending:
    return "first-ascending";
  case PatternException::first_descending:
    return "first-descending";
  case PatternException::most_recent:
    return "most-recent";
  }
  return "unknown";
}

std::string
to_string(const Retention& retention)
{
  if (const auto* keep = std::get_if<KeepRetention>(&retention)) {
    return FMT("keep {} by {}", keep->count, to_string(keep->order));
  } else {
    return std::string(to_string(std::get<PatternException>(retention)));
  }
}

std::vector<fs::path>
apply_retention(std::vector<fs::path> matches, const Retention& retention)
{
  if (const auto* keep = std::get_if<KeepRetention>(&retention)) {
    return apply_keep_retention(std::move(matches), *keep);
  } else {
    return apply_pattern_exception(std::move(matches),
                                   std::get<PatternException>(retention));
  }
}

} // namespace core
