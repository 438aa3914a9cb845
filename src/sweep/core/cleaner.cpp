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

#include "cleaner.hpp"

#include <sweep/core/remover.hpp>
#include <sweep/util/logging.hpp>
#include <sweep/util/time.hpp>

#include <system_error>

namespace fs = std::filesystem;

namespace core {

std::optional<Mode>
parse_mode(std::string_view value)
{
  if (value == "silent") {
    return Mode::silent;
  } else if (value == "everyEntry") {
    return Mode::every_entry;
  } else if (value == "everyPath") {
    return Mode::every_path;
  } else {
    return std::nullopt;
  }
}

std::string_view
to_string(Mode mode)
{
  switch (mode) {
  case Mode::silent:
    return "silent";
  case Mode::every_entry:
    return "everyEntry";
  case Mode::every_path:
    return "everyPath";
  }
  return "unknown";
}

std::vector<fs::path>
resolve_paths(const std::vector<fs::path>& paths)
{
  std::vector<fs::path> result;
  result.reserve(paths.size());
  for (const auto& path : paths) {
    std::error_code ec;
    auto canonical = fs::canonical(path, ec);
    if (ec) {
      LOG("Dropping {}: {}", path, ec);
    } else {
      result.push_back(std::move(canonical));
    }
  }
  return result;
}

Cleaner::Cleaner(const CleanOptions& options, Prompt prompt, FILE* output)
  : m_options(options),
    m_prompt(std::move(prompt)),
    m_output(output)
{
}

CleanSummary
Cleaner::clean(const Profile& profile)
{
  LOG("Cleaning using profile '{}' in mode {}",
      profile.name,
      to_string(m_options.mode));
  report("Discovering paths using profile '{}'...\n", profile.name);

  CleanSummary summary;
  const auto entries = select_entries(profile);

  util::Timer expand_timer;
  const auto paths = resolve_paths(expand_entries(entries, summary));
  summary.expanded = paths.size();
  report("Expanded {} paths in {}.\n",
         paths.size(),
         util::format_duration(expand_timer.measure_s()));

  report("Deleting {} paths...\n", paths.size());
  util::Timer remove_timer;
  remove_paths(paths, summary);
  report("Deleted {} paths in {}, reclaiming {} of space.\n",
         summary.removed,
         util::format_duration(remove_timer.measure_s()),
         util::format_human_readable_size(summary.reclaimed,
                                          m_options.size_unit));

  return summary;
}

std::vector<const Entry*>
Cleaner::select_entries(const Profile& profile)
{
  std::vector<const Entry*> entries;
  for (const auto& entry : profile.entries) {
    if (m_options.mode == Mode::every_entry
        && !m_prompt(FMT("Include entry [{}]?", to_string(entry)))) {
      LOG("Skipping entry {}", to_string(entry));
      continue;
    }
    entries.push_back(&entry);
  }
  return entries;
}

std::vector<fs::path>
Cleaner::expand_entries(const std::vector<const Entry*>& entries,
                        CleanSummary& summary)
{
  std::vector<fs::path> paths;
  for (const auto* entry : entries) {
    auto expanded = expand(*entry);
    if (!expanded) {
      const auto description = to_string(*entry);
      LOG("Failed to expand entry [{}]: {}", description, expanded.error());
      report("Failed to expand entry [{}]: {}.\n",
             description,
             expanded.error());
      summary.errors.push_back(FMT(
        "failed to expand entry [{}]: {}", description, expanded.error()));
      continue;
    }
    paths.insert(paths.end(),
                 std::make_move_iterator(expanded->begin()),
                 std::make_move_iterator(expanded->end()));
  }
  return paths;
}

void
Cleaner::remove_paths(const std::vector<fs::path>& paths,
                      CleanSummary& summary)
{
  const auto on_child_error = [&](const RemoveError& error) {
    if (m_options.report_child_errors) {
      auto message = to_string(error);
      report("Failed to delete path: {}.\n", message);
      summary.errors.push_back(std::move(message));
    }
  };

  for (size_t i = 0; i < paths.size(); ++i) {
    const auto& path = paths[i];
    if (m_options.mode == Mode::every_path) {
      if (!m_prompt(FMT("Delete path <{}>?", path))) {
        LOG("Skipping path {}", path);
        continue;
      }
    } else {
      report("Deleting path {} of {}: <{}>...\n", i + 1, paths.size(), path);
    }

    const auto result = remove(path, on_child_error);
    if (result) {
      ++summary.removed;
      summary.reclaimed += *result;
    } else {
      auto message = to_string(result.error());
      LOG("Failed to delete {}: {}", path, message);
      report("Failed to delete path: {}.\n", message);
      summary.reclaimed += result.error().reclaimed;
      summary.errors.push_back(std::move(message));
    }
  }
}

} // namespace core
