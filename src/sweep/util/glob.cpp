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

#include "glob.hpp"

#include <sweep/util/direntry.hpp>
#include <sweep/util/file.hpp>
#include <sweep/util/format.hpp>
#include <sweep/util/logging.hpp>

#include <fnmatch.h>

#include <cerrno>
#include <cstring>
#include <optional>

namespace fs = std::filesystem;

namespace {

// Return the position of the ']' closing the character class that starts at
// `start` (which is the position of '['), or std::string_view::npos if the
// class is unterminated.
size_t
find_class_end(std::string_view component, size_t start)
{
  size_t pos = start + 1;
  if (pos < component.size()
      && (component[pos] == '!' || component[pos] == '^')) {
    ++pos;
  }
  if (pos < component.size() && component[pos] == ']') {
    ++pos; // A leading ']' is a member of the class.
  }
  while (pos < component.size() && component[pos] != ']') {
    if (component[pos] == '[' && pos + 1 < component.size()
        && (component[pos + 1] == ':' || component[pos + 1] == '.'
            || component[pos + 1] == '=')) {
      // Bracket expression such as [:alpha:].
      const char delimiter = component[pos + 1];
      const char terminator[] = {delimiter, ']', '\0'};
      const size_t end = component.find(terminator, pos + 2);
      if (end == std::string_view::npos) {
        return std::string_view::npos;
      }
      pos = end + 2;
    } else {
      ++pos;
    }
  }
  return pos < component.size() ? pos : std::string_view::npos;
}

// Validate `component` and return whether it contains any wildcard.
tl::expected<bool, std::string>
scan_component(std::string_view component)
{
  bool has_wildcard = false;
  for (size_t i = 0; i < component.size(); ++i) {
    switch (component[i]) {
    case '\\':
      if (i + 1 == component.size()) {
        return tl::unexpected(
          FMT("dangling escape at end of \"{}\"", component));
      }
      ++i;
      break;
    case '*':
      if (i + 1 < component.size() && component[i + 1] == '*') {
        return tl::unexpected(
          "recursive wildcards must form a single path component");
      }
      has_wildcard = true;
      break;
    case '?':
      has_wildcard = true;
      break;
    case '[': {
      const size_t end = find_class_end(component, i);
      if (end == std::string_view::npos) {
        return tl::unexpected(
          FMT("unterminated character class in \"{}\"", component));
      }
      has_wildcard = true;
      i = end;
      break;
    }
    default:
      break;
    }
  }
  return has_wildcard;
}

std::string
unescape(std::string_view component)
{
  std::string result;
  for (size_t i = 0; i < component.size(); ++i) {
    if (component[i] == '\\' && i + 1 < component.size()) {
      ++i;
    }
    result += component[i];
  }
  return result;
}

std::optional<std::vector<std::string>>
read_names(const fs::path& base)
{
  const fs::path directory = base.empty() ? fs::path(".") : base;
  auto names = util::list_directory(directory);
  if (!names) {
    LOG("Failed to read directory {}: {}", directory, names.error());
    return std::nullopt;
  }
  return std::move(*names);
}

fs::path
join(const fs::path& base, const std::string& name)
{
  return base.empty() ? fs::path(name) : base / name;
}

} // namespace

namespace util {

tl::expected<Glob, std::string>
Glob::compile(std::string_view pattern)
{
  if (pattern.empty()) {
    return tl::unexpected("empty pattern");
  }

  Glob glob;
  glob.m_pattern = std::string(pattern);
  if (pattern.front() == '/') {
    glob.m_root = "/";
  }

  size_t start = 0;
  while (start <= pattern.size()) {
    size_t end = pattern.find('/', start);
    if (end == std::string_view::npos) {
      end = pattern.size();
    }
    const auto component = pattern.substr(start, end - start);
    start = end + 1;

    if (component.empty()) {
      continue;
    }
    if (component == "**") {
      if (glob.m_components.empty()
          || glob.m_components.back().kind != ComponentKind::recursive) {
        glob.m_components.push_back({ComponentKind::recursive, "**"});
      }
      continue;
    }

    auto has_wildcard = scan_component(component);
    if (!has_wildcard) {
      return tl::unexpected(has_wildcard.error());
    }
    if (*has_wildcard) {
      glob.m_components.push_back(
        {ComponentKind::wildcard, std::string(component)});
    } else {
      glob.m_components.push_back(
        {ComponentKind::literal, unescape(component)});
    }
  }

  return glob;
}

std::vector<fs::path>
Glob::expand() const
{
  std::vector<fs::path> result;
  expand_from(m_root, 0, result);
  return result;
}

bool
Glob::component_matches(const std::string& component_pattern,
                        const std::string& name)
{
  return fnmatch(component_pattern.c_str(), name.c_str(), 0) == 0;
}

void
Glob::expand_from(const fs::path& base,
                  size_t index,
                  std::vector<fs::path>& result) const
{
  if (index == m_components.size()) {
    if (!base.empty()) {
      result.push_back(base);
    }
    return;
  }

  const auto& component = m_components[index];
  switch (component.kind) {
  case ComponentKind::literal:
    add_match(join(base, component.text), index, result);
    break;

  case ComponentKind::wildcard: {
    const auto names = read_names(base);
    if (!names) {
      return;
    }
    for (const auto& name : *names) {
      if (component_matches(component.text, name)) {
        add_match(join(base, name), index, result);
      }
    }
    break;
  }

  case ComponentKind::recursive: {
    // Zero directories.
    expand_from(base, index + 1, result);

    const auto names = read_names(base);
    if (!names) {
      return;
    }
    for (const auto& name : *names) {
      const auto subdir = join(base, name);
      DirEntry dir_entry(subdir);
      // Don't descend into symlinked directories to avoid cycles.
      if (dir_entry && !dir_entry.is_symlink() && dir_entry.is_directory()) {
        expand_from(subdir, index, result);
      }
    }
    break;
  }
  }
}

void
Glob::add_match(const fs::path& candidate,
                size_t index,
                std::vector<fs::path>& result) const
{
  DirEntry dir_entry(candidate);
  if (!dir_entry) {
    if (dir_entry.error_number() != ENOENT) {
      LOG("Skipping {}: {}", candidate, strerror(dir_entry.error_number()));
    }
    return;
  }

  if (index + 1 == m_components.size()) {
    result.push_back(candidate);
  } else if (dir_entry.is_directory()) {
    expand_from(candidate, index + 1, result);
  }
}

} // namespace util
