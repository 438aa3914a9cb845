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

#include "prompt.hpp"

#include <sweep/util/format.hpp>

#include <optional>

namespace {

// Read a line without its line terminator, or std::nullopt at end of input.
std::optional<std::string>
read_line(FILE* input)
{
  std::string line;
  int ch;
  bool got_any = false;
  while ((ch = fgetc(input)) != EOF) {
    got_any = true;
    if (ch == '\n') {
      break;
    }
    line += static_cast<char>(ch);
  }
  if (!got_any) {
    return std::nullopt;
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  return line;
}

} // namespace

namespace core {

bool
prompt_yes_no(std::string_view question, FILE* input, FILE* output)
{
  while (true) {
    PRINT(output, "{} (Y/n): ", question);
    fflush(output);

    const auto line = read_line(input);
    if (!line) {
      return false;
    }
    if (*line == "Y" || *line == "y" || line->empty()) {
      return true;
    }
    if (*line == "N" || *line == "n") {
      return false;
    }
  }
}

Prompt
console_prompt()
{
  return [](const std::string& question) {
    return prompt_yes_no(question, stdin, stdout);
  };
}

} // namespace core
