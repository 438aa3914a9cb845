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

#pragma once

#include <cstdio>
#include <functional>
#include <string>
#include <string_view>

namespace core {

// Ask a yes/no question and return the answer.
using Prompt = std::function<bool(const std::string& question)>;

// Print "<question> (Y/n): " to `output` and read an answer line from `input`
// until it is valid. "Y"/"y" and an empty line mean yes, "N"/"n" means no,
// anything else asks again. End of input means no.
bool prompt_yes_no(std::string_view question, FILE* input, FILE* output);

// Return a Prompt that asks on stdin/stdout.
Prompt console_prompt();

} // namespace core
