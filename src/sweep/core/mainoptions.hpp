// Copyright (C) 2021-2025 Joel Rosdahl and other contributors
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

#include <sweep/core/cleaner.hpp>
#include <sweep/core/prompt.hpp>

#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>

namespace core {

// Run the command line. Returns the process exit code.
int process_main_options(int argc, const char* const* argv);

std::string get_usage_text(std::string_view sweep_name);

std::string get_version_text(std::string_view sweep_name);

// Load the profile at `profile_path` and remove what it describes. Returns
// EXIT_FAILURE if the profile could not be loaded, otherwise EXIT_SUCCESS.
int clean_profile(const std::filesystem::path& profile_path,
                  const CleanOptions& options,
                  const Prompt& prompt,
                  FILE* output);

} // namespace core
