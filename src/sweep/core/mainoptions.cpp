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

#include "mainoptions.hpp"

#include <sweep/config.hpp>
#include <sweep/core/profile.hpp>
#include <sweep/util/format.hpp>
#include <sweep/util/logging.hpp>

#include <getopt.h>

#include <cstdint>
#include <cstdlib>
#include <optional>

namespace fs = std::filesystem;

namespace core {

constexpr const char VERSION_TEXT[] =
  R"({0} version {1}

Copyright (C) 2026 The sweep authors

This program is free software; you can redistribute it and/or modify it under
the terms of the GNU General Public License as published by the Free Software
Foundation; either version 3 of the License, or (at your option) any later
version.
)";

constexpr const char USAGE_TEXT[] =
  R"(Usage:
    {0} -p PATH [options]

    Remove the files and directories described by the profile at PATH.

Options:
    -p, --profile PATH         load the cleaning profile from PATH (JSON)
    -m, --mode MODE            confirmation mode: silent (no prompts),
                               everyEntry (confirm each profile entry) or
                               everyPath (confirm each path; default)
        --config-path PATH     read configuration file PATH instead of the
                               default
    -d, --debug                enable debug logging
    -k, --get-config KEY       print the value of configuration option KEY
        --show-config          show current configuration options in
                               human-readable format
    -h, --help                 print this help text
    -V, --version              print version and copyright information
)";

static void
configuration_printer(const std::string& key,
                      const std::string& value,
                      const std::string& origin)
{
  PRINT(stdout, "({}) {} = {}\n", origin, key, value);
}

std::string
get_usage_text(const std::string_view sweep_name)
{
  return FMT(USAGE_TEXT, sweep_name);
}

std::string
get_version_text(const std::string_view sweep_name)
{
  return FMT(VERSION_TEXT, sweep_name, SWEEP_VERSION);
}

int
clean_profile(const fs::path& profile_path,
              const CleanOptions& options,
              const Prompt& prompt,
              FILE* output)
{
  PRINT(output, "Loading profile from path <{}>...\n", profile_path);
  const auto profile = load_profile(profile_path);
  if (!profile) {
    LOG("Failed to load profile {}: {}", profile_path, profile.error());
    PRINT(output,
          "Failed to clean items: failed to load profile [{}].\n",
          profile.error());
    return EXIT_FAILURE;
  }

  Cleaner cleaner(options, prompt, output);
  const auto summary = cleaner.clean(*profile);
  LOG("Removed {} of {} paths with {} errors, reclaiming {} bytes",
      summary.removed,
      summary.expanded,
      summary.errors.size(),
      summary.reclaimed);

  PRINT_RAW(output, "Successfully cleaned items.\n");
  return EXIT_SUCCESS;
}

enum : uint8_t {
  CONFIG_PATH = 128,
  SHOW_CONFIG,
};

const char options_string[] = "dhk:m:p:V";
const option long_options[] = {
  {"config-path", required_argument, nullptr, CONFIG_PATH},
  {"debug",       no_argument,       nullptr, 'd'        },
  {"get-config",  required_argument, nullptr, 'k'        },
  {"help",        no_argument,       nullptr, 'h'        },
  {"mode",        required_argument, nullptr, 'm'        },
  {"profile",     required_argument, nullptr, 'p'        },
  {"show-config", no_argument,       nullptr, SHOW_CONFIG},
  {"version",     no_argument,       nullptr, 'V'        },
  {nullptr,       0,                 nullptr, 0          }
};

int
process_main_options(int argc, const char* const* argv)
{
  int c;

  const std::string program_name = fs::path(argv[0]).filename().string();

  std::optional<fs::path> config_path;
  std::optional<Mode> mode;
  std::optional<fs::path> profile_path;
  bool debug = false;
  bool command_given = false;

  // First pass: Handle options that affect the configuration.
  while ((c = getopt_long(argc,
                          const_cast<char* const*>(argv),
                          options_string,
                          long_options,
                          nullptr))
         != -1) {
    const std::string arg = optarg ? optarg : std::string();

    switch (c) {
    case CONFIG_PATH:
      config_path = arg;
      break;

    case 'd': // --debug
      debug = true;
      break;

    case 'm': // --mode
      mode = parse_mode(arg);
      if (!mode) {
        PRINT(stderr, "Error: unknown mode \"{}\"\n", arg);
        return EXIT_FAILURE;
      }
      break;

    case 'p': // --profile
      profile_path = arg;
      break;

    case 'h': // --help
    case 'k': // --get-config
    case 'V': // --version
    case SHOW_CONFIG:
      command_given = true;
      break;

    case '?': // unknown option
      return EXIT_FAILURE;
    }
  }

  if (optind < argc) {
    PRINT(stderr, "Error: unexpected argument \"{}\"\n", argv[optind]);
    return EXIT_FAILURE;
  }

  if (!profile_path && !command_given) {
    PRINT_RAW(stderr, get_usage_text(program_name));
    return EXIT_FAILURE;
  }

  Config config;
  config.read(config_path);
  if (debug) {
    config.set_debug(true);
  }
  if (mode) {
    config.set_mode(*mode);
  }
  util::logging::init(config.debug(), config.log_file());

  // Second pass: Handle command options in order.
  optind = 1;
  while ((c = getopt_long(argc,
                          const_cast<char* const*>(argv),
                          options_string,
                          long_options,
                          nullptr))
         != -1) {
    const std::string arg = optarg ? optarg : std::string();

    switch (c) {
    case CONFIG_PATH:
    case 'd': // --debug
    case 'm': // --mode
    case 'p': // --profile
      // Already handled in the first pass.
      break;

    case 'h': // --help
      PRINT_RAW(stdout, get_usage_text(program_name));
      return EXIT_SUCCESS;

    case 'k': // --get-config
      PRINT(stdout, "{}\n", config.get_string_value(arg));
      break;

    case SHOW_CONFIG:
      config.visit_items(configuration_printer);
      break;

    case 'V': // --version
      PRINT_RAW(stdout, get_version_text(program_name));
      break;

    default:
      PRINT_RAW(stderr, get_usage_text(program_name));
      return EXIT_FAILURE;
    }
  }

  if (!profile_path) {
    return EXIT_SUCCESS;
  }

  const int result = clean_profile(
    *profile_path, config.clean_options(), console_prompt(), stdout);
  if (config.debug()) {
    util::logging::dump_log(FMT("{}.sweep-log", *profile_path));
  }
  return result;
}

} // namespace core
