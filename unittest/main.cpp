// Copyright (C) 2010-2025 Joel Rosdahl and other contributors
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

#include <sweep/util/format.hpp>

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <initializer_list>

namespace fs = std::filesystem;

namespace {

int
run_in_test_directory(int argc, char** argv)
{
  const auto dir_before = fs::current_path();
  const fs::path testdir = FMT("testdir/{}", getpid());

  fs::remove_all(testdir);
  fs::create_directories(testdir);
  fs::current_path(testdir);

  doctest::Context context;
  context.applyCommandLine(argc, argv);
  const int result = context.run();

  if (result == EXIT_SUCCESS) {
    fs::current_path(dir_before);
    fs::remove_all(testdir);
  } else {
    PRINT(stderr, "Note: Test data has been left in {}\n", testdir);
  }
  return result;
}

} // namespace

int
main(int argc, char** argv)
{
  // Don't let the environment of the test runner affect configuration tests.
  for (const char* name : {"SWEEP_CONFIGPATH",
                           "SWEEP_DEBUG",
                           "SWEEP_LOGFILE",
                           "SWEEP_MODE",
                           "SWEEP_REPORT_CHILD_ERRORS",
                           "SWEEP_SIZE_UNIT"}) {
    unsetenv(name);
  }

  try {
    return run_in_test_directory(argc, argv);
  } catch (const fs::filesystem_error& e) {
    PRINT(stderr, "error: {}\n", e.what());
    return EXIT_FAILURE;
  }
}
