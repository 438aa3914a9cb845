// Copyright (C) 2002 Andrew Tridgell
// Copyright (C) 2009-2025 Joel Rosdahl and other contributors
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

#include "logging.hpp"

#include <sweep/util/filestream.hpp>
#include <sweep/util/format.hpp>
#include <sweep/util/string.hpp>
#include <sweep/util/time.hpp>

#include <fcntl.h>
#include <unistd.h>

#ifdef HAVE_SYSLOG_H
#  include <syslog.h>
#endif

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace {

struct Destinations
{
  // Set when Config::log_file() names a file.
  fs::path file_path;
  util::FileStream file;

  // Set when Config::log_file() is "syslog".
  bool syslog = false;

  // Set in debug mode. The buffer is written out by dump_log().
  bool buffer = false;
  std::string buffered;
};

Destinations destinations;

// Exits instead of throwing since an exception handler may itself log.
[[noreturn]] void
exit_on_log_file_error()
{
  const std::string error = strerror(errno);
  try {
    PRINT(stderr,
          "sweep: error: Failed to write to {}: {}\n",
          destinations.file_path,
          error);
  } catch (const std::runtime_error&) { // NOLINT: stderr is gone too
  }
  exit(EXIT_FAILURE);
}

// "[<local ISO 8601 time>.<microseconds> <pid>] "
std::string
line_prefix()
{
  const auto now = util::now();
  return FMT("[{}.{:06} {:<5}] ",
             util::format_iso8601_timestamp(now),
             util::nsec_part(now) / 1000,
             getpid());
}

} // namespace

namespace util::logging {

void
init(bool debug, const fs::path& log_file)
{
  destinations.buffer = debug;

#ifdef HAVE_SYSLOG_H
  if (log_file == "syslog") {
    destinations.syslog = true;
    openlog("sweep", LOG_PID, LOG_USER);
    return;
  }
#endif

  if (log_file.empty()) {
    return;
  }
  destinations.file_path = log_file;
  destinations.file.open(log_file, "a");
  if (!destinations.file) {
    exit_on_log_file_error();
  }
  fcntl(fileno(*destinations.file), F_SETFD, FD_CLOEXEC);
}

bool
enabled()
{
  return destinations.buffer || destinations.file || destinations.syslog;
}

void
log(std::string_view message)
{
  if (!enabled()) {
    return;
  }

  const std::string prefix = line_prefix();

  if (destinations.file) {
    FILE* file = *destinations.file;
    try {
      PRINT(file, "{}{}\n", prefix, message);
    } catch (const std::system_error&) {
      exit_on_log_file_error();
    }
    if (fflush(file) == EOF) {
      exit_on_log_file_error();
    }
  }
#ifdef HAVE_SYSLOG_H
  if (destinations.syslog) {
    // syslog adds a prefix of its own.
    syslog(
      LOG_DEBUG, "%.*s", static_cast<int>(message.length()), message.data());
  }
#endif
  if (destinations.buffer) {
    destinations.buffered += prefix;
    destinations.buffered += message;
    destinations.buffered += '\n';
  }
}

void
dump_log(const fs::path& path)
{
  if (!destinations.buffer) {
    return;
  }

  util::FileStream file(path, "w");
  if (file) {
    PRINT_RAW(*file, destinations.buffered);
  }
}

} // namespace util::logging
