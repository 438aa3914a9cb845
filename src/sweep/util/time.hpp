// Copyright (C) 2023-2025 Joel Rosdahl and other contributors
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

#include <chrono>
#include <cstdint>
#include <ctime>

namespace util {

using TimePoint =
  std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;

inline TimePoint
now()
{
  return std::chrono::system_clock::now();
}

// Whole seconds since the epoch.
inline int64_t
sec(TimePoint tp)
{
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch())
    .count();
}

// Nanoseconds past the whole second.
inline int32_t
nsec_part(TimePoint tp)
{
  return static_cast<int32_t>(tp.time_since_epoch().count() % 1'000'000'000);
}

inline TimePoint
timepoint_from_sec_nsec(int64_t sec, int64_t nsec)
{
  return TimePoint(std::chrono::seconds(sec) + std::chrono::nanoseconds(nsec));
}

inline TimePoint
timepoint_from_timespec(const timespec& ts)
{
  return timepoint_from_sec_nsec(ts.tv_sec, ts.tv_nsec);
}

inline timespec
to_timespec(TimePoint tp)
{
  return {static_cast<time_t>(sec(tp)), nsec_part(tp)};
}

// Wall time elapsed since construction, on the monotonic clock.
class Timer
{
public:
  Timer()
    : m_start(std::chrono::steady_clock::now())
  {
  }

  double
  measure_s() const
  {
    return std::chrono::duration<double>(std::chrono::steady_clock::now()
                                         - m_start)
      .count();
  }

private:
  std::chrono::steady_clock::time_point m_start;
};

} // namespace util
