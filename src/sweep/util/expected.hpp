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

#include <sweep/util/macro.hpp>

#include <tl/expected.hpp>

#include <utility>

// Evaluate `expression_`, which must yield a tl::expected, and return its
// error from the enclosing function on failure.
#define TRY(expression_)                                                       \
  do {                                                                         \
    auto result_ = (expression_);                                              \
    if (!result_) {                                                            \
      return tl::unexpected(std::move(result_.error()));                       \
    }                                                                          \
  } while (false)

// Like TRY, but move the value into `var_` on success.
#define TRY_ASSIGN(var_, expression_)                                          \
  auto UNIQUE_VARNAME(_result_) = (expression_);                               \
  if (!UNIQUE_VARNAME(_result_)) {                                             \
    return tl::unexpected(std::move(UNIQUE_VARNAME(_result_).error()));        \
  }                                                                            \
  var_ = std::move(*UNIQUE_VARNAME(_result_))
