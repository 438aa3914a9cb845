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

#define SWEEP_CONCAT_INNER(a_, b_) a_##b_
#define SWEEP_CONCAT(a_, b_) SWEEP_CONCAT_INNER(a_, b_)

// Expand to a variable name that is unique within the translation unit.
#define UNIQUE_VARNAME(prefix_) SWEEP_CONCAT(prefix_, __LINE__)
