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


#include "json.hpp"

namespace util::json {

ParseError::ParseError(glz::error_ctx ctx)
  : m_repr(ctx)
{
}

ParseError::operator bool() const noexcept
{
  return static_cast<bool>(m_repr);
}

bool
ParseError::operator==(ParseError::code err) const noexcept
{
  return m_repr == err;
}

std::string
ParseError::format(std::string_view document) const
{
  return glz::format_error(m_repr, document);
}

} // namespace util::json
