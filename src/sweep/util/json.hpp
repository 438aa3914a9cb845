// Copyright (C) 2020-2024 Joel Rosdahl and other contributors
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

#include <tl/expected.hpp>

#include <glaze/glaze.hpp>

#include <string>
#include <string_view>

// Parsing of JSON documents into plain structs described by glz::meta
// specializations. The glaze JSON parsing library:
// https://github.com/stephenberry/glaze

namespace util::json {

static constexpr glz::opts ParseOpts = glz::opts{
  .format = glz::JSON,
  .error_on_unknown_keys = false,
  .error_on_missing_keys = true,
};

class ParseError;

template<class T, glz::opts Opts = ParseOpts>
tl::expected<void, ParseError> parse(std::string_view document, T& dest);

class ParseError
{
public:
  using code = glz::error_code;

  operator bool() const noexcept;

  bool operator==(code err) const noexcept;

  // Describe the error, including the line and column in `document`.
  std::string format(std::string_view document) const;

private:
  glz::error_ctx m_repr;

  ParseError(glz::error_ctx ctx);

  template<class T, glz::opts Opts>
  friend tl::expected<void, ParseError> parse(std::string_view document,
                                              T& dest);
};

template<class T, glz::opts Opts>
tl::expected<void, ParseError>
parse(std::string_view document, T& dest)
{
  if (auto err = glz::read<Opts>(dest, document)) {
    return tl::unexpected(ParseError(err));
  }
  return {};
}

// Parse `document` into a new T. The error message is the formatted parse
// error.
template<class T, glz::opts Opts = ParseOpts>
tl::expected<T, std::string>
parse(std::string_view document)
{
  T dest{};
  if (auto result = parse<T, Opts>(document, dest); !result) {
    return tl::unexpected(result.error().format(document));
  }
  return dest;
}

} // namespace util::json
