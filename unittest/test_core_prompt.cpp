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

#include <sweep/core/prompt.hpp>

#include <doctest/doctest.h>

#include <cstdio>
#include <ostream> // https://github.com/doctest/doctest/issues/618
#include <string>

namespace {

struct PromptResult
{
  bool answer;
  std::string output;
};

std::string
read_all(FILE* file)
{
  rewind(file);
  std::string result;
  int ch;
  while ((ch = fgetc(file)) != EOF) {
    result += static_cast<char>(ch);
  }
  return result;
}

PromptResult
ask(const std::string& input)
{
  FILE* in = tmpfile();
  REQUIRE(in);
  FILE* out = tmpfile();
  REQUIRE(out);
  REQUIRE(fwrite(input.data(), 1, input.size(), in) == input.size());
  rewind(in);

  const bool answer = core::prompt_yes_no("Delete path </tmp/x>?", in, out);
  PromptResult result{answer, read_all(out)};

  fclose(in);
  fclose(out);
  return result;
}

} // namespace

TEST_SUITE_BEGIN("core");

TEST_CASE("core::prompt_yes_no")
{
  SUBCASE("yes answers")
  {
    CHECK(ask("y\n").answer);
    CHECK(ask("Y\n").answer);
    CHECK(ask("\n").answer);
    CHECK(ask("y").answer);
    CHECK(ask("y\r\n").answer);
  }

  SUBCASE("no answers")
  {
    CHECK(!ask("n\n").answer);
    CHECK(!ask("N\n").answer);
  }

  SUBCASE("end of input means no")
  {
    CHECK(!ask("").answer);
  }

  SUBCASE("question format")
  {
    CHECK(ask("y\n").output == "Delete path </tmp/x>? (Y/n): ");
  }

  SUBCASE("invalid answers repeat the question")
  {
    const auto result = ask("yes\nmaybe\nn\n");
    CHECK(!result.answer);
    CHECK(result.output
          == "Delete path </tmp/x>? (Y/n): Delete path </tmp/x>? (Y/n): "
             "Delete path </tmp/x>? (Y/n): ");
  }

  SUBCASE("invalid answer followed by end of input")
  {
    CHECK(!ask("what\n").answer);
  }
}

TEST_SUITE_END();
