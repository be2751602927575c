/* Ordo
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */


#include "ordo/util/util.hpp"
#include "ordo/util/string_ostream.hpp"
#include <gtest/gtest.h>
#include <iomanip>

namespace ordo::util::test
{

namespace
{
using std::string;
} // Anonymous namespace

TEST(Util_misc, Ostream_op_string)
{
  EXPECT_EQ(ostream_op_string("abc[", 2, "] flag[", true, "]:", std::hex, 12), "abc[2] flag[1]:c");
  EXPECT_EQ(ostream_op_string(), "");
  EXPECT_EQ(ostream_op_string(string("x"), '/', 1.5), "x/1.5");
} // TEST(Util_misc, Ostream_op_string)

TEST(Util_where_am_i, Interface)
{
  static_assert(get_last_path_segment("/a/b/c.cpp") == "c.cpp", "Path should be shortened to its last segment.");
  static_assert(get_last_path_segment("c.cpp") == "c.cpp", "Path without separator should be unchanged.");
  static_assert(get_last_path_segment("a/") == "", "Trailing separator leaves empty segment.");
  static_assert(get_last_path_segment("") == "", "Empty path should stay empty.");
  static_assert(get_last_path_segment("C:\\src\\d.cpp") == "d.cpp", "Backslash also separates segments.");

  const string where = ORDO_UTIL_WHERE_AM_I_STR();
  EXPECT_EQ(where.find("util_test.cpp:"), 0u) << where;
  EXPECT_NE(where.find("TestBody"), string::npos) << where;
  EXPECT_EQ(where.find('/'), string::npos) << where;

  const string where_literal = ORDO_UTIL_WHERE_AM_I_LITERAL(some_function);
  EXPECT_NE(where_literal.find(":some_function("), string::npos) << where_literal;
  EXPECT_EQ(where_literal.back(), ')') << where_literal;
} // TEST(Util_where_am_i, Interface)

TEST(Util_string_ostream, Interface)
{
  String_ostream os;
  EXPECT_TRUE(os.str().empty());
  os.os() << "abc" << 12 << std::flush;
  EXPECT_EQ(os.str(), "abc12");
  os.os() << std::setw(4) << std::setfill('0') << 7 << std::flush;
  EXPECT_EQ(os.str(), "abc120007");
  os.str_clear();
  EXPECT_TRUE(os.str().empty());
  os.os() << 'x' << std::flush;
  EXPECT_EQ(os.str(), "x");

  string target = "existing ";
  String_ostream os2(&target);
  os2.os() << "appended" << std::flush;
  EXPECT_EQ(target, "existing appended");
  EXPECT_EQ(&os2.str(), &target);
} // TEST(Util_string_ostream, Interface)

} // namespace ordo::util::test
