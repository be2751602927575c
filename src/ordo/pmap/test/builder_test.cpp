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


#include "ordo/pmap/builder.hpp"
#include "ordo/pmap/error/error.hpp"
#include "ordo/log/config.hpp"
#include "ordo/log/buffer_logger.hpp"
#include "ordo/util/util.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace ordo::pmap::test
{

namespace
{
using std::string;
using std::vector;
} // Anonymous namespace

TEST(Make_ordered_map, Pairs)
{
  const auto none = make_ordered_map<string, int>();
  EXPECT_TRUE(none.empty());

  const auto map = make_ordered_map<string, int>("b", 2, "a", 1, string("c"), 3);
  EXPECT_EQ(map.keys(), (vector<string>{ "b", "a", "c" }));
  EXPECT_EQ(map.values(), (vector<int>{ 2, 1, 3 }));

  // Later duplicates update the value in place.
  const auto dups = make_ordered_map<string, int>("x", 1, "y", 2, "x", 3);
  EXPECT_EQ(dups.size(), 2u);
  EXPECT_EQ(dups.keys(), (vector<string>{ "x", "y" }));
  EXPECT_EQ(dups.get("x", 0), 3);

  // Argument types need only convert.
  const auto widened = make_ordered_map<long, double>(1, 1.5f, 2, 2);
  EXPECT_EQ(widened.get(2, 0), 2.0);
} // TEST(Make_ordered_map, Pairs)

TEST(Make_ordered_map, Odd_count)
{
  try
  {
    make_ordered_map<string, int>("a", 1, "b");
    ADD_FAILURE() << "Expected exception not thrown.";
  }
  catch (const error::Unpaired_key_error<string>& exc)
  {
    EXPECT_EQ(exc.unpaired_key(), "b");
    EXPECT_EQ(exc.arg_count(), 3u);
    EXPECT_EQ(exc.code(), error::Code::S_ODD_ARGUMENT_COUNT);
    EXPECT_NE(string(exc.what()).find("even number of arguments"), string::npos) << exc.what();
  }

  EXPECT_THROW((make_ordered_map<int, int>(7)), ordo::error::Runtime_error);
} // TEST(Make_ordered_map, Odd_count)

TEST(Build_ordered_map, Flat_sequence)
{
  using Map = Ordered_map<string, string>;

  log::Config cfg(log::Sev::S_TRACE);
  log::Buffer_logger logger(&cfg);

  const vector<string> flat{ "k1", "v1", "k2", "v2", "k1", "v3" };
  const auto map = build_ordered_map<Map>(flat.begin(), flat.end(), &logger);
  EXPECT_EQ(map.keys(), (vector<string>{ "k1", "k2" }));
  EXPECT_EQ(map.values(), (vector<string>{ "v3", "v2" }));
  EXPECT_EQ(map.get_logger(), &logger);
  EXPECT_NE(logger.buffer_str_copy().find("[3] key/value pairs yielded map of size [2]"), string::npos)
    << logger.buffer_str_copy();

  const vector<string> empty;
  EXPECT_TRUE(build_ordered_map<Map>(empty.begin(), empty.end()).empty());

  const vector<string> odd{ "k1", "v1", "k2" };
  try
  {
    build_ordered_map<Map>(odd.begin(), odd.end(), &logger);
    ADD_FAILURE() << "Expected exception not thrown.";
  }
  catch (const error::Unpaired_key_error<string>& exc)
  {
    EXPECT_EQ(exc.unpaired_key(), "k2");
    EXPECT_EQ(exc.arg_count(), 3u);
    EXPECT_EQ(exc.code(), error::Code::S_ODD_ARGUMENT_COUNT);
  }
  EXPECT_NE(logger.buffer_str_copy().find("has odd length"), string::npos) << logger.buffer_str_copy();

  // Works from any input iterator over convertible elements.
  const char* const c_strs[] = { "a", "1", "b", "2" };
  const auto from_array = build_ordered_map<Map>(std::begin(c_strs), std::end(c_strs));
  EXPECT_EQ(util::ostream_op_string(from_array), "{a 1, b 2}");
} // TEST(Build_ordered_map, Flat_sequence)

} // namespace ordo::pmap::test
