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


#include "ordo/pmap/map_surface.hpp"
#include "ordo/pmap/error/error.hpp"
#include "ordo/log/config.hpp"
#include "ordo/log/buffer_logger.hpp"
#include "ordo/util/util.hpp"
#include <boost/unordered_map.hpp>
#include <gtest/gtest.h>
#include <string>

namespace ordo::pmap::test
{

namespace
{
using std::string;
using Map = Ordered_map<string, int>;
using Native_map = boost::unordered_map<string, int>;
using Surface = Map_surface<string, int>;

/// Every mutation of `surface` must fail, in both error-reporting modes, and leave it as it was.
void check_refuses_mutation(Surface* surface, const Surface& other)
{
  const auto size_before = surface->size();

  Error_code err_code;
  surface->put("new", 1, &err_code);
  EXPECT_EQ(err_code, error::Code::S_UNSUPPORTED_MUTATION);
  err_code.clear();
  EXPECT_EQ(surface->erase("a", &err_code), 0u);
  EXPECT_EQ(err_code, error::Code::S_UNSUPPORTED_MUTATION);
  err_code.clear();
  surface->clear(&err_code);
  EXPECT_EQ(err_code, error::Code::S_UNSUPPORTED_MUTATION);
  err_code.clear();
  surface->put_all(other, &err_code);
  EXPECT_EQ(err_code, error::Code::S_UNSUPPORTED_MUTATION);

  EXPECT_THROW(surface->put("new", 1), ordo::error::Runtime_error);
  EXPECT_THROW(surface->erase("a"), ordo::error::Runtime_error);
  EXPECT_THROW(surface->clear(), ordo::error::Runtime_error);
  EXPECT_THROW(surface->put_all(other), ordo::error::Runtime_error);

  try
  {
    surface->put("new", 1);
  }
  catch (const ordo::error::Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), error::Code::S_UNSUPPORTED_MUTATION);
    EXPECT_NE(string(exc.what()).find("put"), string::npos) << exc.what();
  }

  EXPECT_EQ(surface->size(), size_before);
  EXPECT_FALSE(surface->contains("new"));
}

} // Anonymous namespace

TEST(Immutable_map_surface, Reads_and_refusals)
{
  log::Config cfg(log::Sev::S_TRACE);
  log::Buffer_logger logger(&cfg);

  const Map map({ { "a", 1 }, { "b", 2 }, { "c", 3 } }, &logger);
  Immutable_map_surface<Map> surface(map);
  EXPECT_EQ(surface.get_logger(), &logger);

  EXPECT_EQ(surface.size(), 3u);
  EXPECT_TRUE(surface.contains("b"));
  EXPECT_FALSE(surface.contains("z"));
  ASSERT_TRUE(surface.find("c"));
  EXPECT_EQ(*surface.find("c"), 3);
  EXPECT_EQ(surface.find("z"), nullptr);

  string visited;
  surface.for_each([&](const string& key, int val) { visited += util::ostream_op_string(key, val); });
  EXPECT_EQ(visited, "a1b2c3"); // Insertion order.

  const Immutable_map_surface<Map> other(Map{ { "x", 9 } });
  check_refuses_mutation(&surface, other);
  EXPECT_EQ(surface.map(), map);
  EXPECT_EQ(surface.map().keys(), map.keys());

  const auto out = logger.buffer_str_copy();
  EXPECT_NE(out.find("Refusing in-place [put_all]"), string::npos) << out;
  EXPECT_NE(out.find("In-place mutation is not supported by an immutable map."), string::npos) << out;
} // TEST(Immutable_map_surface, Reads_and_refusals)

TEST(Unordered_map_surface, Mutations)
{
  Native_map native{ { "a", 1 } };
  Unordered_map_surface<Native_map> surface(0, &native);

  Error_code err_code = error::Code::S_INDEX_OUT_OF_RANGE; // Must get cleared.
  surface.put("b", 2, &err_code);
  EXPECT_FALSE(err_code);
  surface.put("a", 10);
  EXPECT_EQ(native.size(), 2u);
  EXPECT_EQ(native.at("a"), 10);
  ASSERT_TRUE(surface.find("b"));
  EXPECT_EQ(*surface.find("b"), 2);

  EXPECT_EQ(surface.erase("b"), 1u);
  EXPECT_EQ(surface.erase("b", &err_code), 0u);
  EXPECT_FALSE(err_code);
  EXPECT_FALSE(surface.contains("b"));

  // Copy everything from an ordered map into the native one.
  const Immutable_map_surface<Map> source(Map{ { "x", 7 }, { "a", 100 } });
  surface.put_all(source, &err_code);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(native, (Native_map{ { "a", 100 }, { "x", 7 } }));
  EXPECT_EQ((sum_mapped_values<string, int>(surface)), 107);
  EXPECT_EQ((sum_mapped_values<string, int>(source, 1000)), 1107);

  surface.clear();
  EXPECT_TRUE(native.empty());
  EXPECT_EQ(surface.size(), 0u);
  EXPECT_EQ((sum_mapped_values<string, int>(surface)), 0);
  EXPECT_EQ(source.size(), 2u);
} // TEST(Unordered_map_surface, Mutations)

TEST(Map_surface, Polymorphic_use)
{
  Native_map native;
  Unordered_map_surface<Native_map> mutable_surface(0, &native);
  const Immutable_map_surface<Map> immutable_surface(Map{ { "k", 5 } });
  const Surface* surfaces[] = { &mutable_surface, &immutable_surface };

  mutable_surface.put("k", 5);
  for (const auto surface : surfaces)
  {
    EXPECT_TRUE(surface->contains("k"));
    EXPECT_EQ(sum_mapped_values(*surface), 5);
  }
} // TEST(Map_surface, Polymorphic_use)

} // namespace ordo::pmap::test
