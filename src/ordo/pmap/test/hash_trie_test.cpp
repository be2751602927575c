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


#include "ordo/pmap/hash_trie.hpp"
#include "ordo/pmap/detail/hash_trie_node.hpp"
#include "ordo/util/util.hpp"
#include <boost/unordered_map.hpp>
#include <gtest/gtest.h>
#include <string>
#include <utility>

namespace ordo::pmap::test
{

namespace
{
using std::string;

/// Every key collides with every other in all hash bits.
struct Const_hash
{
  size_t operator()(const string&) const { return 42; }
};

/// Keys agree in all low-order hash chunks and differ only high up, forcing deep paths.
struct High_bits_hash
{
  size_t operator()(int key) const { return size_t(key) << 40; }
};

/// Checks that `trie` holds exactly `expected`, via both lookups and full traversal.
template<typename Trie, typename Map>
void check_contents(const Trie& trie, const Map& expected, const string& ctx)
{
  ASSERT_EQ(trie.size(), expected.size()) << ctx;
  EXPECT_EQ(trie.empty(), expected.empty()) << ctx;
  for (const auto& exp_entry : expected)
  {
    const auto entry = trie.find(exp_entry.first);
    ASSERT_TRUE(entry) << ctx;
    EXPECT_EQ(entry->first, exp_entry.first) << ctx;
    EXPECT_EQ(entry->second, exp_entry.second) << ctx;
  }

  size_t n_visited = 0;
  trie.for_each([&](const typename Trie::Value& entry)
  {
    ++n_visited;
    const auto exp_it = expected.find(entry.first);
    ASSERT_TRUE(exp_it != expected.end()) << ctx;
    EXPECT_EQ(entry.second, exp_it->second) << ctx;
  });
  EXPECT_EQ(n_visited, expected.size()) << ctx;
}

} // Anonymous namespace

/// Failure-message context: where the check was made.
#define CTX util::ostream_op_string("Caller context [", ORDO_UTIL_WHERE_AM_I_STR(), "].")

TEST(Hash_trie, Interface)
{
  using Trie = Hash_trie<string, int>;

  const Trie empty;
  EXPECT_TRUE(empty.empty());
  EXPECT_EQ(empty.size(), 0u);
  EXPECT_EQ(empty.find("a"), nullptr);
  EXPECT_FALSE(empty.contains("a"));
  EXPECT_EQ(empty.get("a", -1), -1);

  bool added = false;
  const auto t1 = empty.assoc("a", 1, &added);
  EXPECT_TRUE(added);
  const auto t2 = t1.assoc("b", 2, &added);
  EXPECT_TRUE(added);
  const auto t3 = t2.assoc("a", 10, &added);
  EXPECT_FALSE(added);

  // Every version is intact.
  EXPECT_TRUE(empty.empty());
  check_contents(t1, boost::unordered_map<string, int>{ { "a", 1 } }, CTX);
  check_contents(t2, boost::unordered_map<string, int>{ { "a", 1 }, { "b", 2 } }, CTX);
  check_contents(t3, boost::unordered_map<string, int>{ { "a", 10 }, { "b", 2 } }, CTX);
  EXPECT_EQ(t3.get("a", -1), 10);
  EXPECT_EQ(t2.get("a", -1), 1);
  EXPECT_EQ(t3.get("zzz", -1), -1);

  // Entries untouched by an update are shared, not copied.
  EXPECT_EQ(t2.find("b"), t3.find("b"));

  bool removed = true;
  const auto t4 = t3.dissoc("zzz", &removed);
  EXPECT_FALSE(removed);
  EXPECT_TRUE(t4.shares_root_with(t3));
  EXPECT_EQ(t4.size(), t3.size());

  const auto t5 = t3.dissoc("a", &removed);
  EXPECT_TRUE(removed);
  EXPECT_FALSE(t5.shares_root_with(t3));
  check_contents(t5, boost::unordered_map<string, int>{ { "b", 2 } }, CTX);
  check_contents(t3, boost::unordered_map<string, int>{ { "a", 10 }, { "b", 2 } }, CTX);

  const auto t6 = t5.dissoc("b");
  EXPECT_TRUE(t6.empty());
  EXPECT_TRUE(t6.shares_root_with(empty));
  EXPECT_TRUE(t6.dissoc("b").empty());
} // TEST(Hash_trie, Interface)

TEST(Hash_trie, Many_keys)
{
  using Trie = Hash_trie<int, int>;
  constexpr int N = 20000;

  boost::unordered_map<int, int> expected;
  Trie trie;
  for (int key = 0; key != N; ++key)
  {
    trie = trie.assoc(key, key * 3);
    expected[key] = key * 3;
  }
  const Trie full = trie;
  check_contents(full, expected, CTX);

  // Remove all multiples of 3, replace the values of odd keys.
  for (int key = 0; key != N; ++key)
  {
    if ((key % 3) == 0)
    {
      bool removed = false;
      trie = trie.dissoc(key, &removed);
      EXPECT_TRUE(removed) << key;
      expected.erase(key);
    }
    else if ((key % 2) == 1)
    {
      bool added = true;
      trie = trie.assoc(key, -key, &added);
      EXPECT_FALSE(added) << key;
      expected[key] = -key;
    }
  }
  check_contents(trie, expected, CTX);
  EXPECT_EQ(full.size(), size_t(N)); // Old version still complete.
  EXPECT_EQ(full.get(3, 0), 9);
  EXPECT_EQ(trie.get(3, 0), 0);

  for (int key = 0; key != N; ++key)
  {
    trie = trie.dissoc(key);
  }
  EXPECT_TRUE(trie.empty());
  EXPECT_EQ(full.size(), size_t(N));
} // TEST(Hash_trie, Many_keys)

TEST(Hash_trie, Full_collisions)
{
  using Trie = Hash_trie<string, int, Const_hash>;

  boost::unordered_map<string, int> expected;
  Trie trie;
  for (int idx = 0; idx != 50; ++idx)
  {
    const auto key = util::ostream_op_string("key", idx);
    trie = trie.assoc(key, idx);
    expected[key] = idx;
  }
  check_contents(trie, expected, CTX);

  trie = trie.assoc("key7", 700);
  expected["key7"] = 700;
  EXPECT_EQ(trie.size(), 50u);
  check_contents(trie, expected, CTX);

  bool removed = true;
  EXPECT_TRUE(trie.dissoc("absent", &removed).shares_root_with(trie));
  EXPECT_FALSE(removed);

  // Remove down to one entry, which must then still be found (pulled back up toward the root).
  for (int idx = 0; idx != 49; ++idx)
  {
    const auto key = util::ostream_op_string("key", idx);
    trie = trie.dissoc(key, &removed);
    EXPECT_TRUE(removed) << key;
    expected.erase(key);
    check_contents(trie, expected, CTX);
  }
  EXPECT_EQ(trie.get("key49", -1), 49);
  trie = trie.dissoc("key49");
  EXPECT_TRUE(trie.empty());
  EXPECT_FALSE(trie.contains("key49"));
} // TEST(Hash_trie, Full_collisions)

TEST(Hash_trie, Deep_paths)
{
  using Trie = Hash_trie<int, string, High_bits_hash>;

  boost::unordered_map<int, string> expected;
  Trie trie;
  for (int key = 0; key != 300; ++key)
  {
    trie = trie.assoc(key, util::ostream_op_string('v', key));
    expected[key] = util::ostream_op_string('v', key);
  }
  check_contents(trie, expected, CTX);

  for (int key = 0; key < 300; key += 2)
  {
    trie = trie.dissoc(key);
    expected.erase(key);
  }
  check_contents(trie, expected, CTX);
  EXPECT_FALSE(trie.contains(0));
  EXPECT_EQ(trie.get(299, ""), "v299");
} // TEST(Hash_trie, Deep_paths)

TEST(Hash_trie_node, Slot_index)
{
  using Node = Hash_trie_node<std::pair<const int, int>>;

  Node node{};
  node.m_bitmap = 0;
  EXPECT_EQ(node.slot_idx(uint32_t(1) << 7), 0u);

  node.m_bitmap = (uint32_t(1) << 0) | (uint32_t(1) << 3) | (uint32_t(1) << 7) | (uint32_t(1) << 31);
  EXPECT_EQ(node.slot_idx(uint32_t(1) << 0), 0u);
  EXPECT_EQ(node.slot_idx(uint32_t(1) << 3), 1u);
  EXPECT_EQ(node.slot_idx(uint32_t(1) << 7), 2u);
  EXPECT_EQ(node.slot_idx(uint32_t(1) << 31), 3u);
  EXPECT_EQ(node.slot_idx(uint32_t(1) << 5), 2u); // Unset chunk: where its slot would be inserted.

  node.m_bitmap = ~uint32_t(0);
  EXPECT_EQ(node.slot_idx(uint32_t(1) << 31), 31u);
} // TEST(Hash_trie_node, Slot_index)

} // namespace ordo::pmap::test
