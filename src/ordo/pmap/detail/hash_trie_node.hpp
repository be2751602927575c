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

/// @file
#pragma once

#include "ordo/pmap/pmap_fwd.hpp"
#include <boost/shared_ptr.hpp>
#include <boost/make_shared.hpp>
#include <bitset>
#include <cstdint>
#include <vector>

namespace ordo::pmap
{

// Types.

/**
 * Internal node of Hash_trie.  Immutable once published (held only via `shared_ptr<const ...>`); all "modification"
 * builds new nodes.  A node is one of two kinds:
 *   - Branch: #m_bitmap has bit `b` set if and only if a slot exists for hash chunk `b` (5 bits of the hash at
 *     this node's depth); #m_slots holds those slots in increasing `b` order, so the slot for `b` is at index
 *     `popcount(m_bitmap & ((1 << b) - 1))`.  Each slot holds either one entry or a child node.
 *   - Collision: all the hash bits have been consumed, yet several distinct keys remain; they share
 *     #m_collision_hash and sit in #m_collision_entries, searched linearly.
 *
 * @tparam Value
 *         The entry type, `std::pair<const Key, Mapped>`.
 */
template<typename Value>
struct Hash_trie_node
{
  // Types.

  /// Entries are individually ref-counted so that path copies share them instead of copying keys and values.
  using Entry_ptr = boost::shared_ptr<const Value>;

  /// Short-hand for ref-counted pointer to immutable node.
  using Ptr = boost::shared_ptr<const Hash_trie_node>;

  /// One branch slot: exactly one of #m_entry, #m_child is non-null.
  struct Slot
  {
    /// Full hash of `m_entry->first`, cached so deeper splits need not rehash; meaningless if #m_child.
    size_t m_hash;

    /// The entry stored directly in this slot; or null.
    Entry_ptr m_entry;

    /// The subtree for this hash chunk; or null.
    Ptr m_child;
  };

  // Data.

  /// `true` if and only if this is a collision node.
  bool m_collision;

  /// Branch only: which of the 32 hash chunks have a slot.
  uint32_t m_bitmap;

  /// Branch only: the slots; see class doc header.
  std::vector<Slot> m_slots;

  /// Collision only: the hash common to all of #m_collision_entries.
  size_t m_collision_hash;

  /// Collision only: the entries, at least 1 of them, with pairwise unequal keys.
  std::vector<Entry_ptr> m_collision_entries;

  // Methods.

  /**
   * Returns the slot index for the given hash chunk, assuming its bit is set.
   * @param bit
   *        `1 << chunk`.
   * @return See above.
   */
  size_t slot_idx(uint32_t bit) const;

  /**
   * Returns `true`, loading the entry and its hash, if and only if this node holds exactly one entry and nothing
   * else.  Used to pull lone entries up a level after removals.
   *
   * @param entry
   *        If `true` returned, set to the lone entry.
   * @param hash
   *        If `true` returned, set to its hash.
   * @return See above.
   */
  bool lone_entry(Entry_ptr* entry, size_t* hash) const;

  /**
   * Makes an empty branch node.
   * @return See above.
   */
  static Hash_trie_node make_branch();

  /**
   * Makes a collision node.
   * @param hash
   *        Common hash.
   * @param entries
   *        The entries.
   * @return See above.
   */
  static Hash_trie_node make_collision(size_t hash, std::vector<Entry_ptr>&& entries);
}; // struct Hash_trie_node

// Template implementations.

template<typename Value>
size_t Hash_trie_node<Value>::slot_idx(uint32_t bit) const
{
  return std::bitset<32>(m_bitmap & (bit - 1)).count();
}

template<typename Value>
bool Hash_trie_node<Value>::lone_entry(Entry_ptr* entry, size_t* hash) const
{
  if (m_collision)
  {
    if (m_collision_entries.size() != 1)
    {
      return false;
    }
    *entry = m_collision_entries.front();
    *hash = m_collision_hash;
    return true;
  }
  // else

  if ((m_slots.size() != 1) || (!m_slots.front().m_entry))
  {
    return false;
  }
  *entry = m_slots.front().m_entry;
  *hash = m_slots.front().m_hash;
  return true;
}

template<typename Value>
Hash_trie_node<Value> Hash_trie_node<Value>::make_branch() // Static.
{
  Hash_trie_node node;
  node.m_collision = false;
  node.m_bitmap = 0;
  node.m_collision_hash = 0;
  return node;
}

template<typename Value>
Hash_trie_node<Value> Hash_trie_node<Value>::make_collision(size_t hash, std::vector<Entry_ptr>&& entries) // Static.
{
  Hash_trie_node node;
  node.m_collision = true;
  node.m_bitmap = 0;
  node.m_collision_hash = hash;
  node.m_collision_entries = std::move(entries);
  return node;
}

} // namespace ordo::pmap
