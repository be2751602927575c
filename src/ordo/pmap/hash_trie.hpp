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

#include "ordo/pmap/detail/hash_trie_node.hpp"
#include <cassert>
#include <utility>

namespace ordo::pmap
{

/**
 * A persistent hash map: a hash array mapped trie (HAMT) of `std::pair<const Key, Mapped>` entries.
 *
 * The hash of a key is consumed #S_BITS_PER_LEVEL bits at a time, from the low end, one chunk per trie level;
 * each branch node holds a 32-bit bitmap of which chunks are present and a dense array of just those slots.
 * When two keys' hashes agree in all bits, they share a collision node at the bottom.  Lookups are thus
 * O(log<sub>32</sub> n) pointer hops; `assoc()`/`dissoc()` copy exactly the nodes on the root-to-entry path and share
 * everything else (including the entries themselves) with the source trie.
 *
 * The object itself is a small handle (root pointer, size, functors); copying it is O(1) and the copy shares all
 * nodes.  No operation modifies an existing node.
 *
 * ### Iterator and pointer stability ###
 * `const Value*` returned by find() remains valid as long as any Hash_trie (or Ordered_map) containing that entry
 * exists, not just `*this`.
 *
 * ### Thread safety ###
 * Any number of threads may call `const` methods concurrently, including on different Hash_trie objects sharing
 * nodes.  Non-`const` methods (assignment, swap) follow the usual rules for a value type.
 *
 * @tparam Key
 *         Key type.  Copy-constructible.
 * @tparam Mapped
 *         Mapped type.  Copy-constructible.
 * @tparam Hash
 *         Hasher type; `boost::hash<Key>` by default, so `hash_value(Key)` found via ADL is used for custom types.
 * @tparam Pred
 *         Key equality predicate type, consistent with `Hash`.
 */
template<typename Key, typename Mapped, typename Hash, typename Pred>
class Hash_trie
{
public:
  // Types.

  /// Short-hand for key/mapped-value pairs stored in the trie.
  using Value = std::pair<Key const, Mapped>;

  /// STL-style alias of #Key.
  using key_type = Key;
  /// STL-style alias of #Mapped.
  using mapped_type = Mapped;
  /// STL-style alias of #Value.
  using value_type = Value;
  /// STL-style alias of #Hash.
  using hasher = Hash;
  /// STL-style alias of #Pred.
  using key_equal = Pred;
  /// Type for index into trie and size.
  using size_type = std::size_t;

  // Constants.

  /// Number of hash bits consumed per trie level; hence up to 2^5 = 32 slots per branch node.
  static constexpr unsigned int S_BITS_PER_LEVEL = 5;

  // Constructors/destructor.

  /**
   * Constructs empty structure.
   *
   * @param hasher_instance
   *        Instance of the hash function type.
   * @param key_equal_instance
   *        Instance of the equality function type.
   */
  explicit Hash_trie(const Hash& hasher_instance = Hash(), const Pred& key_equal_instance = Pred());

  // Methods.

  /**
   * Returns pointer to the entry with key equal to the given key; or null if there is no such entry.
   *
   * @param key
   *        Key to look up.
   * @return See above.  See also class doc header regarding stability of the pointer.
   */
  const Value* find(const Key& key) const;

  /**
   * Returns `true` if and only if an entry with an equal key is present.
   *
   * @param key
   *        Key to look up.
   * @return See above.
   */
  bool contains(const Key& key) const;

  /**
   * Returns the mapped value for the given key, or `not_found` if there is no such entry.
   *
   * @param key
   *        Key to look up.
   * @param not_found
   *        Value to return if key is absent.
   * @return See above.
   */
  Mapped get(const Key& key, const Mapped& not_found) const;

  /**
   * Returns a trie equal to `*this` except that `key` maps to `mapped`: the entry is replaced if the key was
   * present, added otherwise.  `*this` is unchanged.
   *
   * @param key
   *        Key.
   * @param mapped
   *        Mapped value.
   * @param added
   *        If not null, set to `true` if the key was not present before (size grows by 1); `false` if it replaced
   *        an existing entry.
   * @return See above.
   */
  Hash_trie assoc(const Key& key, const Mapped& mapped, bool* added = 0) const;

  /**
   * Returns a trie equal to `*this` minus the entry for `key`, if any.  If there is no such entry, the result
   * shares `*this` root node exactly (see shares_root_with()) and nothing is allocated.  `*this` is unchanged.
   *
   * @param key
   *        Key.
   * @param removed
   *        If not null, set to `true` if an entry was removed; `false` otherwise.
   * @return See above.
   */
  Hash_trie dissoc(const Key& key, bool* removed = 0) const;

  /**
   * Number of entries.
   * @return Ditto.
   */
  size_type size() const;

  /**
   * Returns `true` if and only if size() is zero.
   * @return Ditto.
   */
  bool empty() const;

  /**
   * Invokes `func(const Value&)` for each entry, in unspecified (but, for a given trie, repeatable) order.
   *
   * @tparam Func
   *         Functor type.
   * @param func
   *        Functor.
   */
  template<typename Func>
  void for_each(const Func& func) const;

  /**
   * Returns `true` if and only if `*this` and `other` have the very same root node (or are both empty): a
   * sufficient, not necessary, condition for equal content.  Cheap identity test, mainly for tests.
   *
   * @param other
   *        Other trie.
   * @return See above.
   */
  bool shares_root_with(const Hash_trie& other) const;

  /**
   * Returns the hash function instance.
   * @return Ditto.
   */
  const Hash& hash_function() const;

  /**
   * Returns the key equality predicate instance.
   * @return Ditto.
   */
  const Pred& key_eq() const;

private:
  // Types.

  /// Short-hand for node type.
  using Node = Hash_trie_node<Value>;

  /// Short-hand for node pointer.
  using Node_ptr = typename Node::Ptr;

  /// Short-hand for entry pointer.
  using Entry_ptr = typename Node::Entry_ptr;

  /// Short-hand for branch slot.
  using Slot = typename Node::Slot;

  // Constants.

  /// Number of bits in a hash; once a path is this deep, the remaining distinct keys go in a collision node.
  static constexpr unsigned int S_HASH_BITS = sizeof(size_t) * 8;

  /// Mask for one hash chunk.
  static constexpr size_t S_CHUNK_MASK = (size_t(1) << S_BITS_PER_LEVEL) - 1;

  // Methods.

  /**
   * Returns the bitmap bit for the given hash at the given depth.
   *
   * @param hash
   *        Hash.
   * @param shift
   *        Depth, in bits consumed so far; less than #S_HASH_BITS.
   * @return See above.
   */
  static uint32_t chunk_bit(size_t hash, unsigned int shift);

  /**
   * Helper of assoc() operating on a sub-trie.
   *
   * @param node
   *        Sub-trie root; null means empty.
   * @param shift
   *        Depth of `node`, in bits.
   * @param hash
   *        Hash of `entry->first`.
   * @param entry
   *        New entry.
   * @param added
   *        Set to whether the key was new.
   * @return Root of new sub-trie.
   */
  Node_ptr assoc_in(const Node_ptr& node, unsigned int shift, size_t hash, const Entry_ptr& entry, bool* added) const;

  /**
   * Helper of dissoc() operating on a sub-trie.
   *
   * @param node
   *        Sub-trie root; not null.
   * @param shift
   *        Depth of `node`, in bits.
   * @param hash
   *        Hash of `key`.
   * @param key
   *        Key to remove.
   * @param removed
   *        Set to whether an entry was removed.
   * @return Root of new sub-trie: `node` itself if nothing was removed; null if it became empty.
   */
  Node_ptr dissoc_in(const Node_ptr& node, unsigned int shift, size_t hash, const Key& key, bool* removed) const;

  /**
   * Builds the smallest sub-trie holding the two given entries, whose keys differ.
   *
   * @param shift
   *        Depth of the sub-trie root.
   * @param entry1
   *        Entry.
   * @param hash1
   *        Its hash.
   * @param entry2
   *        Entry.
   * @param hash2
   *        Its hash.
   * @return See above.
   */
  static Node_ptr make_pair_node(unsigned int shift,
                                 const Entry_ptr& entry1, size_t hash1, const Entry_ptr& entry2, size_t hash2);

  /**
   * Helper of for_each().
   *
   * @tparam Func
   *         See for_each().
   * @param node
   *        Sub-trie root; not null.
   * @param func
   *        See for_each().
   */
  template<typename Func>
  static void for_each_in(const Node& node, const Func& func);

  // Data.

  /// Root node; null if and only if empty.
  Node_ptr m_root;

  /// Number of entries.
  size_type m_size;

  /// Hasher.
  Hash m_hasher;

  /// Key equality predicate.
  Pred m_pred;
}; // class Hash_trie

// Template implementations.

template<typename Key, typename Mapped, typename Hash, typename Pred>
Hash_trie<Key, Mapped, Hash, Pred>::Hash_trie(const Hash& hasher_instance, const Pred& key_equal_instance) :
  m_size(0),
  m_hasher(hasher_instance),
  m_pred(key_equal_instance)
{
  // Nothing.
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
uint32_t Hash_trie<Key, Mapped, Hash, Pred>::chunk_bit(size_t hash, unsigned int shift) // Static.
{
  assert(shift < S_HASH_BITS);
  return uint32_t(1) << ((hash >> shift) & S_CHUNK_MASK);
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
typename Hash_trie<Key, Mapped, Hash, Pred>::Value const *
  Hash_trie<Key, Mapped, Hash, Pred>::find(const Key& key) const
{
  if (!m_root)
  {
    return 0;
  }
  // else

  const size_t hash = m_hasher(key);
  const Node* node = m_root.get();
  for (unsigned int shift = 0; ; shift += S_BITS_PER_LEVEL)
  {
    if (node->m_collision)
    {
      if (node->m_collision_hash == hash)
      {
        for (const auto& entry : node->m_collision_entries)
        {
          if (m_pred(entry->first, key))
          {
            return entry.get();
          }
        }
      }
      return 0;
    }
    // else

    const uint32_t bit = chunk_bit(hash, shift);
    if (!(node->m_bitmap & bit))
    {
      return 0;
    }
    // else
    const Slot& slot = node->m_slots[node->slot_idx(bit)];
    if (slot.m_child)
    {
      node = slot.m_child.get();
      continue;
    }
    // else
    return ((slot.m_hash == hash) && m_pred(slot.m_entry->first, key)) ? slot.m_entry.get() : 0;
  }
} // Hash_trie::find()

template<typename Key, typename Mapped, typename Hash, typename Pred>
bool Hash_trie<Key, Mapped, Hash, Pred>::contains(const Key& key) const
{
  return find(key);
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
Mapped Hash_trie<Key, Mapped, Hash, Pred>::get(const Key& key, const Mapped& not_found) const
{
  const auto entry = find(key);
  return entry ? entry->second : not_found;
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
Hash_trie<Key, Mapped, Hash, Pred>
  Hash_trie<Key, Mapped, Hash, Pred>::assoc(const Key& key, const Mapped& mapped, bool* added) const
{
  const Entry_ptr entry = boost::make_shared<Value>(key, mapped);
  bool was_added;

  Hash_trie result(*this);
  result.m_root = assoc_in(m_root, 0, m_hasher(key), entry, &was_added);
  if (was_added)
  {
    ++result.m_size;
  }

  if (added)
  {
    *added = was_added;
  }
  return result;
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
typename Hash_trie<Key, Mapped, Hash, Pred>::Node_ptr
  Hash_trie<Key, Mapped, Hash, Pred>::assoc_in(const Node_ptr& node, unsigned int shift, size_t hash,
                                               const Entry_ptr& entry, bool* added) const
{
  if (!node)
  {
    // Empty trie: the root is a branch with a single entry slot.
    Node new_node = Node::make_branch();
    new_node.m_bitmap = chunk_bit(hash, shift);
    new_node.m_slots.push_back(Slot{ hash, entry, Node_ptr() });
    *added = true;
    return boost::make_shared<Node>(std::move(new_node));
  }
  // else

  if (node->m_collision)
  {
    // We only get here having matched every hash bit on the way down.
    assert(node->m_collision_hash == hash);

    auto entries = node->m_collision_entries; // Copies pointers only.
    *added = true;
    for (auto& existing : entries)
    {
      if (m_pred(existing->first, entry->first))
      {
        existing = entry;
        *added = false;
        break;
      }
    }
    if (*added)
    {
      entries.push_back(entry);
    }
    return boost::make_shared<Node>(Node::make_collision(hash, std::move(entries)));
  }
  // else

  const uint32_t bit = chunk_bit(hash, shift);
  const size_t idx = node->slot_idx(bit);
  Node new_node(*node); // The path copy: the slot array is copied, but its pointees are shared.

  if (!(node->m_bitmap & bit))
  {
    new_node.m_bitmap |= bit;
    new_node.m_slots.insert(new_node.m_slots.begin() + idx, Slot{ hash, entry, Node_ptr() });
    *added = true;
  }
  else
  {
    Slot& slot = new_node.m_slots[idx];
    if (slot.m_child)
    {
      slot.m_child = assoc_in(slot.m_child, shift + S_BITS_PER_LEVEL, hash, entry, added);
    }
    else if ((slot.m_hash == hash) && m_pred(slot.m_entry->first, entry->first))
    {
      slot.m_entry = entry;
      *added = false;
    }
    else
    {
      // Two distinct keys in one slot: push both down a level (or more, while their chunks keep agreeing).
      slot.m_child = make_pair_node(shift + S_BITS_PER_LEVEL, slot.m_entry, slot.m_hash, entry, hash);
      slot.m_entry.reset();
      slot.m_hash = 0;
      *added = true;
    }
  }

  return boost::make_shared<Node>(std::move(new_node));
} // Hash_trie::assoc_in()

template<typename Key, typename Mapped, typename Hash, typename Pred>
typename Hash_trie<Key, Mapped, Hash, Pred>::Node_ptr
  Hash_trie<Key, Mapped, Hash, Pred>::make_pair_node(unsigned int shift,
                                                     const Entry_ptr& entry1, size_t hash1,
                                                     const Entry_ptr& entry2, size_t hash2) // Static.
{
  if (shift >= S_HASH_BITS)
  {
    assert(hash1 == hash2);
    return boost::make_shared<Node>(Node::make_collision(hash1, { entry1, entry2 }));
  }
  // else

  const uint32_t bit1 = chunk_bit(hash1, shift);
  const uint32_t bit2 = chunk_bit(hash2, shift);
  Node new_node = Node::make_branch();
  new_node.m_bitmap = bit1 | bit2;

  if (bit1 == bit2)
  {
    new_node.m_slots.push_back
      (Slot{ 0, Entry_ptr(), make_pair_node(shift + S_BITS_PER_LEVEL, entry1, hash1, entry2, hash2) });
  }
  else if (bit1 < bit2)
  {
    new_node.m_slots.push_back(Slot{ hash1, entry1, Node_ptr() });
    new_node.m_slots.push_back(Slot{ hash2, entry2, Node_ptr() });
  }
  else
  {
    new_node.m_slots.push_back(Slot{ hash2, entry2, Node_ptr() });
    new_node.m_slots.push_back(Slot{ hash1, entry1, Node_ptr() });
  }

  return boost::make_shared<Node>(std::move(new_node));
} // Hash_trie::make_pair_node()

template<typename Key, typename Mapped, typename Hash, typename Pred>
Hash_trie<Key, Mapped, Hash, Pred> Hash_trie<Key, Mapped, Hash, Pred>::dissoc(const Key& key, bool* removed) const
{
  bool was_removed = false;
  Hash_trie result(*this);

  if (m_root)
  {
    result.m_root = dissoc_in(m_root, 0, m_hasher(key), key, &was_removed);
    if (was_removed)
    {
      --result.m_size;
    }
  }

  if (removed)
  {
    *removed = was_removed;
  }
  return result;
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
typename Hash_trie<Key, Mapped, Hash, Pred>::Node_ptr
  Hash_trie<Key, Mapped, Hash, Pred>::dissoc_in(const Node_ptr& node, unsigned int shift, size_t hash,
                                                const Key& key, bool* removed) const
{
  *removed = false;

  if (node->m_collision)
  {
    const auto& entries = node->m_collision_entries;
    size_t idx = 0;
    while ((idx != entries.size()) && (!m_pred(entries[idx]->first, key)))
    {
      ++idx;
    }
    if ((node->m_collision_hash != hash) || (idx == entries.size()))
    {
      return node;
    }
    // else
    *removed = true;
    if (entries.size() == 1)
    {
      return Node_ptr();
    }
    // else
    auto new_entries = entries;
    new_entries.erase(new_entries.begin() + idx);
    return boost::make_shared<Node>(Node::make_collision(hash, std::move(new_entries)));
  }
  // else

  const uint32_t bit = chunk_bit(hash, shift);
  if (!(node->m_bitmap & bit))
  {
    return node;
  }
  // else

  const size_t idx = node->slot_idx(bit);
  const Slot& slot = node->m_slots[idx];

  if (slot.m_child)
  {
    const Node_ptr new_child = dissoc_in(slot.m_child, shift + S_BITS_PER_LEVEL, hash, key, removed);
    if (!*removed)
    {
      return node;
    }
    // else

    Node new_node(*node);
    Entry_ptr lone_entry;
    size_t lone_hash;
    if (!new_child)
    {
      new_node.m_slots.erase(new_node.m_slots.begin() + idx);
      new_node.m_bitmap &= ~bit;
    }
    else if (new_child->lone_entry(&lone_entry, &lone_hash))
    {
      // Keep the trie canonical: a sub-trie holding one entry collapses into a plain entry slot.
      new_node.m_slots[idx] = Slot{ lone_hash, lone_entry, Node_ptr() };
    }
    else
    {
      new_node.m_slots[idx].m_child = new_child;
    }

    if (new_node.m_slots.empty())
    {
      return Node_ptr();
    }
    // else
    return boost::make_shared<Node>(std::move(new_node));
  }
  // else

  if (!((slot.m_hash == hash) && m_pred(slot.m_entry->first, key)))
  {
    return node;
  }
  // else

  *removed = true;
  if (node->m_slots.size() == 1)
  {
    return Node_ptr();
  }
  // else

  Node new_node(*node);
  new_node.m_slots.erase(new_node.m_slots.begin() + idx);
  new_node.m_bitmap &= ~bit;
  return boost::make_shared<Node>(std::move(new_node));
} // Hash_trie::dissoc_in()

template<typename Key, typename Mapped, typename Hash, typename Pred>
typename Hash_trie<Key, Mapped, Hash, Pred>::size_type Hash_trie<Key, Mapped, Hash, Pred>::size() const
{
  return m_size;
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
bool Hash_trie<Key, Mapped, Hash, Pred>::empty() const
{
  return m_size == 0;
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
template<typename Func>
void Hash_trie<Key, Mapped, Hash, Pred>::for_each(const Func& func) const
{
  if (m_root)
  {
    for_each_in(*m_root, func);
  }
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
template<typename Func>
void Hash_trie<Key, Mapped, Hash, Pred>::for_each_in(const Node& node, const Func& func) // Static.
{
  if (node.m_collision)
  {
    for (const auto& entry : node.m_collision_entries)
    {
      func(*entry);
    }
    return;
  }
  // else

  for (const auto& slot : node.m_slots)
  {
    if (slot.m_child)
    {
      for_each_in(*slot.m_child, func);
    }
    else
    {
      func(*slot.m_entry);
    }
  }
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
bool Hash_trie<Key, Mapped, Hash, Pred>::shares_root_with(const Hash_trie& other) const
{
  return m_root == other.m_root;
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
const Hash& Hash_trie<Key, Mapped, Hash, Pred>::hash_function() const
{
  return m_hasher;
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
const Pred& Hash_trie<Key, Mapped, Hash, Pred>::key_eq() const
{
  return m_pred;
}

} // namespace ordo::pmap
