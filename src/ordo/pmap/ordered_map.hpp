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

#include "ordo/pmap/hash_trie.hpp"
#include "ordo/pmap/seq_tree.hpp"
#include "ordo/pmap/error/error.hpp"
#include "ordo/error/error.hpp"
#include "ordo/log/log.hpp"
#include <boost/any.hpp>
#include <boost/functional/hash.hpp>
#include <initializer_list>
#include <ostream>
#include <type_traits>
#include <vector>

namespace ordo::pmap
{

// Types.

/**
 * Forward iterator over the entries of an Ordered_map in (ascending or descending) insertion order.  Walks the
 * map's ordering index and resolves each key to its entry in the map's base store.
 *
 * Valid as long as the Ordered_map it came from exists (a copy of the map does not suffice, as the iterator
 * points into the particular map object's base store handle).
 *
 * @tparam Base_store
 *         The Ordered_map's Hash_trie type.
 * @tparam Seq_iterator
 *         The Seq_tree iterator type (ascending or descending).
 */
template<typename Base_store, typename Seq_iterator>
class Ordered_map_iterator
{
public:
  // Types.

  /// For iterator compliance (hence the irregular capitalization).
  using iterator_category = std::forward_iterator_tag;
  /// For iterator compliance (hence the irregular capitalization).
  using value_type = typename Base_store::Value;
  /// For iterator compliance (hence the irregular capitalization).
  using difference_type = std::ptrdiff_t;
  /// For iterator compliance (hence the irregular capitalization).
  using pointer = const value_type*;
  /// For iterator compliance (hence the irregular capitalization).
  using reference = const value_type&;

  // Constructors/destructor.

  /// Constructs a singular iterator, usable only as an assignment target.
  Ordered_map_iterator();

  /**
   * Constructs iterator.
   *
   * @param base
   *        The map's base store.
   * @param seq_it
   *        Position in the map's ordering index.
   */
  explicit Ordered_map_iterator(const Base_store* base, const Seq_iterator& seq_it);

  // Methods.

  /**
   * Current entry.  Behavior undefined if past-the-end.
   * @return Ditto.
   */
  reference operator*() const;

  /**
   * Current entry.  Behavior undefined if past-the-end.
   * @return Ditto.
   */
  pointer operator->() const;

  /**
   * Sequence number of the current entry.  Behavior undefined if past-the-end.
   * @return Ditto.
   */
  seq_num_t seq_num() const;

  /**
   * Advances to the next entry.
   * @return `*this`.
   */
  Ordered_map_iterator& operator++();

  /**
   * Post-increment.
   * @return Copy of `*this` before advancing.
   */
  Ordered_map_iterator operator++(int);

  /**
   * Returns `true` if and only if the two iterators are at the same position.
   *
   * @param other
   *        Other iterator.
   * @return See above.
   */
  bool operator==(const Ordered_map_iterator& other) const;

  /**
   * Negation of `==`.
   *
   * @param other
   *        Other iterator.
   * @return See above.
   */
  bool operator!=(const Ordered_map_iterator& other) const;

private:
  // Data.

  /// The map's base store.
  const Base_store* m_base;

  /// Position in the ordering index.
  Seq_iterator m_seq_it;
}; // class Ordered_map_iterator

/**
 * A self-contained, restartable range over an Ordered_map's entries, holding its own (O(1)) copy of the map; so it
 * remains valid however long it is kept, regardless of the source map.  Returned by Ordered_map::seq() and
 * Ordered_map::rseq().
 *
 * @tparam Map
 *         The Ordered_map type.
 * @tparam ASCENDING
 *         `true` for insertion order; `false` for its reverse.
 */
template<typename Map, bool ASCENDING>
class Ordered_map_range
{
public:
  // Types.

  /// Iterator type.
  using Const_iterator = std::conditional_t<ASCENDING,
                                            typename Map::Const_iterator, typename Map::Const_reverse_iterator>;

  /// STL-style alias of #Const_iterator.
  using const_iterator = Const_iterator;
  /// STL-style alias of #Const_iterator.
  using iterator = Const_iterator;

  // Constructors/destructor.

  /**
   * Constructs the range.
   *
   * @param map
   *        Map to copy.
   */
  explicit Ordered_map_range(const Map& map);

  // Methods.

  /**
   * Iterator to the first entry in range order.
   * @return Ditto.
   */
  Const_iterator begin() const;

  /**
   * Past-the-end iterator.
   * @return Ditto.
   */
  Const_iterator end() const;

  /**
   * Number of entries.
   * @return Ditto.
   */
  size_t size() const;

  /**
   * Returns `true` if and only if size() is zero.
   * @return Ditto.
   */
  bool empty() const;

private:
  // Data.

  /// The map snapshot.
  const Map m_map;
}; // class Ordered_map_range

/**
 * A persistent key/value map that remembers insertion order: iteration yields entries in the order their keys were
 * first associated, while lookup and update cost about as much as in a persistent hash map.
 *
 * The API is that of an immutable associative container.  Every "modifying" method -- assoc(), conj(), dissoc(),
 * with_metadata() -- is `const`, leaves `*this` untouched and returns the modified map; the result shares nearly all
 * of its structure with `*this`.  Copying is O(1).
 *
 * Order semantics:
 *   - A key associated for the first time is given the next sequence number (next_seq_num()) and goes to the end of
 *     the iteration order.
 *   - Re-associating a present key replaces its value and keeps its position.
 *   - Dissociating a key removes it; its sequence number is never reused in this map's lineage, so re-associating the
 *     key later puts it at the end.
 *
 * Iteration: begin()/end() (so `for (const auto& entry : map)`) and seq() give insertion order; rbegin()/rend() and
 * rseq() give exactly the reverse.  nth() looks an entry up by raw sequence number.
 *
 * Equality (`==`) and hash_value() consider only the set of (key, value) pairs: two maps with the same content built
 * in different orders are equal and hash equally, though they iterate differently.  Metadata (with_metadata()) and
 * the logger never matter to equality, hashing or order.
 *
 * Performance: lookup, assoc() and dissoc() are O(log<sub>32</sub> n) in the hash tries plus O(log n) in the ordering
 * tree; a full iteration is O(n).
 *
 * ### Thread safety ###
 * Any number of threads may concurrently call `const` methods on one Ordered_map or on maps sharing structure.
 * Assignment and swap() are not safe concurrently with other access to the same object (as for any value type).
 *
 * ### Logging ###
 * A map constructed with a non-null Logger logs (via ordo::log, component `S_PMAP`) at TRACE on each structural
 * change, and a WARNING on each error emitted; derived maps inherit the Logger.  Keys and values are never logged,
 * so they need not be streamable.
 *
 * @internal
 * ### Impl notes ###
 * Three persistent structures, kept consistent by every method that derives a new map:
 *   - #m_base: key -> mapped value (Hash_trie).  Authoritative for content.
 *   - #m_ordering: sequence number -> key (Seq_tree).  Authoritative for order.
 *   - #m_reverse: key -> sequence number (Hash_trie).  Lets dissoc() find what to remove from #m_ordering.
 *
 * All three always have the same size; `m_reverse[k] == s` if and only if `m_ordering[s] == k`; and every such `s`
 * is below #m_next_seq_num.
 *
 * @tparam Key
 *         Key type.  Copy-constructible; hashable by `Hash`; comparable by `Pred`.
 * @tparam Mapped
 *         Mapped value type.  Copy-constructible.
 * @tparam Hash
 *         Hasher type; see Hash_trie.
 * @tparam Pred
 *         Key equality predicate type; see Hash_trie.
 */
template<typename Key, typename Mapped, typename Hash, typename Pred>
class Ordered_map :
  public log::Log_context
{
public:
  // Types.

  /// Short-hand for key/mapped-value pairs stored in the map.
  using Value = std::pair<Key const, Mapped>;

  /// The base store type: key -> mapped value.
  using Base_store = Hash_trie<Key, Mapped, Hash, Pred>;

  /// The ordering index type: sequence number -> key.
  using Ordering_index = Seq_tree<Key>;

  /// The reverse index type: key -> sequence number.
  using Reverse_index = Hash_trie<Key, seq_num_t, Hash, Pred>;

  /// Iterator in insertion order.
  using Const_iterator = Ordered_map_iterator<Base_store, typename Ordering_index::Const_iterator>;

  /// Iterator in reverse insertion order.
  using Const_reverse_iterator = Ordered_map_iterator<Base_store, typename Ordering_index::Const_reverse_iterator>;

  /// Range type returned by seq().
  using Entry_range = Ordered_map_range<Ordered_map, true>;

  /// Range type returned by rseq().
  using Reverse_entry_range = Ordered_map_range<Ordered_map, false>;

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
  /// STL-style alias of #Const_iterator.
  using const_iterator = Const_iterator;
  /// STL-style alias of #Const_iterator.
  using iterator = Const_iterator;
  /// STL-style alias of #Const_reverse_iterator.
  using const_reverse_iterator = Const_reverse_iterator;
  /// STL-style alias of #Const_reverse_iterator.
  using reverse_iterator = Const_reverse_iterator;
  /// STL-style alias of #Value.
  using const_reference = const Value&;
  /// Type for size.
  using size_type = std::size_t;

  // Constructors/destructor.

  /**
   * Constructs empty map.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging; this and all maps derived from `*this` log to it.  Null
   *        disables logging.
   */
  explicit Ordered_map(log::Logger* logger_ptr = 0);

  /**
   * Constructs map by associating the given pairs in order, as if by repeated assoc() starting from empty: a
   * repeated key keeps its first position and takes the last value.
   *
   * @param values
   *        Key/value pairs.
   * @param logger_ptr
   *        See other constructor.
   */
  Ordered_map(std::initializer_list<Value> values, log::Logger* logger_ptr = 0);

  // Methods.

  /**
   * The canonical empty map, with no Logger: a shared constant.
   *
   * @return See above.
   */
  static const Ordered_map& empty_map();

  /**
   * Returns pointer to the entry with the given key, or null if absent.  The pointer remains valid as long as any
   * map containing the entry exists.
   *
   * @param key
   *        Key.
   * @return See above.
   */
  const Value* find(const Key& key) const;

  /**
   * Returns `true` if and only if `key` is present.
   *
   * @param key
   *        Key.
   * @return See above.
   */
  bool contains(const Key& key) const;

  /**
   * Returns 1 if `key` is present, else 0.
   *
   * @param key
   *        Key.
   * @return See above.
   */
  size_type count(const Key& key) const;

  /**
   * Returns the value mapped to `key`; or `not_found` if absent.
   *
   * @param key
   *        Key.
   * @param not_found
   *        Value to return if `key` is absent.
   * @return See above.
   */
  Mapped get(const Key& key, const Mapped& not_found) const;

  /**
   * Identical to get(), letting the map be used as a function from key to value.
   *
   * @param key
   *        Key.
   * @param not_found
   *        Value to return if `key` is absent.
   * @return See above.
   */
  Mapped operator()(const Key& key, const Mapped& not_found) const;

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
   * Returns a map equal to `*this` but with `key` mapped to `mapped`.  If `key` is present, only its value changes;
   * its position in the order is kept.  Otherwise it is appended at the end, with sequence number next_seq_num().
   *
   * @param key
   *        Key.
   * @param mapped
   *        Value.
   * @return See above.
   */
  Ordered_map assoc(const Key& key, const Mapped& mapped) const;

  /**
   * Equivalent to `assoc(entry.first, entry.second)`.
   *
   * @param entry
   *        Key/value pair.
   * @return See above.
   */
  Ordered_map conj(const Value& entry) const;

  /**
   * Returns a map equal to `*this` minus the entry for `key`.  If `key` is absent, the result is a copy of `*this`
   * sharing all of its structure (nothing is allocated).  next_seq_num() is unchanged either way.
   *
   * @param key
   *        Key.
   * @return See above.
   */
  Ordered_map dissoc(const Key& key) const;

  /**
   * Returns pointer to the entry whose key was assigned sequence number `i`.  Sequence numbers are assigned
   * 0, 1, 2, ... in insertion order and never reassigned; so, absent removals, this is the `i`-th entry in
   * iteration order.  The lookup fails if `i >= size()`, or if the key given `i` has since been dissociated.
   * The latter, a gap below size(), fails exactly like an out-of-range `i`: no empty or default entry stands in
   * for the removed one.  To get a fallback entry instead, use nth() with `not_found`.
   *
   * @param i
   *        Sequence number.
   * @param err_code
   *        See ordo::Error_code docs for error reporting semantics.  error::Code generated:
   *        error::Code::S_INDEX_OUT_OF_RANGE.
   * @return Pointer to the entry (valid as long as any map containing it exists); null on error.
   */
  const Value* find_nth(seq_num_t i, Error_code* err_code = 0) const;

  /**
   * Returns the entry whose key was assigned sequence number `i`, as in find_nth(); throws error::Runtime_error
   * with error::Code::S_INDEX_OUT_OF_RANGE on failure, including when `i` is a gap left by a removal.
   *
   * @param i
   *        Sequence number.
   * @return See above.
   */
  const Value& nth(seq_num_t i) const;

  /**
   * Returns a copy of the entry whose key was assigned sequence number `i`, as in find_nth(); or `not_found` if
   * there is none.
   *
   * @param i
   *        Sequence number.
   * @param not_found
   *        Value to return on failure.
   * @return See above.
   */
  Value nth(seq_num_t i, const Value& not_found) const;

  /**
   * Returns a range over the entries in insertion order.  The range holds its own copy of the map, so it may
   * outlive `*this`; it can be iterated any number of times.
   *
   * @return See above.
   */
  Entry_range seq() const;

  /**
   * Returns a range over the entries in reverse insertion order; exactly the reverse of seq().
   *
   * @return See above.
   */
  Reverse_entry_range rseq() const;

  /**
   * Iterator to the earliest inserted entry; end() if empty().
   * @return Ditto.
   */
  Const_iterator begin() const;

  /**
   * Past-the-end iterator.
   * @return Ditto.
   */
  Const_iterator end() const;

  /**
   * Synonym of begin().
   * @return Ditto.
   */
  Const_iterator cbegin() const;

  /**
   * Synonym of end().
   * @return Ditto.
   */
  Const_iterator cend() const;

  /**
   * Iterator to the latest inserted entry; rend() if empty().
   * @return Ditto.
   */
  Const_reverse_iterator rbegin() const;

  /**
   * Past-the-end reverse iterator.
   * @return Ditto.
   */
  Const_reverse_iterator rend() const;

  /**
   * Returns a map equal to `*this` except that its metadata is `metadata`.  Metadata never affects equality,
   * hashing or order; it is carried along into maps derived via assoc(), dissoc() and so on.
   *
   * @param metadata
   *        Arbitrary value; an empty `any` removes metadata.
   * @return See above.
   */
  Ordered_map with_metadata(const boost::any& metadata) const;

  /**
   * The metadata; an empty `any` if none.
   * @return Ditto.
   */
  const boost::any& metadata() const;

  /**
   * Returns `true` if and only if metadata is set and not empty.
   * @return Ditto.
   */
  bool has_metadata() const;

  /**
   * Left fold over the entries in insertion order: `acc = func(acc, key, mapped)` for each entry, starting with
   * `init`.
   *
   * @tparam Func
   *         Functor type: `T (T, const Key&, const Mapped&)`.
   * @tparam T
   *         Accumulator type.
   * @param func
   *        Functor.
   * @param init
   *        Initial accumulator.
   * @return Final accumulator.
   */
  template<typename Func, typename T>
  T reduce_kv(const Func& func, T init) const;

  /**
   * The keys, in insertion order.
   * @return Ditto.
   */
  std::vector<Key> keys() const;

  /**
   * The values, in insertion order.
   * @return Ditto.
   */
  std::vector<Mapped> values() const;

  /**
   * Returns `true` if and only if some entry's value equals `mapped`.  Linear time.
   *
   * @param mapped
   *        Value to look for.
   * @return See above.
   */
  bool contains_value(const Mapped& mapped) const;

  /**
   * The base store (key -> value).
   * @return Ditto.
   */
  const Base_store& base_store() const;

  /**
   * The ordering index (sequence number -> key).
   * @return Ditto.
   */
  const Ordering_index& ordering_index() const;

  /**
   * The reverse index (key -> sequence number).
   * @return Ditto.
   */
  const Reverse_index& reverse_index() const;

  /**
   * The sequence number the next new key would get; one past the highest ever assigned in this map's lineage.
   * @return Ditto.
   */
  seq_num_t next_seq_num() const;

  /**
   * Swaps the contents of this structure and `other`, including the Logger.  Constant-time.
   *
   * @param other
   *        Other map.
   */
  void swap(Ordered_map& other);

private:
  // Types.

  /// Short-hand for the metadata holder.
  using Metadata_ptr = boost::shared_ptr<const boost::any>;

  // Methods.

  /**
   * Shared implementation of find_nth() and the non-throwing nth(): the lookup alone, without logging.
   *
   * @param i
   *        Sequence number.
   * @return Entry pointer or null.
   */
  const Value* lookup_nth(seq_num_t i) const;

  // Data.

  /// Key -> mapped value.
  Base_store m_base;

  /// Sequence number -> key.
  Ordering_index m_ordering;

  /// Key -> sequence number.
  Reverse_index m_reverse;

  /// See next_seq_num().
  seq_num_t m_next_seq_num;

  /// See metadata(); null if never set.
  Metadata_ptr m_metadata;
}; // class Ordered_map

// Free functions: in *_fwd.hpp.

// Template implementations.

template<typename Base_store, typename Seq_iterator>
Ordered_map_iterator<Base_store, Seq_iterator>::Ordered_map_iterator() :
  m_base(0)
{
  // Nothing.
}

template<typename Base_store, typename Seq_iterator>
Ordered_map_iterator<Base_store, Seq_iterator>::Ordered_map_iterator(const Base_store* base,
                                                                     const Seq_iterator& seq_it) :
  m_base(base),
  m_seq_it(seq_it)
{
  // Nothing.
}

template<typename Base_store, typename Seq_iterator>
typename Ordered_map_iterator<Base_store, Seq_iterator>::reference
  Ordered_map_iterator<Base_store, Seq_iterator>::operator*() const
{
  const auto entry = m_base->find(m_seq_it->second);
  assert(entry && "Ordering index names a key missing from the base store.");
  return *entry;
}

template<typename Base_store, typename Seq_iterator>
typename Ordered_map_iterator<Base_store, Seq_iterator>::pointer
  Ordered_map_iterator<Base_store, Seq_iterator>::operator->() const
{
  return &(operator*());
}

template<typename Base_store, typename Seq_iterator>
seq_num_t Ordered_map_iterator<Base_store, Seq_iterator>::seq_num() const
{
  return m_seq_it->first;
}

template<typename Base_store, typename Seq_iterator>
Ordered_map_iterator<Base_store, Seq_iterator>& Ordered_map_iterator<Base_store, Seq_iterator>::operator++()
{
  ++m_seq_it;
  return *this;
}

template<typename Base_store, typename Seq_iterator>
Ordered_map_iterator<Base_store, Seq_iterator> Ordered_map_iterator<Base_store, Seq_iterator>::operator++(int)
{
  Ordered_map_iterator result(*this);
  ++m_seq_it;
  return result;
}

template<typename Base_store, typename Seq_iterator>
bool Ordered_map_iterator<Base_store, Seq_iterator>::operator==(const Ordered_map_iterator& other) const
{
  return m_seq_it == other.m_seq_it;
}

template<typename Base_store, typename Seq_iterator>
bool Ordered_map_iterator<Base_store, Seq_iterator>::operator!=(const Ordered_map_iterator& other) const
{
  return m_seq_it != other.m_seq_it;
}

template<typename Map, bool ASCENDING>
Ordered_map_range<Map, ASCENDING>::Ordered_map_range(const Map& map) :
  m_map(map)
{
  // Nothing.
}

template<typename Map, bool ASCENDING>
typename Ordered_map_range<Map, ASCENDING>::Const_iterator Ordered_map_range<Map, ASCENDING>::begin() const
{
  if constexpr(ASCENDING)
  {
    return m_map.begin();
  }
  else
  {
    return m_map.rbegin();
  }
}

template<typename Map, bool ASCENDING>
typename Ordered_map_range<Map, ASCENDING>::Const_iterator Ordered_map_range<Map, ASCENDING>::end() const
{
  if constexpr(ASCENDING)
  {
    return m_map.end();
  }
  else
  {
    return m_map.rend();
  }
}

template<typename Map, bool ASCENDING>
size_t Ordered_map_range<Map, ASCENDING>::size() const
{
  return m_map.size();
}

template<typename Map, bool ASCENDING>
bool Ordered_map_range<Map, ASCENDING>::empty() const
{
  return m_map.empty();
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
Ordered_map<Key, Mapped, Hash, Pred>::Ordered_map(log::Logger* logger_ptr) :
  log::Log_context(logger_ptr, Ordo_log_component::S_PMAP),
  m_next_seq_num(0)
{
  // Nothing.
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
Ordered_map<Key, Mapped, Hash, Pred>::Ordered_map(std::initializer_list<Value> values, log::Logger* logger_ptr) :
  Ordered_map(logger_ptr)
{
  for (const auto& value : values)
  {
    *this = assoc(value.first, value.second);
  }
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
const Ordered_map<Key, Mapped, Hash, Pred>& Ordered_map<Key, Mapped, Hash, Pred>::empty_map() // Static.
{
  static const Ordered_map S_EMPTY;
  return S_EMPTY;
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
typename Ordered_map<Key, Mapped, Hash, Pred>::Value const *
  Ordered_map<Key, Mapped, Hash, Pred>::find(const Key& key) const
{
  return m_base.find(key);
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
bool Ordered_map<Key, Mapped, Hash, Pred>::contains(const Key& key) const
{
  return m_base.contains(key);
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
typename Ordered_map<Key, Mapped, Hash, Pred>::size_type
  Ordered_map<Key, Mapped, Hash, Pred>::count(const Key& key) const
{
  return contains(key) ? 1 : 0;
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
Mapped Ordered_map<Key, Mapped, Hash, Pred>::get(const Key& key, const Mapped& not_found) const
{
  return m_base.get(key, not_found);
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
Mapped Ordered_map<Key, Mapped, Hash, Pred>::operator()(const Key& key, const Mapped& not_found) const
{
  return get(key, not_found);
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
typename Ordered_map<Key, Mapped, Hash, Pred>::size_type Ordered_map<Key, Mapped, Hash, Pred>::size() const
{
  return m_base.size();
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
bool Ordered_map<Key, Mapped, Hash, Pred>::empty() const
{
  return m_base.empty();
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
Ordered_map<Key, Mapped, Hash, Pred>
  Ordered_map<Key, Mapped, Hash, Pred>::assoc(const Key& key, const Mapped& mapped) const
{
  bool added;
  Ordered_map result(*this);
  result.m_base = m_base.assoc(key, mapped, &added);

  if (!added)
  {
    ORDO_LOG_TRACE("Ordered_map [" << this << "]: Replaced value of existing key; "
                   "size stays [" << result.size() << "].");
    return result;
  }
  // else: New key: it goes at the end.

  result.m_ordering = m_ordering.insert(m_next_seq_num, key);
  result.m_reverse = m_reverse.assoc(key, m_next_seq_num);
  ++result.m_next_seq_num;

  assert(result.m_ordering.size() == result.m_base.size());
  assert(result.m_reverse.size() == result.m_base.size());

  ORDO_LOG_TRACE("Ordered_map [" << this << "]: Appended new key at sequence number [" << m_next_seq_num << "]; "
                 "size now [" << result.size() << "].");
  return result;
} // Ordered_map::assoc()

template<typename Key, typename Mapped, typename Hash, typename Pred>
Ordered_map<Key, Mapped, Hash, Pred> Ordered_map<Key, Mapped, Hash, Pred>::conj(const Value& entry) const
{
  return assoc(entry.first, entry.second);
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
Ordered_map<Key, Mapped, Hash, Pred> Ordered_map<Key, Mapped, Hash, Pred>::dissoc(const Key& key) const
{
  const auto seq_entry = m_reverse.find(key);
  if (!seq_entry)
  {
    return *this;
  }
  // else

  const seq_num_t seq = seq_entry->second;
  Ordered_map result(*this);
  result.m_base = m_base.dissoc(key);
  result.m_ordering = m_ordering.remove(seq);
  result.m_reverse = m_reverse.dissoc(key);

  assert(result.m_ordering.size() == result.m_base.size());
  assert(result.m_reverse.size() == result.m_base.size());

  ORDO_LOG_TRACE("Ordered_map [" << this << "]: Removed key with sequence number [" << seq << "]; "
                 "size now [" << result.size() << "]; next sequence number stays [" << m_next_seq_num << "].");
  return result;
} // Ordered_map::dissoc()

template<typename Key, typename Mapped, typename Hash, typename Pred>
typename Ordered_map<Key, Mapped, Hash, Pred>::Value const *
  Ordered_map<Key, Mapped, Hash, Pred>::lookup_nth(seq_num_t i) const
{
  if (i >= size())
  {
    return 0;
  }
  // else
  const auto key = m_ordering.at(i);
  return key ? m_base.find(*key) : 0;
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
typename Ordered_map<Key, Mapped, Hash, Pred>::Value const *
  Ordered_map<Key, Mapped, Hash, Pred>::find_nth(seq_num_t i, Error_code* err_code) const
{
  ORDO_ERROR_EXEC_AND_THROW_ON_ERROR(const Value*, find_nth, i, _1);
  // err_code is non-null below.

  const auto entry = lookup_nth(i);
  if (!entry)
  {
    ORDO_LOG_TRACE("Ordered_map [" << this << "]: No entry at sequence number [" << i << "]; "
                   "size [" << size() << "], next sequence number [" << m_next_seq_num << "].");
    ORDO_ERROR_EMIT_ERROR(error::Code::S_INDEX_OUT_OF_RANGE);
    return 0;
  }
  // else

  err_code->clear();
  return entry;
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
typename Ordered_map<Key, Mapped, Hash, Pred>::Value const &
  Ordered_map<Key, Mapped, Hash, Pred>::nth(seq_num_t i) const
{
  return *(find_nth(i)); // Throws on error; hence never null here.
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
typename Ordered_map<Key, Mapped, Hash, Pred>::Value
  Ordered_map<Key, Mapped, Hash, Pred>::nth(seq_num_t i, const Value& not_found) const
{
  const auto entry = lookup_nth(i);
  return entry ? *entry : not_found;
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
typename Ordered_map<Key, Mapped, Hash, Pred>::Entry_range Ordered_map<Key, Mapped, Hash, Pred>::seq() const
{
  return Entry_range(*this);
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
typename Ordered_map<Key, Mapped, Hash, Pred>::Reverse_entry_range
  Ordered_map<Key, Mapped, Hash, Pred>::rseq() const
{
  return Reverse_entry_range(*this);
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
typename Ordered_map<Key, Mapped, Hash, Pred>::Const_iterator Ordered_map<Key, Mapped, Hash, Pred>::begin() const
{
  return Const_iterator(&m_base, m_ordering.begin());
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
typename Ordered_map<Key, Mapped, Hash, Pred>::Const_iterator Ordered_map<Key, Mapped, Hash, Pred>::end() const
{
  return Const_iterator(&m_base, m_ordering.end());
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
typename Ordered_map<Key, Mapped, Hash, Pred>::Const_iterator Ordered_map<Key, Mapped, Hash, Pred>::cbegin() const
{
  return begin();
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
typename Ordered_map<Key, Mapped, Hash, Pred>::Const_iterator Ordered_map<Key, Mapped, Hash, Pred>::cend() const
{
  return end();
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
typename Ordered_map<Key, Mapped, Hash, Pred>::Const_reverse_iterator
  Ordered_map<Key, Mapped, Hash, Pred>::rbegin() const
{
  return Const_reverse_iterator(&m_base, m_ordering.rbegin());
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
typename Ordered_map<Key, Mapped, Hash, Pred>::Const_reverse_iterator
  Ordered_map<Key, Mapped, Hash, Pred>::rend() const
{
  return Const_reverse_iterator(&m_base, m_ordering.rend());
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
Ordered_map<Key, Mapped, Hash, Pred>
  Ordered_map<Key, Mapped, Hash, Pred>::with_metadata(const boost::any& metadata) const
{
  Ordered_map result(*this);
  if (metadata.empty())
  {
    result.m_metadata.reset();
  }
  else
  {
    result.m_metadata = boost::make_shared<boost::any>(metadata);
  }
  return result;
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
const boost::any& Ordered_map<Key, Mapped, Hash, Pred>::metadata() const
{
  static const boost::any S_NO_METADATA;
  return m_metadata ? *m_metadata : S_NO_METADATA;
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
bool Ordered_map<Key, Mapped, Hash, Pred>::has_metadata() const
{
  return m_metadata && (!m_metadata->empty());
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
template<typename Func, typename T>
T Ordered_map<Key, Mapped, Hash, Pred>::reduce_kv(const Func& func, T init) const
{
  T acc(std::move(init));
  for (const auto& entry : *this)
  {
    acc = func(std::move(acc), entry.first, entry.second);
  }
  return acc;
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
std::vector<Key> Ordered_map<Key, Mapped, Hash, Pred>::keys() const
{
  std::vector<Key> result;
  result.reserve(size());
  for (const auto& entry : *this)
  {
    result.push_back(entry.first);
  }
  return result;
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
std::vector<Mapped> Ordered_map<Key, Mapped, Hash, Pred>::values() const
{
  std::vector<Mapped> result;
  result.reserve(size());
  for (const auto& entry : *this)
  {
    result.push_back(entry.second);
  }
  return result;
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
bool Ordered_map<Key, Mapped, Hash, Pred>::contains_value(const Mapped& mapped) const
{
  bool found = false;
  m_base.for_each([&](const Value& entry)
  {
    found = found || (entry.second == mapped);
  });
  return found;
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
const typename Ordered_map<Key, Mapped, Hash, Pred>::Base_store&
  Ordered_map<Key, Mapped, Hash, Pred>::base_store() const
{
  return m_base;
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
const typename Ordered_map<Key, Mapped, Hash, Pred>::Ordering_index&
  Ordered_map<Key, Mapped, Hash, Pred>::ordering_index() const
{
  return m_ordering;
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
const typename Ordered_map<Key, Mapped, Hash, Pred>::Reverse_index&
  Ordered_map<Key, Mapped, Hash, Pred>::reverse_index() const
{
  return m_reverse;
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
seq_num_t Ordered_map<Key, Mapped, Hash, Pred>::next_seq_num() const
{
  return m_next_seq_num;
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
void Ordered_map<Key, Mapped, Hash, Pred>::swap(Ordered_map& other)
{
  using std::swap;

  if (&other != this)
  {
    log::Log_context::swap(other);
    swap(m_base, other.m_base);
    swap(m_ordering, other.m_ordering);
    swap(m_reverse, other.m_reverse);
    swap(m_next_seq_num, other.m_next_seq_num);
    swap(m_metadata, other.m_metadata);
  }
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
bool operator==(const Ordered_map<Key, Mapped, Hash, Pred>& val1, const Ordered_map<Key, Mapped, Hash, Pred>& val2)
{
  using Value = typename Ordered_map<Key, Mapped, Hash, Pred>::Value;

  if (val1.size() != val2.size())
  {
    return false;
  }
  // else

  bool equal = true;
  val1.base_store().for_each([&](const Value& entry)
  {
    if (equal)
    {
      const auto other_entry = val2.find(entry.first);
      equal = other_entry && (other_entry->second == entry.second);
    }
  });
  return equal;
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
bool operator!=(const Ordered_map<Key, Mapped, Hash, Pred>& val1, const Ordered_map<Key, Mapped, Hash, Pred>& val2)
{
  return !(val1 == val2);
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
size_t hash_value(const Ordered_map<Key, Mapped, Hash, Pred>& val)
{
  using Value = typename Ordered_map<Key, Mapped, Hash, Pred>::Value;

  const auto& key_hasher = val.base_store().hash_function();
  size_t result = 0;
  // Sum of per-entry hashes: commutative, so iteration order cannot matter.
  val.base_store().for_each([&](const Value& entry)
  {
    size_t entry_hash = key_hasher(entry.first);
    boost::hash_combine(entry_hash, entry.second);
    result += entry_hash;
  });
  return result;
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
void swap(Ordered_map<Key, Mapped, Hash, Pred>& val1, Ordered_map<Key, Mapped, Hash, Pred>& val2)
{
  val1.swap(val2);
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
std::ostream& operator<<(std::ostream& os, const Ordered_map<Key, Mapped, Hash, Pred>& val)
{
  os << '{';
  bool first = true;
  for (const auto& entry : val)
  {
    if (!first)
    {
      os << ", ";
    }
    first = false;
    os << entry.first << ' ' << entry.second;
  }
  return os << '}';
}

} // namespace ordo::pmap
