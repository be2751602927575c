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

#include "ordo/common.hpp"
#include "ordo/log/log_fwd.hpp"
#include <boost/functional/hash.hpp>
#include <cstdint>
#include <functional>
#include <iosfwd>

/**
 * Ordo module containing persistent (immutable, structurally shared) associative containers; chiefly
 * Ordered_map, a key/value map that remembers the order in which keys were first associated.
 *
 * "Persistent" here means every modifying operation (`assoc()`, `dissoc()`, ...) leaves the source object untouched
 * and returns a new one; the two share all of their internal structure except the O(log n) nodes on the path that
 * changed.  Copying any of these containers is O(1).  Since nothing is ever modified in place, instances may be
 * read, copied and derived from by any number of threads concurrently with no locking.
 *
 * Layers, bottom-up:
 *   - Hash_trie: persistent hash array mapped trie (key -> value).
 *   - Seq_tree: persistent AVL tree keyed by #seq_num_t (sequence number -> key).
 *   - Ordered_map: the two above (plus a second Hash_trie, key -> sequence number) kept consistent.
 *   - make_ordered_map(), build_ordered_map(): builders from flat key/value lists.
 *   - Map_surface and its adapters: a classic mutable-map interface over either an Ordered_map (which refuses
 *     mutation) or a native `boost::unordered_map`.
 */
namespace ordo::pmap
{

// Types.

/**
 * Sequence number type: each key gets the next one when first associated into an Ordered_map lineage; it is
 * never reused, even after the key is removed.
 */
using seq_num_t = uint64_t;

// Find doc headers near the bodies of these compound types.

template<typename Key, typename Mapped,
         typename Hash = boost::hash<Key>,
         typename Pred = std::equal_to<Key>>
class Hash_trie;

template<typename Key>
class Seq_tree;

template<typename Key, typename Mapped,
         typename Hash = boost::hash<Key>,
         typename Pred = std::equal_to<Key>>
class Ordered_map;

template<typename Key, typename Mapped>
class Map_surface;

template<typename Ordered_map_t>
class Immutable_map_surface;

template<typename Unordered_map_t>
class Unordered_map_surface;

// Free functions.

/**
 * Returns `true` if and only if the two maps hold the same set of (key, value) pairs.  Insertion order, the
 * history of removals and metadata are all ignored.  Requires `Mapped == Mapped`.
 *
 * @relatesalso Ordered_map
 *
 * @tparam Key
 *         See Ordered_map.
 * @tparam Mapped
 *         See Ordered_map.
 * @tparam Hash
 *         See Ordered_map.
 * @tparam Pred
 *         See Ordered_map.
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
template<typename Key, typename Mapped, typename Hash, typename Pred>
bool operator==(const Ordered_map<Key, Mapped, Hash, Pred>& val1, const Ordered_map<Key, Mapped, Hash, Pred>& val2);

/**
 * Negation of the `==` counterpart.
 *
 * @relatesalso Ordered_map
 *
 * @tparam Key
 *         See Ordered_map.
 * @tparam Mapped
 *         See Ordered_map.
 * @tparam Hash
 *         See Ordered_map.
 * @tparam Pred
 *         See Ordered_map.
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
template<typename Key, typename Mapped, typename Hash, typename Pred>
bool operator!=(const Ordered_map<Key, Mapped, Hash, Pred>& val1, const Ordered_map<Key, Mapped, Hash, Pred>& val2);

/**
 * boost.hash hook (found via ADL by `boost::hash<Ordered_map<...>>`): a hash consistent with `operator==()`, that is
 * computed over content only and independent of order.  Requires `boost::hash<Mapped>`.
 *
 * @relatesalso Ordered_map
 *
 * @tparam Key
 *         See Ordered_map.
 * @tparam Mapped
 *         See Ordered_map.
 * @tparam Hash
 *         See Ordered_map.
 * @tparam Pred
 *         See Ordered_map.
 * @param val
 *        Object to hash.
 * @return See above.
 */
template<typename Key, typename Mapped, typename Hash, typename Pred>
size_t hash_value(const Ordered_map<Key, Mapped, Hash, Pred>& val);

/**
 * Equivalent to `val1.swap(val2)`.
 *
 * @relatesalso Ordered_map
 *
 * @tparam Key
 *         See Ordered_map.
 * @tparam Mapped
 *         See Ordered_map.
 * @tparam Hash
 *         See Ordered_map.
 * @tparam Pred
 *         See Ordered_map.
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 */
template<typename Key, typename Mapped, typename Hash, typename Pred>
void swap(Ordered_map<Key, Mapped, Hash, Pred>& val1, Ordered_map<Key, Mapped, Hash, Pred>& val2);

/**
 * Prints the map in insertion order, like `{k1 v1, k2 v2}`.  Requires `ostream << Key` and `ostream << Mapped`.
 *
 * @relatesalso Ordered_map
 *
 * @tparam Key
 *         See Ordered_map.
 * @tparam Mapped
 *         See Ordered_map.
 * @tparam Hash
 *         See Ordered_map.
 * @tparam Pred
 *         See Ordered_map.
 * @param os
 *        Stream to print to.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
template<typename Key, typename Mapped, typename Hash, typename Pred>
std::ostream& operator<<(std::ostream& os, const Ordered_map<Key, Mapped, Hash, Pred>& val);

} // namespace ordo::pmap
