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
#include <algorithm>
#include <utility>

namespace ordo::pmap
{

// Types.

/**
 * Internal node of Seq_tree: one (sequence number, key) entry plus its two subtrees.  Immutable once constructed;
 * subtrees are shared among all trees derived from a common ancestor.
 *
 * @tparam Key
 *         See Seq_tree.
 */
template<typename Key>
struct Seq_tree_node
{
  // Types.

  /// Short-hand for ref-counted pointer to immutable node.
  using Ptr = boost::shared_ptr<const Seq_tree_node>;

  /// The entry type.
  using Value = std::pair<const seq_num_t, Key>;

  // Constructors/destructor.

  /**
   * Constructs the node, computing #m_height from the children.
   *
   * @param entry
   *        The entry.
   * @param left
   *        Subtree with lesser sequence numbers; may be null.
   * @param right
   *        Subtree with greater sequence numbers; may be null.
   */
  explicit Seq_tree_node(const Value& entry, const Ptr& left, const Ptr& right);

  // Methods.

  /**
   * Height of the given subtree: 0 if null, else 1 + height of the taller child.
   *
   * @param node
   *        Subtree; may be null.
   * @return See above.
   */
  static unsigned int height_of(const Ptr& node);

  // Data.

  /// The entry.
  const Value m_entry;

  /// Left subtree.
  const Ptr m_left;

  /// Right subtree.
  const Ptr m_right;

  /// Height of the subtree rooted here; a leaf has height 1.
  const unsigned int m_height;
}; // struct Seq_tree_node

// Template implementations.

template<typename Key>
Seq_tree_node<Key>::Seq_tree_node(const Value& entry, const Ptr& left, const Ptr& right) :
  m_entry(entry),
  m_left(left),
  m_right(right),
  m_height(1 + std::max(height_of(left), height_of(right)))
{
  // Nothing.
}

template<typename Key>
unsigned int Seq_tree_node<Key>::height_of(const Ptr& node) // Static.
{
  return node ? node->m_height : 0;
}

} // namespace ordo::pmap
