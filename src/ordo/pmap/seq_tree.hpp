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

#include "ordo/pmap/detail/seq_tree_node.hpp"
#include <cassert>
#include <cstddef>
#include <iterator>
#include <vector>

namespace ordo::pmap
{

// Types.

/**
 * Forward iterator over a Seq_tree, in ascending or descending sequence number order.  Holds an explicit stack of
 * the not-yet-visited ancestors of the current node, so a full traversal is O(n) and the iterator is O(log n) in
 * size.  The past-the-end iterator has an empty stack.
 *
 * The iterator stores raw node pointers: it is valid as long as the Seq_tree it came from (or any copy of it, or
 * any tree still sharing the nodes in question) exists.
 *
 * @tparam Key
 *         See Seq_tree.
 * @tparam ASCENDING
 *         `true` for in-order traversal, `false` for reverse in-order.
 */
template<typename Key, bool ASCENDING>
class Seq_tree_iterator
{
public:
  // Types.

  /// Short-hand for node type.
  using Node = Seq_tree_node<Key>;

  /// For iterator compliance (hence the irregular capitalization).
  using iterator_category = std::forward_iterator_tag;
  /// For iterator compliance (hence the irregular capitalization).
  using value_type = typename Node::Value;
  /// For iterator compliance (hence the irregular capitalization).
  using difference_type = std::ptrdiff_t;
  /// For iterator compliance (hence the irregular capitalization).
  using pointer = const value_type*;
  /// For iterator compliance (hence the irregular capitalization).
  using reference = const value_type&;

  // Constructors/destructor.

  /// Constructs past-the-end iterator.
  Seq_tree_iterator();

  /**
   * Constructs iterator to the first entry (in the traversal direction) of the given subtree.
   *
   * @param root
   *        Root; if null the result is past-the-end.
   */
  explicit Seq_tree_iterator(const Node* root);

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
   * Advances to the next entry in traversal direction.  Behavior undefined if past-the-end.
   * @return `*this`.
   */
  Seq_tree_iterator& operator++();

  /**
   * Post-increment.
   * @return Copy of `*this` before advancing.
   */
  Seq_tree_iterator operator++(int);

  /**
   * Returns `true` if and only if both iterators point to the same node, or both are past-the-end.
   *
   * @param other
   *        Other iterator.
   * @return See above.
   */
  bool operator==(const Seq_tree_iterator& other) const;

  /**
   * Negation of `==`.
   *
   * @param other
   *        Other iterator.
   * @return See above.
   */
  bool operator!=(const Seq_tree_iterator& other) const;

private:
  // Methods.

  /**
   * Pushes `node` and then its chain of near-side descendants (left ones if #ASCENDING, else right ones).
   *
   * @param node
   *        Subtree root; may be null.
   */
  void descend(const Node* node);

  // Data.

  /// Top is the current node; below it are ancestors yet to be visited.  Empty means past-the-end.
  std::vector<const Node*> m_stack;
}; // class Seq_tree_iterator

/**
 * Persistent AVL tree mapping sequence number (#seq_num_t) to `Key`; the ordering index of Ordered_map.
 *
 * insert() and remove() copy the O(log n) nodes on the search path, rebalancing by rotation as they rebuild it, and
 * share all other nodes with the source tree; the source tree is unchanged.  Height is always within the AVL bound
 * (about 1.44 * log<sub>2</sub>(n + 2)), which height() exposes for verification.
 *
 * Iteration by begin()/end() is in ascending sequence number order; rbegin()/rend() descending.
 *
 * @tparam Key
 *         Key type of the owning map.  Copy-constructible.
 */
template<typename Key>
class Seq_tree
{
public:
  // Types.

  /// Short-hand for the entry type: sequence number and the key holding it.
  using Value = typename Seq_tree_node<Key>::Value;

  /// Ascending iterator type.
  using Const_iterator = Seq_tree_iterator<Key, true>;

  /// Descending iterator type.
  using Const_reverse_iterator = Seq_tree_iterator<Key, false>;

  /// STL-style alias of #Const_iterator.
  using const_iterator = Const_iterator;
  /// STL-style alias of #Const_reverse_iterator.
  using const_reverse_iterator = Const_reverse_iterator;
  /// STL-style alias of #Value.
  using value_type = Value;
  /// Type for size.
  using size_type = std::size_t;

  // Constructors/destructor.

  /// Constructs empty tree.
  Seq_tree();

  // Methods.

  /**
   * Returns a tree equal to `*this` plus the entry (`seq`, `key`); if `seq` is already present its key is
   * replaced.
   *
   * @param seq
   *        Sequence number.
   * @param key
   *        Key.
   * @return See above.
   */
  Seq_tree insert(seq_num_t seq, const Key& key) const;

  /**
   * Returns a tree equal to `*this` minus the entry for `seq`.  `seq` must be present: this is asserted; without
   * assertions an absent `seq` yields a tree sharing `*this` root.
   *
   * @param seq
   *        Sequence number.
   * @return See above.
   */
  Seq_tree remove(seq_num_t seq) const;

  /**
   * Returns pointer to the key stored under `seq`; or null if there is none.
   *
   * @param seq
   *        Sequence number.
   * @return See above.
   */
  const Key* at(seq_num_t seq) const;

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
   * Height of the tree: 0 if empty.
   * @return Ditto.
   */
  unsigned int height() const;

  /**
   * Iterator to lowest sequence number entry; or end() if empty.
   * @return Ditto.
   */
  Const_iterator begin() const;

  /**
   * Past-the-end ascending iterator.
   * @return Ditto.
   */
  Const_iterator end() const;

  /**
   * Iterator to highest sequence number entry; or rend() if empty.
   * @return Ditto.
   */
  Const_reverse_iterator rbegin() const;

  /**
   * Past-the-end descending iterator.
   * @return Ditto.
   */
  Const_reverse_iterator rend() const;

private:
  // Types.

  /// Short-hand for node type.
  using Node = Seq_tree_node<Key>;

  /// Short-hand for node pointer.
  using Node_ptr = typename Node::Ptr;

  // Methods.

  /**
   * Helper of insert() operating on a subtree.
   *
   * @param node
   *        Subtree; may be null.
   * @param entry
   *        Entry to insert.
   * @param added
   *        Set to `false` if an entry with the same sequence number was replaced, else `true`.
   * @return New balanced subtree.
   */
  static Node_ptr insert_in(const Node_ptr& node, const Value& entry, bool* added);

  /**
   * Helper of remove() operating on a subtree.
   *
   * @param node
   *        Subtree; may be null.
   * @param seq
   *        Sequence number to remove.
   * @param removed
   *        Set to whether it was found.
   * @return New balanced subtree; `node` itself if nothing was removed.
   */
  static Node_ptr remove_in(const Node_ptr& node, seq_num_t seq, bool* removed);

  /**
   * Returns `node` minus its lowest entry, balanced.
   *
   * @param node
   *        Subtree; not null.
   * @return See above.
   */
  static Node_ptr remove_min(const Node_ptr& node);

  /**
   * Builds a node with the given entry and subtrees, whose heights differ by at most 2, performing the single or
   * double rotation needed to bring the difference back to at most 1.
   *
   * @param entry
   *        Entry, ordered between the two subtrees.
   * @param left
   *        Left subtree.
   * @param right
   *        Right subtree.
   * @return See above.
   */
  static Node_ptr balance(const Value& entry, const Node_ptr& left, const Node_ptr& right);

  /**
   * Builds one node.
   *
   * @param entry
   *        Entry.
   * @param left
   *        Left subtree.
   * @param right
   *        Right subtree.
   * @return See above.
   */
  static Node_ptr make_node(const Value& entry, const Node_ptr& left, const Node_ptr& right);

  // Data.

  /// Root; null if and only if empty.
  Node_ptr m_root;

  /// Number of entries.
  size_type m_size;
}; // class Seq_tree

// Template implementations.

template<typename Key, bool ASCENDING>
Seq_tree_iterator<Key, ASCENDING>::Seq_tree_iterator() = default;

template<typename Key, bool ASCENDING>
Seq_tree_iterator<Key, ASCENDING>::Seq_tree_iterator(const Node* root)
{
  descend(root);
}

template<typename Key, bool ASCENDING>
void Seq_tree_iterator<Key, ASCENDING>::descend(const Node* node)
{
  while (node)
  {
    m_stack.push_back(node);
    node = ASCENDING ? node->m_left.get() : node->m_right.get();
  }
}

template<typename Key, bool ASCENDING>
typename Seq_tree_iterator<Key, ASCENDING>::reference Seq_tree_iterator<Key, ASCENDING>::operator*() const
{
  assert(!m_stack.empty());
  return m_stack.back()->m_entry;
}

template<typename Key, bool ASCENDING>
typename Seq_tree_iterator<Key, ASCENDING>::pointer Seq_tree_iterator<Key, ASCENDING>::operator->() const
{
  return &(operator*());
}

template<typename Key, bool ASCENDING>
Seq_tree_iterator<Key, ASCENDING>& Seq_tree_iterator<Key, ASCENDING>::operator++()
{
  assert(!m_stack.empty());
  const Node* const node = m_stack.back();
  m_stack.pop_back();
  descend(ASCENDING ? node->m_right.get() : node->m_left.get());
  return *this;
}

template<typename Key, bool ASCENDING>
Seq_tree_iterator<Key, ASCENDING> Seq_tree_iterator<Key, ASCENDING>::operator++(int)
{
  Seq_tree_iterator result(*this);
  operator++();
  return result;
}

template<typename Key, bool ASCENDING>
bool Seq_tree_iterator<Key, ASCENDING>::operator==(const Seq_tree_iterator& other) const
{
  if (m_stack.empty() || other.m_stack.empty())
  {
    return m_stack.empty() == other.m_stack.empty();
  }
  // else
  return m_stack.back() == other.m_stack.back();
}

template<typename Key, bool ASCENDING>
bool Seq_tree_iterator<Key, ASCENDING>::operator!=(const Seq_tree_iterator& other) const
{
  return !(operator==(other));
}

template<typename Key>
Seq_tree<Key>::Seq_tree() :
  m_size(0)
{
  // Nothing.
}

template<typename Key>
Seq_tree<Key> Seq_tree<Key>::insert(seq_num_t seq, const Key& key) const
{
  bool added;
  Seq_tree result(*this);
  result.m_root = insert_in(m_root, Value(seq, key), &added);
  if (added)
  {
    ++result.m_size;
  }
  return result;
}

template<typename Key>
Seq_tree<Key> Seq_tree<Key>::remove(seq_num_t seq) const
{
  bool removed = false;
  Seq_tree result(*this);
  result.m_root = remove_in(m_root, seq, &removed);
  assert(removed && "Only sequence numbers known to be present should be removed.");
  if (removed)
  {
    --result.m_size;
  }
  return result;
}

template<typename Key>
const Key* Seq_tree<Key>::at(seq_num_t seq) const
{
  const Node* node = m_root.get();
  while (node)
  {
    if (seq < node->m_entry.first)
    {
      node = node->m_left.get();
    }
    else if (node->m_entry.first < seq)
    {
      node = node->m_right.get();
    }
    else
    {
      return &node->m_entry.second;
    }
  }
  return 0;
}

template<typename Key>
typename Seq_tree<Key>::size_type Seq_tree<Key>::size() const
{
  return m_size;
}

template<typename Key>
bool Seq_tree<Key>::empty() const
{
  return m_size == 0;
}

template<typename Key>
unsigned int Seq_tree<Key>::height() const
{
  return Node::height_of(m_root);
}

template<typename Key>
typename Seq_tree<Key>::Const_iterator Seq_tree<Key>::begin() const
{
  return Const_iterator(m_root.get());
}

template<typename Key>
typename Seq_tree<Key>::Const_iterator Seq_tree<Key>::end() const
{
  return Const_iterator();
}

template<typename Key>
typename Seq_tree<Key>::Const_reverse_iterator Seq_tree<Key>::rbegin() const
{
  return Const_reverse_iterator(m_root.get());
}

template<typename Key>
typename Seq_tree<Key>::Const_reverse_iterator Seq_tree<Key>::rend() const
{
  return Const_reverse_iterator();
}

template<typename Key>
typename Seq_tree<Key>::Node_ptr
  Seq_tree<Key>::insert_in(const Node_ptr& node, const Value& entry, bool* added) // Static.
{
  if (!node)
  {
    *added = true;
    return make_node(entry, Node_ptr(), Node_ptr());
  }
  // else

  if (entry.first < node->m_entry.first)
  {
    return balance(node->m_entry, insert_in(node->m_left, entry, added), node->m_right);
  }
  if (node->m_entry.first < entry.first)
  {
    return balance(node->m_entry, node->m_left, insert_in(node->m_right, entry, added));
  }
  // else: Same sequence number; shape unchanged.
  *added = false;
  return make_node(entry, node->m_left, node->m_right);
}

template<typename Key>
typename Seq_tree<Key>::Node_ptr
  Seq_tree<Key>::remove_in(const Node_ptr& node, seq_num_t seq, bool* removed) // Static.
{
  if (!node)
  {
    return node;
  }
  // else

  if (seq < node->m_entry.first)
  {
    const auto new_left = remove_in(node->m_left, seq, removed);
    return *removed ? balance(node->m_entry, new_left, node->m_right) : node;
  }
  if (node->m_entry.first < seq)
  {
    const auto new_right = remove_in(node->m_right, seq, removed);
    return *removed ? balance(node->m_entry, node->m_left, new_right) : node;
  }
  // else

  *removed = true;
  if (!node->m_left)
  {
    return node->m_right;
  }
  if (!node->m_right)
  {
    return node->m_left;
  }
  // else: Two children: the in-order successor takes this node's place.

  const Node* successor = node->m_right.get();
  while (successor->m_left)
  {
    successor = successor->m_left.get();
  }
  return balance(successor->m_entry, node->m_left, remove_min(node->m_right));
} // Seq_tree::remove_in()

template<typename Key>
typename Seq_tree<Key>::Node_ptr Seq_tree<Key>::remove_min(const Node_ptr& node) // Static.
{
  if (!node->m_left)
  {
    return node->m_right;
  }
  // else
  return balance(node->m_entry, remove_min(node->m_left), node->m_right);
}

template<typename Key>
typename Seq_tree<Key>::Node_ptr
  Seq_tree<Key>::balance(const Value& entry, const Node_ptr& left, const Node_ptr& right) // Static.
{
  const auto left_height = Node::height_of(left);
  const auto right_height = Node::height_of(right);

  if (left_height > right_height + 1)
  {
    if (Node::height_of(left->m_left) >= Node::height_of(left->m_right))
    {
      // Single right rotation.
      return make_node(left->m_entry, left->m_left, make_node(entry, left->m_right, right));
    }
    // else: Left-right double rotation.
    const auto& pivot = left->m_right;
    return make_node(pivot->m_entry,
                     make_node(left->m_entry, left->m_left, pivot->m_left),
                     make_node(entry, pivot->m_right, right));
  }
  // else

  if (right_height > left_height + 1)
  {
    if (Node::height_of(right->m_right) >= Node::height_of(right->m_left))
    {
      // Single left rotation.
      return make_node(right->m_entry, make_node(entry, left, right->m_left), right->m_right);
    }
    // else: Right-left double rotation.
    const auto& pivot = right->m_left;
    return make_node(pivot->m_entry,
                     make_node(entry, left, pivot->m_left),
                     make_node(right->m_entry, pivot->m_right, right->m_right));
  }
  // else

  return make_node(entry, left, right);
} // Seq_tree::balance()

template<typename Key>
typename Seq_tree<Key>::Node_ptr
  Seq_tree<Key>::make_node(const Value& entry, const Node_ptr& left, const Node_ptr& right) // Static.
{
  return boost::make_shared<Node>(entry, left, right);
}

} // namespace ordo::pmap
