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

#include "ordo/pmap/ordered_map.hpp"
#include <boost/unordered_map.hpp>

namespace ordo::pmap
{

// Types.

/**
 * Interface for a classic mutable map: lookup, size, iteration and in-place mutation.  Generic algorithms (e.g.,
 * sum_mapped_values()) can be written once against this interface and applied to any map type with an adapter
 * implementing it: Immutable_map_surface for Ordered_map, Unordered_map_surface for `boost::unordered_map`.
 *
 * Mutators report errors per the ordo::Error_code convention, as an implementation may refuse them (see
 * Immutable_map_surface).  If an implementation refuses, the map is left unchanged.
 *
 * @tparam Key
 *         Key type.
 * @tparam Mapped
 *         Mapped value type.
 */
template<typename Key, typename Mapped>
class Map_surface
{
public:
  // Types.

  /// Type of the functor accepted by for_each().
  using Visitor = Function<void (const Key&, const Mapped&)>;

  // Constructors/destructor.

  /// Boring `virtual` destructor.
  virtual ~Map_surface() = default;

  // Methods.

  /**
   * Returns pointer to the value mapped to `key`, or null if absent.
   *
   * @param key
   *        Key.
   * @return See above.
   */
  virtual const Mapped* find(const Key& key) const = 0;

  /**
   * Returns `true` if and only if `key` is present.
   *
   * @param key
   *        Key.
   * @return See above.
   */
  virtual bool contains(const Key& key) const = 0;

  /**
   * Number of entries.
   * @return Ditto.
   */
  virtual size_t size() const = 0;

  /**
   * Invokes `visitor(key, mapped)` for each entry, in the map's own iteration order.
   *
   * @param visitor
   *        Functor.
   */
  virtual void for_each(const Visitor& visitor) const = 0;

  /**
   * Maps `key` to `mapped` in place.
   *
   * @param key
   *        Key.
   * @param mapped
   *        Value.
   * @param err_code
   *        See ordo::Error_code docs for error reporting semantics.
   */
  virtual void put(const Key& key, const Mapped& mapped, Error_code* err_code = 0) = 0;

  /**
   * Removes `key` in place, if present.
   *
   * @param key
   *        Key.
   * @param err_code
   *        See ordo::Error_code docs for error reporting semantics.
   * @return Number of entries removed (0 or 1); 0 on error.
   */
  virtual size_t erase(const Key& key, Error_code* err_code = 0) = 0;

  /**
   * Removes all entries in place.
   *
   * @param err_code
   *        See ordo::Error_code docs for error reporting semantics.
   */
  virtual void clear(Error_code* err_code = 0) = 0;

  /**
   * Puts every entry of `other` into `*this` in place, in `other` iteration order.
   *
   * @param other
   *        Source map.
   * @param err_code
   *        See ordo::Error_code docs for error reporting semantics.
   */
  virtual void put_all(const Map_surface& other, Error_code* err_code = 0) = 0;
}; // class Map_surface

/**
 * Map_surface over an Ordered_map value: lookups and iteration (in insertion order) delegate to the map, while every
 * mutator refuses with error::Code::S_UNSUPPORTED_MUTATION, leaving the map as it was.  To "modify" an Ordered_map,
 * use its assoc() and dissoc().
 *
 * Logs via the held map's Logger.
 *
 * @tparam Ordered_map_t
 *         An Ordered_map type.
 */
template<typename Ordered_map_t>
class Immutable_map_surface :
  public Map_surface<typename Ordered_map_t::key_type, typename Ordered_map_t::mapped_type>,
  public log::Log_context
{
public:
  // Types.

  /// Short-hand for key type.
  using Key = typename Ordered_map_t::key_type;

  /// Short-hand for mapped type.
  using Mapped = typename Ordered_map_t::mapped_type;

  /// Short-hand for the implemented interface.
  using Surface = Map_surface<Key, Mapped>;

  /// Short-hand for the for_each() functor type.
  using Visitor = typename Surface::Visitor;

  // Constructors/destructor.

  /**
   * Constructs the adapter over a copy (O(1)) of the given map.
   *
   * @param map
   *        The map.
   */
  explicit Immutable_map_surface(const Ordered_map_t& map);

  // Methods.

  /**
   * Implements interface method.
   * @param key
   *        See Map_surface.
   * @return See Map_surface.
   */
  const Mapped* find(const Key& key) const override;

  /**
   * Implements interface method.
   * @param key
   *        See Map_surface.
   * @return See Map_surface.
   */
  bool contains(const Key& key) const override;

  /**
   * Implements interface method.
   * @return See Map_surface.
   */
  size_t size() const override;

  /**
   * Implements interface method: visits in insertion order.
   * @param visitor
   *        See Map_surface.
   */
  void for_each(const Visitor& visitor) const override;

  /**
   * Implements interface method: always fails.
   *
   * @param key
   *        Ignored.
   * @param mapped
   *        Ignored.
   * @param err_code
   *        See ordo::Error_code docs for error reporting semantics.  error::Code generated:
   *        error::Code::S_UNSUPPORTED_MUTATION.
   */
  void put(const Key& key, const Mapped& mapped, Error_code* err_code = 0) override;

  /**
   * Implements interface method: always fails.
   *
   * @param key
   *        Ignored.
   * @param err_code
   *        See put().
   * @return 0.
   */
  size_t erase(const Key& key, Error_code* err_code = 0) override;

  /**
   * Implements interface method: always fails.
   *
   * @param err_code
   *        See put().
   */
  void clear(Error_code* err_code = 0) override;

  /**
   * Implements interface method: always fails.
   *
   * @param other
   *        Ignored.
   * @param err_code
   *        See put().
   */
  void put_all(const Surface& other, Error_code* err_code = 0) override;

  /**
   * The held map.
   * @return Ditto.
   */
  const Ordered_map_t& map() const;

private:
  // Methods.

  /**
   * Emits error::Code::S_UNSUPPORTED_MUTATION into non-null `*err_code`.
   *
   * @param op_name
   *        Name of the refused mutator, for logging.
   * @param err_code
   *        Not null.
   */
  void refuse_mutation(util::String_view op_name, Error_code* err_code) const;

  // Data.

  /// The map.
  const Ordered_map_t m_map;
}; // class Immutable_map_surface

/**
 * Map_surface over a native `boost::unordered_map` (or any type with its API), referred to and mutated in place.
 * All mutators succeed.
 *
 * @tparam Unordered_map_t
 *         `boost::unordered_map<Key, Mapped, ...>` or compatible.
 */
template<typename Unordered_map_t>
class Unordered_map_surface :
  public Map_surface<typename Unordered_map_t::key_type, typename Unordered_map_t::mapped_type>,
  public log::Log_context
{
public:
  // Types.

  /// Short-hand for key type.
  using Key = typename Unordered_map_t::key_type;

  /// Short-hand for mapped type.
  using Mapped = typename Unordered_map_t::mapped_type;

  /// Short-hand for the implemented interface.
  using Surface = Map_surface<Key, Mapped>;

  /// Short-hand for the for_each() functor type.
  using Visitor = typename Surface::Visitor;

  // Constructors/destructor.

  /**
   * Constructs the adapter.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param map
   *        The map; it must exist at least as long as `*this`.
   */
  explicit Unordered_map_surface(log::Logger* logger_ptr, Unordered_map_t* map);

  // Methods.

  /**
   * Implements interface method.
   * @param key
   *        See Map_surface.
   * @return See Map_surface.
   */
  const Mapped* find(const Key& key) const override;

  /**
   * Implements interface method.
   * @param key
   *        See Map_surface.
   * @return See Map_surface.
   */
  bool contains(const Key& key) const override;

  /**
   * Implements interface method.
   * @return See Map_surface.
   */
  size_t size() const override;

  /**
   * Implements interface method: visits in the map's (unspecified) order.
   * @param visitor
   *        See Map_surface.
   */
  void for_each(const Visitor& visitor) const override;

  /**
   * Implements interface method.
   * @param key
   *        See Map_surface.
   * @param mapped
   *        See Map_surface.
   * @param err_code
   *        See Map_surface.  Never fails.
   */
  void put(const Key& key, const Mapped& mapped, Error_code* err_code = 0) override;

  /**
   * Implements interface method.
   * @param key
   *        See Map_surface.
   * @param err_code
   *        See Map_surface.  Never fails.
   * @return See Map_surface.
   */
  size_t erase(const Key& key, Error_code* err_code = 0) override;

  /**
   * Implements interface method.
   * @param err_code
   *        See Map_surface.  Never fails.
   */
  void clear(Error_code* err_code = 0) override;

  /**
   * Implements interface method.
   * @param other
   *        See Map_surface.
   * @param err_code
   *        See Map_surface.  Never fails.
   */
  void put_all(const Surface& other, Error_code* err_code = 0) override;

private:
  // Data.

  /// The map.
  Unordered_map_t* const m_map;
}; // class Unordered_map_surface

// Free functions.

/**
 * Returns `init` plus the sum (by `+`) of all values in the given map, whatever its implementation.
 *
 * @tparam Key
 *         See Map_surface.
 * @tparam Mapped
 *         See Map_surface.
 * @param map
 *        Map.
 * @param init
 *        Starting value.
 * @return See above.
 */
template<typename Key, typename Mapped>
Mapped sum_mapped_values(const Map_surface<Key, Mapped>& map, Mapped init = Mapped());

// Template implementations.

template<typename Ordered_map_t>
Immutable_map_surface<Ordered_map_t>::Immutable_map_surface(const Ordered_map_t& map) :
  log::Log_context(map.get_logger(), Ordo_log_component::S_PMAP),
  m_map(map)
{
  // Nothing.
}

template<typename Ordered_map_t>
typename Immutable_map_surface<Ordered_map_t>::Mapped const *
  Immutable_map_surface<Ordered_map_t>::find(const Key& key) const
{
  const auto entry = m_map.find(key);
  return entry ? &entry->second : 0;
}

template<typename Ordered_map_t>
bool Immutable_map_surface<Ordered_map_t>::contains(const Key& key) const
{
  return m_map.contains(key);
}

template<typename Ordered_map_t>
size_t Immutable_map_surface<Ordered_map_t>::size() const
{
  return m_map.size();
}

template<typename Ordered_map_t>
void Immutable_map_surface<Ordered_map_t>::for_each(const Visitor& visitor) const
{
  for (const auto& entry : m_map)
  {
    visitor(entry.first, entry.second);
  }
}

template<typename Ordered_map_t>
void Immutable_map_surface<Ordered_map_t>::put(const Key& key, const Mapped& mapped, Error_code* err_code)
{
  ORDO_ERROR_EXEC_VOID_AND_THROW_ON_ERROR(put, key, mapped, _1);
  // err_code is non-null below.

  refuse_mutation("put", err_code);
}

template<typename Ordered_map_t>
size_t Immutable_map_surface<Ordered_map_t>::erase(const Key& key, Error_code* err_code)
{
  ORDO_ERROR_EXEC_AND_THROW_ON_ERROR(size_t, erase, key, _1);
  // err_code is non-null below.

  refuse_mutation("erase", err_code);
  return 0;
}

template<typename Ordered_map_t>
void Immutable_map_surface<Ordered_map_t>::clear(Error_code* err_code)
{
  ORDO_ERROR_EXEC_VOID_AND_THROW_ON_ERROR(clear, _1);
  // err_code is non-null below.

  refuse_mutation("clear", err_code);
}

template<typename Ordered_map_t>
void Immutable_map_surface<Ordered_map_t>::put_all(const Surface& other, Error_code* err_code)
{
  ORDO_ERROR_EXEC_VOID_AND_THROW_ON_ERROR(put_all, other, _1);
  // err_code is non-null below.

  refuse_mutation("put_all", err_code);
}

template<typename Ordered_map_t>
void Immutable_map_surface<Ordered_map_t>::refuse_mutation(util::String_view op_name, Error_code* err_code) const
{
  ORDO_LOG_TRACE("Immutable_map_surface [" << this << "]: Refusing in-place [" << op_name << "] on map of "
                 "size [" << m_map.size() << "]; derive a new map via assoc()/dissoc() instead.");
  ORDO_ERROR_EMIT_ERROR(error::Code::S_UNSUPPORTED_MUTATION);
}

template<typename Ordered_map_t>
const Ordered_map_t& Immutable_map_surface<Ordered_map_t>::map() const
{
  return m_map;
}

template<typename Unordered_map_t>
Unordered_map_surface<Unordered_map_t>::Unordered_map_surface(log::Logger* logger_ptr, Unordered_map_t* map) :
  log::Log_context(logger_ptr, Ordo_log_component::S_PMAP),
  m_map(map)
{
  // Nothing.
}

template<typename Unordered_map_t>
typename Unordered_map_surface<Unordered_map_t>::Mapped const *
  Unordered_map_surface<Unordered_map_t>::find(const Key& key) const
{
  const auto it = m_map->find(key);
  return (it == m_map->end()) ? 0 : &it->second;
}

template<typename Unordered_map_t>
bool Unordered_map_surface<Unordered_map_t>::contains(const Key& key) const
{
  return m_map->find(key) != m_map->end();
}

template<typename Unordered_map_t>
size_t Unordered_map_surface<Unordered_map_t>::size() const
{
  return m_map->size();
}

template<typename Unordered_map_t>
void Unordered_map_surface<Unordered_map_t>::for_each(const Visitor& visitor) const
{
  for (const auto& entry : *m_map)
  {
    visitor(entry.first, entry.second);
  }
}

template<typename Unordered_map_t>
void Unordered_map_surface<Unordered_map_t>::put(const Key& key, const Mapped& mapped, Error_code* err_code)
{
  const auto it = m_map->find(key);
  if (it == m_map->end())
  {
    m_map->emplace(key, mapped);
  }
  else
  {
    it->second = mapped;
  }

  if (err_code)
  {
    err_code->clear();
  }
}

template<typename Unordered_map_t>
size_t Unordered_map_surface<Unordered_map_t>::erase(const Key& key, Error_code* err_code)
{
  const size_t n_erased = m_map->erase(key);
  if (err_code)
  {
    err_code->clear();
  }
  return n_erased;
}

template<typename Unordered_map_t>
void Unordered_map_surface<Unordered_map_t>::clear(Error_code* err_code)
{
  ORDO_LOG_TRACE("Unordered_map_surface [" << this << "]: Clearing [" << m_map->size() << "] entries.");
  m_map->clear();
  if (err_code)
  {
    err_code->clear();
  }
}

template<typename Unordered_map_t>
void Unordered_map_surface<Unordered_map_t>::put_all(const Surface& other, Error_code* err_code)
{
  other.for_each([&](const Key& key, const Mapped& mapped) { put(key, mapped); });
  if (err_code)
  {
    err_code->clear();
  }
}

template<typename Key, typename Mapped>
Mapped sum_mapped_values(const Map_surface<Key, Mapped>& map, Mapped init)
{
  map.for_each([&](const Key&, const Mapped& mapped) { init = init + mapped; });
  return init;
}

} // namespace ordo::pmap
