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
#include "ordo/util/util.hpp"
#include <tuple>

namespace ordo::pmap
{

// Free functions.

/**
 * Builds an Ordered_map from a flat argument list alternating keys and values: `make_ordered_map<K, M>(k1, v1, k2,
 * v2, ...)`.  The result equals `Ordered_map<K, M>::empty_map().assoc(k1, v1).assoc(k2, v2)...`; in particular a key
 * repeated in the list keeps the position of its first occurrence and takes the value of its last.
 *
 * With an odd number of arguments, throws error::Unpaired_key_error carrying the trailing argument (converted to
 * `Key`) and the argument count.  No argument at all yields an empty map.
 *
 * @tparam Key
 *         Map key type; each key argument must be convertible to it.
 * @tparam Mapped
 *         Map mapped type; each value argument must be convertible to it.
 * @tparam Args
 *         Argument types.
 * @param args
 *        Keys and values, alternating.
 * @return See above.
 */
template<typename Key, typename Mapped, typename... Args>
Ordered_map<Key, Mapped> make_ordered_map(const Args&... args);

/**
 * Builds an Ordered_map from the flat key/value sequence in `[first, last)`, as make_ordered_map() does from its
 * arguments.  The elements must be convertible to both `Map::key_type` and `Map::mapped_type` (e.g., a
 * `vector<string>` for an `Ordered_map<string, string>`).  Throws error::Unpaired_key_error if the sequence has odd
 * length.
 *
 * @tparam Map
 *         An Ordered_map type.
 * @tparam Iterator
 *         Input iterator type.
 * @param first
 *        Start of sequence.
 * @param last
 *        End of sequence.
 * @param logger_ptr
 *        The result's Logger (see Ordered_map constructor); the build itself is also logged to it.
 * @return See above.
 */
template<typename Map, typename Iterator>
Map build_ordered_map(Iterator first, Iterator last, log::Logger* logger_ptr = 0);

/// Internal helpers of the builders.
namespace builder_detail
{

/**
 * Recursion end of the other overload.
 *
 * @tparam Map
 *         Ordered_map type.
 * @param map
 *        Map built so far.
 * @return `map`.
 */
template<typename Map>
Map assoc_flat(const Map& map);

/**
 * Associates the first two arguments into `map`, then recurses on the rest.
 *
 * @tparam Map
 *         Ordered_map type.
 * @tparam Key_arg
 *         Key argument type.
 * @tparam Mapped_arg
 *         Value argument type.
 * @tparam Rest
 *         Remaining argument types; an even number of them.
 * @param map
 *        Map built so far.
 * @param key
 *        Key.
 * @param mapped
 *        Value.
 * @param rest
 *        Remaining keys and values.
 * @return See above.
 */
template<typename Map, typename Key_arg, typename Mapped_arg, typename... Rest>
Map assoc_flat(const Map& map, const Key_arg& key, const Mapped_arg& mapped, const Rest&... rest);

} // namespace builder_detail

// Template implementations.

template<typename Key, typename Mapped, typename... Args>
Ordered_map<Key, Mapped> make_ordered_map(const Args&... args)
{
  constexpr size_t N_ARGS = sizeof...(Args);

  if constexpr((N_ARGS % 2) == 1)
  {
    throw error::Unpaired_key_error<Key>(Key(std::get<N_ARGS - 1>(std::forward_as_tuple(args...))),
                                         N_ARGS, ORDO_UTIL_WHERE_AM_I_STR());
  }
  else
  {
    return builder_detail::assoc_flat(Ordered_map<Key, Mapped>::empty_map(), args...);
  }
}

template<typename Map, typename Iterator>
Map build_ordered_map(Iterator first, Iterator last, log::Logger* logger_ptr)
{
  using Key = typename Map::key_type;
  using Mapped = typename Map::mapped_type;

  ORDO_LOG_SET_CONTEXT(logger_ptr, Ordo_log_component::S_PMAP);

  Map result(logger_ptr);
  size_t arg_count = 0;
  while (first != last)
  {
    const Key key(*first);
    ++first;
    ++arg_count;

    if (first == last)
    {
      ORDO_LOG_WARNING("Ordered map build: flat sequence of [" << arg_count << "] elements has odd length; "
                       "the last key has no value.  Map built so far, of size [" << result.size() << "], "
                       "is discarded.");
      throw error::Unpaired_key_error<Key>(key, arg_count, ORDO_UTIL_WHERE_AM_I_STR());
    }
    // else

    result = result.assoc(key, Mapped(*first));
    ++first;
    ++arg_count;
  }

  ORDO_LOG_DEBUG("Ordered map build: [" << (arg_count / 2) << "] key/value pairs yielded map of "
                 "size [" << result.size() << "].");
  return result;
} // build_ordered_map()

template<typename Map>
Map builder_detail::assoc_flat(const Map& map)
{
  return map;
}

template<typename Map, typename Key_arg, typename Mapped_arg, typename... Rest>
Map builder_detail::assoc_flat(const Map& map, const Key_arg& key, const Mapped_arg& mapped, const Rest&... rest)
{
  return assoc_flat(map.assoc(typename Map::key_type(key), typename Map::mapped_type(mapped)), rest...);
}

} // namespace ordo::pmap
