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
#include "ordo/error/error.hpp"
#include <boost/system/error_code.hpp>
#include <cstddef>
#include <type_traits>

/**
 * The error codes of ordo::pmap, as a boost.system error code set: Code values convert implicitly to
 * ordo::Error_code, whose `category().name()` is then `"ordo_pmap"`.  Reporting follows ordo::error.
 */
namespace ordo::pmap::error
{

// Types.

/// Ways an ordo::pmap operation can fail.  Each comment is the code's `message()`.
enum class Code
{
  /// Ordered map requires an even number of arguments: a key was given without a value.
  S_ODD_ARGUMENT_COUNT = 1,

  /// Index out of range: no entry is stored under the given sequence number.
  S_INDEX_OUT_OF_RANGE,

  /// In-place mutation is not supported by an immutable map.
  S_UNSUPPORTED_MUTATION,

  /// Not a code: one past the last one.
  S_END_SENTINEL
}; // enum class Code

/**
 * Exception thrown by the ordered map builders when given an odd-length flat key/value sequence.  `code()` is always
 * Code::S_ODD_ARGUMENT_COUNT; additionally stores the trailing unpaired element, so the caller can see what was
 * left over.
 *
 * @tparam Key
 *         Element type of the builder's input (the map's key type).
 */
template<typename Key>
class Unpaired_key_error :
  public ordo::error::Runtime_error
{
public:
  // Constructors/destructor.

  /**
   * Constructs the exception.
   *
   * @param unpaired_key
   *        The trailing element with no value after it.
   * @param arg_count
   *        Total number of flat arguments given to the builder.
   * @param context
   *        See Runtime_error constructor.
   */
  explicit Unpaired_key_error(const Key& unpaired_key, size_t arg_count, util::String_view context);

  // Methods.

  /**
   * The trailing element with no value after it.
   * @return See above.
   */
  const Key& unpaired_key() const;

  /**
   * The number of flat arguments given to the builder (always odd).
   * @return See above.
   */
  size_t arg_count() const;

private:
  // Data.

  /// See unpaired_key().
  const Key m_unpaired_key;

  /// See arg_count().
  const size_t m_arg_count;
}; // class Unpaired_key_error

// Free functions.

/**
 * The Error_code for a Code; found by boost.system through ADL when a Code converts to Error_code.
 *
 * @param err_code
 *        Code.
 * @return See above.
 */
Error_code make_error_code(Code err_code);

// Template implementations.

template<typename Key>
Unpaired_key_error<Key>::Unpaired_key_error(const Key& unpaired_key, size_t arg_count, util::String_view context) :
  ordo::error::Runtime_error(make_error_code(Code::S_ODD_ARGUMENT_COUNT), context),
  m_unpaired_key(unpaired_key),
  m_arg_count(arg_count)
{
  // Nothing.
}

template<typename Key>
const Key& Unpaired_key_error<Key>::unpaired_key() const
{
  return m_unpaired_key;
}

template<typename Key>
size_t Unpaired_key_error<Key>::arg_count() const
{
  return m_arg_count;
}

} // namespace ordo::pmap::error

namespace boost::system
{

// Types.

/// Lets ordo::pmap::error::Code convert implicitly to ordo::Error_code.
template<>
struct is_error_code_enum<::ordo::pmap::error::Code> :
  public std::true_type
{
};

} // namespace boost::system
