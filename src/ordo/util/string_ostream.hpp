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

#include "ordo/util/util_fwd.hpp"
#include <boost/iostreams/stream.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/noncopyable.hpp>

namespace ordo::util
{

/**
 * An `ostream` appending to an `std::string` that the user may read at any time without a copy: the log macros
 * and Buffer_logger render into one of these and then hand str() on as a `String_view`.
 *
 * The string is either owned by `*this` or borrowed from the caller.  Output passes through the stream buffer of
 * os(), so flush os() before reading str().
 */
class String_ostream :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs the stream.
   *
   * @param borrowed_str
   *        String to append to (existing contents are kept); or null to append to an internal string.
   *        `*borrowed_str` must outlive `*this`.
   */
  explicit String_ostream(std::string* borrowed_str = nullptr);

  // Methods.

  /**
   * The stream.
   * @return See above.
   */
  std::ostream& os();

  /**
   * The string appended to so far (up to the last flush).
   * @return See above.
   */
  const std::string& str() const;

  /// Empties str(); later output appends to the empty string.
  void str_clear();

private:
  // Types.

  /// The device: `push_back()`s every character into a string.
  using Device = boost::iostreams::back_insert_device<std::string>;

  // Data.

  /// The target when none is borrowed.
  std::string m_own_str;

  /// `&m_own_str` or the borrowed string.
  std::string* const m_str;

  /// Writes into `*m_str`.
  Device m_device;

  /// The `ostream` over #m_device.
  boost::iostreams::stream<Device> m_stream;
}; // class String_ostream

} // namespace ordo::util
