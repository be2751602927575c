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

#include <functional>
#include <iostream>
#include <string>
#include <type_traits>
#include <vector>

/// Helpers shared by the unit tests of all Ordo modules; not part of the library proper.
namespace ordo::test
{

// Free functions.

/**
 * Name of the GoogleTest suite whose test body is executing now.
 * @return See above.
 */
std::string get_test_suite_name();

/**
 * `true` if and only if each pattern (ECMAScript regex syntax) is found somewhere in `text`.
 *
 * @param text
 *        Text to search, typically captured log output.
 * @param patterns
 *        Patterns, all of which must be found.
 * @return See above.
 */
bool check_output(const std::string& text, const std::vector<std::string>& patterns);

/**
 * Runs `func` while capturing whatever it writes to `os`, then reports whether `pattern` occurs in the capture.
 *
 * @param func
 *        Code to run.
 * @param os
 *        Stream whose output to capture, such as `std::cout`.
 * @param pattern
 *        ECMAScript regex.
 * @param echo
 *        If `true` the captured text is written through to `os` once `func` returns.
 * @return See above.
 */
bool check_output(const std::function<void()>& func,
                  std::ostream& os,
                  const std::string& pattern,
                  bool echo = true);

/**
 * Runs `func` and returns whatever it wrote to `os` meanwhile.
 *
 * @param func
 *        Code to run.
 * @param os
 *        Stream whose output to capture.
 * @param echo
 *        See check_output().
 * @return The captured text.
 */
std::string collect_output(const std::function<void()>& func, std::ostream& os = std::cout, bool echo = true);

/**
 * `static_cast`s a scoped `enum` value to its underlying integer, for comparisons in assertions.
 *
 * @tparam Enum
 *         `enum` type.
 * @param val
 *        Value.
 * @return See above.
 */
template<typename Enum>
constexpr std::underlying_type_t<Enum> to_underlying(Enum val) noexcept
{
  return static_cast<std::underlying_type_t<Enum>>(val);
}

} // namespace ordo::test
