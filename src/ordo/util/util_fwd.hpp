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
#include <boost/thread/thread.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/locks.hpp>
#include <string>
#include <string_view>

/// Ordo module of small helpers used by the other modules (and available to users).
namespace ordo::util
{

// Types.

class String_ostream;

/// Read-only string argument type of Ordo APIs.
using String_view = std::string_view;

/// ID of a thread, as printed in log lines of threads without a nickname.
using Thread_id = boost::thread::id;

/// Plain exclusive mutex.
using Mutex_non_recursive = boost::mutex;

/**
 * Scoped lock of a mutex.
 *
 * @tparam Mutex
 *         Mutex type, usually #Mutex_non_recursive.
 */
template<typename Mutex>
using Lock_guard = boost::unique_lock<Mutex>;

// Free functions.

/**
 * Returns a string with what `os << arg` writes for each of `args` in turn.
 *
 * @tparam T
 *         Argument types; each must be `ostream`-printable.
 * @param args
 *        Things to print.
 * @return See above.
 */
template<typename ...T>
std::string ostream_op_string(T const &... args);

/**
 * The part of `path` following its last `/` or `\`; `path` itself if there is no separator.  `constexpr`, so that
 * shortening `__FILE__` costs nothing at run time.
 *
 * @param path
 *        File path.
 * @return View into `path`.
 */
constexpr String_view get_last_path_segment(String_view path);

} // namespace ordo::util

// Macros.

/// `std::string` of the form `file.cpp:function(line)` for the place where the macro is invoked.
#define ORDO_UTIL_WHERE_AM_I_STR() \
  ::ordo::util::ostream_op_string(::ordo::util::get_last_path_segment(__FILE__), ':', __FUNCTION__, \
                                  '(', __LINE__, ')')

/**
 * String literal of the form `path/file.cpp:ARG_function(line)`, usable where a compile-time string is needed.
 *
 * @param ARG_function
 *        Function name, as a token.
 */
#define ORDO_UTIL_WHERE_AM_I_LITERAL(ARG_function) \
  __FILE__ ":" #ARG_function "(" ORDO_UTIL_STRINGIZE(__LINE__) ")"

/**
 * Stringizes its argument after macro-expanding it.
 * @param ARG_expr
 *        Expression, such as `__LINE__`.
 */
#define ORDO_UTIL_STRINGIZE(ARG_expr) ORDO_UTIL_STRINGIZE_NO_EXPAND(ARG_expr)

/**
 * Helper of ORDO_UTIL_STRINGIZE().
 * @param ARG_expr
 *        See ORDO_UTIL_STRINGIZE().
 */
#define ORDO_UTIL_STRINGIZE_NO_EXPAND(ARG_expr) #ARG_expr

/**
 * Makes a multi-statement macro body behave as a single statement requiring a trailing `;`.  Variadic, so the
 * body may contain top-level commas (brace initializers, template argument lists).
 *
 * @param ...
 *        Statements.
 */
#define ORDO_UTIL_SEMICOLON_SAFE(...) \
  do \
  { \
    __VA_ARGS__ \
  } \
  while (false)
