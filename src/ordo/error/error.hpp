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

#include "ordo/error/error_fwd.hpp"
#include "ordo/log/log.hpp"
#include <boost/system/system_error.hpp>

namespace ordo::error
{

// Types.

/**
 * Exception thrown by Ordo operations called with a null `err_code`.  Its what() reads
 * `<context>: <code message>`, context being the place the operation was invoked from.
 */
class Runtime_error :
  public boost::system::system_error
{
public:
  // Constructors/destructor.

  /**
   * Constructs the exception.
   *
   * @param err_code
   *        The failure; must be truthy.
   * @param context
   *        Where it happened, such as `ORDO_UTIL_WHERE_AM_I_STR()`.
   */
  explicit Runtime_error(const Error_code& err_code, util::String_view context);
}; // class Runtime_error

// Free functions.

/**
 * The run-time half of ORDO_ERROR_EXEC_AND_THROW_ON_ERROR().  If `err_code` is non-null, returns `false` at once.
 * Otherwise calls `func(&e)` with a local `Error_code e`; throws Runtime_error if `e` is then truthy; else returns
 * `true`.
 *
 * @tparam Func
 *         Callable as `void (Error_code*)`.
 * @param func
 *        Calls the operation, non-throwing form, keeping any result.
 * @param err_code
 *        The operation's `err_code` argument.
 * @param context
 *        See Runtime_error.
 * @return `true` if `func` ran and succeeded.
 */
template<typename Func>
bool exec_and_throw_on_error(const Func& func, Error_code* err_code, util::String_view context);

// Template implementations.

template<typename Func>
bool exec_and_throw_on_error(const Func& func, Error_code* err_code, util::String_view context)
{
  if (err_code)
  {
    return false;
  }
  // else

  Error_code local_err_code;
  func(&local_err_code);
  if (local_err_code)
  {
    throw Runtime_error(local_err_code, context);
  }
  return true;
}

} // namespace ordo::error

// Macros.

/**
 * Sets `*err_code` to `ARG_val`, logging it at WARNING severity.  `err_code` must be a non-null `Error_code*` in
 * scope, as must `get_logger()` and `get_log_component()` (see ORDO_LOG_WARNING()).
 *
 * @param ARG_val
 *        Error code enumerator (such as `pmap::error::Code::S_INDEX_OUT_OF_RANGE`) or Error_code.
 */
#define ORDO_ERROR_EMIT_ERROR(ARG_val) \
  ORDO_UTIL_SEMICOLON_SAFE \
  ( \
    const ::ordo::Error_code ORDO_ERROR_emitted(ARG_val); \
    ORDO_LOG_WARNING("Error code emitted: [" << ORDO_ERROR_emitted << "] " \
                     "[" << ORDO_ERROR_emitted.message() << "]."); \
    *err_code = ORDO_ERROR_emitted; \
  )

/**
 * Placed first in an operation `T f(..., Error_code* err_code = 0)`: if `err_code` is null, calls `f()` again with
 * a non-null `err_code` and returns its result or throws Runtime_error.  Otherwise does nothing, so the rest of
 * `f()` runs knowing `err_code` is non-null.
 *
 * @param ARG_ret_type
 *        `T`; default-constructible and assignable.  For `void` use ORDO_ERROR_EXEC_VOID_AND_THROW_ON_ERROR().
 * @param ARG_function_name
 *        `f`.
 * @param ...
 *        Arguments to pass to `f()`, with `_1` in the place of `err_code`.
 */
#define ORDO_ERROR_EXEC_AND_THROW_ON_ERROR(ARG_ret_type, ARG_function_name, ...) \
  ORDO_UTIL_SEMICOLON_SAFE \
  ( \
    ARG_ret_type ORDO_ERROR_result; \
    if (::ordo::error::exec_and_throw_on_error \
          ([&](::ordo::Error_code* _1) { ORDO_ERROR_result = ARG_function_name(__VA_ARGS__); }, \
           err_code, ORDO_UTIL_WHERE_AM_I_LITERAL(ARG_function_name))) \
    { \
      return ORDO_ERROR_result; \
    } \
  )

/**
 * ORDO_ERROR_EXEC_AND_THROW_ON_ERROR() for `void` operations.
 *
 * @param ARG_function_name
 *        See ORDO_ERROR_EXEC_AND_THROW_ON_ERROR().
 * @param ...
 *        See ORDO_ERROR_EXEC_AND_THROW_ON_ERROR().
 */
#define ORDO_ERROR_EXEC_VOID_AND_THROW_ON_ERROR(ARG_function_name, ...) \
  ORDO_UTIL_SEMICOLON_SAFE \
  ( \
    if (::ordo::error::exec_and_throw_on_error \
          ([&](::ordo::Error_code* _1) { ARG_function_name(__VA_ARGS__); }, \
           err_code, ORDO_UTIL_WHERE_AM_I_LITERAL(ARG_function_name))) \
    { \
      return; \
    } \
  )
