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

/**
 * @file
 * Items used throughout Ordo: the error code type, the clock, the function wrapper, and the `enum` naming each
 * Ordo module for logging purposes.
 */

#pragma once

#include <boost/system/error_code.hpp>
#include <boost/unordered_map.hpp>
#include <chrono>
#include <functional>
#include <string>

#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "Ordo headers require C++17 or later."
#endif

/**
 * Root namespace of Ordo, a library of persistent containers whose centerpiece is ordo::pmap::Ordered_map.
 *
 * Sub-namespaces:
 *   - ordo::pmap: the containers themselves.
 *   - ordo::log: logging (the containers log through a user-supplied log::Logger, or not at all).
 *   - ordo::error: the `Error_code*`-or-exception error reporting convention.
 *   - ordo::util: small helpers shared by the above.
 */
namespace ordo
{

// Types.

/// The error code type of all Ordo APIs reporting failure; see ordo::error for the convention.
using Error_code = boost::system::error_code;

/// Wall clock, used for log time stamps.
using Sys_clock = std::chrono::system_clock;

/**
 * Ordo's callback wrapper; behaves as `std::function` and adds empty().
 *
 * @tparam Signature
 *         Function type, such as `void (int)`.
 */
template<typename Signature>
class Function;

/**
 * Function for a particular result and argument list.
 *
 * @tparam Result
 *         Result type.
 * @tparam Args
 *         Argument types.
 */
template<typename Result, typename... Args>
class Function<Result (Args...)> :
  public std::function<Result (Args...)>
{
public:
  using std::function<Result (Args...)>::function;

  /**
   * `true` if there is no target to call.
   * @return See above.
   */
  bool empty() const
  {
    return !static_cast<bool>(*this);
  }
}; // class Function

/**
 * The areas of Ordo that log, each a value usable as a log::Component payload.  A log::Config learns their names
 * from #S_ORDO_LOG_COMPONENT_NAME_MAP.
 */
enum class Ordo_log_component : unsigned int
{
  /// ordo::error.
  S_ERROR = 0,

  /// ordo::util.
  S_UTIL,

  /// ordo::pmap.
  S_PMAP,

  /// Not a component: one past the last one.
  S_END_SENTINEL
}; // enum class Ordo_log_component

// Data.

/// Name of each Ordo_log_component value, without the `S_` prefix.
extern const boost::unordered_map<Ordo_log_component, std::string> S_ORDO_LOG_COMPONENT_NAME_MAP;

} // namespace ordo
