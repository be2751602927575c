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
#include <iosfwd>

/**
 * Ordo module for logging.  Ordo code never writes to a stream directly: an object that logs holds a `Logger*`
 * (null means silence) and a Component naming its area of the library, typically by deriving from Log_context.
 * Each message has a Sev; the Logger's should_log() decides, before the message is even formatted, whether to
 * bother.  Messages are written with the `ORDO_LOG_*()` macros:
 *
 *   ~~~
 *   ORDO_LOG_TRACE("Appended key [" << key << "] at sequence number [" << seq << "].");
 *   ~~~
 *
 * Ordo ships two Logger%s: Simple_ostream_logger (console) and Buffer_logger (in memory, for tests).  Both are
 * filtered and formatted according to a Config.
 */
namespace ordo::log
{

// Types.

class Buffer_logger;
class Component;
class Config;
class Logger;
class Log_context;
struct Msg_metadata;
class Ostream_log_msg_writer;
class Simple_ostream_logger;

/**
 * Severity of a log message.  Lower values are more severe.  A filter level `L` passes every message whose
 * severity is `L` or lower; so S_NONE as a level passes nothing.
 */
enum class Sev : size_t
{
  /// Filter level only: nothing is logged.
  S_NONE = 0,

  /// A failure reported to the caller, or a misuse of the API.
  S_WARNING,

  /// A rare event worth noting.
  S_INFO,

  /// Summary of a larger operation, such as building a map.
  S_DEBUG,

  /// Detail of each individual operation.
  S_TRACE,

  /// Not a severity: one past the last one.
  S_END_SENTINEL
}; // enum class Sev

// Free functions.

/**
 * Prints the Sev's name without `S_`, such as `TRACE`.
 *
 * @param os
 *        Stream.
 * @param val
 *        Value.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Sev val);

/**
 * Reads a Sev printed by `operator<<()` (in any letter case) or as its number.  A token that is neither
 * yields Sev::S_NONE.  The token is the longest run of letters, digits and `_` at the front of the stream.
 *
 * @param is
 *        Stream.
 * @param val
 *        Result.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Sev& val);

} // namespace ordo::log
