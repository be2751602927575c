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

#include "ordo/log/log.hpp"
#include <boost/noncopyable.hpp>
#include <ostream>
#include <string>

namespace ordo::log
{

// Types.

/**
 * Formats log messages onto an `ostream`, one line each:
 *
 *   ~~~
 *   <time stamp> [<sev>]: T<thread nickname or ID>: <component>: <file>:<function>(<line>): <msg>
 *   ~~~
 *
 * The `<component>: ` part is left out for components without a name in the Config.  The time stamp format is
 * chosen by Config::m_use_human_friendly_time_stamps.
 *
 * Not thread-safe: the Logger owning it must serialize log() calls.
 */
class Ostream_log_msg_writer :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs the writer.  Neither argument is owned; both must outlive `*this`.
   *
   * @param config
   *        Supplies component names and the time stamp format.
   * @param os
   *        Where lines go.
   */
  explicit Ostream_log_msg_writer(const Config& config, std::ostream& os);

  // Methods.

  /**
   * Writes the line for one message, and flushes.
   *
   * @param metadata
   *        Message metadata.
   * @param msg
   *        Message text.
   */
  void log(const Msg_metadata& metadata, util::String_view msg);

private:
  // Methods.

  /**
   * The time stamp part of a line, including its trailing space.
   *
   * @param when
   *        Time.
   * @return See above.
   */
  std::string time_stamp_str(Sys_clock::time_point when) const;

  // Data.

  /// See constructor.
  const Config& m_config;

  /// Copied from the Config at construction.
  const bool m_use_human_friendly_time_stamps;

  /// See constructor.
  std::ostream& m_os;
}; // class Ostream_log_msg_writer

} // namespace ordo::log
