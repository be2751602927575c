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

#include "ordo/log/ostream_log_msg_writer.hpp"
#include "ordo/util/string_ostream.hpp"
#include <string>

namespace ordo::log
{

// Types.

/**
 * Logger that keeps all output, formatted as by Simple_ostream_logger, in a string; so that tests can inspect what
 * was logged.
 */
class Buffer_logger :
  public Logger
{
public:
  // Constructors/destructor.

  /**
   * Constructs the logger with an empty buffer.
   *
   * @param config
   *        Filter and format.  Not owned; must outlive `*this`.
   */
  explicit Buffer_logger(Config* config);

  // Methods.

  /**
   * Implements interface per the Config.
   *
   * @param sev
   *        Severity.
   * @param component
   *        Component.
   * @return See above.
   */
  bool should_log(Sev sev, const Component& component) const override;

  /**
   * Implements interface: appends the line to the buffer.
   *
   * @param metadata
   *        Metadata.
   * @param msg
   *        Message.
   */
  void do_log(const Msg_metadata& metadata, util::String_view msg) override;

  /**
   * Copy of everything logged since construction or the last buffer_clear().
   * @return See above.
   */
  std::string buffer_str_copy() const;

  /// Empties the buffer.
  void buffer_clear();

private:
  // Data.

  /// See constructor.
  Config* const m_config;

  /// The buffer.
  util::String_ostream m_buf;

  /// Writes into #m_buf.
  Ostream_log_msg_writer m_writer;

  /// Protects #m_buf.
  mutable util::Mutex_non_recursive m_mutex;
}; // class Buffer_logger

} // namespace ordo::log
