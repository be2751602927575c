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
#include <boost/scoped_ptr.hpp>
#include <iostream>

namespace ordo::log
{

// Types.

/**
 * Logger for the console: messages of Sev::S_WARNING go to one stream (`std::cerr` by default), the rest to
 * another (`std::cout` by default).  The two may be the same stream.  Output is immediate, in the logging thread,
 * one whole line at a time.
 */
class Simple_ostream_logger :
  public Logger
{
public:
  // Constructors/destructor.

  /**
   * Constructs the logger.  Nothing is owned; all arguments must outlive `*this`.
   *
   * @param config
   *        Filter and format.
   * @param os
   *        Stream for Sev::S_INFO and more verbose.
   * @param os_for_err
   *        Stream for Sev::S_WARNING.
   */
  explicit Simple_ostream_logger(Config* config,
                                 std::ostream& os = std::cout, std::ostream& os_for_err = std::cerr);

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
   * Implements interface: writes the line to the stream for its severity.
   *
   * @param metadata
   *        Metadata.
   * @param msg
   *        Message.
   */
  void do_log(const Msg_metadata& metadata, util::String_view msg) override;

private:
  // Data.

  /// See constructor.
  Config* const m_config;

  /// Writes to the `os` stream.
  Ostream_log_msg_writer m_writer;

  /// Writes to the `os_for_err` stream; null if it is the same as `os`.
  boost::scoped_ptr<Ostream_log_msg_writer> m_err_writer;

  /// Serializes do_log().
  util::Mutex_non_recursive m_mutex;
}; // class Simple_ostream_logger

} // namespace ordo::log
