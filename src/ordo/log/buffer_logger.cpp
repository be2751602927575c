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
#include "ordo/log/buffer_logger.hpp"
#include "ordo/log/config.hpp"

namespace ordo::log
{

Buffer_logger::Buffer_logger(Config* config) :
  m_config(config),
  m_writer(*m_config, m_buf.os())
{
  // Nothing.
}

bool Buffer_logger::should_log(Sev sev, const Component& component) const // Virtual.
{
  return m_config->should_log(sev, component);
}

void Buffer_logger::do_log(const Msg_metadata& metadata, util::String_view msg) // Virtual.
{
  util::Lock_guard<util::Mutex_non_recursive> lock(m_mutex);
  m_writer.log(metadata, msg);
}

std::string Buffer_logger::buffer_str_copy() const
{
  util::Lock_guard<util::Mutex_non_recursive> lock(m_mutex);
  return m_buf.str();
}

void Buffer_logger::buffer_clear()
{
  util::Lock_guard<util::Mutex_non_recursive> lock(m_mutex);
  m_buf.str_clear();
}

} // namespace ordo::log
