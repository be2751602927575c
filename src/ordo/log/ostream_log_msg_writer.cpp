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
#include "ordo/log/ostream_log_msg_writer.hpp"
#include "ordo/log/config.hpp"
#include <boost/array.hpp>
#include <fmt/format.h>
#include <fmt/chrono.h>
#include <chrono>
#include <ctime>

namespace ordo::log
{

namespace
{

/// Four-letter form of each Sev, indexed by value, as printed in log lines.
const boost::array<util::String_view, size_t(Sev::S_END_SENTINEL)> S_SEV_ABBREVS
  = {{ "none", "warn", "info", "debg", "trce" }};

} // Anonymous namespace

Ostream_log_msg_writer::Ostream_log_msg_writer(const Config& config, std::ostream& os) :
  m_config(config),
  m_use_human_friendly_time_stamps(config.m_use_human_friendly_time_stamps),
  m_os(os)
{
  // Nothing.
}

void Ostream_log_msg_writer::log(const Msg_metadata& metadata, util::String_view msg)
{
  m_os << time_stamp_str(metadata.m_called_when)
       << '[' << S_SEV_ABBREVS[size_t(metadata.m_sev)] << "]: T";
  if (metadata.m_thread_nickname.empty())
  {
    m_os << metadata.m_thread_id;
  }
  else
  {
    m_os << metadata.m_thread_nickname;
  }
  m_os << ": ";

  const auto component_name = m_config.component_name(metadata.m_component);
  if (!component_name.empty())
  {
    m_os << component_name << ": ";
  }

  m_os << metadata.m_src_file << ':' << metadata.m_src_function << '(' << metadata.m_src_line << "): "
       << msg << '\n' << std::flush;
}

std::string Ostream_log_msg_writer::time_stamp_str(Sys_clock::time_point when) const
{
  using std::chrono::duration_cast;
  using std::chrono::microseconds;

  constexpr long long USEC_PER_SEC = 1000 * 1000;

  const long long usec_since_epoch = duration_cast<microseconds>(when.time_since_epoch()).count();
  long long sec = usec_since_epoch / USEC_PER_SEC;
  long long usec = usec_since_epoch % USEC_PER_SEC;
  if (usec < 0) // Before the epoch: round toward the past.
  {
    usec += USEC_PER_SEC;
    --sec;
  }

  if (!m_use_human_friendly_time_stamps)
  {
    return fmt::format("{}.{:06d} ", sec, usec);
  }
  // else

  const std::tm local_tm = fmt::localtime(static_cast<std::time_t>(sec));
  return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:06d} {:%z} ", local_tm, usec, local_tm);
}

} // namespace ordo::log
