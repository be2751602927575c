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
#include "ordo/log/log.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/array.hpp>
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <cassert>
#include <cctype>
#include <istream>
#include <locale>
#include <ostream>

namespace ordo::log
{

namespace
{

/// Printed names of the Sev values, indexed by value.
const boost::array<util::String_view, size_t(Sev::S_END_SENTINEL)> S_SEV_NAMES
  = {{ "NONE", "WARNING", "INFO", "DEBUG", "TRACE" }};

} // Anonymous namespace

// Static initializations.

boost::thread_specific_ptr<std::string> Logger::s_thread_nickname;

// Logger implementations.

void Logger::log_formatted(const Component& component, Sev sev,
                           util::String_view src_file, util::String_view src_function, unsigned int src_line,
                           util::String_view msg)
{
  Msg_metadata metadata;
  metadata.m_component = component;
  metadata.m_sev = sev;
  metadata.m_src_file = src_file;
  metadata.m_src_function = src_function;
  metadata.m_src_line = src_line;
  metadata.m_called_when = Sys_clock::now();

  const std::string* const nickname = s_thread_nickname.get();
  if (nickname)
  {
    metadata.m_thread_nickname = *nickname;
  }
  else
  {
    metadata.m_thread_id = boost::this_thread::get_id();
  }

  do_log(metadata, msg);
} // Logger::log_formatted()

void Logger::set_thread_nickname(util::String_view nickname) // Static.
{
  s_thread_nickname.reset(nickname.empty() ? 0 : new std::string(nickname));
}

// Component implementations.

Component::Component() :
  m_payload_type(0),
  m_payload_raw(0)
{
  // Nothing.
}

bool Component::empty() const
{
  return !m_payload_type;
}

const std::type_info& Component::payload_type() const
{
  assert(!empty());
  return *m_payload_type;
}

Component::enum_raw_t Component::payload_raw() const
{
  return m_payload_raw;
}

// Log_context implementations.

Log_context::Log_context(Logger* logger) :
  m_logger(logger)
{
  // Nothing.
}

Logger* Log_context::get_logger() const
{
  return m_logger;
}

const Component& Log_context::get_log_component() const
{
  return m_component;
}

void Log_context::swap(Log_context& other)
{
  std::swap(m_logger, other.m_logger);
  std::swap(m_component, other.m_component);
}

// Free function implementations.

std::ostream& operator<<(std::ostream& os, Sev val)
{
  assert(size_t(val) < S_SEV_NAMES.size());
  return os << S_SEV_NAMES[size_t(val)];
}

std::istream& operator>>(std::istream& is, Sev& val)
{
  using Traits = std::istream::traits_type;

  std::string token;
  for (auto ch = is.peek(); (ch != Traits::eof()) && (std::isalnum(ch) || (ch == '_')); ch = is.peek())
  {
    token += char(is.get());
  }

  val = Sev::S_NONE;

  size_t number;
  if (boost::conversion::try_lexical_convert(token, number))
  {
    if (number < S_SEV_NAMES.size())
    {
      val = Sev(number);
    }
    return is;
  }
  // else

  const auto name_it = std::find_if(S_SEV_NAMES.begin(), S_SEV_NAMES.end(), [&](util::String_view name)
  {
    return boost::algorithm::iequals(token, name, std::locale::classic());
  });
  if (name_it != S_SEV_NAMES.end())
  {
    val = Sev(name_it - S_SEV_NAMES.begin());
  }
  return is;
} // operator>>(Sev)

} // namespace ordo::log
