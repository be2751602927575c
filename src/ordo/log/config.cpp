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
#include "ordo/log/config.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/functional/hash.hpp>
#include <cassert>
#include <locale>

namespace ordo::log
{

Config::Config(Sev most_verbose_sev_default) :
  m_use_human_friendly_time_stamps(true),
  m_verbosity_default(most_verbose_sev_default)
{
  // Nothing.
}

bool Config::should_log(Sev sev, const Component& component) const
{
  assert(sev != Sev::S_NONE);

  if (!component.empty())
  {
    util::Lock_guard<util::Mutex_non_recursive> lock(m_mutex);
    const auto sev_it = m_verbosities.find(key_of(component));
    if (sev_it != m_verbosities.end())
    {
      return sev <= sev_it->second;
    }
  }

  return sev <= m_verbosity_default.load(std::memory_order_relaxed);
}

void Config::configure_default_verbosity(Sev most_verbose_sev_default)
{
  m_verbosity_default.store(most_verbose_sev_default, std::memory_order_relaxed);
}

bool Config::configure_component_verbosity_by_name(Sev most_verbose_sev, util::String_view component_name)
{
  util::Lock_guard<util::Mutex_non_recursive> lock(m_mutex);
  const auto key_it = m_components_by_name.find(normalized(component_name));
  if (key_it == m_components_by_name.end())
  {
    return false;
  }
  // else
  m_verbosities[key_it->second] = most_verbose_sev;
  return true;
}

std::string Config::component_name(const Component& component) const
{
  if (component.empty())
  {
    return std::string();
  }
  // else

  util::Lock_guard<util::Mutex_non_recursive> lock(m_mutex);
  const auto name_it = m_names.find(key_of(component));
  return (name_it == m_names.end()) ? std::string() : name_it->second;
}

void Config::add_component_name(const Component_key& key, std::string name)
{
  util::Lock_guard<util::Mutex_non_recursive> lock(m_mutex);
  assert(m_components_by_name.count(name) == 0);
  m_components_by_name.emplace(name, key);
  m_names[key] = std::move(name);
}

void Config::set_component_verbosity(const Component_key& key, Sev most_verbose_sev)
{
  util::Lock_guard<util::Mutex_non_recursive> lock(m_mutex);
  m_verbosities[key] = most_verbose_sev;
}

std::string Config::normalized(util::String_view name) // Static.
{
  return boost::algorithm::to_upper_copy(std::string(name), std::locale::classic());
}

Config::Component_key Config::key_of(const Component& component) // Static.
{
  return Component_key(std::type_index(component.payload_type()), component.payload_raw());
}

size_t Config::Component_key_hash::operator()(const Component_key& key) const
{
  size_t seed = key.first.hash_code();
  boost::hash_combine(seed, key.second);
  return seed;
}

} // namespace ordo::log
