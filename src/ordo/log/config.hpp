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
#include <boost/unordered_map.hpp>
#include <boost/noncopyable.hpp>
#include <atomic>
#include <string>
#include <typeindex>
#include <utility>

namespace ordo::log
{

// Types.

/**
 * Filtering and formatting settings of the Ordo Logger%s.
 *
 * Filtering: every Component has a verbosity, the most verbose Sev that gets logged for it.  It is the value set by
 * configure_component_verbosity() (or the by-name form) for that component, if any; otherwise the default
 * verbosity.  Formatting: components print under the names given to init_component_names(); unnamed ones print
 * nothing.
 *
 * All methods are safe to call concurrently with each other, so verbosity may be changed while other threads log.
 * #m_use_human_friendly_time_stamps is the exception: set it before constructing a Logger with `*this`.
 */
class Config :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs a Config with no per-component settings and no component names.
   *
   * @param most_verbose_sev_default
   *        Default verbosity.
   */
  explicit Config(Sev most_verbose_sev_default = Sev::S_INFO);

  // Methods.

  /**
   * Whether a message of the given severity and component passes the filter.
   *
   * @param sev
   *        Severity.
   * @param component
   *        Component; if empty, the default verbosity applies.
   * @return See above.
   */
  bool should_log(Sev sev, const Component& component) const;

  /**
   * Registers the printed names of the values of a component `enum`.  Each name is upper-cased and prefixed by
   * `prefix` (also upper-cased).  Names so formed must be unique across all registered `enum`s.
   *
   * @tparam Component_payload
   *         The `enum`.
   * @param names
   *        Name of each value, such as ordo::S_ORDO_LOG_COMPONENT_NAME_MAP.
   * @param prefix
   *        Prefix, such as `"ordo_"`; may be empty.
   */
  template<typename Component_payload>
  void init_component_names(const boost::unordered_map<Component_payload, std::string>& names,
                            util::String_view prefix = util::String_view());

  /**
   * Sets the default verbosity.
   *
   * @param most_verbose_sev_default
   *        New default verbosity.
   */
  void configure_default_verbosity(Sev most_verbose_sev_default);

  /**
   * Sets the verbosity of one component, overriding the default verbosity.
   *
   * @tparam Component_payload
   *         Component `enum`.
   * @param most_verbose_sev
   *        Verbosity.
   * @param component_payload
   *        The component.
   */
  template<typename Component_payload>
  void configure_component_verbosity(Sev most_verbose_sev, Component_payload component_payload);

  /**
   * Same as configure_component_verbosity() but takes a name registered by init_component_names(), with the
   * prefix, in any letter case.
   *
   * @param most_verbose_sev
   *        Verbosity.
   * @param component_name
   *        Name, such as `"ordo_pmap"`.
   * @return `false` if the name is not registered (and nothing changed); otherwise `true`.
   */
  bool configure_component_verbosity_by_name(Sev most_verbose_sev, util::String_view component_name);

  /**
   * Printed name of the component, such as `"ORDO_PMAP"`; empty if it is empty or was never named.
   *
   * @param component
   *        The component.
   * @return See above.
   */
  std::string component_name(const Component& component) const;

  // Data.

  /**
   * If `true` (the default), log lines start with local date and time and the UTC offset; if `false`, with
   * seconds since the Unix epoch.  Both have microsecond resolution.
   */
  bool m_use_human_friendly_time_stamps;

private:
  // Types.

  /// Identity of a Component: its `enum` type and value.
  using Component_key = std::pair<std::type_index, Component::enum_raw_t>;

  /// Hash of a #Component_key.
  struct Component_key_hash
  {
    /**
     * The hash.
     * @param key
     *        Key.
     * @return See above.
     */
    size_t operator()(const Component_key& key) const;
  };

  // Methods.

  /**
   * `name`, upper-cased.
   * @param name
   *        Name.
   * @return See above.
   */
  static std::string normalized(util::String_view name);

  /**
   * The #Component_key of a non-empty Component.
   * @param component
   *        Component.
   * @return See above.
   */
  static Component_key key_of(const Component& component);

  /**
   * Records a name of a component in both directions.
   * @param key
   *        Component.
   * @param name
   *        Normalized name, prefix included.
   */
  void add_component_name(const Component_key& key, std::string name);

  /**
   * Records the verbosity of a component.
   * @param key
   *        Component.
   * @param most_verbose_sev
   *        Verbosity.
   */
  void set_component_verbosity(const Component_key& key, Sev most_verbose_sev);

  // Data.

  /// The default verbosity.
  std::atomic<Sev> m_verbosity_default;

  /// Protects the maps below.
  mutable util::Mutex_non_recursive m_mutex;

  /// Per-component verbosities.
  boost::unordered_map<Component_key, Sev, Component_key_hash> m_verbosities;

  /// Printed name of each named component.
  boost::unordered_map<Component_key, std::string, Component_key_hash> m_names;

  /// Inverse of #m_names.
  boost::unordered_map<std::string, Component_key> m_components_by_name;
}; // class Config

// Template implementations.

template<typename Component_payload>
void Config::init_component_names(const boost::unordered_map<Component_payload, std::string>& names,
                                  util::String_view prefix)
{
  const std::string prefix_normalized = normalized(prefix);
  for (const auto& value_and_name : names)
  {
    add_component_name(key_of(Component(value_and_name.first)), prefix_normalized + normalized(value_and_name.second));
  }
}

template<typename Component_payload>
void Config::configure_component_verbosity(Sev most_verbose_sev, Component_payload component_payload)
{
  set_component_verbosity(key_of(Component(component_payload)), most_verbose_sev);
}

} // namespace ordo::log
