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

#include "ordo/log/log_fwd.hpp"
#include "ordo/util/util.hpp"
#include "ordo/util/string_ostream.hpp"
#include <boost/thread/tss.hpp>
#include <boost/noncopyable.hpp>
#include <string>
#include <typeinfo>
#include <type_traits>

// Macros.

/**
 * Logs a WARNING message to `*get_logger()` under `get_log_component()`, if the Logger lets it through.
 * Inside a class deriving from ordo::log::Log_context both functions are inherited; elsewhere use
 * ORDO_LOG_SET_CONTEXT() first.
 *
 * @param ...
 *        What one would write after `os <<`, without a trailing newline.  Evaluated only if the message is logged.
 *        May contain top-level commas.
 */
#define ORDO_LOG_WARNING(...) \
  ORDO_LOG_WITH_CHECKING(::ordo::log::Sev::S_WARNING, __VA_ARGS__)

/**
 * As ORDO_LOG_WARNING() but at INFO severity.
 * @param ...
 *        See ORDO_LOG_WARNING().
 */
#define ORDO_LOG_INFO(...) \
  ORDO_LOG_WITH_CHECKING(::ordo::log::Sev::S_INFO, __VA_ARGS__)

/**
 * As ORDO_LOG_WARNING() but at DEBUG severity.
 * @param ...
 *        See ORDO_LOG_WARNING().
 */
#define ORDO_LOG_DEBUG(...) \
  ORDO_LOG_WITH_CHECKING(::ordo::log::Sev::S_DEBUG, __VA_ARGS__)

/**
 * As ORDO_LOG_WARNING() but at TRACE severity.
 * @param ...
 *        See ORDO_LOG_WARNING().
 */
#define ORDO_LOG_TRACE(...) \
  ORDO_LOG_WITH_CHECKING(::ordo::log::Sev::S_TRACE, __VA_ARGS__)

/**
 * Defines `get_logger()` and `get_log_component()` for the rest of the enclosing block, so that the `ORDO_LOG_*()`
 * macros can be used in free functions and `static` methods.
 *
 * @param ARG_logger_ptr
 *        `Logger*`; may be null.
 * @param ARG_component_payload
 *        Value of an `enum` usable as a Component payload, such as `Ordo_log_component::S_PMAP`.
 */
#define ORDO_LOG_SET_CONTEXT(ARG_logger_ptr, ARG_component_payload) \
  [[maybe_unused]] const auto get_logger \
    = [ORDO_LOG_ctx_logger = static_cast<::ordo::log::Logger*>(ARG_logger_ptr)]() \
        -> ::ordo::log::Logger* { return ORDO_LOG_ctx_logger; }; \
  [[maybe_unused]] const auto get_log_component \
    = [ORDO_LOG_ctx_component = ::ordo::log::Component(ARG_component_payload)]() \
        -> const ::ordo::log::Component& { return ORDO_LOG_ctx_component; }

/**
 * Logs a message of severity `ARG_sev`; see ORDO_LOG_WARNING().  Nothing is evaluated beyond the Logger's
 * should_log() unless the message passes.
 *
 * @param ARG_sev
 *        log::Sev.
 * @param ...
 *        See ORDO_LOG_WARNING().
 */
#define ORDO_LOG_WITH_CHECKING(ARG_sev, ...) \
  ORDO_UTIL_SEMICOLON_SAFE \
  ( \
    ::ordo::log::Logger* const ORDO_LOG_logger = get_logger(); \
    if (ORDO_LOG_logger && ORDO_LOG_logger->should_log(ARG_sev, get_log_component())) \
    { \
      constexpr ::ordo::util::String_view ORDO_LOG_file = ::ordo::util::get_last_path_segment(__FILE__); \
      ::ordo::util::String_ostream ORDO_LOG_msg; \
      ORDO_LOG_msg.os() << __VA_ARGS__ << ::std::flush; \
      ORDO_LOG_logger->log_formatted(get_log_component(), ARG_sev, ORDO_LOG_file, __FUNCTION__, __LINE__, \
                                     ORDO_LOG_msg.str()); \
    } \
  )

namespace ordo::log
{

// Types.

/**
 * The area of the program a log message comes from.  It stores a value of some `enum class` (the payload) as an
 * integer together with the `typeid` of that `enum`, so any number of independent `enum`s can serve as
 * components side by side.  Ordo's own is ordo::Ordo_log_component.  An empty Component means "unspecified".
 */
class Component
{
public:
  // Types.

  /// Required underlying type of payload `enum`s.
  using enum_raw_t = unsigned int;

  // Constructors/destructor.

  /// Constructs an empty Component.
  Component();

  /**
   * Constructs a Component holding `payload`.  Implicit, so that an `enum` value may be passed wherever a
   * Component is expected.
   *
   * @tparam Payload
   *         `enum class` with underlying type #enum_raw_t.
   * @param payload
   *        Value.
   */
  template<typename Payload>
  Component(Payload payload);

  // Methods.

  /**
   * `true` if default-constructed.
   * @return See above.
   */
  bool empty() const;

  /**
   * The payload.  `Payload` must be the type given to the constructor; and `*this` must not be empty().
   *
   * @tparam Payload
   *         See above.
   * @return See above.
   */
  template<typename Payload>
  Payload payload() const;

  /**
   * `typeid` of the payload `enum`.  Requires `!empty()`.
   * @return See above.
   */
  const std::type_info& payload_type() const;

  /**
   * The payload as an integer.  Requires `!empty()`.
   * @return See above.
   */
  enum_raw_t payload_raw() const;

private:
  // Data.

  /// `&typeid(Payload)`; null if empty().
  std::type_info const * m_payload_type;

  /// Payload as an integer; 0 if empty().
  enum_raw_t m_payload_raw;
}; // class Component

/// What is known about a log message besides its text; assembled by Logger::log_formatted().
struct Msg_metadata
{
  // Data.

  /// Area of the program.  May be empty.
  Component m_component;

  /// Severity; never Sev::S_NONE.
  Sev m_sev;

  /// Last path segment of `__FILE__` at the call site.
  util::String_view m_src_file;

  /// `__FUNCTION__` at the call site.
  util::String_view m_src_function;

  /// `__LINE__` at the call site.
  unsigned int m_src_line;

  /// When the message was formatted.
  Sys_clock::time_point m_called_when;

  /// Nickname of the logging thread, if it has one (Logger::set_thread_nickname()); else empty.
  std::string m_thread_nickname;

  /// ID of the logging thread; set only if #m_thread_nickname is empty.
  util::Thread_id m_thread_id;
}; // struct Msg_metadata

/**
 * Destination of log messages; implemented by the user or taken from Ordo (Simple_ostream_logger,
 * Buffer_logger).  Objects that log are given a `Logger*` at construction.
 *
 * An implementation supplies the filter, should_log(), and the output, do_log().  Both are called concurrently by
 * any thread that logs, so both must be thread-safe.  Logging is synchronous: do_log() has finished with its
 * arguments once it returns.
 */
class Logger :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /// Boring `virtual` destructor.
  virtual ~Logger() = default;

  // Methods.

  /**
   * Whether a message of the given severity and component should be logged.  Called for every message, before it
   * is formatted; keep it cheap.
   *
   * @param sev
   *        Severity.
   * @param component
   *        Component; possibly empty.
   * @return See above.
   */
  virtual bool should_log(Sev sev, const Component& component) const = 0;

  /**
   * Outputs a message that has passed should_log().
   *
   * @param metadata
   *        Everything known about the message besides its text.
   * @param msg
   *        The text, without a trailing newline.
   */
  virtual void do_log(const Msg_metadata& metadata, util::String_view msg) = 0;

  /**
   * Time-stamps the message, attaches the calling thread's identity and passes the lot to do_log().  The
   * `ORDO_LOG_*()` macros call this once should_log() has approved the message.
   *
   * @param component
   *        See Msg_metadata.
   * @param sev
   *        See Msg_metadata.
   * @param src_file
   *        See Msg_metadata.
   * @param src_function
   *        See Msg_metadata.
   * @param src_line
   *        See Msg_metadata.
   * @param msg
   *        See do_log().
   */
  void log_formatted(const Component& component, Sev sev,
                     util::String_view src_file, util::String_view src_function, unsigned int src_line,
                     util::String_view msg);

  /**
   * Gives the calling thread a name under which its messages are logged in place of its thread ID; or, if empty,
   * goes back to the ID.
   *
   * @param nickname
   *        Name, or empty.
   */
  static void set_thread_nickname(util::String_view nickname = util::String_view());

private:
  // Data.

  /// Calling thread's nickname; null in a thread that never set one.
  static boost::thread_specific_ptr<std::string> s_thread_nickname;
}; // class Logger

/**
 * A `Logger*` and a Component, with accessors named as the `ORDO_LOG_*()` macros expect.  Deriving from it lets
 * a class log from any member function.  It copies along with the deriving object; so a derived persistent map
 * logs where its source did.
 */
class Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs with an empty Component.
   *
   * @param logger
   *        Logger, or null for no logging.
   */
  explicit Log_context(Logger* logger = 0);

  /**
   * Constructs with a Component of the given payload.
   *
   * @tparam Component_payload
   *         See Component.
   * @param logger
   *        Logger, or null for no logging.
   * @param component_payload
   *        See Component.
   */
  template<typename Component_payload>
  explicit Log_context(Logger* logger, Component_payload component_payload);

  // Methods.

  /**
   * The Logger; possibly null.
   * @return See above.
   */
  Logger* get_logger() const;

  /**
   * The Component.
   * @return See above.
   */
  const Component& get_log_component() const;

  /**
   * Exchanges contents with `other`.
   * @param other
   *        Object.
   */
  void swap(Log_context& other);

private:
  // Data.

  /// See get_logger().
  Logger* m_logger;

  /// See get_log_component().
  Component m_component;
}; // class Log_context

// Template implementations.

template<typename Payload>
Component::Component(Payload payload) :
  m_payload_type(&(typeid(Payload))),
  m_payload_raw(static_cast<enum_raw_t>(payload))
{
  static_assert(std::is_enum_v<Payload> && std::is_same_v<std::underlying_type_t<Payload>, enum_raw_t>,
                "Component payload must be an enum based on enum_raw_t.");
}

template<typename Payload>
Payload Component::payload() const
{
  return static_cast<Payload>(m_payload_raw);
}

template<typename Component_payload>
Log_context::Log_context(Logger* logger, Component_payload component_payload) :
  m_logger(logger),
  m_component(component_payload)
{
  // Nothing.
}

} // namespace ordo::log
