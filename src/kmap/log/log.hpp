/* kmap
 * Copyright 2026 The kmap Authors.
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

#include "kmap/log/log_fwd.hpp"
#include "kmap/util/util.hpp"
#include "kmap/util/string_ostream.hpp"
#include <boost/thread/tss.hpp>
#include <boost/noncopyable.hpp>
#include <chrono>
#include <string>
#include <typeinfo>
#include <typeindex>

// Macros.

/**
 * Logs a WARNING message to `get_logger()`, with component `get_log_component()`, if that Logger's
 * Logger::should_log() allows it.  Both names must be visible at the call site: inside a Log_context subclass they
 * are its methods; elsewhere KMAP_LOG_SET_CONTEXT() declares them.  A null `get_logger()` makes this a no-op.
 *
 * Source file, function, line, thread and time are attached automatically.
 *
 * @param ARG_stream_fragment
 *        What one would write after `os <<`, such as `"x = [" << x << "]."`.  Evaluated only if the message
 *        is logged.
 */
#define KMAP_LOG_WARNING(ARG_stream_fragment) \
  KMAP_LOG_WITH_CHECKING(::kmap::log::Sev::S_WARNING, ARG_stream_fragment)

/**
 * Like KMAP_LOG_WARNING() but at severity FATAL.
 *
 * @param ARG_stream_fragment
 *        See KMAP_LOG_WARNING().
 */
#define KMAP_LOG_FATAL(ARG_stream_fragment) \
  KMAP_LOG_WITH_CHECKING(::kmap::log::Sev::S_FATAL, ARG_stream_fragment)

/**
 * Like KMAP_LOG_WARNING() but at severity ERROR.
 *
 * @param ARG_stream_fragment
 *        See KMAP_LOG_WARNING().
 */
#define KMAP_LOG_ERROR(ARG_stream_fragment) \
  KMAP_LOG_WITH_CHECKING(::kmap::log::Sev::S_ERROR, ARG_stream_fragment)

/**
 * Like KMAP_LOG_WARNING() but at severity INFO.
 *
 * @param ARG_stream_fragment
 *        See KMAP_LOG_WARNING().
 */
#define KMAP_LOG_INFO(ARG_stream_fragment) \
  KMAP_LOG_WITH_CHECKING(::kmap::log::Sev::S_INFO, ARG_stream_fragment)

/**
 * Like KMAP_LOG_WARNING() but at severity DEBUG.
 *
 * @param ARG_stream_fragment
 *        See KMAP_LOG_WARNING().
 */
#define KMAP_LOG_DEBUG(ARG_stream_fragment) \
  KMAP_LOG_WITH_CHECKING(::kmap::log::Sev::S_DEBUG, ARG_stream_fragment)

/**
 * Like KMAP_LOG_WARNING() but at severity TRACE.
 *
 * @param ARG_stream_fragment
 *        See KMAP_LOG_WARNING().
 */
#define KMAP_LOG_TRACE(ARG_stream_fragment) \
  KMAP_LOG_WITH_CHECKING(::kmap::log::Sev::S_TRACE, ARG_stream_fragment)

/**
 * Like KMAP_LOG_WARNING() but at severity DATA.
 *
 * @param ARG_stream_fragment
 *        See KMAP_LOG_WARNING().
 */
#define KMAP_LOG_DATA(ARG_stream_fragment) \
  KMAP_LOG_WITH_CHECKING(::kmap::log::Sev::S_DATA, ARG_stream_fragment)

/**
 * Declares, for the rest of the enclosing block, the `get_logger()` and `get_log_component()` that the
 * `KMAP_LOG_*()` macros use; for free functions and other code outside a Log_context.
 *
 * @param ARG_logger_ptr
 *        `Logger*` to log to; may be null.
 * @param ARG_component_payload
 *        `enum` value from which a Component is constructed.
 */
#define KMAP_LOG_SET_CONTEXT(ARG_logger_ptr, ARG_component_payload) \
  KMAP_LOG_SET_LOGGER(ARG_logger_ptr); \
  KMAP_LOG_SET_COMPONENT(ARG_component_payload)

/**
 * The `get_logger()` half of KMAP_LOG_SET_CONTEXT().
 *
 * @param ARG_logger_ptr
 *        See KMAP_LOG_SET_CONTEXT().
 */
#define KMAP_LOG_SET_LOGGER(ARG_logger_ptr) \
  [[maybe_unused]] const auto get_logger \
    = [KMAP_LOG_logger_ptr = static_cast<::kmap::log::Logger*>(ARG_logger_ptr)]() -> ::kmap::log::Logger* \
      { \
        return KMAP_LOG_logger_ptr; \
      }

/**
 * The `get_log_component()` half of KMAP_LOG_SET_CONTEXT().
 *
 * @param ARG_component_payload
 *        See KMAP_LOG_SET_CONTEXT().
 */
#define KMAP_LOG_SET_COMPONENT(ARG_component_payload) \
  [[maybe_unused]] const auto get_log_component \
    = [KMAP_LOG_component = ::kmap::log::Component(ARG_component_payload)]() -> const ::kmap::log::Component& \
      { \
        return KMAP_LOG_component; \
      }

/**
 * Logs a message of the given severity if `get_logger()` is not null and its Logger::should_log() allows it.
 *
 * @param ARG_sev
 *        A log::Sev.
 * @param ARG_stream_fragment
 *        See KMAP_LOG_WARNING().
 */
#define KMAP_LOG_WITH_CHECKING(ARG_sev, ARG_stream_fragment) \
  KMAP_UTIL_SEMICOLON_SAFE \
  ( \
    ::kmap::log::Logger* const KMAP_LOG_chk_logger = get_logger(); \
    if (KMAP_LOG_chk_logger && KMAP_LOG_chk_logger->should_log(ARG_sev, get_log_component())) \
    { \
      KMAP_LOG_BUILD_AND_LOG(KMAP_LOG_chk_logger, ARG_sev, ARG_stream_fragment); \
    } \
  )

/**
 * Logs a message of the given severity if `get_logger()` is not null, skipping Logger::should_log().  For use
 * after the caller checked should_log() once for a group of messages.
 *
 * @param ARG_sev
 *        A log::Sev.
 * @param ARG_stream_fragment
 *        See KMAP_LOG_WARNING().
 */
#define KMAP_LOG_WITHOUT_CHECKING(ARG_sev, ARG_stream_fragment) \
  KMAP_UTIL_SEMICOLON_SAFE \
  ( \
    ::kmap::log::Logger* const KMAP_LOG_no_chk_logger = get_logger(); \
    if (KMAP_LOG_no_chk_logger) \
    { \
      KMAP_LOG_BUILD_AND_LOG(KMAP_LOG_no_chk_logger, ARG_sev, ARG_stream_fragment); \
    } \
  )

/// @cond
// Internal to the above: statements (not semicolon-safe) that format the message and hand it to log::log_msg().
#define KMAP_LOG_BUILD_AND_LOG(ARG_logger_ptr, ARG_sev, ARG_stream_fragment) \
  constexpr ::kmap::util::String_view KMAP_LOG_file \
    = ::kmap::util::get_last_path_segment(::kmap::util::String_view(__FILE__, sizeof(__FILE__) - 1)); \
  const ::kmap::util::String_view KMAP_LOG_function(__FUNCTION__, sizeof(__FUNCTION__) - 1); \
  ::kmap::util::String_ostream KMAP_LOG_os; \
  KMAP_LOG_os.os() << ARG_stream_fragment << ::std::flush; \
  ::kmap::log::log_msg(ARG_logger_ptr, get_log_component(), ARG_sev, \
                       KMAP_LOG_file, __LINE__, KMAP_LOG_function, KMAP_LOG_os.str())
/// @endcond

namespace kmap::log
{

// Types.

/**
 * The component of a log message: a value of some `enum class` with underlying type #enum_raw_t, remembered along
 * with the identity of that `enum` type, so that components from different `enum`s never compare equal.  kmap's own
 * `enum` is #Kmap_log_component; a user may log with one of their own.  A default-constructed Component is empty
 * (no component).
 */
class Component
{
public:
  // Types.

  /// Required underlying type of a payload `enum`.
  using enum_raw_t = unsigned int;

  // Constructors/destructor.

  /// Constructs an empty Component.
  Component();

  /**
   * Constructs a Component holding the given `enum` value.
   *
   * @tparam Payload
   *         `enum class Payload : enum_raw_t`.
   * @param payload
   *        The value.
   */
  template<typename Payload>
  Component(Payload payload);

  // Methods.

  /**
   * Returns `true` if and only if default-constructed.
   *
   * @return See above.
   */
  bool empty() const;

  /**
   * Returns the held value.  Undefined behavior if empty() or if `Payload` is not the type given to the
   * constructor.
   *
   * @tparam Payload
   *         See constructor.
   * @return See above.
   */
  template<typename Payload>
  Payload payload() const;

  /**
   * Returns the identity of the payload's `enum` type.  Undefined behavior if empty().
   *
   * @return See above.
   */
  std::type_index payload_type_index() const;

  /**
   * Returns the payload as its underlying integer.  Undefined behavior if empty().
   *
   * @return See above.
   */
  enum_raw_t payload_enum_raw_value() const;

private:
  // Data.

  /// `typeid(Payload)`; null if empty().
  const std::type_info* m_payload_type_or_null;

  /// The payload as an integer.
  enum_raw_t m_payload_enum_raw_value;
}; // class Component

/// Everything known about a message at its call site, besides its text.  Passed to Logger::do_log().
struct Msg_metadata
{
  // Types.

  /// Clock of #m_called_when.  Wall-clock, so that it can be shown as a date and time.
  using Time_stamp = std::chrono::system_clock::time_point;

  // Data.

  /// Component; possibly empty.
  Component m_msg_component;

  /// Severity.
  Sev m_msg_sev;

  /// Source file name, without directories.  Refers to static storage.
  util::String_view m_msg_src_file;

  /// Source line.
  unsigned int m_msg_src_line;

  /// Function name.  Refers to static storage.
  util::String_view m_msg_src_function;

  /// When the message was logged.
  Time_stamp m_called_when;

  /// Nickname of the logging thread (see Logger::this_thread_set_logged_nickname()); empty if none.
  std::string m_call_thread_nickname;

  /// ID of the logging thread.
  util::Thread_id m_call_thread_id;
}; // struct Msg_metadata

/**
 * Interface of a log sink.  Implementations decide which messages to keep (should_log()) and where to put them
 * (do_log()).  Both methods may be called concurrently from any thread, so implementations must be thread-safe.
 */
class Logger :
  public util::Null_interface,
  private boost::noncopyable
{
public:
  // Methods.

  /**
   * Returns `true` if a message of the given severity and component is to be logged.  Called before the message
   * is formatted.
   *
   * @param sev
   *        Severity.
   * @param component
   *        Component; may be empty.
   * @return See above.
   */
  virtual bool should_log(Sev sev, const Component& component) const = 0;

  /**
   * Logs a message approved by should_log().
   *
   * @param metadata
   *        Everything about the message except its text.  Valid only during the call.
   * @param msg
   *        The text.  Valid only during the call.
   */
  virtual void do_log(const Msg_metadata& metadata, util::String_view msg) = 0;

  /**
   * Names the calling thread for logging purposes (and, truncated as needed, for the OS, as shown by `top -H`).
   * Messages from this thread then show the nickname instead of the thread ID.
   *
   * @param thread_nickname
   *        The name; empty to remove it.
   * @param logger_ptr
   *        If not null, the change is logged to it.
   */
  static void this_thread_set_logged_nickname(util::String_view thread_nickname = util::String_view(),
                                              Logger* logger_ptr = 0);

  /**
   * Returns the calling thread's nickname; empty if none.
   *
   * @return See above.
   */
  static util::String_view this_thread_logged_nickname();

private:
  // Data.

  /// Each thread's nickname; null if none.
  static boost::thread_specific_ptr<std::string> s_this_thread_nickname_ptr;
}; // class Logger

/**
 * Holder of a `Logger*` and a Component, exposing them as get_logger() and get_log_component().  A class that logs
 * derives from this, after which the `KMAP_LOG_*()` macros work in its methods.  Copyable.
 */
class Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs with the given Logger and an empty Component.
   *
   * @param logger
   *        May be null.
   */
  explicit Log_context(Logger* logger = 0);

  /**
   * Constructs with the given Logger and Component.
   *
   * @tparam Component_payload
   *         See Component constructor.
   * @param logger
   *        May be null.
   * @param component_payload
   *        See Component constructor.
   */
  template<typename Component_payload>
  explicit Log_context(Logger* logger, Component_payload component_payload);

  // Methods.

  /**
   * Returns the Logger; possibly null.
   *
   * @return See above.
   */
  Logger* get_logger() const;

  /**
   * Returns the Component.
   *
   * @return See above.
   */
  const Component& get_log_component() const;

private:
  // Data.

  /// See get_logger().
  Logger* m_logger;

  /// See get_log_component().
  Component m_component;
}; // class Log_context

// Free functions.

/**
 * Hands a formatted message to `logger->do_log()`, filling in the time and the calling thread's identity.  Does not
 * call should_log().  The `KMAP_LOG_*()` macros end up here; direct use is rarely needed.
 *
 * @param logger
 *        Must not be null.
 * @param component
 *        See Msg_metadata.
 * @param sev
 *        See Msg_metadata.
 * @param src_file
 *        See Msg_metadata.
 * @param src_line
 *        See Msg_metadata.
 * @param src_function
 *        See Msg_metadata.
 * @param msg
 *        The text.
 */
void log_msg(Logger* logger, const Component& component, Sev sev,
             util::String_view src_file, unsigned int src_line, util::String_view src_function,
             util::String_view msg);

// Template implementations.

template<typename Payload>
Component::Component(Payload payload) :
  m_payload_type_or_null(&(typeid(Payload))),
  m_payload_enum_raw_value(static_cast<enum_raw_t>(payload))
{
  static_assert(std::is_enum_v<Payload>, "Component payload must be an enum.");
  static_assert(std::is_same_v<std::underlying_type_t<Payload>, enum_raw_t>,
                "Component payload enum must have underlying type enum_raw_t.");
}

template<typename Payload>
Payload Component::payload() const
{
  return static_cast<Payload>(m_payload_enum_raw_value);
}

template<typename Component_payload>
Log_context::Log_context(Logger* logger, Component_payload component_payload) :
  m_logger(logger),
  m_component(component_payload)
{
  // Nothing.
}

} // namespace kmap::log
