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
#include "kmap/log/log.hpp"
#include "kmap/error/error.hpp"
#include <boost/thread/thread.hpp>
#include <pthread.h>
#include <algorithm>

namespace kmap::log
{

// Static initializations.

boost::thread_specific_ptr<std::string> Logger::s_this_thread_nickname_ptr;

// Logger implementations.

void Logger::this_thread_set_logged_nickname(util::String_view thread_nickname, Logger* logger_ptr) // Static.
{
  using std::string;

  s_this_thread_nickname_ptr.reset(thread_nickname.empty() ? 0 : new string(thread_nickname));

  KMAP_LOG_SET_CONTEXT(logger_ptr, Kmap_log_component::S_LOG);
  KMAP_LOG_INFO("Thread [" << boost::this_thread::get_id() << "] is now nicknamed [" << thread_nickname << "].");

#ifndef KMAP_OS_LINUX
  static_assert(false, "Setting the OS thread name is implemented for Linux only.");
#endif
  // The kernel limits the name to 16 bytes including the NUL.
  constexpr size_t MAX_OS_NAME_SZ = 15;
  string os_name = thread_nickname.empty() ? util::ostream_op_string(boost::this_thread::get_id())
                                           : string(thread_nickname);
  os_name.resize(std::min(os_name.size(), MAX_OS_NAME_SZ));

  const int result = ::pthread_setname_np(::pthread_self(), os_name.c_str());
  if (result != 0)
  {
    const Error_code sys_err_code(result, boost::system::system_category());
    KMAP_LOG_WARNING("Could not set OS thread name to [" << os_name << "].  Details follow.");
    KMAP_ERROR_SYS_ERROR_LOG_WARNING();
  }
} // Logger::this_thread_set_logged_nickname()

util::String_view Logger::this_thread_logged_nickname() // Static.
{
  const auto nickname_ptr = s_this_thread_nickname_ptr.get();
  return nickname_ptr ? util::String_view(*nickname_ptr) : util::String_view();
}

// Component implementations.

Component::Component() :
  m_payload_type_or_null(0),
  m_payload_enum_raw_value(0)
{
  // Nothing.
}

bool Component::empty() const
{
  return !m_payload_type_or_null;
}

std::type_index Component::payload_type_index() const
{
  assert(!empty());
  return std::type_index(*m_payload_type_or_null);
}

Component::enum_raw_t Component::payload_enum_raw_value() const
{
  assert(!empty());
  return m_payload_enum_raw_value;
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

// Free function implementations.

void log_msg(Logger* logger, const Component& component, Sev sev,
             util::String_view src_file, unsigned int src_line, util::String_view src_function,
             util::String_view msg)
{
  assert(logger);
  assert((sev != Sev::S_NONE) && (sev != Sev::S_END_SENTINEL));

  Msg_metadata metadata{ component, sev, src_file, src_line, src_function, std::chrono::system_clock::now(),
                         std::string(Logger::this_thread_logged_nickname()), boost::this_thread::get_id() };
  logger->do_log(metadata, msg);
}

std::ostream& operator<<(std::ostream& os, Sev val)
{
  // Names must stay parseable by istream_to_enum(), as operator>>() relies on it.
  switch (val)
  {
    case Sev::S_NONE: return os << "NONE";
    case Sev::S_FATAL: return os << "FATAL";
    case Sev::S_ERROR: return os << "ERROR";
    case Sev::S_WARNING: return os << "WARNING";
    case Sev::S_INFO: return os << "INFO";
    case Sev::S_DEBUG: return os << "DEBUG";
    case Sev::S_TRACE: return os << "TRACE";
    case Sev::S_DATA: return os << "DATA";
    case Sev::S_END_SENTINEL: break;
  }
  assert(false && "Sentinel or corrupt log::Sev.");
  return os;
}

std::istream& operator>>(std::istream& is, Sev& val)
{
  val = util::istream_to_enum(&is, Sev::S_NONE, Sev::S_END_SENTINEL);
  return is;
}

} // namespace kmap::log
