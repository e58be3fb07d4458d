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

#include "kmap/log/log.hpp"
#include <boost/io/ios_state.hpp>
#include <ostream>

namespace kmap::log
{

// Types.

/**
 * Formats messages onto an `ostream`, one line each:
 *
 *   `<time stamp> [<SEV>] T<thread nickname or ID>: <COMPONENT>: <file>:<function>(<line>): <msg>`
 *
 * The component part is omitted for messages without a (registered) component.  The time stamp is the local date and
 * time with microseconds and UTC offset, or seconds since the Epoch, per Config::m_use_human_friendly_time_stamps.
 *
 * Not thread-safe; the owning Logger serializes log() calls.  The stream's formatting state is restored on
 * destruction.
 */
class Ostream_log_msg_writer :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs the writer.
   *
   * @param config
   *        Naming and time stamp settings.  Must outlive `*this`.
   * @param os
   *        Output.  Must outlive `*this`.
   */
  explicit Ostream_log_msg_writer(const Config& config, std::ostream& os);

  // Methods.

  /**
   * Writes one message, then flushes.
   *
   * @param metadata
   *        Message attributes.
   * @param msg
   *        Message text.
   */
  void log(const Msg_metadata& metadata, util::String_view msg);

private:
  // Data.

  /// See constructor.
  const Config& m_config;

  /// See constructor.
  std::ostream& m_os;

  /// #m_os formatting as of construction.
  boost::io::ios_all_saver m_os_state_saver;
}; // class Ostream_log_msg_writer

} // namespace kmap::log
