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
#include "kmap/log/ostream_log_msg_writer.hpp"
#include "kmap/util/string_ostream.hpp"

namespace kmap::log
{

// Types.

/**
 * Logger accumulating formatted messages in memory, for tests that check what was logged.  Same filtering and
 * format as Simple_ostream_logger.  Thread-safe, including contents().
 */
class Buffer_logger :
  public Logger
{
public:
  // Constructors/destructor.

  /**
   * Constructs the logger with an empty buffer.
   *
   * @param config
   *        Filter and format settings.  Must outlive `*this`.
   */
  explicit Buffer_logger(Config* config);

  // Methods.

  /**
   * Implements the interface by consulting the Config.
   *
   * @param sev
   *        See Logger.
   * @param component
   *        See Logger.
   * @return See above.
   */
  bool should_log(Sev sev, const Component& component) const override;

  /**
   * Implements the interface by appending the formatted message to the buffer.
   *
   * @param metadata
   *        See Logger.
   * @param msg
   *        See Logger.
   */
  void do_log(const Msg_metadata& metadata, util::String_view msg) override;

  /**
   * Returns a copy of everything logged so far.
   *
   * @return See above.
   */
  std::string contents() const;

private:
  // Data.

  /// See constructor.
  Config* const m_config;

  /// The buffer.
  util::String_ostream m_buffer;

  /// Writes to #m_buffer.
  Ostream_log_msg_writer m_writer;

  /// Protects #m_buffer.
  mutable util::Mutex_non_recursive m_mutex;
}; // class Buffer_logger

} // namespace kmap::log
