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
#include <iostream>
#include <memory>

namespace kmap::log
{

// Types.

/**
 * Logger writing to standard streams: Sev::S_WARNING and more severe messages to one stream (by default `cerr`),
 * the rest to another (by default `cout`).  Messages are filtered by the given Config and formatted by
 * Ostream_log_msg_writer.  Thread-safe; the streams must not be written to by anyone else meanwhile.
 */
class Simple_ostream_logger :
  public Logger
{
public:
  // Constructors/destructor.

  /**
   * Constructs the logger.
   *
   * @param config
   *        Filter and format settings.  Must outlive `*this`.
   * @param os
   *        Stream for messages less severe than Sev::S_WARNING.
   * @param os_for_err
   *        Stream for the rest.  May be `os`.
   */
  explicit Simple_ostream_logger(Config* config,
                                 std::ostream& os = std::cout, std::ostream& os_for_err = std::cerr);

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
   * Implements the interface by writing the message to the stream appropriate to its severity, before returning.
   *
   * @param metadata
   *        See Logger.
   * @param msg
   *        See Logger.
   */
  void do_log(const Msg_metadata& metadata, util::String_view msg) override;

private:
  // Data.

  /// See constructor.
  Config* const m_config;

  /// Writes to `os`.
  Ostream_log_msg_writer m_os_writer;

  /// Writes to `os_for_err`; null if it is the same stream as `os`.
  std::unique_ptr<Ostream_log_msg_writer> m_err_os_writer;

  /// Serializes do_log().
  util::Mutex_non_recursive m_mutex;
}; // class Simple_ostream_logger

} // namespace kmap::log
