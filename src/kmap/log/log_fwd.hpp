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

#include "kmap/util/util_fwd.hpp"
#include <iosfwd>

/**
 * kmap module for logging.  Every kmap class that logs takes a `Logger*` at construction and derives from
 * Log_context; null disables its logging.  Supply Simple_ostream_logger for console output, Buffer_logger to capture
 * output in memory, or implement Logger to route messages elsewhere.
 *
 * A message is built only after Logger::should_log() approves its Sev and Component, so disabled messages cost one
 * virtual call.  Errors are not reported through logging (see kmap::error); they are merely also logged.
 */
namespace kmap::log
{

// Types.

class Buffer_logger;
class Component;
class Config;
class Logger;
class Log_context;
struct Msg_metadata;
class Ostream_log_msg_writer;
class Simple_ostream_logger;

/**
 * Message severity, from most severe to most verbose.  The values are 0, 1, ... in that order, so a Sev can index
 * an array; and `a < b` means `a` is more severe than `b`.
 */
enum class Sev : size_t
{
  /// Not for messages.  As a filter it means: log nothing.
  S_NONE = 0,
  /// The program cannot continue.
  S_FATAL,
  /// A failure worse than a warning.
  S_ERROR,
  /// A failure reported to the caller, or an unusual condition.  Every emitted kmap error code is logged at this level.
  S_WARNING,
  /// Infrequent notable events: construction, eviction, a completed save or load.
  S_INFO,
  /// Like S_INFO but of interest mostly when debugging.
  S_DEBUG,
  /// Per-operation detail; may be voluminous.
  S_TRACE,
  /// Like S_TRACE, plus per-item detail such as each entry of a save or load.
  S_DATA,
  /// Not a severity: one past the last.
  S_END_SENTINEL
}; // enum class Sev

// Free functions.

/**
 * Writes the name of a Sev, such as `WARNING`.
 *
 * @param os
 *        Stream.
 * @param val
 *        Value.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Sev val);

/**
 * Reads a Sev written by `operator<<` (in any letter case) or as its number.  Unrecognized input yields Sev::S_NONE.
 *
 * @param is
 *        Stream.
 * @param val
 *        Result.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Sev& val);

} // namespace kmap::log
