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

#include "kmap/persist/persist_fwd.hpp"
#include "kmap/log/log.hpp"
#include <boost/filesystem.hpp>
#include <string>

namespace kmap::persist
{

// Free functions.

/**
 * Writes `bytes` as the entire contents of the file at `path`, creating the parent directories as needed.  The
 * bytes are first written to a temporary file in the same directory, which is then renamed over `path`; so a
 * reader of `path` sees either the old file or the complete new one.  The temporary file is removed on failure.
 * There is no `fsync()`: after a crash the file may be empty or absent.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param path
 *        Target path.
 * @param bytes
 *        Contents.
 * @param err_code
 *        See #Error_code docs for error reporting semantics.  Errors: whatever boost.filesystem reports when
 *        creating the directories, writing, or renaming (e.g., `boost::system::errc::permission_denied`).
 */
void write_file_atomically(log::Logger* logger_ptr, const boost::filesystem::path& path, util::String_view bytes,
                           Error_code* err_code = 0);

/**
 * Reads the entire contents of the file at `path` into `*bytes` (replacing its contents).
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param path
 *        Source path.
 * @param bytes
 *        Target.
 * @param err_code
 *        See #Error_code docs for error reporting semantics.  Errors: whatever boost.filesystem reports (e.g.,
 *        `boost::system::errc::no_such_file_or_directory`); `boost::system::errc::io_error` if the read itself fails.
 */
void read_file(log::Logger* logger_ptr, const boost::filesystem::path& path, std::string* bytes,
               Error_code* err_code = 0);

} // namespace kmap::persist
