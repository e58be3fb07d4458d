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
#include "kmap/persist/async_result.hpp"
#include "kmap/async/single_thread_task_loop.hpp"
#include "kmap/log/log.hpp"
#include <boost/filesystem/path.hpp>
#include <boost/noncopyable.hpp>
#include <string>

namespace kmap::persist
{

/**
 * Drives the byte-level half of saving and loading an image: compression and file I/O on save; file I/O and
 * decompression (detected by the gzip signature) on load.  The codec-level half, turning a map into an image and
 * back, is done by the map itself (map::Ordered_map) with Encoder and Decoder.  In addition the Coordinator
 * runs background units of work, one at a time, in order, on its own thread, each reporting through an
 * Async_result.
 *
 * The thread is started on the first post(); an object that never posts never spawns a thread.
 *
 * ### Thread safety ###
 * All methods are safe to call concurrently.
 */
class Coordinator :
  public log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// A unit of background work: it reports its result through `*err_code`, which is not null.
  using Work = Function<void (Error_code* err_code)>;

  // Constructors/destructor.

  /**
   * Constructs the Coordinator.  No thread is spawned yet.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname
   *        Brief, human-readable nickname of the background thread, for logging.
   */
  explicit Coordinator(log::Logger* logger_ptr, util::String_view nickname);

  /// Executes stop().
  ~Coordinator();

  // Methods.

  /**
   * Writes the given uncompressed image to `path`, gzip-compressing it first if `opts.m_compress`.
   * See write_file_atomically() for the write itself.
   *
   * @param path
   *        Target path.
   * @param image
   *        Uncompressed image.
   * @param opts
   *        Options.
   * @param err_code
   *        See #Error_code docs for error reporting semantics.  Errors: as from gzip_compress() and
   *        write_file_atomically().
   */
  void write_image(const boost::filesystem::path& path, util::String_view image, const Save_options& opts,
                   Error_code* err_code = 0);

  /**
   * Reads the image at `path` into `*image`, decompressing it first if it starts with the gzip signature.
   * The result is not parsed.
   *
   * @param path
   *        Source path.
   * @param image
   *        Target; replaced with the uncompressed image.
   * @param err_code
   *        See #Error_code docs for error reporting semantics.  Errors: as from read_file() and
   *        gzip_decompress().
   */
  void read_image(const boost::filesystem::path& path, std::string* image, Error_code* err_code = 0);

  /**
   * Schedules `work` to run on the background thread, after any work posted before it, and returns the handle
   * through which its completion and result are reported.  If the Coordinator has been stop()ped, `work` is
   * dropped, and the returned handle is already complete with persist::error::Code::S_ASYNC_ABANDONED.
   *
   * @param work
   *        The work.  If it throws a `boost::system::system_error` (such as error::Runtime_error), the handle
   *        reports that exception's code; if it throws another `std::exception`, the handle reports
   *        persist::error::Code::S_ASYNC_WORK_FAILED.  Either way the background thread carries on.
   * @return See above.
   */
  Async_result_ptr post(Work&& work);

  /**
   * Waits for all work posted so far to complete, then stops the background thread.  Subsequent post()s are
   * abandoned.  Idempotent.
   */
  void stop();

private:
  // Data.

  /// The background thread, started lazily by post().
  async::Single_thread_task_loop m_loop;
}; // class Coordinator

} // namespace kmap::persist
