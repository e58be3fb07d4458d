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
#include <boost/thread/future.hpp>
#include <boost/noncopyable.hpp>
#include <atomic>

namespace kmap::persist
{

/**
 * The handle to a background save or load (map::Ordered_map::save_async(), map::Ordered_map::load_async()).
 * It exposes a completion signal (wait(), done()), the operation's result (error()), and a coarse progress
 * percentage (progress()), which is 0 until the operation completes and then 100.  There are no intermediate
 * values, and there is no cancellation.
 *
 * ### Thread safety ###
 * All methods are safe to call concurrently, from any thread.
 */
class Async_result :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /// Constructs a not-yet-completed result with progress 0.
  explicit Async_result();

  // Methods.

  /// Blocks until the operation completes.  Returns immediately if it already has.
  void wait() const;

  /**
   * Returns `true` if and only if the operation has completed; does not block.
   *
   * @return See above.
   */
  bool done() const;

  /**
   * Blocks until the operation completes (if not already), then returns its result: falsy on success.
   *
   * @return See above.
   */
  Error_code error() const;

  /**
   * Returns 0 if the operation has not yet completed, 100 if it has.  Does not block.
   *
   * @return See above.
   */
  int progress() const;

  /**
   * Marks the operation as completed with the given result; progress() becomes 100 before waiters are released.
   * Must be called exactly once, by whoever runs the operation.
   *
   * @param err_code
   *        The result.
   */
  void complete(const Error_code& err_code);

private:
  // Data.

  /// Set to the result by complete().
  boost::promise<Error_code> m_done_promise;

  /// The future of #m_done_promise; shared so that any number of threads may wait and read.
  boost::shared_future<Error_code> m_done_future;

  /// See progress().
  std::atomic<int> m_progress;
}; // class Async_result

} // namespace kmap::persist
