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

#include "kmap/async/async_fwd.hpp"
#include "kmap/log/log.hpp"
#include <boost/noncopyable.hpp>
#include <memory>
#include <optional>
#include <string>

namespace kmap::async
{

/**
 * A single-threaded event loop: one worker thread executing a boost.asio `io_context`, onto which tasks are
 * post()ed from any thread and executed one at a time, in order.
 *
 * Lifecycle: construct (no thread yet); start() (spawns the thread and waits until it is up); post() any number of
 * times; stop() (lets already-posted tasks run to completion, then joins the thread).  stop() is also invoked by the
 * destructor.  A stopped loop cannot be restarted; a post() outside the started-and-not-stopped window is
 * refused (returns `false`, and the task is dropped).
 *
 * The worker thread's logged nickname (and OS thread name) is the nickname given to the constructor.
 *
 * ### Thread safety ###
 * All methods may be called concurrently, except that the destructor must not race with anything.  A task must not
 * call stop() (deadlock).
 */
class Single_thread_task_loop :
  public log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs object, making it available for post() immediately after start().  No thread is spawned yet.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param nickname
   *        Brief, human-readable nickname of the new thread pool, as of this writing for logging only.
   */
  explicit Single_thread_task_loop(log::Logger* logger_ptr, util::String_view nickname);

  /// Executes stop(): runs any posted tasks, then joins the thread.
  ~Single_thread_task_loop();

  // Methods.

  /**
   * Starts the worker thread and returns once it is running.  No-op if already started (or stopped).
   */
  void start();

  /**
   * Waits for all tasks posted so far to complete, then stops and joins the worker thread.  Idempotent.
   * No-op if not start()ed.
   */
  void stop();

  /**
   * Schedules the given task to execute on the worker thread, after all tasks posted before it.
   *
   * @param task
   *        Task to execute.  Exceptions must not escape it.
   * @return `true` if scheduled; `false` if not started or already stopped (`task` is then dropped).
   */
  bool post(Task&& task);

  /**
   * Returns `true` if and only if the caller is executing on the worker thread.
   *
   * @return See above.
   */
  bool in_thread() const;

private:
  // Types.

  /// Lifecycle state.
  enum class State
  {
    /// Before start().
    S_NOT_STARTED,
    /// After start(), before stop().
    S_STARTED,
    /// After stop().
    S_STOPPED
  };

  // Data.

  /// Nickname from ctor.
  const std::string m_nickname;

  /// The `io_context` run() by #m_worker.
  util::Task_engine m_task_engine;

  /// Keeps `m_task_engine.run()` from returning while there are no tasks; reset by stop().
  std::optional<util::Work_guard> m_work_guard;

  /// The worker thread; null before start().
  std::unique_ptr<util::Thread> m_worker;

  /// ID of #m_worker; default (not-a-thread) before start().
  util::Thread_id m_worker_id;

  /// Current state.
  State m_state;

  /// Protects #m_state, #m_work_guard, #m_worker, #m_worker_id.
  mutable util::Mutex_non_recursive m_mutex;
}; // class Single_thread_task_loop

} // namespace kmap::async
