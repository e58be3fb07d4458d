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
#include "kmap/async/single_thread_task_loop.hpp"
#include "kmap/log/config.hpp"
#include <boost/asio/post.hpp>
#include <boost/thread/future.hpp>

namespace kmap::async
{

Single_thread_task_loop::Single_thread_task_loop(log::Logger* logger_ptr, util::String_view nickname) :
  log::Log_context(logger_ptr, Kmap_log_component::S_ASYNC),
  m_nickname(nickname),
  m_task_engine(1), // Concurrency hint: 1 thread.
  m_state(State::S_NOT_STARTED)
{
  KMAP_LOG_INFO("Single_thread_task_loop [" << static_cast<const void*>(this) << "] "
                "with nickname [" << m_nickname << "]: Created; awaiting start().");
}

Single_thread_task_loop::~Single_thread_task_loop()
{
  KMAP_LOG_INFO("Single_thread_task_loop [" << this << "]: Destroying object.");
  stop();
}

void Single_thread_task_loop::start()
{
  using boost::asio::make_work_guard;
  using boost::promise;
  using log::Logger;
  using Log_config = log::Config;

  util::Lock_guard_non_recursive lock(m_mutex);

  if (m_state != State::S_NOT_STARTED)
  {
    KMAP_LOG_TRACE("Single_thread_task_loop [" << this << "]: start() ignored: already started or stopped.");
    return;
  }
  // else

  m_work_guard.emplace(make_work_guard(m_task_engine));

  // Apply any current verbosity override to the new thread, as it would apply to this one.
  const auto sev_override = *(Log_config::this_thread_verbosity_override());
  promise<void> up_promise;

  m_worker.reset(new util::Thread([this, sev_override, &up_promise]()
  {
    {
      const auto sev_override_auto = Log_config::this_thread_verbosity_override_auto(sev_override);
      Logger::this_thread_set_logged_nickname(m_nickname, get_logger());
      KMAP_LOG_TRACE("Worker thread starting.");
    }

    boost::asio::post(m_task_engine, [&up_promise]() { up_promise.set_value(); });

    m_task_engine.run();

    const auto sev_override_auto = Log_config::this_thread_verbosity_override_auto(sev_override);
    KMAP_LOG_INFO("Event loop finished: Single_thread_task_loop [" << this << "] stopped.  Thread exit imminent.");
  }));

  m_worker_id = m_worker->get_id();
  up_promise.get_future().wait();
  m_state = State::S_STARTED;

  KMAP_LOG_INFO("Single_thread_task_loop [" << this << "]: Worker thread [T" << m_worker_id << "] is up.");
} // Single_thread_task_loop::start()

void Single_thread_task_loop::stop()
{
  std::unique_ptr<util::Thread> worker;
  {
    util::Lock_guard_non_recursive lock(m_mutex);

    if (m_state != State::S_STARTED)
    {
      m_state = State::S_STOPPED;
      return;
    }
    // else

    KMAP_LOG_INFO("Single_thread_task_loop [" << this << "]: Waiting for worker thread [T" << m_worker_id << "] "
                  "to run remaining tasks and finish.");

    // From now on post() is refused; and with no guard, run() returns once the queue is empty.
    m_state = State::S_STOPPED;
    m_work_guard.reset();
    worker = std::move(m_worker);
  } // Unlock: the remaining tasks may call in_thread().

  worker->join();

  KMAP_LOG_TRACE("Single_thread_task_loop [" << this << "]: Thread stopped/joined; stop() return imminent.");
}

bool Single_thread_task_loop::post(Task&& task)
{
  util::Lock_guard_non_recursive lock(m_mutex);

  if (m_state != State::S_STARTED)
  {
    KMAP_LOG_WARNING("Single_thread_task_loop [" << this << "]: post() refused: loop is not running.");
    return false;
  }
  // else

  boost::asio::post(m_task_engine, std::move(task));
  return true;
}

bool Single_thread_task_loop::in_thread() const
{
  util::Lock_guard_non_recursive lock(m_mutex);
  return boost::this_thread::get_id() == m_worker_id; // Corner case: false before start().
}

} // namespace kmap::async
