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
#include "kmap/persist/async_result.hpp"

namespace kmap::persist
{

Async_result::Async_result() :
  m_done_future(m_done_promise.get_future()),
  m_progress(0)
{
  // Nothing else.
}

void Async_result::wait() const
{
  m_done_future.wait();
}

bool Async_result::done() const
{
  return m_done_future.is_ready();
}

Error_code Async_result::error() const
{
  return m_done_future.get();
}

int Async_result::progress() const
{
  return m_progress.load();
}

void Async_result::complete(const Error_code& err_code)
{
  m_progress = 100;
  m_done_promise.set_value(err_code);
}

} // namespace kmap::persist
