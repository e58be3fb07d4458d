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

#include "kmap/common.hpp"

/**
 * kmap module containing tools facilitating multi-threaded event loops: here, the single-thread task loop on which
 * background persistence work runs.
 */
namespace kmap::async
{

// Types.

class Single_thread_task_loop;

/// Short-hand for a task that can be posted for execution by a Single_thread_task_loop.
using Task = Function<void ()>;

} // namespace kmap::async
