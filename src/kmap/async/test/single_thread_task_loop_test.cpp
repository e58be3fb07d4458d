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

#include "kmap/async/single_thread_task_loop.hpp"
#include "kmap/test/test_logger.hpp"
#include <boost/thread/future.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <vector>

namespace kmap::async::test
{

namespace
{
using kmap::test::Test_logger;
using std::vector;
} // Anonymous namespace

TEST(Single_thread_task_loop, Posts_run_in_order_on_worker)
{
  Test_logger logger;
  Single_thread_task_loop loop(&logger, "test_loop");

  EXPECT_FALSE(loop.post([]() {})) << "Post before start() must be refused.";

  loop.start();
  loop.start(); // No-op.
  EXPECT_FALSE(loop.in_thread());

  vector<int> order; // Touched only by the worker until stop() returns.
  std::atomic<bool> all_in_thread(true);
  for (int i = 0; i != 100; ++i)
  {
    EXPECT_TRUE(loop.post([&, i]()
    {
      order.push_back(i);
      if (!loop.in_thread())
      {
        all_in_thread = false;
      }
    }));
  }

  boost::promise<void> done_promise;
  auto done_future = done_promise.get_future();
  loop.post([&]() { done_promise.set_value(); });
  done_future.wait();

  loop.stop();
  ASSERT_EQ(order.size(), 100u);
  for (int i = 0; i != 100; ++i)
  {
    EXPECT_EQ(order[i], i);
  }
  EXPECT_TRUE(all_in_thread);

  EXPECT_FALSE(loop.post([]() {})) << "Post after stop() must be refused.";
  loop.stop(); // No-op.
}

TEST(Single_thread_task_loop, Stop_drains_queue)
{
  Test_logger logger;
  std::atomic<int> n_ran(0);
  {
    Single_thread_task_loop loop(&logger, "drain_loop");
    loop.start();
    for (int i = 0; i != 50; ++i)
    {
      loop.post([&]() { boost::this_thread::sleep_for(boost::chrono::milliseconds(1)); ++n_ran; });
    }
    // Destructor stop()s, which must let all 50 run.
  }
  EXPECT_EQ(n_ran, 50);
}

} // namespace kmap::async::test
