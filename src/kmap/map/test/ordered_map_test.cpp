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

#include "kmap/map/ordered_map.hpp"
#include "kmap/test/test_logger.hpp"
#include "kmap/test/test_file_util.hpp"
#include "kmap/util/util.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <random>
#include <string>
#include <vector>
#include <atomic>

namespace kmap::map::test
{

namespace
{
using kmap::test::Test_logger;
using kmap::test::Temp_dir;
using std::string;
using std::vector;

constexpr int64_t S_MIB = 1024 * 1024;

using Str_map = Ordered_map<string, string>;

Map_options limit_opts(int64_t limit_mb)
{
  Map_options opts;
  opts.m_limit_mb = limit_mb;
  return opts;
}

string kib(size_t n)
{
  return string(n * 1024, 'x');
}

} // Anonymous namespace

TEST(Ordered_map, Update_in_place)
{
  Test_logger logger;
  Ordered_map<string, int> map(&logger);

  map.set("a", 1);
  map.set("b", 2);
  map.set("a", 3);

  EXPECT_EQ(map.keys(), vector<string>({ "a", "b" }));
  EXPECT_EQ(map.get("a"), 3);
  EXPECT_EQ(map.get("b"), 2);
  EXPECT_FALSE(map.get("c"));
  EXPECT_EQ(map.len(), 2u);
  EXPECT_EQ(map.total_size(), int64_t(2 * sizeof(int)));
  EXPECT_EQ(map.limit_bytes(), 0);
}

TEST(Ordered_map, Order_and_bijection_under_churn)
{
  Test_logger logger;
  Ordered_map<int, string> map(&logger);

  // Reference model: insertion order with in-place update.
  vector<std::pair<int, string>> model;
  const auto model_find = [&](int key)
  {
    return std::find_if(model.begin(), model.end(), [&](const auto& key_val) { return key_val.first == key; });
  };

  std::mt19937 rnd(12345);
  std::uniform_int_distribution<int> key_dist(0, 199);
  std::uniform_int_distribution<int> op_dist(0, 9);

  for (int i = 0; i != 5000; ++i)
  {
    const int key = key_dist(rnd);
    const int op = op_dist(rnd);
    if (op < 6)
    {
      const string val(size_t(key % 7), char('a' + (i % 26)));
      map.set(key, val);
      const auto it = model_find(key);
      if (it == model.end())
      {
        model.emplace_back(key, val);
      }
      else
      {
        it->second = val;
      }
    }
    else if (op < 9)
    {
      const auto it = model_find(key);
      EXPECT_EQ(map.erase(key), it != model.end());
      if (it != model.end())
      {
        model.erase(it);
      }
    }
    else if ((i % 1000) == 999)
    {
      map.clear();
      model.clear();
    }
  }

  // Index -> list: every key the index knows is reachable by traversal, in model order, with matching values.
  ASSERT_EQ(map.len(), model.size());
  EXPECT_EQ(map.entries(), model);

  // List -> index: traversal via handles yields exactly the keys, each found by lookup.
  size_t idx = 0;
  int64_t total = 0;
  for (auto handle = map.front(); !handle.null(); handle = map.next(handle))
  {
    ASSERT_LT(idx, model.size());
    const auto key_val = map.entry(handle);
    EXPECT_EQ(key_val, model[idx]);
    EXPECT_EQ(map.get(key_val.first), key_val.second);
    total += approx_size(key_val.second);
    ++idx;
  }
  EXPECT_EQ(idx, model.size());
  EXPECT_EQ(map.total_size(), total);
} // TEST(Ordered_map, Order_and_bijection_under_churn)

TEST(Ordered_map, Eviction_clears_everything)
{
  Test_logger logger;
  Str_map map(&logger, limit_opts(1));
  ASSERT_EQ(map.limit_bytes(), S_MIB);

  map.set("k1", kib(400));
  map.set("k2", kib(400));
  EXPECT_EQ(map.len(), 2u);
  EXPECT_EQ(map.total_size(), 800 * 1024);

  // 1200 KiB > 1024 KiB: evict all, then store the newcomer alone.
  Error_code err_code;
  map.set("k3", kib(400), &err_code);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(map.len(), 1u);
  EXPECT_EQ(map.keys(), vector<string>({ "k3" }));
  EXPECT_EQ(map.total_size(), 400 * 1024);
}

TEST(Ordered_map, Eviction_counts_replaced_size)
{
  Test_logger logger;
  Str_map map(&logger, limit_opts(1));

  map.set("k1", kib(600));
  map.set("k2", kib(300));

  // 900 - 600 + 700 = 1000 KiB: fits; the key keeps its position.
  map.set("k1", kib(700));
  EXPECT_EQ(map.keys(), vector<string>({ "k1", "k2" }));
  EXPECT_EQ(map.total_size(), 1000 * 1024);

  // 1000 - 300 + 400 = 1100 KiB: does not fit; even the replaced key's neighbors go.
  map.set("k2", kib(400));
  EXPECT_EQ(map.keys(), vector<string>({ "k2" }));
  EXPECT_EQ(map.total_size(), 400 * 1024);
}

TEST(Ordered_map, Eviction_boundary)
{
  Test_logger logger;
  Str_map map(&logger, limit_opts(1));

  // Exactly the limit: accepted.
  map.set("full", string(size_t(S_MIB), 'f'));
  EXPECT_EQ(map.len(), 1u);
  EXPECT_EQ(map.total_size(), S_MIB);

  // Anything more: evicts.
  map.set("tiny", "t");
  EXPECT_EQ(map.keys(), vector<string>({ "tiny" }));
  EXPECT_EQ(map.total_size(), 1);

  // Unbounded: never evicts.
  Str_map unbounded(&logger, limit_opts(0));
  unbounded.set("a", kib(2048));
  unbounded.set("b", kib(2048));
  EXPECT_EQ(unbounded.len(), 2u);
  EXPECT_EQ(unbounded.limit_bytes(), 0);
  Str_map negative(&logger, limit_opts(-3));
  EXPECT_EQ(negative.limit_bytes(), 0);
}

TEST(Ordered_map, Oversized_value)
{
  Test_logger logger;
  Str_map map(&logger, limit_opts(1));
  map.set("a", "1");
  map.set("b", "22");

  const string huge(size_t(S_MIB) + 1, 'h');

  Error_code err_code;
  map.set("c", huge, &err_code);
  EXPECT_EQ(err_code, Error_code(error::Code::S_SIZE_EXCEEDED));
  EXPECT_EQ(map.keys(), vector<string>({ "a", "b" }));
  EXPECT_EQ(map.total_size(), 3);

  // Same for an existing key: its old value stays.
  map.set("a", huge, &err_code);
  EXPECT_EQ(err_code, Error_code(error::Code::S_SIZE_EXCEEDED));
  EXPECT_EQ(map.get("a"), string("1"));

  // Null err_code: throws.
  try
  {
    map.set("c", huge);
    ADD_FAILURE() << "set() should have thrown.";
  }
  catch (const kmap::error::Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), Error_code(error::Code::S_SIZE_EXCEEDED));
  }
  EXPECT_EQ(map.len(), 2u);
  EXPECT_EQ(map.total_size(), 3);
}

TEST(Ordered_map, Handles)
{
  Test_logger logger;
  Ordered_map<string, int> map(&logger);
  using Handle = decltype(map)::Handle;

  EXPECT_TRUE(map.front().null());
  EXPECT_TRUE(map.back().null());

  for (const auto& key : { "a", "b", "c", "d" })
  {
    map.set(key, int(key[0]));
  }

  // Forward.
  vector<string> seen;
  for (auto handle = map.front(); !handle.null(); handle = map.next(handle))
  {
    seen.push_back(map.entry(handle).first);
  }
  EXPECT_EQ(seen, vector<string>({ "a", "b", "c", "d" }));

  // Backward.
  seen.clear();
  for (auto handle = map.back(); !handle.null(); handle = map.prev(handle))
  {
    seen.push_back(map.entry(handle).first);
  }
  EXPECT_EQ(seen, vector<string>({ "d", "c", "b", "a" }));

  // Removing an entry makes its handle stale; neighbors are patched.
  const auto handle_b = map.next(map.front());
  EXPECT_EQ(map.entry(handle_b), std::make_pair(string("b"), int('b')));
  EXPECT_TRUE(map.erase("b"));
  EXPECT_FALSE(map.erase("b"));
  EXPECT_TRUE(map.next(handle_b).null());
  EXPECT_TRUE(map.prev(handle_b).null());
  EXPECT_EQ(map.entry(map.next(map.front())).first, "c");
  EXPECT_EQ(map.entry(map.prev(map.back())).first, "c");

  Error_code err_code;
  map.entry(handle_b, &err_code);
  EXPECT_EQ(err_code, Error_code(error::Code::S_INVALID_HANDLE));

  // A later insertion reusing the slot does not revive the stale handle.
  map.set("e", 5);
  map.entry(handle_b, &err_code);
  EXPECT_EQ(err_code, Error_code(error::Code::S_INVALID_HANDLE));
  EXPECT_EQ(map.entry(map.back()).first, "e");

  EXPECT_THROW(map.entry(Handle()), kmap::error::Runtime_error);

  // Sole element: front == back; clear() stales everything.
  map.clear();
  map.set("only", 1);
  EXPECT_EQ(map.front(), map.back());
  EXPECT_TRUE(map.next(map.front()).null());
  const auto only = map.front();
  map.flush();
  EXPECT_TRUE(map.front().null());
  map.entry(only, &err_code);
  EXPECT_EQ(err_code, Error_code(error::Code::S_INVALID_HANDLE));

  // Starting mid-map from a key.
  for (const auto& key : { "p", "q", "r" })
  {
    map.set(key, int(key[0]));
  }
  EXPECT_TRUE(map.handle_of("zzz").null());
  const auto handle_q = map.handle_of("q");
  ASSERT_FALSE(handle_q.null());
  EXPECT_EQ(map.entry(handle_q).first, "q");
  EXPECT_EQ(map.entry(map.next(handle_q)).first, "r");
  EXPECT_EQ(map.entry(map.prev(handle_q)).first, "p");
  EXPECT_EQ(map.handle_of("p"), map.front());
  map.erase("q");
  EXPECT_TRUE(map.handle_of("q").null());
  EXPECT_TRUE(map.next(handle_q).null());

  // load() stales every handle, even where the loaded entries occupy the same slots.
  Temp_dir dir;
  const auto path = dir.path() / "loaded.img";
  {
    Ordered_map<string, int> other(&logger);
    other.set("loaded", 42);
    other.save(path);
  }
  map.clear();
  map.set("old", 1);
  const auto handle_old = map.front();
  map.load(path);
  EXPECT_EQ(map.len(), 1u);
  EXPECT_EQ(map.entry(map.front()), std::make_pair(string("loaded"), 42));
  EXPECT_NE(map.front(), handle_old);
  map.entry(handle_old, &err_code);
  EXPECT_EQ(err_code, Error_code(error::Code::S_INVALID_HANDLE));
  EXPECT_TRUE(map.next(handle_old).null());
  EXPECT_TRUE(map.prev(handle_old).null());

  // Handles from the loaded map behave normally, including across another load.
  const auto handle_loaded = map.handle_of("loaded");
  EXPECT_EQ(handle_loaded, map.front());
  map.load(path);
  map.entry(handle_loaded, &err_code);
  EXPECT_EQ(err_code, Error_code(error::Code::S_INVALID_HANDLE));
  EXPECT_EQ(map.entry(map.handle_of("loaded")).second, 42);
} // TEST(Ordered_map, Handles)

TEST(Ordered_map, Accessors)
{
  Test_logger logger;
  Ordered_map<string, int> map(&logger);
  map.set("a", 1);
  map.set("b", 2);
  map.set("c", 3);

  EXPECT_EQ(map.values(), vector<int>({ 1, 2, 3 }));
  EXPECT_EQ(map.get_or_default("b", -1), 2);
  EXPECT_EQ(map.get_or_default("z", -1), -1);
  EXPECT_EQ(map.get_any({ "x", "c", "a" }), 3);
  EXPECT_FALSE(map.get_any({ "x", "y" }));
  EXPECT_TRUE(map.contains("a"));
  EXPECT_FALSE(map.contains("z"));

  // range() stops as soon as the visitor says so.
  vector<string> seen;
  map.range([&](const string& key, int val) -> bool
  {
    seen.push_back(key + '=' + std::to_string(val));
    return seen.size() != 2;
  });
  EXPECT_EQ(seen, vector<string>({ "a=1", "b=2" }));

  EXPECT_TRUE(map.erase("a"));
  EXPECT_EQ(map.total_size(), int64_t(2 * sizeof(int)));
  map.clear();
  EXPECT_EQ(map.len(), 0u);
  EXPECT_EQ(map.total_size(), 0);
  EXPECT_TRUE(map.entries().empty());
}

TEST(Ordered_map, Copy)
{
  Test_logger logger;
  Str_map map(&logger, limit_opts(1));
  map.set("x", "1");
  map.set("y", "22");
  map.set("z", "333");

  const auto copy = map.copy();
  EXPECT_EQ(copy->entries(), map.entries());
  EXPECT_EQ(copy->total_size(), 6);
  EXPECT_EQ(copy->limit_bytes(), S_MIB);

  // Independent.
  map.erase("y");
  copy->set("w", "4444");
  EXPECT_EQ(map.keys(), vector<string>({ "x", "z" }));
  EXPECT_EQ(copy->keys(), vector<string>({ "x", "y", "z", "w" }));
  EXPECT_EQ(copy->total_size(), 10);

  // The copy enforces the same limit.
  copy->set("big", kib(1024));
  EXPECT_EQ(copy->keys(), vector<string>({ "big" }));
}

TEST(Ordered_map, Concurrent_disjoint_keys)
{
  constexpr int N_THREADS = 8;
  constexpr int N_OPS = 1000;

  Test_logger logger;
  Ordered_map<int, int> map(&logger);
  std::atomic<int> n_bad(0);
  std::atomic<bool> writers_done(false);

  vector<std::unique_ptr<util::Thread>> writers;
  for (int t = 0; t != N_THREADS; ++t)
  {
    writers.emplace_back(new util::Thread([&, t]()
    {
      for (int i = 0; i != N_OPS; ++i)
      {
        const int key = (t * N_OPS) + i;
        map.set(key, i);
        if (map.get(key) != i)
        {
          ++n_bad;
        }
        if ((i % 3) == 0)
        {
          if (!map.erase(key))
          {
            ++n_bad;
          }
        }
      }
    }));
  }

  // Concurrent readers see consistent snapshots.
  util::Thread reader([&]()
  {
    while (!writers_done)
    {
      const auto entries = map.entries();
      for (const auto& key_val : entries)
      {
        if ((key_val.first % N_OPS) != key_val.second)
        {
          ++n_bad;
        }
      }
      if (map.total_size() < 0)
      {
        ++n_bad;
      }
    }
  });

  for (auto& writer : writers)
  {
    writer->join();
  }
  writers_done = true;
  reader.join();

  const int n_deleted_per_thread = (N_OPS + 2) / 3;
  EXPECT_EQ(n_bad.load(), 0);
  EXPECT_EQ(map.len(), size_t(N_THREADS * (N_OPS - n_deleted_per_thread)));
  EXPECT_EQ(map.total_size(), int64_t(map.len() * sizeof(int)));
} // TEST(Ordered_map, Concurrent_disjoint_keys)

} // namespace kmap::map::test
