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

#include "kmap/util/ordered_list.hpp"
#include "kmap/util/util.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace kmap::util::test
{

namespace
{
using std::string;
using std::vector;
using List = Ordered_list<string, int>;

vector<string> keys_forward(const List& list)
{
  vector<string> keys;
  for (auto handle = list.front(); !handle.null(); handle = list.next(handle))
  {
    keys.push_back(list.value(handle).first);
  }
  return keys;
}

vector<string> keys_backward(const List& list)
{
  vector<string> keys;
  for (auto handle = list.back(); !handle.null(); handle = list.prev(handle))
  {
    keys.push_back(list.value(handle).first);
  }
  return keys;
}

} // Anonymous namespace

// Yes... this is very cheesy... but this is a test, so I don't really care.
#define CTX ostream_op_string("Caller context [", KMAP_UTIL_WHERE_AM_I_LITERAL(Push_and_traverse), "].")

TEST(Ordered_list, Push_and_traverse)
{
  List list;
  EXPECT_TRUE(list.empty());
  EXPECT_TRUE(list.front().null());
  EXPECT_TRUE(list.back().null());
  EXPECT_EQ(list.begin(), list.end());

  list.push_back("b", 2);
  list.push_back("c", 3);
  list.push_front("a", 1);
  list.push_back("d", 4);

  EXPECT_EQ(list.size(), 4u);
  EXPECT_EQ(keys_forward(list), (vector<string>{ "a", "b", "c", "d" })) << CTX;
  EXPECT_EQ(keys_backward(list), (vector<string>{ "d", "c", "b", "a" })) << CTX;

  vector<int> vals;
  for (const auto& key_and_val : list)
  {
    vals.push_back(key_and_val.second);
  }
  EXPECT_EQ(vals, (vector<int>{ 1, 2, 3, 4 }));

  auto it = list.end();
  --it;
  EXPECT_EQ(it->first, "d");
  it->second = 40;
  EXPECT_EQ(list.value(list.back()).second, 40);

  List front_list;
  front_list.push_front("x", 0);
  front_list.push_front("y", 0);
  front_list.push_front("z", 0);
  EXPECT_EQ(keys_forward(front_list), (vector<string>{ "z", "y", "x" }));
}

TEST(Ordered_list, Remove_any_position)
{
  List list;
  const auto h_a = list.push_back("a", 1);
  const auto h_b = list.push_back("b", 2);
  const auto h_c = list.push_back("c", 3);
  const auto h_d = list.push_back("d", 4);

  list.remove(h_b); // Middle.
  EXPECT_EQ(keys_forward(list), (vector<string>{ "a", "c", "d" }));
  EXPECT_EQ(keys_backward(list), (vector<string>{ "d", "c", "a" }));
  EXPECT_FALSE(list.valid(h_b));

  list.remove(h_a); // Head.
  EXPECT_EQ(keys_forward(list), (vector<string>{ "c", "d" }));
  EXPECT_EQ(list.front(), h_c);
  EXPECT_TRUE(list.prev(h_c).null());

  list.remove(h_d); // Tail.
  EXPECT_EQ(keys_forward(list), (vector<string>{ "c" }));
  EXPECT_EQ(list.back(), h_c);
  EXPECT_TRUE(list.next(h_c).null());

  list.remove(h_c); // Sole element.
  EXPECT_TRUE(list.empty());
  EXPECT_TRUE(list.front().null());
  EXPECT_TRUE(list.back().null());
  EXPECT_EQ(list.begin(), list.end());

  // Slots get reused, but stale handles stay stale.
  const auto h_e = list.push_back("e", 5);
  EXPECT_TRUE(list.valid(h_e));
  EXPECT_FALSE(list.valid(h_a));
  EXPECT_FALSE(list.valid(h_b));
  EXPECT_FALSE(list.valid(h_c));
  EXPECT_FALSE(list.valid(h_d));
  EXPECT_FALSE(list.valid(List::Handle()));
  EXPECT_EQ(keys_forward(list), (vector<string>{ "e" }));
}

TEST(Ordered_list, Clear_copy_swap)
{
  List list;
  const auto h_a = list.push_back("a", 1);
  list.push_back("b", 2);

  List copy(list);
  EXPECT_EQ(keys_forward(copy), keys_forward(list));
  EXPECT_TRUE(copy.valid(h_a)); // Index-linked: handles carry over to a copy.
  EXPECT_EQ(copy.value(h_a).second, 1);

  list.clear();
  EXPECT_TRUE(list.empty());
  EXPECT_FALSE(list.valid(h_a));
  list.push_back("c", 3);
  EXPECT_FALSE(list.valid(h_a)) << "A handle from before clear() must not match a new node.";

  swap(list, copy);
  EXPECT_EQ(keys_forward(list), (vector<string>{ "a", "b" }));
  EXPECT_EQ(keys_forward(copy), (vector<string>{ "c" }));
}

} // namespace kmap::util::test
