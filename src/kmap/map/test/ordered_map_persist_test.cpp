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
#include "kmap/persist/compression.hpp"
#include "kmap/persist/error/error.hpp"
#include "kmap/test/test_logger.hpp"
#include "kmap/test/test_file_util.hpp"
#include <gtest/gtest.h>
#include <limits>
#include <string>
#include <vector>

namespace kmap::map::test
{

namespace
{
using kmap::test::Test_logger;
using kmap::test::Temp_dir;
using kmap::test::read_test_file;
using kmap::test::write_test_file;
using std::string;
using std::vector;
using Map = Ordered_map<string, int64_t>;
using Persist_code = persist::error::Code;

string le32(uint32_t val)
{
  string bytes;
  for (unsigned int idx = 0; idx != 4; ++idx)
  {
    bytes += char((val >> (8 * idx)) & 0xff);
  }
  return bytes;
}

string le64(uint64_t val)
{
  return le32(uint32_t(val & 0xffffffff)) + le32(uint32_t(val >> 32));
}

/// Image bytes with the given header fields, followed by `body`.
string image_bytes(int64_t total, int64_t limit, int64_t count, const string& body)
{
  return "PAMK" + le32(1) + le64(total) + le64(limit) + le64(count) + body;
}

/// One encoded entry of a Map.
string entry_bytes(const string& key, int64_t val, int64_t size)
{
  return le32(uint32_t(key.size())) + key + le64(val) + le64(size);
}

/// A value type encoded and sized through the generic paths.
struct Point
{
  int m_x;
  int m_y;
  bool operator==(const Point& other) const { return (m_x == other.m_x) && (m_y == other.m_y); }
};

void encode_blob(const Point& val, string* blob)
{
  *blob = std::to_string(val.m_x) + ':' + std::to_string(val.m_y);
}

bool decode_blob(util::String_view blob, Point* val)
{
  const auto colon = blob.find(':');
  if ((colon == util::String_view::npos) || (colon == 0) || (colon == blob.size() - 1))
  {
    return false;
  }
  // else
  val->m_x = std::stoi(string(blob.substr(0, colon)));
  val->m_y = std::stoi(string(blob.substr(colon + 1)));
  return true;
}

} // Anonymous namespace

TEST(Ordered_map_persist, Round_trip)
{
  Test_logger logger;
  Temp_dir dir;

  Map map(&logger);
  map.set("a", 1);
  map.set("b", 2);
  map.set("a", 3);

  for (const bool compress : { false, true })
  {
    persist::Save_options opts;
    opts.m_compress = compress;
    const auto path = dir.path() / (compress ? "map.img.gz" : "map.img");
    map.save(path, opts);

    const auto file_bytes = read_test_file(path);
    if (compress)
    {
      EXPECT_TRUE(persist::is_gzip_compressed(file_bytes));
    }
    else
    {
      EXPECT_EQ(file_bytes.substr(0, 4), "PAMK");
    }

    Map loaded(&logger);
    loaded.load(path);
    EXPECT_EQ(loaded.entries(), (vector<Map::Key_value>{ { "a", 3 }, { "b", 2 } }));
    EXPECT_EQ(loaded.total_size(), 16);
    EXPECT_EQ(loaded.limit_bytes(), 0);
    EXPECT_EQ(loaded.len(), 2u);

    // The loaded map is fully usable: order and sizes carry on from the image.
    loaded.set("c", 4);
    loaded.set("b", 5);
    EXPECT_EQ(loaded.keys(), (vector<string>{ "a", "b", "c" }));
    EXPECT_EQ(loaded.total_size(), 24);
  }
} // TEST(Ordered_map_persist, Round_trip)

TEST(Ordered_map_persist, Byte_layout)
{
  Test_logger logger;
  Temp_dir dir;
  const auto path = dir.path() / "one.img";

  Map map(&logger);
  map.set("k", 7);
  map.save(path);
  EXPECT_EQ(read_test_file(path), image_bytes(8, 0, 1, entry_bytes("k", 7, 8)));

  // Empty map: header only.
  Map empty(&logger);
  empty.save(path);
  EXPECT_EQ(read_test_file(path), image_bytes(0, 0, 0, ""));

  map.load(path);
  EXPECT_EQ(map.len(), 0u);
  EXPECT_EQ(map.total_size(), 0);
  EXPECT_TRUE(map.front().null());

  // Hand-built image with a limit and 2 entries, loaded over existing contents.
  write_test_file(path, image_bytes(16, 100, 2, entry_bytes("y", -1, 8) + entry_bytes("x", 1LL << 40, 8)));
  map.set("z", 0);
  map.load(path);
  EXPECT_EQ(map.entries(), (vector<Map::Key_value>{ { "y", -1 }, { "x", 1LL << 40 } }));
  EXPECT_EQ(map.limit_bytes(), 100);
  EXPECT_FALSE(map.contains("z"));

  // The loaded limit is enforced.
  for (int idx = 0; idx != 10; ++idx)
  {
    map.set(string(1, char('a' + idx)), idx);
  }
  EXPECT_EQ(map.total_size(), 96);
  EXPECT_EQ(map.len(), 12u);
  map.set("n", 0); // 104 > 100.
  EXPECT_EQ(map.keys(), (vector<string>{ "n" }));
} // TEST(Ordered_map_persist, Byte_layout)

TEST(Ordered_map_persist, Load_replaces_limit)
{
  Test_logger logger;
  Temp_dir dir;
  const auto path = dir.path() / "limited.img";

  Map_options opts;
  opts.m_limit_mb = 1;
  Map limited(&logger, opts);
  limited.set("a", 1);
  limited.save(path);

  Map unlimited(&logger);
  unlimited.load(path);
  EXPECT_EQ(unlimited.limit_bytes(), 1024 * 1024);

  Map empty(&logger);
  empty.save(path);
  limited.load(path);
  EXPECT_EQ(limited.limit_bytes(), 0);
  EXPECT_EQ(limited.len(), 0u);
}

TEST(Ordered_map_persist, Failed_load_changes_nothing)
{
  Test_logger logger;
  Temp_dir dir;
  const auto path = dir.path() / "bad.img";

  Map_options opts;
  opts.m_limit_mb = 2;
  Map map(&logger, opts);
  map.set("x", 1);
  map.set("y", 2);
  const auto before = map.entries();

  const auto good = image_bytes(8, 0, 1, entry_bytes("k", 7, 8));
  const auto check_load_fails = [&](const string& file_bytes, const Error_code& expected)
  {
    write_test_file(path, file_bytes);
    Error_code err_code;
    map.load(path, &err_code);
    EXPECT_EQ(err_code, expected) << err_code.message();
    EXPECT_EQ(map.entries(), before);
    EXPECT_EQ(map.total_size(), 16);
    EXPECT_EQ(map.limit_bytes(), 2 * 1024 * 1024);
  };

  check_load_fails("MAPK" + good.substr(4), Persist_code::S_BAD_MAGIC);
  check_load_fails("PAMK" + le32(2) + good.substr(8), Persist_code::S_UNSUPPORTED_VERSION);
  check_load_fails("", Persist_code::S_TRUNCATED);
  check_load_fails(good.substr(0, good.size() - 1), Persist_code::S_TRUNCATED);
  check_load_fails(good + "x", Persist_code::S_TRAILING_BYTES);
  check_load_fails(image_bytes(16, 0, 2, entry_bytes("k", 1, 8) + entry_bytes("k", 2, 8)),
                   Persist_code::S_DUPLICATE_KEY);
  check_load_fails(image_bytes(9, 0, 1, entry_bytes("k", 7, 8)), Persist_code::S_SIZE_MISMATCH);
  check_load_fails(image_bytes(-8, 0, 1, entry_bytes("k", 7, -8)), Persist_code::S_SIZE_MISMATCH);
  check_load_fails(image_bytes(-1, 0, 0, ""), Persist_code::S_SIZE_MISMATCH);

  // Entry sizes whose sum overflows must not wrap around to match the header.
  const int64_t max_size = std::numeric_limits<int64_t>::max();
  const auto huge_entries = entry_bytes("k", 1, max_size) + entry_bytes("j", 2, max_size);
  check_load_fails(image_bytes(-2, 0, 2, huge_entries), Persist_code::S_SIZE_MISMATCH);
  check_load_fails(image_bytes(max_size, 0, 2, huge_entries), Persist_code::S_SIZE_MISMATCH);
  check_load_fails(image_bytes(max_size, 0, 2, entry_bytes("k", 1, max_size) + entry_bytes("j", 2, 1)),
                   Persist_code::S_SIZE_MISMATCH);
  check_load_fails(image_bytes(8, 0, 1000, entry_bytes("k", 7, 8)), Persist_code::S_INVALID_LENGTH);
  check_load_fails(image_bytes(8, 0, -1, entry_bytes("k", 7, 8)), Persist_code::S_INVALID_LENGTH);
  check_load_fails(image_bytes(8, 0, 1, le32(0xffffffff) + "k" + le64(7) + le64(8)), Persist_code::S_INVALID_LENGTH);
  check_load_fails(string("\x1f\x8b\x08\x00junk", 8), Persist_code::S_DECOMPRESSION_FAILED);

  // Compressed but malformed inside.
  string compressed;
  persist::gzip_compress(&logger, good + "x", 6, &compressed);
  check_load_fails(compressed, Persist_code::S_TRAILING_BYTES);

  Error_code err_code;
  map.load(dir.path() / "missing.img", &err_code);
  EXPECT_TRUE(err_code == boost::system::errc::no_such_file_or_directory) << err_code;
  EXPECT_EQ(map.entries(), before);

  EXPECT_THROW(map.load(dir.path() / "missing.img"), kmap::error::Runtime_error);
  EXPECT_EQ(map.entries(), before);
} // TEST(Ordered_map_persist, Failed_load_changes_nothing)

TEST(Ordered_map_persist, Compression_options)
{
  Test_logger logger;
  Temp_dir dir;

  Map map(&logger);
  for (int64_t idx = 0; idx != 1000; ++idx)
  {
    map.set("key" + std::to_string(idx % 100), idx);
  }
  const auto plain_path = dir.path() / "plain.img";
  map.save(plain_path);
  const auto plain_size = read_test_file(plain_path).size();

  persist::Save_options opts;
  opts.m_compress = true;
  for (const int level : { 0, 1, 9 })
  {
    opts.m_compress_level = level;
    const auto path = dir.path() / ("level" + std::to_string(level) + ".img");
    map.save(path, opts);
    EXPECT_LT(read_test_file(path).size(), plain_size);

    Map loaded(&logger);
    loaded.load(path);
    EXPECT_EQ(loaded.entries(), map.entries());
    EXPECT_EQ(loaded.total_size(), map.total_size());
  }

  // Out-of-range level: nothing written.
  opts.m_compress_level = 10;
  const auto bad_path = dir.path() / "level10.img";
  Error_code err_code;
  map.save(bad_path, opts, &err_code);
  EXPECT_EQ(err_code, Error_code(Persist_code::S_INVALID_COMPRESSION_LEVEL));
  EXPECT_FALSE(kmap::test::does_file_exist(bad_path, err_code));
  EXPECT_THROW(map.save(bad_path, opts), kmap::error::Runtime_error);

  // Missing parent directories are created.
  const auto deep_path = dir.path() / "x" / "y" / "z.img";
  map.save(deep_path);
  EXPECT_EQ(read_test_file(deep_path).size(), plain_size);
} // TEST(Ordered_map_persist, Compression_options)

TEST(Ordered_map_persist, Async)
{
  Test_logger logger;
  Temp_dir dir;
  const auto path = dir.path() / "async.img";

  Map map(&logger);
  map.set("a", 1);
  map.set("b", 2);

  persist::Save_options opts;
  opts.m_compress = true;
  const auto saved = map.save_async(path, opts);
  saved->wait();
  EXPECT_TRUE(saved->done());
  EXPECT_EQ(saved->progress(), 100);
  EXPECT_FALSE(saved->error());

  Map loaded(&logger);
  const auto load_result = loaded.load_async(path);
  EXPECT_FALSE(load_result->error()); // Blocks until done.
  EXPECT_EQ(load_result->progress(), 100);
  EXPECT_EQ(loaded.entries(), map.entries());

  // Errors are reported through the result, not thrown.
  const auto failed = loaded.load_async(dir.path() / "missing.img");
  EXPECT_TRUE(failed->error() == boost::system::errc::no_such_file_or_directory);
  EXPECT_EQ(failed->progress(), 100);
  EXPECT_EQ(loaded.len(), 2u);

  opts.m_compress_level = -5;
  EXPECT_EQ(map.save_async(path, opts)->error(), Error_code(Persist_code::S_INVALID_COMPRESSION_LEVEL));

  // Several saves, queued back to back, run in order.
  vector<persist::Async_result_ptr> results;
  opts.m_compress_level = 0;
  for (int idx = 0; idx != 5; ++idx)
  {
    map.set("n", idx);
    results.push_back(map.save_async(path, opts));
  }
  results.back()->wait();
  for (const auto& result : results)
  {
    EXPECT_TRUE(result->done());
    EXPECT_FALSE(result->error());
  }

  EXPECT_FALSE(loaded.load_async(path)->error());
  EXPECT_EQ(loaded.keys(), (vector<string>{ "a", "b", "n" }));
  EXPECT_EQ(loaded.get("n"), 4);
} // TEST(Ordered_map_persist, Async)

TEST(Ordered_map_persist, Other_value_types)
{
  Test_logger logger;
  Temp_dir dir;
  const auto path = dir.path() / "values.img";

  {
    Ordered_map<string, vector<string>> map(&logger);
    map.set("empty", {});
    map.set("two", { "alpha", "" });
    map.save(path);

    Ordered_map<string, vector<string>> loaded(&logger);
    loaded.load(path);
    EXPECT_EQ(loaded.entries(), map.entries());
    EXPECT_EQ(loaded.total_size(), 5);
  }

  {
    Ordered_map<int32_t, Point> map(&logger);
    map.set(-1, Point{ 3, 4 });
    map.set(2, Point{ 0, -7 });
    map.save(path);

    Ordered_map<int32_t, Point> loaded(&logger);
    loaded.load(path);
    EXPECT_EQ(loaded.keys(), (vector<int32_t>{ -1, 2 }));
    EXPECT_EQ(loaded.get(2), Point({ 0, -7 }));
    EXPECT_EQ(loaded.total_size(), int64_t(2 * sizeof(Point)));

    // Same layout, but a blob decode_blob() rejects.
    write_test_file(path, image_bytes(8, 0, 1, le32(1) + le32(5) + "12345" + le64(8)));
    Error_code err_code;
    loaded.load(path, &err_code);
    EXPECT_EQ(err_code, Error_code(Persist_code::S_BAD_BLOB));
    EXPECT_EQ(loaded.len(), 2u);
  }
} // TEST(Ordered_map_persist, Other_value_types)

} // namespace kmap::map::test
