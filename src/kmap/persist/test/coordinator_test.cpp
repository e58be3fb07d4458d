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

#include "kmap/persist/coordinator.hpp"
#include "kmap/persist/compression.hpp"
#include "kmap/persist/file_util.hpp"
#include "kmap/persist/save_options.hpp"
#include "kmap/persist/error/error.hpp"
#include "kmap/test/test_logger.hpp"
#include "kmap/test/test_file_util.hpp"
#include "kmap/util/util.hpp"
#include "kmap/error/error.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>
#include <string>

namespace kmap::persist::test
{

namespace
{
using kmap::test::Test_logger;
using kmap::test::Temp_dir;
using kmap::test::read_test_file;
using kmap::test::write_test_file;
using std::string;

string sample_bytes()
{
  string bytes;
  for (int idx = 0; idx != 10000; ++idx)
  {
    bytes += "line " + std::to_string(idx % 17) + '\n';
  }
  return bytes;
}

} // Anonymous namespace

TEST(Compression, Gzip)
{
  Test_logger logger;
  const auto raw = sample_bytes();

  for (const int level : { 0, 1, 6, 9 })
  {
    string compressed;
    gzip_compress(&logger, raw, level, &compressed);
    EXPECT_TRUE(is_gzip_compressed(compressed));
    EXPECT_LT(compressed.size(), raw.size());

    string decompressed;
    gzip_decompress(&logger, compressed, &decompressed);
    EXPECT_EQ(decompressed, raw);
  }

  EXPECT_FALSE(is_gzip_compressed(raw));
  EXPECT_FALSE(is_gzip_compressed(string("\x1f", 1)));
  EXPECT_FALSE(is_gzip_compressed(""));

  Error_code err_code;
  string out;
  gzip_compress(&logger, raw, 10, &out, &err_code);
  EXPECT_EQ(err_code, Error_code(error::Code::S_INVALID_COMPRESSION_LEVEL));
  gzip_compress(&logger, raw, -1, &out, &err_code);
  EXPECT_EQ(err_code, Error_code(error::Code::S_INVALID_COMPRESSION_LEVEL));

  // Right signature, garbage after it.
  gzip_decompress(&logger, string("\x1f\x8b" "garbage, not a deflate stream", 31), &out, &err_code);
  EXPECT_EQ(err_code, Error_code(error::Code::S_DECOMPRESSION_FAILED));
  EXPECT_THROW(gzip_decompress(&logger, string("\x1f\x8b\x00", 3), &out), kmap::error::Runtime_error);
} // TEST(Compression, Gzip)

TEST(File_util, Write_and_read)
{
  Test_logger logger;
  Temp_dir dir;
  const auto path = dir.path() / "a" / "b" / "file.bin";
  const string contents("\x00\x01 binary \xff", 11);

  // Parent directories are created.
  write_file_atomically(&logger, path, contents);
  EXPECT_EQ(read_test_file(path), contents);

  // Replaced, not appended; no temporary file left behind.
  write_file_atomically(&logger, path, "second");
  string bytes;
  read_file(&logger, path, &bytes);
  EXPECT_EQ(bytes, "second");
  size_t n_files = 0;
  for (boost::filesystem::directory_iterator it(path.parent_path()), end; it != end; ++it)
  {
    ++n_files;
  }
  EXPECT_EQ(n_files, 1u);

  // Empty file.
  write_file_atomically(&logger, path, "");
  read_file(&logger, path, &bytes);
  EXPECT_TRUE(bytes.empty());

  Error_code err_code;
  read_file(&logger, dir.path() / "missing.bin", &bytes, &err_code);
  EXPECT_TRUE(err_code == boost::system::errc::no_such_file_or_directory) << err_code;

  // Parent "directory" is a file.
  write_file_atomically(&logger, path / "under_a_file.bin", "x", &err_code);
  EXPECT_TRUE(err_code);
  EXPECT_THROW(read_file(&logger, dir.path() / "missing.bin", &bytes), kmap::error::Runtime_error);
} // TEST(File_util, Write_and_read)

TEST(Coordinator, Write_and_read_image)
{
  Test_logger logger;
  Temp_dir dir;
  Coordinator coordinator(&logger, "test_coord");
  const auto image = sample_bytes();

  Save_options opts;
  const auto plain_path = dir.path() / "plain.img";
  coordinator.write_image(plain_path, image, opts);
  EXPECT_EQ(read_test_file(plain_path), image);

  opts.m_compress = true;
  opts.m_compress_level = 9;
  const auto gz_path = dir.path() / "compressed.img";
  coordinator.write_image(gz_path, image, opts);
  EXPECT_TRUE(is_gzip_compressed(read_test_file(gz_path)));

  // Reading detects compression by itself.
  string read_back;
  coordinator.read_image(plain_path, &read_back);
  EXPECT_EQ(read_back, image);
  coordinator.read_image(gz_path, &read_back);
  EXPECT_EQ(read_back, image);

  // Bad level: nothing written.
  opts.m_compress_level = 42;
  const auto bad_path = dir.path() / "bad.img";
  Error_code err_code;
  coordinator.write_image(bad_path, image, opts, &err_code);
  EXPECT_EQ(err_code, Error_code(error::Code::S_INVALID_COMPRESSION_LEVEL));
  Error_code exists_err_code;
  EXPECT_FALSE(kmap::test::does_file_exist(bad_path, exists_err_code));

  // Corrupt gzip on disk.
  write_test_file(bad_path, string("\x1f\x8b\x08\x00junk", 8));
  coordinator.read_image(bad_path, &read_back, &err_code);
  EXPECT_EQ(err_code, Error_code(error::Code::S_DECOMPRESSION_FAILED));
} // TEST(Coordinator, Write_and_read_image)

TEST(Coordinator, Background_work)
{
  Test_logger logger;
  Coordinator coordinator(&logger, "test_coord");

  boost::promise<void> release;
  auto released = release.get_future();
  string order;

  const auto first = coordinator.post([&](Error_code* err_code)
  {
    released.wait();
    order += '1';
    err_code->clear();
  });
  const auto second = coordinator.post([&](Error_code* err_code)
  {
    order += '2';
    *err_code = error::Code::S_BAD_MAGIC;
  });

  // Nothing can complete until released.
  EXPECT_FALSE(first->done());
  EXPECT_EQ(first->progress(), 0);
  EXPECT_EQ(second->progress(), 0);

  release.set_value();
  second->wait(); // Work runs in order, so first is done too.
  EXPECT_TRUE(first->done());
  EXPECT_EQ(first->progress(), 100);
  EXPECT_FALSE(first->error());
  EXPECT_EQ(second->progress(), 100);
  EXPECT_EQ(second->error(), Error_code(error::Code::S_BAD_MAGIC));
  EXPECT_EQ(order, "12");

  // A throwing piece of work completes its result with an error; the thread survives it.
  const auto threw_plain = coordinator.post([](Error_code*) { throw std::invalid_argument("bad blob"); });
  const auto threw_coded = coordinator.post([](Error_code*)
  {
    throw kmap::error::Runtime_error(Error_code(error::Code::S_BAD_BLOB), "decode");
  });
  const auto after_throw = coordinator.post([&](Error_code* err_code)
  {
    order += '3';
    err_code->clear();
  });
  after_throw->wait();
  EXPECT_EQ(threw_plain->error(), Error_code(error::Code::S_ASYNC_WORK_FAILED));
  EXPECT_EQ(threw_plain->progress(), 100);
  EXPECT_EQ(threw_coded->error(), Error_code(error::Code::S_BAD_BLOB));
  EXPECT_FALSE(after_throw->error());
  EXPECT_EQ(order, "123");

  // After stop(), work is abandoned, and the result is complete immediately.
  coordinator.stop();
  bool ran = false;
  const auto abandoned = coordinator.post([&](Error_code*) { ran = true; });
  EXPECT_TRUE(abandoned->done());
  EXPECT_EQ(abandoned->progress(), 100);
  EXPECT_EQ(abandoned->error(), Error_code(error::Code::S_ASYNC_ABANDONED));
  EXPECT_FALSE(ran);
} // TEST(Coordinator, Background_work)

TEST(Save_options, Config_parsing_and_printing)
{
  Test_logger logger;
  Save_options opts;
  EXPECT_FALSE(opts.m_compress);
  EXPECT_EQ(opts.m_compress_level, 0);

  util::Options_description opts_desc("Save options");
  opts.setup_config_parsing(&opts_desc);
  std::istringstream is("compress = true\ncompress-level = 9\n");
  util::parse_config_stream(&logger, is, opts_desc);
  EXPECT_TRUE(opts.m_compress);
  EXPECT_EQ(opts.m_compress_level, 9);

  const auto printed = util::ostream_op_string(opts);
  EXPECT_NE(printed.find("--compress-level"), string::npos) << printed;
  EXPECT_NE(printed.find("(=9)"), string::npos) << printed;
}

} // namespace kmap::persist::test
