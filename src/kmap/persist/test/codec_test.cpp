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

#include "kmap/persist/codec.hpp"
#include "kmap/persist/image.hpp"
#include "kmap/test/test_logger.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace kmap::persist::test
{

namespace
{
using kmap::test::Test_logger;
using std::string;
using std::vector;

enum class Kind : int16_t { S_NONE = 0, S_SOME = -2 };

/// A type encoded through the generic blob path.
struct Point
{
  int m_x;
  int m_y;
  bool operator==(const Point& other) const { return (m_x == other.m_x) && (m_y == other.m_y); }
};

void encode_blob(const Point& val, string* blob)
{
  *blob = std::to_string(val.m_x) + ',' + std::to_string(val.m_y);
}

bool decode_blob(util::String_view blob, Point* val)
{
  const auto comma = blob.find(',');
  if (comma == util::String_view::npos)
  {
    return false;
  }
  // else
  val->m_x = std::stoi(string(blob.substr(0, comma)));
  val->m_y = std::stoi(string(blob.substr(comma + 1)));
  return true;
}

string le32(uint32_t val)
{
  string bytes;
  for (unsigned int idx = 0; idx != 4; ++idx)
  {
    bytes += char((val >> (8 * idx)) & 0xff);
  }
  return bytes;
}

} // Anonymous namespace

TEST(Codec, Wire_layout)
{
  Test_logger logger;
  string bytes;
  Encoder encoder(&logger, &bytes);

  encoder.write(uint32_t(0x01020304));
  EXPECT_EQ(bytes, string("\x04\x03\x02\x01", 4));

  bytes.clear();
  encoder.write(int16_t(-2));
  EXPECT_EQ(bytes, string("\xfe\xff", 2));

  bytes.clear();
  encoder.write(string("abc"));
  EXPECT_EQ(bytes, string("\x03\x00\x00\x00" "abc", 7));

  bytes.clear();
  encoder.write(true);
  encoder.write(false);
  EXPECT_EQ(bytes, string("\x01\x00", 2));

  bytes.clear();
  encoder.write(1.0); // IEEE-754: 0x3FF0000000000000.
  EXPECT_EQ(bytes, string("\x00\x00\x00\x00\x00\x00\xf0\x3f", 8));

  bytes.clear();
  encoder.write(Kind::S_SOME);
  EXPECT_EQ(bytes, string("\xfe\xff", 2));

  // Vector: length-prefixed blob of 8-byte count and the elements.
  bytes.clear();
  encoder.write(vector<string>{ "a", "" });
  EXPECT_EQ(bytes, le32(8 + 5 + 4) + string("\x02\x00\x00\x00\x00\x00\x00\x00", 8)
                     + string("\x01\x00\x00\x00" "a" "\x00\x00\x00\x00", 9));

  // Generic path: length-prefixed blob from encode_blob().
  bytes.clear();
  encoder.write(Point{ 12, -3 });
  EXPECT_EQ(bytes, le32(5) + "12,-3");
  EXPECT_EQ(encoder.size(), 9u);
} // TEST(Codec, Wire_layout)

TEST(Codec, Decode_what_was_encoded)
{
  Test_logger logger;
  string bytes;
  Encoder encoder(&logger, &bytes);
  encoder.write(int64_t(-1234567890123));
  encoder.write(string("text with\0nul", 13));
  encoder.write(false);
  encoder.write(2.5f);
  encoder.write(Kind::S_SOME);
  encoder.write(vector<vector<int32_t>>{ { 1, 2 }, {}, { 3 } });
  encoder.write(Point{ 7, 8 });

  Decoder decoder(&logger, bytes);
  Error_code err_code;
  int64_t int_val;
  string str_val;
  bool bool_val = true;
  float float_val;
  Kind kind_val;
  vector<vector<int32_t>> vec_val;
  Point point_val;
  ASSERT_TRUE(decoder.read(&int_val, &err_code));
  ASSERT_TRUE(decoder.read(&str_val, &err_code));
  ASSERT_TRUE(decoder.read(&bool_val, &err_code));
  ASSERT_TRUE(decoder.read(&float_val, &err_code));
  ASSERT_TRUE(decoder.read(&kind_val, &err_code));
  ASSERT_TRUE(decoder.read(&vec_val, &err_code));
  ASSERT_TRUE(decoder.read(&point_val, &err_code));
  EXPECT_TRUE(decoder.expect_end(&err_code));
  EXPECT_FALSE(err_code);

  EXPECT_EQ(int_val, -1234567890123);
  EXPECT_EQ(str_val, string("text with\0nul", 13));
  EXPECT_FALSE(bool_val);
  EXPECT_EQ(float_val, 2.5f);
  EXPECT_EQ(kind_val, Kind::S_SOME);
  EXPECT_EQ(vec_val, (vector<vector<int32_t>>{ { 1, 2 }, {}, { 3 } }));
  EXPECT_EQ(point_val, (Point{ 7, 8 }));
  EXPECT_EQ(decoder.offset(), bytes.size());
  EXPECT_EQ(decoder.remaining(), 0u);
} // TEST(Codec, Decode_what_was_encoded)

TEST(Codec, Malformed_input)
{
  Test_logger logger;
  const auto expect_error = [&](const string& bytes, auto* val, error::Code expected)
  {
    Decoder decoder(&logger, bytes);
    Error_code err_code;
    EXPECT_FALSE(decoder.read(val, &err_code) && decoder.expect_end(&err_code));
    EXPECT_EQ(err_code, Error_code(expected));
  };

  int64_t int_val;
  string str_val;
  bool bool_val;
  vector<string> vec_val;
  Point point_val;

  expect_error(string("\x01\x02\x03", 3), &int_val, error::Code::S_TRUNCATED);
  expect_error(le32(5) + "abc", &str_val, error::Code::S_TRUNCATED);
  expect_error(le32(uint32_t(-1)) + "abc", &str_val, error::Code::S_INVALID_LENGTH);
  expect_error(le32((uint32_t(1) << 30) + 1), &str_val, error::Code::S_INVALID_LENGTH);
  expect_error(le32(1) + "ab", &str_val, error::Code::S_TRAILING_BYTES);
  expect_error(string("\x02", 1), &bool_val, error::Code::S_BAD_BLOB);
  expect_error(le32(2) + "12", &point_val, error::Code::S_BAD_BLOB);
  // Element count larger than the blob could hold.
  expect_error(le32(8) + string("\x10\x00\x00\x00\x00\x00\x00\x00", 8), &vec_val, error::Code::S_INVALID_LENGTH);
  // Negative element count.
  expect_error(le32(8) + string(8, '\xff'), &vec_val, error::Code::S_INVALID_LENGTH);
  // Bytes after the last element, inside the blob.
  expect_error(le32(8 + 4 + 1) + string("\x01\x00\x00\x00\x00\x00\x00\x00", 8) + le32(0) + "z",
               &vec_val, error::Code::S_TRAILING_BYTES);

  // The largest allowed length is accepted, as far as the length check goes.
  expect_error(le32(uint32_t(1) << 30) + "abc", &str_val, error::Code::S_TRUNCATED);
} // TEST(Codec, Malformed_input)

TEST(Codec, Image_header)
{
  Test_logger logger;
  string bytes;
  Encoder encoder(&logger, &bytes);
  encode_image_header(&encoder, { 100, 200, 2 });
  EXPECT_EQ(bytes.size(), 4u + 4 + 8 + 8 + 8);
  EXPECT_EQ(bytes.substr(0, 8), string("PAMK\x01\x00\x00\x00", 8));

  Error_code err_code;
  {
    // Count of 2 needs at least 20 more bytes.
    const string image = bytes + string(20, '\0');
    Decoder decoder(&logger, image);
    Image_header header;
    ASSERT_TRUE(decode_image_header(&decoder, &header, &err_code));
    EXPECT_EQ(header.m_total_size, 100);
    EXPECT_EQ(header.m_limit, 200);
    EXPECT_EQ(header.m_count, 2);
  }
  {
    const string image = bytes + string(19, '\0');
    Decoder decoder(&logger, image);
    Image_header header;
    EXPECT_FALSE(decode_image_header(&decoder, &header, &err_code));
    EXPECT_EQ(err_code, Error_code(error::Code::S_INVALID_LENGTH));
  }
  {
    string bad = bytes;
    bad[0] = 'X';
    Decoder decoder(&logger, bad);
    Image_header header;
    EXPECT_FALSE(decode_image_header(&decoder, &header, &err_code));
    EXPECT_EQ(err_code, Error_code(error::Code::S_BAD_MAGIC));
  }
  {
    string bad = bytes;
    bad[4] = '\x02';
    Decoder decoder(&logger, bad);
    Image_header header;
    EXPECT_FALSE(decode_image_header(&decoder, &header, &err_code));
    EXPECT_EQ(err_code, Error_code(error::Code::S_UNSUPPORTED_VERSION));
  }
  {
    const string image = bytes.substr(0, 10);
    Decoder decoder(&logger, image);
    Image_header header;
    EXPECT_FALSE(decode_image_header(&decoder, &header, &err_code));
    EXPECT_EQ(err_code, Error_code(error::Code::S_TRUNCATED));
  }
} // TEST(Codec, Image_header)

} // namespace kmap::persist::test
