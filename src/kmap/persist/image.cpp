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
#include "kmap/persist/image.hpp"
#include <boost/io/ios_state.hpp>
#include <ostream>

namespace kmap::persist
{

void encode_image_header(Encoder* encoder, const Image_header& header)
{
  encoder->write_int(S_IMAGE_MAGIC);
  encoder->write_int(S_IMAGE_VERSION);
  encoder->write_int(header.m_total_size);
  encoder->write_int(header.m_limit);
  encoder->write_int(header.m_count);
}

bool decode_image_header(Decoder* decoder, Image_header* header, Error_code* err_code)
{
  // Each entry is at least a 1-byte key, a 1-byte value, and an 8-byte size.
  constexpr size_t MIN_ENTRY_SIZE = 1 + 1 + sizeof(int64_t);

  uint32_t magic;
  if (!decoder->read_int(&magic, err_code))
  {
    return false;
  }
  // else
  if (magic != S_IMAGE_MAGIC)
  {
    return decoder->emit_error(error::Code::S_BAD_MAGIC, err_code);
  }
  // else

  int32_t version;
  if (!decoder->read_int(&version, err_code))
  {
    return false;
  }
  // else
  if (version != S_IMAGE_VERSION)
  {
    return decoder->emit_error(error::Code::S_UNSUPPORTED_VERSION, err_code);
  }
  // else

  if (!(decoder->read_int(&header->m_total_size, err_code)
        && decoder->read_int(&header->m_limit, err_code)
        && decoder->read_int(&header->m_count, err_code)))
  {
    return false;
  }
  // else

  if ((header->m_count < 0)
      || (static_cast<uint64_t>(header->m_count) > (decoder->remaining() / MIN_ENTRY_SIZE)))
  {
    return decoder->emit_error(error::Code::S_INVALID_LENGTH, err_code);
  }
  // else
  if (header->m_total_size < 0)
  {
    return decoder->emit_error(error::Code::S_SIZE_MISMATCH, err_code);
  }
  // else
  return true;
} // decode_image_header()

std::ostream& operator<<(std::ostream& os, const Image_header& header)
{
  boost::io::ios_all_saver saver(os);
  return os << "image_header[total_size=" << header.m_total_size << " limit=" << header.m_limit
            << " count=" << header.m_count << " version=" << S_IMAGE_VERSION
            << " magic=0x" << std::hex << S_IMAGE_MAGIC << ']';
}

} // namespace kmap::persist
