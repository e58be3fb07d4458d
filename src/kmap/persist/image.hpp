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

#include "kmap/persist/persist_fwd.hpp"
#include "kmap/persist/codec.hpp"

namespace kmap::persist
{

// Types.

/**
 * The fixed-size part of an image, following the magic number and format version: the map-wide values
 * recorded at save time.  The entries follow it.
 */
struct Image_header
{
  // Data.

  /// The sum of the entries' sizes.
  int64_t m_total_size;

  /// The map's size limit in bytes; 0 or negative means unbounded.
  int64_t m_limit;

  /// The number of entries that follow.
  int64_t m_count;
};

// Free functions.

/**
 * Writes the magic number, the format version, and the given header.
 *
 * @param encoder
 *        Target.
 * @param header
 *        Header.
 */
void encode_image_header(Encoder* encoder, const Image_header& header);

/**
 * Reads and checks what encode_image_header() writes.  Errors: persist::error::Code::S_BAD_MAGIC;
 * persist::error::Code::S_UNSUPPORTED_VERSION; persist::error::Code::S_INVALID_LENGTH if the entry count is
 * negative or more than the remaining bytes could hold; persist::error::Code::S_TRUNCATED.
 *
 * @param decoder
 *        Source.
 * @param header
 *        On success, the header.
 * @param err_code
 *        Set on error.  Not null.
 * @return `false` on error.
 */
bool decode_image_header(Decoder* decoder, Image_header* header, Error_code* err_code);

} // namespace kmap::persist
