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
#include "kmap/util/util_fwd.hpp"
#include <boost/shared_ptr.hpp>
#include <ostream>

/**
 * Persistence module: the binary codec (persist::Encoder, persist::Decoder, persist::Value_codec), the image
 * header, gzip compression, whole-file I/O, and the coordinator (persist::Coordinator) that drives a save or load
 * either synchronously or as a background unit of work reporting through persist::Async_result.
 *
 * ### Image format ###
 * All integers little-endian:
 *
 *   ~~~
 *   [4 bytes] magic: S_IMAGE_MAGIC
 *   [4 bytes] format version: S_IMAGE_VERSION
 *   [8 bytes] total size (signed)
 *   [8 bytes] limit (signed)
 *   [8 bytes] entry count (signed)
 *   repeated entry count times:
 *     key, value (see Value_codec), size (8 bytes, signed)
 *   ~~~
 *
 * The whole image may be gzip-compressed; a loader detects this by the gzip signature in the first two bytes.
 */
namespace kmap::persist
{

// Types.

// Find doc headers near the bodies of these compound types.

class Encoder;
class Decoder;
template<typename T, typename Enable = void>
struct Value_codec;
struct Image_header;
struct Save_options;
class Async_result;
class Coordinator;

/// Short-hand for ref-counted pointer to Async_result, as returned by the asynchronous save/load operations.
using Async_result_ptr = boost::shared_ptr<Async_result>;

// Constants.

/// First 4 bytes of every uncompressed image: "KMAP" when read as a big-endian integer.
constexpr uint32_t S_IMAGE_MAGIC = 0x4B4D4150;

/// The only image format version this code writes and reads.
constexpr int32_t S_IMAGE_VERSION = 1;

/// The largest allowed length prefix (text or blob) in an image; anything outside [0, this] is a format error.
constexpr int32_t S_MAX_LENGTH_PREFIX = int32_t(1) << 30;

// Free functions.

/**
 * Prints string representation of the given options to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param opts
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Save_options& opts);

/**
 * Prints the header's fields in human-friendly form.
 *
 * @param os
 *        Stream to which to write.
 * @param header
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Image_header& header);

} // namespace kmap::persist
