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
#include "kmap/log/log.hpp"
#include <string>

namespace kmap::persist
{

// Free functions.

/**
 * Returns `true` if and only if `bytes` starts with the gzip signature (0x1f 0x8b).  An uncompressed image
 * never does, as it starts with #S_IMAGE_MAGIC.
 *
 * @param bytes
 *        Bytes.
 * @return See above.
 */
bool is_gzip_compressed(util::String_view bytes);

/**
 * Gzip-compresses `raw` into `*compressed` (replacing its contents).
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param raw
 *        Bytes to compress.
 * @param level
 *        0 means the zlib default level; otherwise in [1, 9], as for zlib.
 * @param compressed
 *        Target.
 * @param err_code
 *        See #Error_code docs for error reporting semantics.  Error:
 *        persist::error::Code::S_INVALID_COMPRESSION_LEVEL.
 */
void gzip_compress(log::Logger* logger_ptr, util::String_view raw, int level, std::string* compressed,
                   Error_code* err_code = 0);

/**
 * Decompresses the gzip stream `compressed` into `*raw` (replacing its contents).
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param compressed
 *        Gzip stream.
 * @param raw
 *        Target.  On error its contents are unspecified.
 * @param err_code
 *        See #Error_code docs for error reporting semantics.  Error:
 *        persist::error::Code::S_DECOMPRESSION_FAILED if the stream is corrupt or truncated.
 */
void gzip_decompress(log::Logger* logger_ptr, util::String_view compressed, std::string* raw,
                     Error_code* err_code = 0);

} // namespace kmap::persist
