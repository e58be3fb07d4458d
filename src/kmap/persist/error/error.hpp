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

/**
 * Namespace containing the persistence module's extension of boost.system error conventions.  These codes are
 * the format errors detected while decoding a saved image, plus a few others specific to persistence.
 * Filesystem failures are not among them: those surface as the boost.system codes reported by boost.filesystem.
 */
namespace kmap::persist::error
{

// Types.

/// All possible errors returned (via `Error_code` arguments) by persist functions/methods.
enum class Code
{
  /// The image does not begin with the expected magic number.
  S_BAD_MAGIC = 1,
  /// The image's format version is not supported.
  S_UNSUPPORTED_VERSION,
  /// A length prefix or count is negative or larger than allowed.
  S_INVALID_LENGTH,
  /// The image ended before a complete field could be read.
  S_TRUNCATED,
  /// The image contains bytes past the last entry.
  S_TRAILING_BYTES,
  /// The image contains the same key more than once.
  S_DUPLICATE_KEY,
  /// The image's recorded total size differs from the sum of its entries' sizes.
  S_SIZE_MISMATCH,
  /// A structured value's blob could not be decoded into the value type.
  S_BAD_BLOB,
  /// The image appeared to be gzip-compressed but could not be decompressed.
  S_DECOMPRESSION_FAILED,
  /// The requested compression level is not 0 (default) or in [1, 9].
  S_INVALID_COMPRESSION_LEVEL,
  /// The background operation was never executed (its task loop was not running).
  S_ASYNC_ABANDONED,
  /// The background operation threw an exception not carrying an error code (for example from a value codec).
  S_ASYNC_WORK_FAILED
};

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight kmap::Error_code representing that error.
 * Analogous to map::error::make_error_code().
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding `Error_code`.
 */
Error_code make_error_code(Code err_code);

} // namespace kmap::persist::error

/// We may add some ADL-based overloads into this namespace outside `kmap`.
namespace boost::system
{

// Types.

/// Tells boost.system that persist::error::Code values are convertible to kmap::Error_code.
template<>
struct is_error_code_enum<::kmap::persist::error::Code>
{
  /// Means `Code` `enum` values can be used for kmap::Error_code.
  static const bool value = true;
};

} // namespace boost::system
