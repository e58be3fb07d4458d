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
#include "kmap/persist/error/error.hpp"
#include <cassert>

namespace kmap::persist::error
{

// Types.

/// The boost.system category for errors returned by the persist module.  Analogous to map::error::Category.
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Analogous to Category::name() API.
   *
   * @return See above.
   */
  const char* name() const noexcept override;

  /**
   * Analogous to Category::message() API.
   *
   * @param val
   *        The `int` version of a Code.
   * @return See above.
   */
  std::string message(int val) const override;

private:
  // Constructors/destructor.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  return Error_code{static_cast<int>(err_code), Category::S_CATEGORY};
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "kmap-persist";
}

std::string Category::message(int val) const // Virtual.
{
  switch (static_cast<Code>(val))
  {
  case Code::S_BAD_MAGIC:
    return "Format error: the image does not begin with the expected magic number.";
  case Code::S_UNSUPPORTED_VERSION:
    return "Format error: the image's format version is not supported.";
  case Code::S_INVALID_LENGTH:
    return "Format error: a length prefix or count is out of the allowed range.";
  case Code::S_TRUNCATED:
    return "Format error: the image ended in the middle of a field.";
  case Code::S_TRAILING_BYTES:
    return "Format error: the image has extra bytes past its last entry.";
  case Code::S_DUPLICATE_KEY:
    return "Format error: the image contains the same key more than once.";
  case Code::S_SIZE_MISMATCH:
    return "Format error: the image's recorded total size does not match the sum of its entry sizes.";
  case Code::S_BAD_BLOB:
    return "Format error: a structured value could not be decoded.";
  case Code::S_DECOMPRESSION_FAILED:
    return "The image has a gzip signature but could not be decompressed.";
  case Code::S_INVALID_COMPRESSION_LEVEL:
    return "Compression level must be 0 (default) or in [1, 9].";
  case Code::S_ASYNC_ABANDONED:
    return "The background operation was not executed, as its task loop was not running.";
  case Code::S_ASYNC_WORK_FAILED:
    return "The background operation failed with an exception.";
  }
  assert(false);
  return "";
} // Category::message()

} // namespace kmap::persist::error
