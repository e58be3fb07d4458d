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
#include "kmap/map/error/error.hpp"
#include <cassert>

namespace kmap::map::error
{

// Types.

/**
 * The boost.system category for errors returned by the map module.  Think of it as the polymorphic
 * counterpart of map::error::Code, and it kicks in when, for example, `Error_code::message()` is called.
 */
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
  return "kmap-map";
}

std::string Category::message(int val) const // Virtual.
{
  switch (static_cast<Code>(val))
  {
  case Code::S_SIZE_EXCEEDED:
    return "The value alone is larger than the map's size limit; nothing was stored.";
  case Code::S_INVALID_HANDLE:
    return "The handle does not refer to an entry currently in the map.";
  }
  assert(false);
  return "";
} // Category::message()

} // namespace kmap::map::error
