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
 * Namespace containing the map module's extension of boost.system error conventions, so that map::Ordered_map
 * APIs can return codes/messages from within its own new set of error codes/messages.  See the analogous
 * persist::error for the persistence module's codes.
 *
 * Synopsis:
 *
 *   ~~~
 *   Error_code err_code;
 *   map.set(key, huge_value, &err_code);
 *   if (err_code == kmap::map::error::Code::S_SIZE_EXCEEDED) { ... }
 *   ~~~
 */
namespace kmap::map::error
{

// Types.

/// All possible errors returned (via `Error_code` arguments) by map::Ordered_map functions/methods.
enum class Code
{
  /// A single value's approximate size exceeds the map's entire size limit; nothing was stored.
  S_SIZE_EXCEEDED = 1,
  /// The handle does not refer to an entry currently in the map: null, or its entry was removed.
  S_INVALID_HANDLE
};

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight kmap::Error_code (a/k/a boost.system `error_code`)
 * representing that error.  This is needed to make the `boost::system::error_code::error_code<Code>()` template
 * implementation work.  Or, slightly more in English, it glues the (completely general) `Error_code`
 * to the (map-specific) error code set, so that one can implicitly covert from the latter to the former.
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding `Error_code`.
 */
Error_code make_error_code(Code err_code);

} // namespace kmap::map::error

/// We may add some ADL-based overloads into this namespace outside `kmap`.
namespace boost::system
{

// Types.

/// Tells boost.system that map::error::Code values are convertible to kmap::Error_code.
template<>
struct is_error_code_enum<::kmap::map::error::Code>
{
  /// Means `Code` `enum` values can be used for kmap::Error_code.
  static const bool value = true;
};

} // namespace boost::system
