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
#include <ostream>

/**
 * Ordered-index module: map::Ordered_map, the thread-safe insertion-ordered key-value map with an all-or-nothing
 * size-limit eviction policy, together with its size accounting (map::Size_of, map::approx_size()) and its
 * configuration (map::Map_options).  Persistence of an Ordered_map is performed by kmap::persist, via
 * Ordered_map::save() and friends.
 */
namespace kmap::map
{

// Types.

// Find doc headers near the bodies of these compound types.

template<typename Key, typename Value, typename Hash = boost::hash<Key>, typename Pred = std::equal_to<Key>>
class Ordered_map;

template<typename T, typename Enable = void>
struct Size_of;

struct Map_options;

// Free functions.

/**
 * Returns the approximate in-memory size, in bytes, of the given value, as counted against an Ordered_map's size
 * limit.  This is simply `Size_of<T>::approx(val)`; see Size_of for the strategy.
 *
 * @tparam T
 *         Value type.
 * @param val
 *        Value.
 * @return See above.  Non-negative.
 */
template<typename T>
int64_t approx_size(const T& val);

/**
 * Prints string representation of the given options to the given `ostream`, one option per line, with the
 * same names as used by Map_options::setup_config_parsing().
 *
 * @param os
 *        Stream to which to write.
 * @param opts
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Map_options& opts);

} // namespace kmap::map
