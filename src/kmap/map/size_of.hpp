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

#include "kmap/map/map_fwd.hpp"
#include <string>
#include <vector>
#include <utility>
#include <type_traits>

namespace kmap::map
{

// Types.

/**
 * The size accountant: computes the approximate in-memory size, in bytes, of a value of type `T`, which is what
 * Ordered_map counts against its size limit.  The strategy is a structural approximation, applied consistently
 * to every write (bounded map or not):
 *   - `std::string`: exactly its `size()` (the text's byte length).
 *   - Arithmetic and `enum` types: `sizeof(T)`.
 *   - `std::vector<E>`: the sum of `Size_of<E>::approx()` over the elements; so a byte vector counts exactly
 *     its length.
 *   - `std::pair<A, B>`: the sum of the two members' sizes.
 *   - Anything else: `sizeof(T)`, plus `deep_size(val)` if such a function is findable by ADL.  `deep_size()`
 *     shall return an estimate of the memory allocated on the value's behalf, excluding its shallow `sizeof`.
 *
 * The user may also specialize Size_of for a type of their own; the specialization must provide
 * `static int64_t approx(const T&)`.
 *
 * @tparam T
 *         Value type.
 * @tparam Enable
 *         Ignore; used for `enable_if`-style specialization.
 */
template<typename T, typename Enable>
struct Size_of
{
  /**
   * Returns the approximate size of `val`.  See class doc header.
   *
   * @param val
   *        Value.
   * @return See above.
   */
  static int64_t approx(const T& val);
};

/// Size_of specialization for text: its exact byte length.
template<>
struct Size_of<std::string>
{
  /**
   * Returns `val.size()`.
   *
   * @param val
   *        Value.
   * @return See above.
   */
  static int64_t approx(const std::string& val)
  {
    return static_cast<int64_t>(val.size());
  }
};

/**
 * Size_of specialization for arithmetic and `enum` types: `sizeof(T)`.
 *
 * @tparam T
 *         Arithmetic or `enum` type.
 */
template<typename T>
struct Size_of<T, std::enable_if_t<std::is_arithmetic_v<T> || std::is_enum_v<T>>>
{
  /**
   * Returns `sizeof(T)`.
   *
   * @return See above.
   */
  static int64_t approx(const T&)
  {
    return static_cast<int64_t>(sizeof(T));
  }
};

/**
 * Size_of specialization for `vector`s: the sum of the elements' sizes.
 *
 * @tparam Elem
 *         Element type.
 * @tparam Allocator
 *         Allocator type.
 */
template<typename Elem, typename Allocator>
struct Size_of<std::vector<Elem, Allocator>>
{
  /**
   * Returns the sum of Size_of<Elem>::approx() over `val`.
   *
   * @param val
   *        Value.
   * @return See above.
   */
  static int64_t approx(const std::vector<Elem, Allocator>& val);
};

/**
 * Size_of specialization for `pair`s: the sum of the two members' sizes.
 *
 * @tparam First
 *         See `std::pair`.
 * @tparam Second
 *         See `std::pair`.
 */
template<typename First, typename Second>
struct Size_of<std::pair<First, Second>>
{
  /**
   * Returns the sum of the two members' sizes.
   *
   * @param val
   *        Value.
   * @return See above.
   */
  static int64_t approx(const std::pair<First, Second>& val)
  {
    return approx_size(val.first) + approx_size(val.second);
  }
};

/// @cond
// -^- Doxygen, please ignore the following.

namespace detail
{

// Detects whether `deep_size(const T&)` is findable by ADL.  Primary template: not findable.
template<typename T, typename = void>
struct Has_deep_size : std::false_type
{
};

template<typename T>
struct Has_deep_size<T, std::void_t<decltype(deep_size(std::declval<const T&>()))>> : std::true_type
{
};

} // namespace detail

// -v- Doxygen, please stop ignoring.
/// @endcond

// Template implementations.

template<typename T, typename Enable>
int64_t Size_of<T, Enable>::approx(const T& val)
{
  if constexpr(detail::Has_deep_size<T>::value)
  {
    return static_cast<int64_t>(sizeof(T) + deep_size(val));
  }
  else
  {
    return static_cast<int64_t>(sizeof(T));
  }
}

template<typename Elem, typename Allocator>
int64_t Size_of<std::vector<Elem, Allocator>>::approx(const std::vector<Elem, Allocator>& val)
{
  if constexpr(std::is_arithmetic_v<Elem> || std::is_enum_v<Elem>)
  {
    return static_cast<int64_t>(val.size() * sizeof(Elem));
  }
  else
  {
    int64_t total = 0;
    for (const auto& elem : val)
    {
      total += approx_size(elem);
    }
    return total;
  }
}

template<typename T>
int64_t approx_size(const T& val)
{
  return Size_of<T>::approx(val);
}

} // namespace kmap::map
