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

#include <boost/chrono/chrono.hpp>
#include <boost/system/error_code.hpp>
#include <boost/unordered_map.hpp>
#include <functional>
#include <string>
#include <cstdint>

/* We build in C++17 mode ourselves; linking user must too, as our headers use C++17 features (`std::optional`,
 * inline variables, `if constexpr`). */
#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any kmap/ API headers, use C++17 compile mode or later."
#endif

// Macros.  These (conceptually) belong to the `kmap` namespace (hence the prefix for each macro).

#ifdef __linux__
#  define KMAP_OS_LINUX
#elif defined(__APPLE__)
#  define KMAP_OS_MAC
#elif defined(_WIN32) || defined(_WIN64)
#  define KMAP_OS_WIN
#endif

/**
 * Catch-all namespace for the kmap library: an insertion-ordered, size-bounded, persistable key-value map.
 *
 * The library is organized into modules, each with its own namespace:
 *   - kmap::util: General utilities; notably util::Ordered_list (slot-map doubly-linked list) and
 *     util::Linked_hash_map (that list composed with a hash table).  Not thread-safe by themselves.
 *   - kmap::log: Logging.  Everything in kmap that logs does so through a log::Logger given to it by the user.
 *   - kmap::error: Error reporting support: #Error_code, error::Runtime_error, and the `Error_code* err_code`
 *     convention described below.
 *   - kmap::async: A single-thread task loop used to run background units of work.
 *   - kmap::map: The thread-safe ordered index, map::Ordered_map, plus its size accounting.
 *   - kmap::persist: The binary codec and the persistence coordinator (save/load, compression, async variants).
 */
namespace kmap
{

// Types.  They're outside of `namespace ::kmap::util` for brevity due to their frequent use.

// Integer short-hands and specific-bit-width types.

/// Byte.  Best way to represent a byte of binary data.  This is 8 bits on all modern systems.
using uint8_t = unsigned char;
/// Signed byte.  Prefer to use `uint8_t` to represent binary data.  This is 8 bits on all modern systems.
using int8_t = signed char;

// Time-related short-hands.

/// Clock used for delicate time measurements, such as timing how long a save took.
using Fine_clock = boost::chrono::high_resolution_clock;

/// A high-res time point as returned by `Fine_clock::now()`.
using Fine_time_pt = Fine_clock::time_point;

/// A high-res time duration as computed from two #Fine_time_pt`s.
using Fine_duration = Fine_clock::duration;

/**
 * Short-hand for a boost.system error code (which basically encapsulates an integer/`enum` error code and a pointer
 * through which to obtain a statically-stored message string); this is how kmap modules report errors to the user;
 * and we humbly recommend all C++ code use the same techniques.
 *
 * ### Error reporting semantics ###
 * Every kmap API that can fail takes, as its last (or near-last) arg, `Error_code* err_code = 0`.  Then:
 *   - If `err_code` is null, and an error occurs, then error::Runtime_error (a `boost::system::system_error`)
 *     is thrown; `Runtime_error::code()` is the error that occurred.  If no error occurs, nothing is thrown.
 *   - If `err_code` is not null, then nothing is thrown; `*err_code` is set to the error or to success
 *     (falsy #Error_code) as appropriate.
 *
 * This allows the user to choose exceptions or return-code style on a per-call basis.  Within kmap the helper
 * KMAP_ERROR_EXEC_AND_THROW_ON_ERROR() (and error::exec_void_and_throw_on_error()) implements the above.
 *
 * Error codes kmap itself emits are in map::error::Code and persist::error::Code.  File-system failures are
 * passed through unchanged as the system errors reported by boost.filesystem.
 */
using Error_code = boost::system::error_code;

// See just below.
template<typename Signature>
class Function;

/**
 * Intended as the polymorphic function wrapper of choice for kmap, internally and externally; to be used
 * instead of `std::function`.  Identical to `std::function` except for the added empty() and clear() conveniences.
 *
 * @tparam Result
 *         See `std::function`.
 * @tparam Args
 *         See `std::function`.
 */
template<typename Result, typename... Args>
class Function<Result (Args...)> :
  public std::function<Result (Args...)>
{
public:
  // Types.

  /// Short-hand for the base.  We add no data; we are just a sugar-coated version of it.
  using Function_base = std::function<Result (Args...)>;

  // Ctors/destructor.

  /// Inherit all the constructors from #Function_base.
  using Function_base::Function_base;

  // Methods.

  /**
   * Returns `!bool(*this)`; i.e., `true` if and only if `*this` has no target.
   *
   * @return See above.
   */
  bool empty() const noexcept;

  /// Makes `*this` empty, as if default-constructed.
  void clear() noexcept;
}; // class Function<Result (Args...)>

/**
 * The `log::Component` payload enumeration comprising the various log components used by kmap's own internal
 * logging.  Internal kmap code specifies members thereof when indicating the log component for each particular
 * piece of logging code.  To configure verbosity per component, register it with log::Config::register_components()
 * and #S_KMAP_LOG_COMPONENT_NAME_MAP.
 */
enum class Kmap_log_component : unsigned int
{
  /// Messages not tied to any particular module.
  S_UNCAT,
  /// kmap::util.
  S_UTIL,
  /// kmap::log itself.
  S_LOG,
  /// kmap::async.
  S_ASYNC,
  /// kmap::map: the ordered index and its eviction.
  S_MAP,
  /// kmap::persist: codec, compression, file I/O, save/load coordination.
  S_PERSIST,
  /// Sentinel: not a real component; one past the last.
  S_END_SENTINEL
}; // enum class Kmap_log_component

/// The map mapping each #Kmap_log_component value to its name, for log output and configuration by name.
extern const boost::unordered_multimap<Kmap_log_component, std::string> S_KMAP_LOG_COMPONENT_NAME_MAP;

// Template implementations.

template<typename Result, typename... Args>
bool Function<Result (Args...)>::empty() const noexcept
{
  return !*this;
}

template<typename Result, typename... Args>
void Function<Result (Args...)>::clear() noexcept
{
  *this = {};
}

} // namespace kmap
