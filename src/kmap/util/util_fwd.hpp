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
#include <boost/thread.hpp>
#include <boost/thread/shared_mutex.hpp>
#include <boost/asio.hpp>
#include <boost/functional/hash.hpp>
#include <boost/program_options.hpp>
#include <boost/preprocessor/stringize.hpp>
#include <string_view>
#include <ostream>

namespace kmap::log
{
class Logger;
}

/**
 * Utilities used throughout kmap: the linked containers under map::Ordered_map, thread and lock aliases, string and
 * stream helpers, config parsing, and a few macros.  Depends on no other module except kmap::log and kmap::error.
 */
namespace kmap::util
{

// Types.

template<typename Key, typename Mapped>
class Ordered_list;
template<typename Key, typename Mapped, typename Hash = boost::hash<Key>, typename Pred = std::equal_to<Key>>
class Linked_hash_map;

class Null_interface;

template<typename Value>
class Scoped_setter;

class String_ostream;

/// Non-owning string reference.
using String_view = std::string_view;

/// Thread type.  boost.thread, as boost.asio uses it.
using Thread = boost::thread;

/// ID of a #Thread.
using Thread_id = Thread::id;

/// boost.asio task queue and executor.
using Task_engine = boost::asio::io_context;

/// Keeps Task_engine::run() from returning while there are no tasks.
using Work_guard = boost::asio::executor_work_guard<Task_engine::executor_type>;

/// Exclusive, non-recursive mutex.
using Mutex_non_recursive = boost::mutex;

/// Reader/writer, non-recursive mutex.  Lock with #Lock_guard_shared_non_recursive_sh or `_ex`.
using Mutex_shared_non_recursive = boost::shared_mutex;

/// Lock of a #Mutex_non_recursive.
using Lock_guard_non_recursive = boost::unique_lock<Mutex_non_recursive>;

/// Shared (reader) lock of a #Mutex_shared_non_recursive.
using Lock_guard_shared_non_recursive_sh = boost::shared_lock<Mutex_shared_non_recursive>;

/// Exclusive (writer) lock of a #Mutex_shared_non_recursive.
using Lock_guard_shared_non_recursive_ex = boost::unique_lock<Mutex_shared_non_recursive>;

/// boost.program_options option set, filled by the `setup_config_parsing()` of the various `*_options` structs.
using Options_description = boost::program_options::options_description;

// Free functions.

/**
 * Returns `true` if and only if `key` is in the associative container.
 *
 * @tparam Container
 *         `boost::unordered_map`, `std::set`, and the like.
 * @param container
 *        Container.
 * @param key
 *        Key.
 * @return See above.
 */
template<typename Container>
bool key_exists(const Container& container, const typename Container::key_type& key);

/**
 * Appends `os << arg` of each argument, in order, to the given string.
 *
 * @tparam T
 *         Types supporting `ostream <<`.
 * @param target_str
 *        String to append to.
 * @param ostream_args
 *        What to write.
 */
template<typename ...T>
void ostream_op_to_string(std::string* target_str, T const &... ostream_args);

/**
 * Like ostream_op_to_string() but returns a new string.
 *
 * @tparam T
 *         See ostream_op_to_string().
 * @param ostream_args
 *        See ostream_op_to_string().
 * @return See above.
 */
template<typename ...T>
std::string ostream_op_string(T const &... ostream_args);

/**
 * Reads an `enum class` value from a stream, as a word (letters, digits, underscores) matching, ignoring case,
 * the `ostream <<` form of a value in [`enum_lowest`, `enum_sentinel`); or as a decimal number in that range.
 * Reading stops at the first character not in a word.
 *
 * @tparam Enum
 *         `enum class` with contiguous non-negative values and `operator<<`.
 * @param is_ptr
 *        Stream.
 * @param enum_default
 *        Returned if the word matches nothing.
 * @param enum_sentinel
 *        One past the highest value.
 * @param enum_lowest
 *        Lowest value.
 * @return See above.
 */
template<typename Enum>
Enum istream_to_enum(std::istream* is_ptr, Enum enum_default, Enum enum_sentinel,
                     Enum enum_lowest = Enum(0));

/**
 * Parses a config stream (`name = value` lines; `#` starts a comment) into the targets registered in `opts_desc`,
 * such as by map::Map_options::setup_config_parsing().  Options absent from the stream take their registered
 * defaults.  An unknown option name is an error.
 *
 * @param logger_ptr
 *        Logger; may be null.
 * @param is
 *        Stream.
 * @param opts_desc
 *        Options to fill.
 * @param err_code
 *        See #Error_code docs for error reporting semantics.  Error: `boost::system::errc::invalid_argument`
 *        if the stream does not parse or a value does not convert to its option's type.
 */
void parse_config_stream(log::Logger* logger_ptr, std::istream& is, const Options_description& opts_desc,
                         Error_code* err_code = 0);

/**
 * Returns the config option name for a data member: `m_limit_mb` becomes `limit-mb`.
 *
 * @param opt_id
 *        Member name, typically as stringized by the preprocessor.
 * @return See above.
 */
std::string opt_id_to_str(const std::string& opt_id);

/**
 * Returns the part of `full_path` after its last `/` (`\` on Windows); or all of it if there is none.  `constexpr`,
 * so the log macros strip `__FILE__` at compile time.
 *
 * @param full_path
 *        Path.
 * @return See above.
 */
constexpr String_view get_last_path_segment(String_view full_path);

} // namespace kmap::util

// Macros.

/**
 * Evaluates to a string literal "<full file path>:<ARG_function>(<line>)", for where a `const char*` to static storage
 * is needed.
 *
 * @param ARG_function
 *        Function name, as it should appear.
 */
#define KMAP_UTIL_WHERE_AM_I_LITERAL(ARG_function) \
  __FILE__ ":" BOOST_PP_STRINGIZE(ARG_function) "(" BOOST_PP_STRINGIZE(__LINE__) ")"

/// `ostream` fragment writing "<file>:<function>(<line>)" from the given parts.
#define KMAP_UTIL_WHERE_AM_I_FROM_ARGS(ARG_file, ARG_function, ARG_line) \
  ARG_file << ':' << ARG_function << '(' << ARG_line << ')'

/// Wraps a multi-statement macro body so that it is one statement requiring a trailing semicolon.
#define KMAP_UTIL_SEMICOLON_SAFE(ARG_func_macro_definition) \
  do \
  { \
    ARG_func_macro_definition \
  } \
  while (false)
