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

#include "kmap/util/util_fwd.hpp"
#include "kmap/util/string_ostream.hpp"
#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string.hpp>
#include <locale>
#include <cctype>
#include <cassert>

namespace kmap::util
{

// Types.

/// Base of interfaces (such as log::Logger) that need nothing but a `virtual` destructor.
class Null_interface
{
public:
  // Destructor.

  /// Pure, but defined.
  virtual ~Null_interface() = 0;
};

/**
 * Sets a variable for the lifetime of `*this`, then restores its previous value.
 *
 * @tparam Value
 *         Move-constructible and move-assignable.
 */
template<typename Value>
class Scoped_setter
{
public:
  // Constructors/destructor.

  /**
   * Saves `*target`, then sets it to `val_src_moved`.
   *
   * @param target
   *        Variable to set.  Must outlive `*this`.
   * @param val_src_moved
   *        New value.
   */
  explicit Scoped_setter(Value* target, Value&& val_src_moved);

  /**
   * Takes over the restoring duty of `src_moved`, whose destructor then does nothing.
   *
   * @param src_moved
   *        Source object.
   */
  Scoped_setter(Scoped_setter&& src_moved);

  /// Restores the saved value, unless moved-from.
  ~Scoped_setter();

  /// Disallowed.
  Scoped_setter(const Scoped_setter&) = delete;

  // Methods.

  /// Disallowed.
  Scoped_setter& operator=(const Scoped_setter&) = delete;

  /// Disallowed.
  Scoped_setter& operator=(Scoped_setter&&) = delete;

private:
  // Data.

  /// Variable to restore; null if moved-from.
  Value* m_target_or_null;

  /// Value to restore.
  Value m_saved_value;
}; // class Scoped_setter

// Free functions.

constexpr String_view get_last_path_segment(String_view full_path)
{
#ifdef KMAP_OS_WIN
  constexpr char SEP = '\\';
#else
  constexpr char SEP = '/';
#endif

  // A hand-written rfind(), as some gcc versions do not evaluate String_view::rfind() at compile time.
  for (size_t idx = full_path.size(); idx != 0; --idx)
  {
    if (full_path[idx - 1] == SEP)
    {
      return full_path.substr(idx);
    }
  }
  return full_path;
}

// Template implementations.

template<typename Value>
Scoped_setter<Value>::Scoped_setter(Value* target, Value&& val_src_moved) :
  m_target_or_null(target),
  m_saved_value(std::move(*target))
{
  *m_target_or_null = std::move(val_src_moved);
}

template<typename Value>
Scoped_setter<Value>::Scoped_setter(Scoped_setter&& src_moved) :
  m_target_or_null(src_moved.m_target_or_null),
  m_saved_value(std::move(src_moved.m_saved_value))
{
  assert(m_target_or_null && "Moving from a moved-from Scoped_setter.");
  src_moved.m_target_or_null = 0;
}

template<typename Value>
Scoped_setter<Value>::~Scoped_setter()
{
  if (m_target_or_null)
  {
    *m_target_or_null = std::move(m_saved_value);
  }
}

template<typename Container>
bool key_exists(const Container& container, const typename Container::key_type& key)
{
  return container.find(key) != container.end();
}

template<typename ...T>
void ostream_op_to_string(std::string* target_str, T const &... ostream_args)
{
  // Writes straight into *target_str: no intermediate ostringstream buffer.
  String_ostream os(target_str);
  (os.os() << ... << ostream_args) << std::flush;
}

template<typename ...T>
std::string ostream_op_string(T const &... ostream_args)
{
  std::string result;
  ostream_op_to_string(&result, ostream_args...);
  return result;
}

template<typename Enum>
Enum istream_to_enum(std::istream* is_ptr, Enum enum_default, Enum enum_sentinel, Enum enum_lowest)
{
  using boost::lexical_cast;
  using boost::bad_lexical_cast;
  using boost::algorithm::iequals;
  using std::string;
  using Traits = std::char_traits<char>;
  using enum_t = std::underlying_type_t<Enum>;

  assert(enum_t(enum_lowest) >= 0);
  auto& is = *is_ptr;

  string word;
  for (auto ch = is.peek(); (ch != Traits::eof()) && (std::isalnum(ch) || (ch == '_')); ch = is.peek())
  {
    word += char(is.get());
  }
  if (word.empty())
  {
    return enum_default;
  }
  // else

  if (std::isdigit(static_cast<unsigned char>(word.front())))
  {
    enum_t num;
    try
    {
      num = lexical_cast<enum_t>(word);
    }
    catch (const bad_lexical_cast&)
    {
      return enum_default;
    }
    return ((num >= enum_t(enum_lowest)) && (num < enum_t(enum_sentinel))) ? Enum(num) : enum_default;
  }
  // else

  for (auto num = enum_t(enum_lowest); num != enum_t(enum_sentinel); ++num)
  {
    if (iequals(word, lexical_cast<string>(Enum(num)), std::locale::classic()))
    {
      return Enum(num);
    }
  }
  return enum_default;
} // istream_to_enum()

} // namespace kmap::util
