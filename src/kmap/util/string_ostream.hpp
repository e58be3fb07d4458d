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
#include <boost/iostreams/stream.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/noncopyable.hpp>

namespace kmap::util
{

/**
 * An `ostream` appending to an `std::string` that the user can read directly, by reference, at any time; unlike
 * `ostringstream` whose `str()` can only hand out a copy.  Used by ostream_op_to_string() and by log::Buffer_logger.
 *
 * ### Thread safety ###
 * Same as `ostringstream`: guard concurrent read/write access to one object with a mutex.
 */
class String_ostream :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Appends to the given `std::string`, or to an internal one if null is passed.
   *
   * @param target_str
   *        String to append to (it is not cleared); or null to use an internal string, initially blank.
   *        While `*this` exists, modify `*target_str` only through `*this`.
   */
  explicit String_ostream(std::string* target_str = nullptr);

  // Methods.

  /**
   * The stream writing to the target string.
   *
   * @return See above.
   */
  std::ostream& os();

  /**
   * The stream writing to the target string (`const` overload).
   *
   * @return See above.
   */
  const std::ostream& os() const;

  /**
   * The target string.  The returned reference stays valid, and refers to the same object, for the life of `*this`.
   * Remember to flush os() before reading, if anything was written without `flush`.
   *
   * @return See above.
   */
  const std::string& str() const;

private:
  // Types.

  /// Short-hand for an `ostream` appending to an `std::string`.
  using String_appender_ostream = boost::iostreams::stream<boost::iostreams::back_insert_device<std::string>>;

  // Data.

  /// Target string when the user passed none to the ctor.  Otherwise unused.
  std::string m_own_target_str;

  /// The target string: either the user's or #m_own_target_str.
  std::string* m_target;

  /// Appends to `*m_target`.
  boost::iostreams::back_insert_device<std::string> m_target_inserter;

  /// The stream over #m_target_inserter.
  String_appender_ostream m_target_appender_ostream;
}; // class String_ostream

} // namespace kmap::util
