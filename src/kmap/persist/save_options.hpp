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

#include "kmap/persist/persist_fwd.hpp"
#include "kmap/util/util_fwd.hpp"

namespace kmap::persist
{

/**
 * Options for a single save of a map::Ordered_map (see map::Ordered_map::save()).  Default-constructed, it
 * requests an uncompressed image.  It can be filled from a config file the same way as map::Map_options; see
 * that class's doc header.
 *
 * ### Thread safety ###
 * Same as any `struct` with no locking done therein.
 */
struct Save_options
{
  // Constructors/destructor.

  /// Constructs a Save_options with the values used when the saver supplies none.
  explicit Save_options();

  // Methods.

  /**
   * Analogous to map::Map_options::setup_config_parsing().  See that method.
   *
   * @param opts_desc
   *        The util::Options_description object into which to load the help information, defaults, and
   *        mapping to members of `*this`.
   */
  void setup_config_parsing(util::Options_description* opts_desc);

  // Data.

  /// If and only if this is `true`, the whole image is gzip-compressed before being written.
  bool m_compress;

  /**
   * The gzip compression level, when #m_compress is `true`: 0 means the zlib default; 1 (fastest) through
   * 9 (smallest) are as for zlib.  Any other value makes the save fail.
   */
  int m_compress_level;

private:
  // Friends.

  // Friend of Save_options: For access to our internals.
  friend std::ostream& operator<<(std::ostream& os, const Save_options& opts);

  // Methods.

  /**
   * Analogous to map::Map_options::add_config_option().  See that method.
   *
   * @tparam Opt_type
   *         See above.
   * @param opts_desc
   *        See above.
   * @param opt_id
   *        See above.
   * @param target_val
   *        See above.
   * @param default_val
   *        See above.
   * @param description
   *        See above.
   * @param printout_only
   *        See above.
   */
  template<typename Opt_type>
  static void add_config_option(util::Options_description* opts_desc,
                                const std::string& opt_id,
                                Opt_type* target_val, const Opt_type& default_val,
                                const char* description, bool printout_only);

  /**
   * Analogous to map::Map_options::setup_config_parsing_helper().  See that method.
   *
   * @param opts_desc
   *        See above.
   * @param target
   *        See above.
   * @param defaults_source
   *        See above.
   * @param printout_only
   *        See above.
   */
  static void setup_config_parsing_helper(util::Options_description* opts_desc,
                                          Save_options* target,
                                          const Save_options& defaults_source,
                                          bool printout_only);
}; // struct Save_options

} // namespace kmap::persist
