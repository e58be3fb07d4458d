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
#include "kmap/util/util_fwd.hpp"

namespace kmap::map
{

/**
 * A set of low-level options affecting a single map::Ordered_map instance: chiefly its size limit.
 * Default-constructed, it describes an unbounded map with the default hash-table sizing.
 *
 * You may read from and write to members of this `struct` at will, and no checking will be performed;
 * moreover, doing so will have no effect other than the field being read or written.  Ordered_map copies the
 * given Map_options at construction and never saves a reference to it.
 *
 * Alternatively, you can fill it parsing a config file or command line using
 * boost.program_options with the help of setup_config_parsing(), which will provide a program_options-suitable
 * util::Options_description object to enable this parsing (see also util::parse_config_stream()).  You may
 * conversely print util::Options_description to an `ostream` for full help text on the meaning of each option
 * and the defaults.  Printing a Map_options itself yields the current settings stored in that object.
 *
 * ### Thread safety ###
 * Same as any `struct` with no locking done therein.
 *
 * @internal
 *
 * If you want to add an option: add the data member with a full comment; add an ADD_CONFIG_OPTION() line into
 * setup_config_parsing_helper() (the description usually being a copy of that comment); add the default value
 * into the constructor; use it in Ordered_map.
 */
struct Map_options
{
  // Constructors/destructor.

  /// Constructs a Map_options with the values Ordered_map uses when the creator chooses not to supply options.
  explicit Map_options();

  // Methods.

  /**
   * Modifies a boost.program_options options description object to enable subsequent parsing of a
   * command line or config file into the data members of this object, as well printing a help
   * message about these options to an `ostream`.  The defaults are the values currently stored in `*this`.
   *
   * @param opts_desc
   *        The util::Options_description object into which to load the help information, defaults, and
   *        mapping to members of `*this`.
   */
  void setup_config_parsing(util::Options_description* opts_desc);

  /**
   * Returns #m_limit_mb converted to bytes; or 0 (unbounded) if it is not positive.
   *
   * @return See above.
   */
  int64_t limit_bytes() const;

  // Data.

  /**
   * The size limit of the map in mebibytes (units of 1024 * 1024 bytes), against which the approximate sizes
   * (see map::Size_of) of all stored values are counted.  A write that would push the total above the limit
   * first clears the entire map.  Zero or negative means unbounded.
   */
  int64_t m_limit_mb;

  /**
   * Initial number of buckets in the map's hash table.  Zero lets the hash table choose.  Purely a performance
   * tuning knob: it has no observable effect on behavior.
   */
  size_t m_n_buckets_hint;

private:
  // Friends.

  // Friend of Map_options: For access to our internals.
  friend std::ostream& operator<<(std::ostream& os, const Map_options& opts);

  // Methods.

  /**
   * A helper that adds a single option to a given util::Options_description, for use either in printing the
   * current values or for parsing into them.
   *
   * @tparam Opt_type
   *         The type of a data member of Map_options.
   * @param opts_desc
   *        The util::Options_description object into which to load a single `option_description`.
   * @param opt_id
   *        The name of the option as stringified from the data member identifier; see util::opt_id_to_str().
   * @param target_val
   *        If `!printout_only`, the location of the value that will be set when parsing.
   * @param default_val
   *        The default value to record in `*opts_desc`.
   * @param description
   *        If `!printout_only`, the description to record.
   * @param printout_only
   *        See above.
   */
  template<typename Opt_type>
  static void add_config_option(util::Options_description* opts_desc,
                                const std::string& opt_id,
                                Opt_type* target_val, const Opt_type& default_val,
                                const char* description, bool printout_only);

  /**
   * Loads the full set of boost.program_options config options into the given util::Options_description,
   * either for printing the values in `defaults_source` or for parsing into `*target`.
   *
   * @param opts_desc
   *        The util::Options_description object to load.
   * @param target
   *        If `!printout_only`, the object into which parsing will later write.
   * @param defaults_source
   *        The object from which default values are taken.
   * @param printout_only
   *        If `true`, only names and values are registered (for operator<<()); otherwise descriptions too.
   */
  static void setup_config_parsing_helper(util::Options_description* opts_desc,
                                          Map_options* target,
                                          const Map_options& defaults_source,
                                          bool printout_only);
}; // struct Map_options

} // namespace kmap::map
