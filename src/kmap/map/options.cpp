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
#include "kmap/map/options.hpp"
#include "kmap/util/util.hpp"

// Internal macros (#undef at the end of file).

// -v- Doxygen, please ignore the following.
/// @cond

/* Helper that reduces verbosity of setup_config_parsing_helper(): the option's name is derived from the member's
 * name; its default from the same member in `defaults_source`. */
#define ADD_CONFIG_OPTION(ARG_opt, ARG_desc) \
  Map_options::add_config_option(opts_desc, #ARG_opt, &target->ARG_opt, defaults_source.ARG_opt, ARG_desc, \
                                 printout_only)

// -v- Doxygen, please stop ignoring.
/// @endcond

namespace kmap::map
{

// Implementations.

Map_options::Map_options() :
  // Unbounded, so that nothing is ever evicted unless the user asks for it.
  m_limit_mb(0),
  // Let boost.unordered pick.
  m_n_buckets_hint(0)
{
  // Nothing.
}

template<typename Opt_type>
void Map_options::add_config_option(util::Options_description* opts_desc,
                                    const std::string& opt_id,
                                    Opt_type* target_val, const Opt_type& default_val,
                                    const char* description, bool printout_only) // Static.
{
  using boost::program_options::value;
  if (printout_only)
  {
    opts_desc->add_options()
      (util::opt_id_to_str(opt_id).c_str(), value<Opt_type>()->default_value(default_val));
  }
  else
  {
    opts_desc->add_options()
      (util::opt_id_to_str(opt_id).c_str(), value<Opt_type>(target_val)->default_value(default_val),
       description);
  }
}

void Map_options::setup_config_parsing_helper(util::Options_description* opts_desc,
                                              Map_options* target,
                                              const Map_options& defaults_source,
                                              bool printout_only) // Static.
{
  ADD_CONFIG_OPTION
    (m_limit_mb,
     "The size limit of the map in mebibytes, against which the approximate sizes of all stored values are "
       "counted.  A write that would push the total above the limit first clears the entire map.  "
       "Zero or negative means unbounded.");
  ADD_CONFIG_OPTION
    (m_n_buckets_hint,
     "Initial number of buckets in the map's hash table.  Zero lets the hash table choose.  This affects "
       "performance only.");
} // Map_options::setup_config_parsing_helper()

void Map_options::setup_config_parsing(util::Options_description* opts_desc)
{
  // Set up *opts_desc to parse into *this when the caller chooses to.  Take defaults from *this.
  setup_config_parsing_helper(opts_desc, this, *this, false);
}

int64_t Map_options::limit_bytes() const
{
  return (m_limit_mb <= 0) ? 0 : (m_limit_mb * 1024 * 1024);
}

std::ostream& operator<<(std::ostream& os, const Map_options& opts)
{
  Map_options sink;
  util::Options_description opts_desc{"Per-map::Ordered_map option values"};
  Map_options::setup_config_parsing_helper(&opts_desc, &sink, opts, true);
  return os << opts_desc;
}

} // namespace kmap::map

#undef ADD_CONFIG_OPTION
