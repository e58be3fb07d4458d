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
#include "kmap/persist/save_options.hpp"
#include "kmap/util/util.hpp"

// Internal macros (#undef at the end of file).

// -v- Doxygen, please ignore the following.
/// @cond

// See map/options.cpp.
#define ADD_CONFIG_OPTION(ARG_opt, ARG_desc) \
  Save_options::add_config_option(opts_desc, #ARG_opt, &target->ARG_opt, defaults_source.ARG_opt, ARG_desc, \
                                  printout_only)

// -v- Doxygen, please stop ignoring.
/// @endcond

namespace kmap::persist
{

// Implementations.

Save_options::Save_options() :
  m_compress(false),
  // zlib default.
  m_compress_level(0)
{
  // Nothing.
}

template<typename Opt_type>
void Save_options::add_config_option(util::Options_description* opts_desc,
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

void Save_options::setup_config_parsing_helper(util::Options_description* opts_desc,
                                               Save_options* target,
                                               const Save_options& defaults_source,
                                               bool printout_only) // Static.
{
  ADD_CONFIG_OPTION
    (m_compress,
     "If and only if this is true, the whole image is gzip-compressed before being written.  Loading detects "
       "compression automatically, so this need not be known when loading.");
  ADD_CONFIG_OPTION
    (m_compress_level,
     "The gzip compression level, when compress is true: 0 means the zlib default; 1 (fastest) through "
       "9 (smallest) are as for zlib.  Any other value makes the save fail.");
}

void Save_options::setup_config_parsing(util::Options_description* opts_desc)
{
  setup_config_parsing_helper(opts_desc, this, *this, false);
}

std::ostream& operator<<(std::ostream& os, const Save_options& opts)
{
  Save_options sink;
  util::Options_description opts_desc{"Per-save option values"};
  Save_options::setup_config_parsing_helper(&opts_desc, &sink, opts, true);
  return os << opts_desc;
}

} // namespace kmap::persist

#undef ADD_CONFIG_OPTION
