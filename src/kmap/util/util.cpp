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
#include "kmap/util/util.hpp"
#include "kmap/log/log.hpp"
#include "kmap/error/error.hpp"

namespace kmap::util
{

// Implementations.

Null_interface::~Null_interface() = default;

std::string opt_id_to_str(const std::string& opt_id)
{
  using boost::algorithm::starts_with;
  using boost::algorithm::replace_all;
  using std::string;

  const string MEMBER_PREFIX = "m_";

  string str = opt_id;
  if (starts_with(opt_id, MEMBER_PREFIX))
  {
    str.erase(0, MEMBER_PREFIX.size());
  }

  replace_all(str, "_", "-");

  return str;
}

void parse_config_stream(log::Logger* logger_ptr, std::istream& is, const Options_description& opts_desc,
                         Error_code* err_code)
{
  namespace opts = boost::program_options;

  if (error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { parse_config_stream(logger_ptr, is, opts_desc, actual_err_code); },
         err_code, "util::parse_config_stream()"))
  {
    return;
  }
  // else

  KMAP_LOG_SET_CONTEXT(logger_ptr, Kmap_log_component::S_UTIL);

  opts::variables_map vars;
  try
  {
    opts::store(opts::parse_config_file(is, opts_desc), vars);
    opts::notify(vars); // This is what actually writes into the targets registered in opts_desc.
  }
  catch (const opts::error& exc)
  {
    KMAP_LOG_WARNING("Configuration parsing failed: [" << exc.what() << "].  Options described as follows:\n"
                     << opts_desc);
    *err_code = boost::system::errc::make_error_code(boost::system::errc::invalid_argument);
    return;
  }

  KMAP_LOG_INFO("Configuration parsed: [" << vars.size() << "] option(s) set or defaulted.");
  err_code->clear();
} // parse_config_stream()

} // namespace kmap::util
