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
#include "kmap/log/simple_ostream_logger.hpp"
#include "kmap/log/config.hpp"

namespace kmap::log
{

Simple_ostream_logger::Simple_ostream_logger(Config* config, std::ostream& os, std::ostream& os_for_err) :
  m_config(config),
  m_os_writer(*m_config, os),
  m_err_os_writer((&os == &os_for_err) ? 0 : new Ostream_log_msg_writer(*m_config, os_for_err))
{
  // Nothing.
}

bool Simple_ostream_logger::should_log(Sev sev, const Component& component) const // Virtual.
{
  return m_config->should_log(sev, component);
}

void Simple_ostream_logger::do_log(const Msg_metadata& metadata, util::String_view msg) // Virtual.
{
  auto& writer = ((metadata.m_msg_sev <= Sev::S_WARNING) && m_err_os_writer) ? *m_err_os_writer : m_os_writer;

  util::Lock_guard_non_recursive lock(m_mutex);
  writer.log(metadata, msg);
}

} // namespace kmap::log
