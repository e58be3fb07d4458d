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
#include "kmap/log/ostream_log_msg_writer.hpp"
#include "kmap/log/config.hpp"
#include "kmap/util/fmt.hpp"

namespace kmap::log
{

Ostream_log_msg_writer::Ostream_log_msg_writer(const Config& config, std::ostream& os) :
  m_config(config),
  m_os(os),
  m_os_state_saver(m_os)
{
  // Nothing.
}

void Ostream_log_msg_writer::log(const Msg_metadata& metadata, util::String_view msg)
{
  using std::chrono::duration_cast;
  using std::chrono::microseconds;
  using std::chrono::system_clock;

  const auto usec_since_epoch = duration_cast<microseconds>(metadata.m_called_when.time_since_epoch()).count();
  const auto usec = usec_since_epoch % 1000000;
  if (m_config.m_use_human_friendly_time_stamps)
  {
    const auto local_tm = fmt::localtime(system_clock::to_time_t(metadata.m_called_when));
    m_os << fmt::format("{0:%Y-%m-%d %H:%M:%S}.{1:06} {0:%z} ", local_tm, usec);
  }
  else
  {
    m_os << fmt::format("{}.{:06} ", usec_since_epoch / 1000000, usec);
  }

  m_os << '[' << metadata.m_msg_sev << "] T";
  if (metadata.m_call_thread_nickname.empty())
  {
    m_os << metadata.m_call_thread_id;
  }
  else
  {
    m_os << metadata.m_call_thread_nickname;
  }
  m_os << ": ";

  if (m_config.write_component_name(&m_os, metadata.m_msg_component))
  {
    m_os << ": ";
  }

  m_os << KMAP_UTIL_WHERE_AM_I_FROM_ARGS(metadata.m_msg_src_file, metadata.m_msg_src_function, metadata.m_msg_src_line)
       << ": " << msg << std::endl;
}

} // namespace kmap::log
