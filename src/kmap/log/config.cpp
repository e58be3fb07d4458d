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
#include "kmap/log/config.hpp"
#include <boost/algorithm/string.hpp>
#include <locale>
#include <ostream>

namespace kmap::log
{

// Static initializations.

const Sev Config::S_DEFAULT_VERBOSITY = Sev::S_INFO;

// Implementations.

Config::Config(Sev default_verbosity) :
  m_use_human_friendly_time_stamps(true),
  m_default_verbosity(int(default_verbosity))
{
  // Nothing.
}

size_t Config::register_payload_type(std::type_index payload_type, size_t n_values)
{
  assert(!util::key_exists(m_first_idx_by_payload_type, payload_type));

  const size_t first_idx = m_component_verbosities.size();
  m_first_idx_by_payload_type.emplace(payload_type, first_idx);
  for (size_t count = 0; count != n_values; ++count)
  {
    m_component_verbosities.emplace_back(S_UNSET);
  }
  return first_idx;
}

void Config::register_name(size_t idx, util::String_view name, util::String_view name_sans_prefix)
{
  using std::string;

  assert(idx < m_component_verbosities.size());
  assert(!name_sans_prefix.empty());

  const auto inserted = m_idxs_by_name.emplace(normalized_name(name), idx).second;
  assert(inserted && "Component name registered twice.");
  (void)inserted;

  // Further names of the same component are appended without the prefix: "KMAP-MAP,ORDERED-MAP".
  string& output_name = m_output_names[idx];
  output_name += output_name.empty() ? normalized_name(name) : (',' + normalized_name(name_sans_prefix));
}

void Config::set_default_verbosity(Sev default_verbosity)
{
  m_default_verbosity.store(int(default_verbosity), std::memory_order_relaxed);
}

void Config::clear_component_verbosities()
{
  for (auto& verbosity : m_component_verbosities)
  {
    verbosity.store(S_UNSET, std::memory_order_relaxed);
  }
}

bool Config::set_component_verbosity_by_name(util::String_view name, Sev verbosity)
{
  const auto idx_it = m_idxs_by_name.find(normalized_name(name));
  if (idx_it == m_idxs_by_name.end())
  {
    return false;
  }
  // else
  m_component_verbosities[idx_it->second].store(int(verbosity), std::memory_order_relaxed);
  return true;
}

bool Config::should_log(Sev sev, const Component& component) const
{
  using std::memory_order_relaxed;

  const Sev thread_override = *(this_thread_verbosity_override());
  if (thread_override != Sev::S_END_SENTINEL)
  {
    return sev <= thread_override;
  }
  // else

  if (!component.empty())
  {
    const auto idx = component_idx(component);
    if (idx >= 0)
    {
      const int verbosity = m_component_verbosities[idx].load(memory_order_relaxed);
      if (verbosity != S_UNSET)
      {
        return sev <= Sev(verbosity);
      }
    }
  }

  return sev <= Sev(m_default_verbosity.load(memory_order_relaxed));
} // Config::should_log()

bool Config::write_component_name(std::ostream* os, const Component& component) const
{
  if (component.empty())
  {
    return false;
  }
  // else
  const auto idx = component_idx(component);
  if (idx < 0)
  {
    return false;
  }
  // else

  const auto name_it = m_output_names.find(size_t(idx));
  if (name_it == m_output_names.end())
  {
    *os << idx;
  }
  else
  {
    *os << name_it->second;
  }
  return true;
}

long Config::component_idx(const Component& component) const
{
  const auto first_idx_it = m_first_idx_by_payload_type.find(component.payload_type_index());
  if (first_idx_it == m_first_idx_by_payload_type.end())
  {
    return -1;
  }
  // else
  const size_t idx = first_idx_it->second + component.payload_enum_raw_value();
  return (idx < m_component_verbosities.size()) ? long(idx) : -1;
}

std::string Config::normalized_name(util::String_view name) // Static.
{
  return boost::algorithm::to_upper_copy(std::string(name), std::locale::classic());
}

Sev* Config::this_thread_verbosity_override() // Static.
{
  thread_local Sev s_verbosity_override = Sev::S_END_SENTINEL;
  return &s_verbosity_override;
}

util::Scoped_setter<Sev> Config::this_thread_verbosity_override_auto(Sev verbosity_or_none) // Static.
{
  return util::Scoped_setter<Sev>(this_thread_verbosity_override(), std::move(verbosity_or_none));
}

} // namespace kmap::log
