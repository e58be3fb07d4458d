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

#include "kmap/log/log.hpp"
#include <boost/unordered_map.hpp>
#include <atomic>
#include <deque>
#include <string>

namespace kmap::log
{

// Types.

/**
 * Verbosity filter and component naming shared by the Logger implementations in this module.  Each Logger holds a
 * `Config*`: its should_log() is should_log() here, and its output names components via write_component_name().
 *
 * A message passes if its Sev is at or above (at least as severe as) the verbosity that applies: the calling thread's
 * override, if set (see this_thread_verbosity_override()); else its component's own verbosity, if set; else the
 * default verbosity.  A component has its own verbosity only if its `enum` type was registered through
 * register_components().
 *
 * ### Thread safety ###
 * register_components() must precede use by any Logger.  Afterwards, all other methods may be called concurrently.
 */
class Config :
  private boost::noncopyable
{
public:
  // Constants.

  /// Default verbosity, absent any configuration.
  static const Sev S_DEFAULT_VERBOSITY;

  // Constructors/destructor.

  /**
   * Constructs a Config with no registered components.
   *
   * @param default_verbosity
   *        See set_default_verbosity().
   */
  explicit Config(Sev default_verbosity = S_DEFAULT_VERBOSITY);

  // Methods.

  /**
   * Registers the `enum` type `Payload` as a source of components, naming its values.  `Payload` must end with
   * `S_END_SENTINEL`, and must not have been registered before.
   *
   * @tparam Payload
   *         See Component.
   * @param names
   *        Names of (some of) the values.  A value with several names accepts each of them in
   *        set_component_verbosity_by_name(); write_component_name() joins them with commas.
   * @param name_prefix
   *        Prepended to each name (for example "kmap-"), to tell apart like-named values of different `enum`s.
   *        Names are matched ignoring letter case and written in upper case.
   */
  template<typename Payload>
  void register_components(const boost::unordered_multimap<Payload, std::string>& names,
                           util::String_view name_prefix = util::String_view());

  /**
   * Sets the verbosity for messages whose component has no verbosity of its own.
   *
   * @param default_verbosity
   *        Most verbose Sev to log; Sev::S_NONE to log nothing.
   */
  void set_default_verbosity(Sev default_verbosity);

  /// Forgets the verbosities set by `set_component_verbosity*()`.
  void clear_component_verbosities();

  /**
   * Sets the verbosity of one component.
   *
   * @tparam Payload
   *         A registered `enum`.
   * @param component_payload
   *        The component.
   * @param verbosity
   *        See set_default_verbosity().
   * @return `false` if `Payload` is not registered; `true` otherwise.
   */
  template<typename Payload>
  bool set_component_verbosity(Payload component_payload, Sev verbosity);

  /**
   * Sets the verbosity of the component registered under the given name, including any prefix.
   *
   * @param name
   *        The name; letter case is ignored.
   * @param verbosity
   *        See set_default_verbosity().
   * @return `false` if the name is not registered; `true` otherwise.
   */
  bool set_component_verbosity_by_name(util::String_view name, Sev verbosity);

  /**
   * Returns `true` if a message with the given attributes passes the filter.
   *
   * @param sev
   *        Message severity.
   * @param component
   *        Message component; may be empty.
   * @return See above.
   */
  bool should_log(Sev sev, const Component& component) const;

  /**
   * Writes the component's name, or its index if unnamed.
   *
   * @param os
   *        Target.
   * @param component
   *        The component.
   * @return `false`, with nothing written, if `component` is empty or its `enum` is not registered.
   */
  bool write_component_name(std::ostream* os, const Component& component) const;

  /**
   * Returns the calling thread's verbosity override, which when not Sev::S_END_SENTINEL (the initial value)
   * supersedes all other verbosity settings for messages logged from this thread.
   *
   * @return Pointer to the thread-local value; never null.
   */
  static Sev* this_thread_verbosity_override();

  /**
   * Sets this_thread_verbosity_override() until the returned object is destroyed.
   *
   * @param verbosity_or_none
   *        The override; or Sev::S_END_SENTINEL for none.
   * @return Object restoring the previous override on destruction.
   */
  static util::Scoped_setter<Sev> this_thread_verbosity_override_auto(Sev verbosity_or_none);

  // Data.  (Public!)

  /// If `true`, Ostream_log_msg_writer writes local date-time stamps; otherwise seconds since the Epoch.
  bool m_use_human_friendly_time_stamps;

private:
  // Types.

  /// A verbosity, or #S_UNSET, readable and writable concurrently.
  using Verbosity_cell = std::atomic<int>;

  // Constants.

  /// Stored in a #Verbosity_cell: no verbosity set.
  static constexpr int S_UNSET = -1;

  // Methods.

  /**
   * Returns the component's index into #m_component_verbosities, or -1 if its `enum` is not registered.
   *
   * @param component
   *        Non-empty component.
   * @return See above.
   */
  long component_idx(const Component& component) const;

  /**
   * Registers one `enum` of `n_values` values: see register_components().
   *
   * @param payload_type
   *        The `enum` type.
   * @param n_values
   *        Its `S_END_SENTINEL`.
   * @return Index of the `enum`'s value 0.
   */
  size_t register_payload_type(std::type_index payload_type, size_t n_values);

  /**
   * Registers a name for the component at the given index.
   *
   * @param idx
   *        See component_idx().
   * @param name
   *        Name, including prefix, not yet normalized.
   * @param name_sans_prefix
   *        Same, without the prefix.
   */
  void register_name(size_t idx, util::String_view name, util::String_view name_sans_prefix);

  /**
   * Returns the upper-case form of the given name.
   *
   * @param name
   *        Name.
   * @return See above.
   */
  static std::string normalized_name(util::String_view name);

  // Data.

  /// Default verbosity.
  Verbosity_cell m_default_verbosity;

  /// For each registered `enum` type: the index of its value 0.
  boost::unordered_map<std::type_index, size_t> m_first_idx_by_payload_type;

  /// Per-component verbosities, for all registered `enum`s back to back.  A `deque`, as atomics cannot be moved.
  std::deque<Verbosity_cell> m_component_verbosities;

  /// Component index to output name.
  boost::unordered_map<size_t, std::string> m_output_names;

  /// Normalized name to component index.
  boost::unordered_map<std::string, size_t> m_idxs_by_name;
}; // class Config

// Template implementations.

template<typename Payload>
void Config::register_components(const boost::unordered_multimap<Payload, std::string>& names,
                                 util::String_view name_prefix)
{
  const size_t first_idx = register_payload_type(std::type_index(typeid(Payload)),
                                                 size_t(Payload::S_END_SENTINEL));
  for (const auto& val_and_name : names)
  {
    const std::string name = std::string(name_prefix) + val_and_name.second;
    register_name(first_idx + static_cast<size_t>(val_and_name.first), name, val_and_name.second);
  }
}

template<typename Payload>
bool Config::set_component_verbosity(Payload component_payload, Sev verbosity)
{
  const auto idx = component_idx(Component(component_payload));
  if (idx < 0)
  {
    return false;
  }
  // else
  m_component_verbosities[idx].store(int(verbosity), std::memory_order_relaxed);
  return true;
}

} // namespace kmap::log
