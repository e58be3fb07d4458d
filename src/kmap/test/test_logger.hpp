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

#include "kmap/test/test_config.hpp"
#include "kmap/log/config.hpp"
#include "kmap/log/simple_ostream_logger.hpp"
#include "kmap/common.hpp"

namespace kmap::test
{

/**
 * Logger used for testing purposes: console output, kmap components registered with their names.
 */
class Test_logger :
  public log::Logger
{
public:
  /**
   * Constructor.
   *
   * @param min_severity Lowest severity that will pass through logging filter.
   */
  Test_logger(const log::Sev& min_severity = Test_config::get_singleton().m_sev) :
    m_config(min_severity),
    m_logger(&m_config)
  {
    m_config.register_components(S_KMAP_LOG_COMPONENT_NAME_MAP, "kmap-");
  }

  /**
   * Returns the logging configuration.
   *
   * @return See above.
   */
  log::Config& get_config()
  {
    return m_config;
  }

  /// Forwards to console Logger.
  bool should_log(log::Sev sev, const log::Component& component) const override
  {
    return m_logger.should_log(sev, component);
  }

  /// Forwards to console Logger.
  void do_log(const log::Msg_metadata& metadata, util::String_view msg) override
  {
    m_logger.do_log(metadata, msg);
  }

private:
  /// Logging configuration.
  log::Config m_config;

  /// The real logger.
  log::Simple_ostream_logger m_logger;
}; // class Test_logger

} // namespace kmap::test
