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

namespace kmap::test
{

/**
 * Test configuration.
 */
class Test_config
{
public:
  /**
   * Returns the singleton to the configuration.
   *
   * @return See above.
   */
  static Test_config& get_singleton()
  {
    static Test_config s_config;
    return s_config;
  }

  /// Minimum log severity.  Tests doing many thousands of operations log at TRACE, so the default stays below that.
  log::Sev m_sev = log::Sev::S_INFO;

private:
  /// Constructor.
  Test_config() {}
}; // class Test_config

} // namespace kmap::test
