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
#include "kmap/common.hpp"

namespace kmap
{

// Static initializations.

const boost::unordered_multimap<Kmap_log_component, std::string> S_KMAP_LOG_COMPONENT_NAME_MAP
  ({
     { Kmap_log_component::S_UNCAT, "UNCAT" },
     { Kmap_log_component::S_UTIL, "UTIL" },
     { Kmap_log_component::S_LOG, "LOG" },
     { Kmap_log_component::S_ASYNC, "ASYNC" },
     { Kmap_log_component::S_MAP, "MAP" },
     { Kmap_log_component::S_PERSIST, "PERSIST" }
   });

} // namespace kmap
