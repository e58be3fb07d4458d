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

/* #include this instead of fmt's own headers.  With some `gcc`s heavy auto-inlining triggers false
 * -Wstringop-overflow warnings inside fmt; we silence them here once.
 *
 * @todo Drop the suppression once the fmt versions we build against no longer trigger it. */

#if defined(__GNUC__) && !defined(__clang__)
#  define KMAP_GCC_COMPILER
#endif

#ifdef KMAP_GCC_COMPILER
#  pragma GCC diagnostic push
#  pragma GCC diagnostic ignored "-Wstringop-overflow"
#endif

#include <fmt/format.h>
#include <fmt/chrono.h>

#ifdef KMAP_GCC_COMPILER
#  pragma GCC diagnostic pop
#  undef KMAP_GCC_COMPILER
#endif
