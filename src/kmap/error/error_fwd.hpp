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

#include "kmap/common.hpp"
#include "kmap/util/util_fwd.hpp"

/**
 * kmap module that facilitates working with error codes and exceptions; essentially comprised of niceties on top
 * of boost.system's error facility.
 *
 * Every kmap operation that can fail takes a trailing `Error_code* err_code = 0` argument.  If non-null, `*err_code`
 * is set to success or to the failure reason, and nothing is thrown.  If null, a failure is reported by throwing
 * Runtime_error wrapping the same `Error_code`.  The helpers below implement the latter in terms of the former.
 */
namespace kmap::error
{

// Types.

class Runtime_error;

// Free functions.

/**
 * Helper for implementing the null-`err_code` throwing semantic of a non-`void` operation.  If `err_code` is
 * non-null, does nothing and returns `false`: the caller proceeds to do its work, reporting errors via `*err_code`.
 * Otherwise executes `func(&e)`, saving its return value into `*ret`; throws Runtime_error if `e` is truthy;
 * and returns `true`.  KMAP_ERROR_EXEC_AND_THROW_ON_ERROR() wraps this.
 *
 * @tparam Func
 *         Functor: `Ret F(Error_code*)`.
 * @tparam Ret
 *         Return type of the operation.
 * @param func
 *        The operation, typically the invoker itself with `err_code` replaced by the given pointer.
 * @param ret
 *        Target for the return value, if `func` executed and no exception was thrown.
 * @param err_code
 *        The invoker's `err_code`.
 * @param context
 *        String describing the invoker, included in the exception's `what()`.
 * @return `true` if and only if `func` executed and succeeded.
 */
template<typename Func, typename Ret>
bool exec_and_throw_on_error(const Func& func, Ret* ret,
                             Error_code* err_code, util::String_view context);

/**
 * Identical to exec_and_throw_on_error() but for operations returning `void`.
 *
 * @tparam Func
 *         Functor: `void F(Error_code*)`.
 * @param func
 *        See exec_and_throw_on_error().
 * @param err_code
 *        See exec_and_throw_on_error().
 * @param context
 *        See exec_and_throw_on_error().
 * @return See exec_and_throw_on_error().
 */
template<typename Func>
bool exec_void_and_throw_on_error(const Func& func, Error_code* err_code, util::String_view context);

} // namespace kmap::error
