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

#include "kmap/error/error_fwd.hpp"
#include "kmap/log/log.hpp"
#include <boost/system/system_error.hpp>
#include <stdexcept>

namespace kmap::error
{

// Types.

/**
 * An `std::runtime_error` (by way of `boost::system::system_error`) which wraps an `Error_code` and an optional
 * context string.  This is what kmap throws when an operation fails and the caller passed a null `err_code`.
 * `code()` yields the `Error_code`; `what()` yields its message plus the context.
 */
class Runtime_error :
  public boost::system::system_error
{
public:
  // Constructors/destructor.

  /**
   * Constructs Runtime_error.
   *
   * @param err_code_or_success
   *        The error; or success, in which case `what()` is just `context`.
   * @param context
   *        String describing the origin, such as KMAP_UTIL_WHERE_AM_I_LITERAL() output.
   */
  explicit Runtime_error(const Error_code& err_code_or_success, util::String_view context = "");

  /**
   * Constructs Runtime_error with success code and the given context.
   *
   * @param context
   *        See other ctor.
   */
  explicit Runtime_error(util::String_view context);

  // Methods.

  /**
   * Returns a message describing the exception.
   *
   * @return See above.
   */
  const char* what() const noexcept override;

private:
  // Data.

  /// If `code()` is success, the context; otherwise empty (the context is then inside `system_error::what()`).
  const std::string m_context_if_no_code;
}; // class Runtime_error

// Template implementations.

template<typename Func, typename Ret>
bool exec_and_throw_on_error(const Func& func, Ret* ret,
                             Error_code* err_code, util::String_view context)
{
  if (err_code)
  {
    // Caller will itself perform the operation and report via *err_code.
    return false;
  }
  // else

  Error_code our_err_code;
  *ret = func(&our_err_code);
  if (our_err_code)
  {
    throw Runtime_error(our_err_code, context);
  }
  // else
  return true;
} // exec_and_throw_on_error()

template<typename Func>
bool exec_void_and_throw_on_error(const Func& func, Error_code* err_code, util::String_view context)
{
  if (err_code)
  {
    return false;
  }
  // else

  Error_code our_err_code;
  func(&our_err_code);
  if (our_err_code)
  {
    throw Runtime_error(our_err_code, context);
  }
  // else
  return true;
} // exec_void_and_throw_on_error()

} // namespace kmap::error

// Macros.

/**
 * Sets `*err_code` to `ARG_val` and logs a WARNING about it.  Requires `err_code` (type `Error_code*`, non-null)
 * and `KMAP_LOG_*()` context to be available at the call site.
 *
 * @param ARG_val
 *        Value convertible to `Error_code`.  Typically an error `enum` value like map::error::Code::S_SIZE_EXCEEDED.
 */
#define KMAP_ERROR_EMIT_ERROR(ARG_val) \
  KMAP_UTIL_SEMICOLON_SAFE \
  ( \
    ::kmap::Error_code KMAP_ERROR_EMIT_ERR_val(ARG_val); \
    KMAP_LOG_WARNING("Error code emitted: [" << KMAP_ERROR_EMIT_ERR_val << "] " \
                     "[" << KMAP_ERROR_EMIT_ERR_val.message() << "]."); \
    *err_code = KMAP_ERROR_EMIT_ERR_val; \
  )

/// Logs a WARNING about the `Error_code sys_err_code` in scope, typically from a failed system call.
#define KMAP_ERROR_SYS_ERROR_LOG_WARNING() \
  KMAP_LOG_WARNING("System error occurred: [" << sys_err_code << "] [" << sys_err_code.message() << "].")

/**
 * Implements the null-`err_code` throwing semantic in the body of a non-`void` operation with an
 * `Error_code* err_code` argument.  Place it first in the body.  If `err_code` is null, re-invokes
 * `ARG_function_name(...)` with the given args, in which `_1` stands for a local `Error_code*`; returns the result
 * or throws error::Runtime_error.  Otherwise does nothing, and the body proceeds with non-null `err_code`.
 *
 * @param ARG_ret_type
 *        Return type of the invoking function.  Must be default-constructible.
 * @param ARG_function_name
 *        Name of the invoking function.
 */
#define KMAP_ERROR_EXEC_AND_THROW_ON_ERROR(ARG_ret_type, ARG_function_name, ...) \
  KMAP_UTIL_SEMICOLON_SAFE \
  ( \
    ARG_ret_type result; \
    if (::kmap::error::exec_and_throw_on_error \
          ([&](::kmap::Error_code* _1) -> ARG_ret_type \
             { return ARG_function_name(__VA_ARGS__); }, \
           &result, err_code, KMAP_UTIL_WHERE_AM_I_LITERAL(ARG_function_name))) \
    { \
      return result; \
    } \
    /* else: err_code is non-null; the invoker proceeds. */ \
  )
