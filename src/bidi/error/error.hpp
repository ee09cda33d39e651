/* bidi
 * Copyright 2026 The bidi Authors
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

#include "bidi/error/error_fwd.hpp"
#include "bidi/log/log.hpp"
#include <boost/system/system_error.hpp>
#include <stdexcept>

namespace bidi::error
{
// Types.

/**
 * Exception thrown by bidi operations called with a null `Error_code*`.  It is a `boost::system::system_error`, so
 * code() gives the failure (for example dict::error::Code::S_KEY_NOT_FOUND), and what() adds the context given at
 * construction, normally the failing operation's source location.
 *
 * A falsy code is allowed; then what() is the context alone, for failures that no code describes.
 */
class Runtime_error :
  public boost::system::system_error
{
public:
  // Constructors/destructor.

  /**
   * Creates the exception.
   *
   * @param err_code_or_success
   *        The failure; or falsy if `context` says it all.
   * @param context
   *        Where or how the failure happened.
   */
  explicit Runtime_error(const Error_code& err_code_or_success, util::String_view context = "");

  /**
   * Same as `Runtime_error(Error_code(), context)`.
   *
   * @param context
   *        Description of the failure.
   */
  explicit Runtime_error(util::String_view context);

  // Methods.

  /**
   * With a truthy code: the context, followed by the code's category, value and message (as formatted by
   * `system_error`).  Without: the context alone.
   *
   * @return See above.
   */
  const char* what() const noexcept override;

private:
  // Data.

  /// The context when code() is falsy (the base would append "Success" to it); empty otherwise.
  const std::string m_bare_context;
}; // class Runtime_error

// Template bodies.

template<typename Func, typename Ret>
bool exec_and_throw_on_error(const Func& func, Ret* ret,
                             Error_code* err_code, util::String_view context)
{
  if (err_code)
  {
    return false; // Caller handles everything itself.
  }
  // else

  Error_code local_err_code;
  *ret = func(&local_err_code);
  throw_if_failed(local_err_code, context);
  return true;
}

template<typename Func>
bool exec_void_and_throw_on_error(const Func& func, Error_code* err_code, util::String_view context)
{
  if (err_code)
  {
    return false;
  }
  // else

  Error_code local_err_code;
  func(&local_err_code);
  throw_if_failed(local_err_code, context);
  return true;
}

} // namespace bidi::error

// Macros.

/**
 * Stores `ARG_val` into `*err_code` after logging it with BIDI_LOG_WARNING().  Needs, at the point of use, a
 * non-null `Error_code* err_code` and the usual logging context (`get_logger()`, `get_log_component()`).
 *
 * @param ARG_val
 *        An error code, or an `enum` value registered with boost.system such as a dict::error::Code.
 */
#define BIDI_ERROR_EMIT_ERROR(ARG_val) \
  BIDI_UTIL_SEMICOLON_SAFE \
  ( \
    const ::bidi::Error_code BIDI_ERROR_EMIT_code(ARG_val); \
    BIDI_LOG_WARNING("Failing with [" << BIDI_ERROR_EMIT_code << "] " \
                     "[" << BIDI_ERROR_EMIT_code.message() << "]."); \
    *err_code = BIDI_ERROR_EMIT_code; \
  )

/**
 * Placed first in a method taking `Error_code* err_code`: if `err_code` is null, it calls the method again with a
 * local code in place of `_1`, throws Runtime_error if that fails, and returns its result otherwise.  If `err_code`
 * is non-null it does nothing, and the rest of the method may rely on `err_code` being non-null.
 *
 *   ~~~
 *   Value Basic_bidict::at(const Key& key, Error_code* err_code) const
 *   {
 *     BIDI_ERROR_EXEC_AND_THROW_ON_ERROR(Value, at, key, _1);
 *     // else
 *     ...
 *   }
 *   ~~~
 *
 * @param ARG_ret_type
 *        The method's return type; default-constructible; wrap commas in an alias.
 * @param ARG_function_name
 *        The method's name.
 * @param ...
 *        The method's arguments, with `_1` for `err_code`.
 */
#define BIDI_ERROR_EXEC_AND_THROW_ON_ERROR(ARG_ret_type, ARG_function_name, ...) \
  BIDI_UTIL_SEMICOLON_SAFE \
  ( \
    ARG_ret_type BIDI_ERROR_EXEC_result; \
    if (::bidi::error::exec_and_throw_on_error \
          ([&](::bidi::Error_code* _1) -> ARG_ret_type \
             { return ARG_function_name(__VA_ARGS__); }, \
           &BIDI_ERROR_EXEC_result, err_code, BIDI_UTIL_WHERE_AM_I_LITERAL(ARG_function_name))) \
    { \
      return BIDI_ERROR_EXEC_result; \
    } \
  )

/**
 * BIDI_ERROR_EXEC_AND_THROW_ON_ERROR() for methods returning `void`.
 *
 * @param ARG_function_name
 *        See BIDI_ERROR_EXEC_AND_THROW_ON_ERROR().
 * @param ...
 *        See BIDI_ERROR_EXEC_AND_THROW_ON_ERROR().
 */
#define BIDI_ERROR_EXEC_VOID_AND_THROW_ON_ERROR(ARG_function_name, ...) \
  BIDI_UTIL_SEMICOLON_SAFE \
  ( \
    if (::bidi::error::exec_void_and_throw_on_error \
          ([&](::bidi::Error_code* _1) { ARG_function_name(__VA_ARGS__); }, \
           err_code, BIDI_UTIL_WHERE_AM_I_LITERAL(ARG_function_name))) \
    { \
      return; \
    } \
  )
