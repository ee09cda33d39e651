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

#include "bidi/util/util_fwd.hpp"
#include "bidi/common.hpp"

/**
 * Error reporting shared by all bidi modules, built on boost.system error codes.
 *
 * A bidi operation that can fail takes `Error_code* err_code = 0` as its last argument.  With a non-null
 * `err_code`, failure sets `*err_code` (and logs a warning) and success clears it.  With a null `err_code`,
 * failure throws a Runtime_error holding the code.  An operation implements only the first form; the macro
 * BIDI_ERROR_EXEC_AND_THROW_ON_ERROR() at its top supplies the second.
 */
namespace bidi::error
{
// Types.

class Runtime_error;

// Free functions.

/**
 * Does the work of BIDI_ERROR_EXEC_AND_THROW_ON_ERROR() that needs no preprocessor.
 *
 * With a non-null `err_code` it only returns `false`.  With a null one it calls `func` on a local #Error_code,
 * saves the result to `*ret`, throws Runtime_error if the code came back set, and returns `true` otherwise.
 *
 * @tparam Func
 *         Callable as `Ret (Error_code*)`.
 * @tparam Ret
 *         Result type of the operation.
 * @param func
 *        The operation, re-invoked with a non-null error code.
 * @param ret
 *        Receives the result of `func` when it runs.
 * @param err_code
 *        The `err_code` the operation itself received.
 * @param context
 *        Where the operation lives; becomes part of Runtime_error::what().
 * @return Whether `func` ran.
 */
template<typename Func, typename Ret>
bool exec_and_throw_on_error(const Func& func, Ret* ret,
                             Error_code* err_code, util::String_view context);

/**
 * exec_and_throw_on_error() for operations returning nothing.
 *
 * @tparam Func
 *         Callable as `void (Error_code*)`.
 * @param func
 *        See exec_and_throw_on_error().
 * @param err_code
 *        See exec_and_throw_on_error().
 * @param context
 *        See exec_and_throw_on_error().
 * @return Whether `func` ran.
 */
template<typename Func>
bool exec_void_and_throw_on_error(const Func& func, Error_code* err_code, util::String_view context);

/**
 * Throws `Runtime_error(err_code, context)` if `err_code` is set; does nothing otherwise.
 *
 * @param err_code
 *        Result of an operation.
 * @param context
 *        See Runtime_error.
 */
void throw_if_failed(const Error_code& err_code, util::String_view context);

} // namespace bidi::error
