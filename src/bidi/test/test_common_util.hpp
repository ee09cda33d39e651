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


#pragma once

#include "bidi/error/error.hpp"
#include "bidi/util/util.hpp"
#include <gtest/gtest.h>
#include <string>

namespace bidi::test
{

/**
 * Runs `func()`, expecting it to throw bidi::error::Runtime_error with the given code.
 *
 * @tparam Func
 *         Nullary callable.
 * @param func
 *        The function to execute.
 * @param expected_code
 *        The code the exception must carry.
 * @param ctx
 *        Caller context for failure messages.
 */
template<typename Func>
void expect_throw_code(const Func& func, const Error_code& expected_code, const std::string& ctx)
{
  try
  {
    func();
    ADD_FAILURE() << "Expected exception with code [" << expected_code << "] but none was thrown.  " << ctx;
  }
  catch (const error::Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), expected_code) << ctx;
  }
}

} // namespace bidi::test

// Context string naming the calling test line, for assertion messages.
#define CTX ::bidi::util::ostream_op_string("Caller context [", BIDI_UTIL_WHERE_AM_I_STR(), "].")
