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

#include "bidi/common.hpp"
#include <boost/thread.hpp>
#include <boost/preprocessor/stringize.hpp>
#include <iostream>
#include <string_view>

/**
 * General-purpose helpers shared by the other bidi modules: string building on top of `ostream <<`, text-to-`enum`
 * parsing for config and command line input, thread type aliases, source location strings and a few macro tools.
 */
namespace bidi::util
{
// Types.

class Null_interface;
class String_ostream;

/// Non-owning view of `char` text.
using String_view = std::string_view;

/// Identifier of a thread, as printed in log lines.
using Thread_id = boost::thread::id;

/// The mutex type used throughout bidi; it may not be locked twice by the same thread.
using Mutex_non_recursive = boost::mutex;

/**
 * Scoped lock of a `Mutex`; it also supports early unlock() and deferred locking.
 *
 * @tparam Mutex
 *         Usually #Mutex_non_recursive.
 */
template<typename Mutex>
using Lock_guard = boost::unique_lock<Mutex>;

// Free functions.

/**
 * Whether `container.find(key)` finds anything.
 *
 * @tparam Container
 *         Anything with `key_type`, `find()` and `end()`: `std::map`, `boost::unordered_set`, a bidi::dict
 *         container...
 * @param container
 *        Where to look.
 * @param key
 *        What to look for.
 * @return See above.
 */
template<typename Container>
bool key_exists(const Container& container, const typename Container::key_type& key);

/**
 * Appends to `*target_str` the text that `os << arg1 << arg2 << ...` would produce.
 *
 * @tparam T
 *         Types each having an `ostream` output operator.
 * @param target_str
 *        String to append to; not null.  Existing content is kept.
 * @param ostream_args
 *        At least one value to print.
 */
template<typename ...T>
void ostream_op_to_string(std::string* target_str, T const &... ostream_args);

/**
 * Returns the text that `os << arg1 << arg2 << ...` would produce.  Handy where a statement cannot go, such as a
 * member initializer.
 *
 * @tparam T
 *         See ostream_op_to_string().
 * @param ostream_args
 *        See ostream_op_to_string().
 * @return New string.
 */
template<typename ...T>
std::string ostream_op_string(T const &... ostream_args);

/**
 * Reads an `enum class` value from `*is_ptr`.  The token read is the longest run of letters, digits and
 * underscores at the current position; it is left out of the stream, while the character after it is not.  The
 * token matches a value if it is:
 *   - the decimal number of that value, when `accept_num_encoding` is set; or
 *   - the text `os << value` produces, compared exactly or ignoring case per `case_sensitive`.
 *
 * Values below `enum_lowest` and at or above `enum_sentinel` never match.  A token matching nothing, including an
 * empty one, yields `enum_default`; nothing is thrown.  The stream may have `eof()` set afterwards.
 *
 * An `operator>>` written on top of this, paired with the `enum`'s `operator<<`, lets boost.program_options and
 * `boost::lexical_cast` handle the type.
 *
 * @tparam Enum
 *         `enum class` with consecutive values from `enum_lowest` up to `enum_sentinel`, each printing as a distinct
 *         identifier-like word.
 * @param is_ptr
 *        Input stream; not null.
 * @param enum_default
 *        Result when the token matches nothing; often `enum_sentinel`.
 * @param enum_sentinel
 *        One past the last valid value.
 * @param accept_num_encoding
 *        Whether a decimal token is tried.
 * @param case_sensitive
 *        Whether names must match case exactly.
 * @param enum_lowest
 *        First valid value.
 * @return See above.
 */
template<typename Enum>
Enum istream_to_enum(std::istream* is_ptr, Enum enum_default, Enum enum_sentinel,
                     bool accept_num_encoding = true, bool case_sensitive = false,
                     Enum enum_lowest = Enum(0));

/**
 * Builds `"<file>:<function>(<line>)"`, the same text BIDI_UTIL_WHERE_AM_I_FROM_ARGS() streams.
 *
 * @param file
 *        File name; printed as given.
 * @param function
 *        Function name.
 * @param line
 *        Line number.
 * @return See above.
 */
std::string get_where_am_i_str(String_view file, String_view function, unsigned int line);

/**
 * The part of `full_path` after its last `/` or `\`; all of `full_path` if it has neither.  Usable at compile time,
 * which the log macros rely on to strip `__FILE__`.
 *
 * @param full_path
 *        Path.
 * @return View into `full_path`.
 */
constexpr String_view get_last_path_segment(String_view full_path)
{
  const auto sep_pos = full_path.find_last_of("/\\");
  if (sep_pos == String_view::npos)
  {
    return full_path;
  }
  // else
  return full_path.substr(sep_pos + 1);
}

// Macros.

/**
 * Streams `<file>:<function>(<line>)` given the three parts; e.g.,
 * `os << BIDI_UTIL_WHERE_AM_I_FROM_ARGS(f, fn, 10) << ": ..."`.
 *
 * @param ARG_file
 *        File name.
 * @param ARG_function
 *        Function name.
 * @param ARG_line
 *        Line number.
 */
#define BIDI_UTIL_WHERE_AM_I_FROM_ARGS(ARG_file, ARG_function, ARG_line) \
  ARG_file << ':' << ARG_function << '(' << ARG_line << ')'

/// `std::string` `<file>:<function>(<line>)` of the place the macro is used, with the directories of the file dropped.
#define BIDI_UTIL_WHERE_AM_I_STR() \
  ::bidi::util::get_where_am_i_str(::bidi::util::get_last_path_segment \
                                     (::bidi::util::String_view(__FILE__, sizeof(__FILE__) - 1)), \
                                   ::bidi::util::String_view(__FUNCTION__, sizeof(__FUNCTION__) - 1), \
                                   __LINE__)

/**
 * String literal `<file>:<function>(<line>)` of the place the macro is used.  The file keeps its full path, and the
 * function is the token given, since neither can be computed inside a literal otherwise.
 *
 * @param ARG_function
 *        Function name, as a bare token.
 */
#define BIDI_UTIL_WHERE_AM_I_LITERAL(ARG_function) \
  __FILE__ ":" #ARG_function "(" BOOST_PP_STRINGIZE(__LINE__) ")"

/**
 * Wraps a multi-statement macro body so that `MACRO(...);` is exactly one statement, safe in an un-braced
 * `if`/`else`.  `break;` inside the body leaves it.
 *
 * @param ARG_func_macro_definition
 *        Macro body.
 */
#define BIDI_UTIL_SEMICOLON_SAFE(ARG_func_macro_definition) \
  do \
  { \
    ARG_func_macro_definition \
  } \
  while (false)

} // namespace bidi::util
