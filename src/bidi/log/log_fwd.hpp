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
#include <cstddef>
#include <iosfwd>

/**
 * bidi module providing logging functionality.  While originally intended to be used from within the bidi::dict
 * module's implementation, it can be used by bidi user modules as well.
 *
 * The design, in brief:
 *   - A Logger (abstract) is the object to which log messages are sent, each message with a Sev (severity) and a
 *     Component (a type-erased `enum class` value, e.g., bidi::Bidi_log_component::S_DICT).  Logger::should_log()
 *     is the filter; Logger::do_log() does the output.  Simple_ostream_logger writes to console-like `ostream`s;
 *     Buffer_logger writes to an in-memory string.
 *   - Both of those delegate filtering to a Config (per-component verbosity, component names) and output to an
 *     Ostream_log_msg_writer (which formats each line, including a time stamp).
 *   - Log call sites use the `BIDI_LOG_...()` macros (BIDI_LOG_WARNING(), BIDI_LOG_TRACE(), etc.), which obtain the
 *     Logger and Component by calling `get_logger()` and `get_log_component()` in the current scope.  These are
 *     provided either by deriving from Log_context or, in free functions, by BIDI_LOG_SET_CONTEXT().
 *   - A null Logger is allowed everywhere and means no logging.  This is the common case for a library user
 *     that does not care.
 */
namespace bidi::log
{

// Types.

class Buffer_logger;
class Component;
class Config;
class Logger;
class Log_context;
struct Msg_metadata;
class Ostream_log_msg_writer;
class Simple_ostream_logger;

/**
 * Message severity.  Lower numeric value means more severe and (normally) rarer; a Config verbosity of `S` lets
 * through messages of severity `S` and every more severe one.  The values are 0, 1, 2, ... in the order below, so
 * a Sev may index an array.
 *
 * What the bidi library itself logs:
 *   - WARNING: every error emitted by an API (e.g., a value collision rejected under the strict policy).
 *   - INFO: rare, notable events (e.g., a mutation attempted on an immutable container).
 *   - DEBUG: an association evicted by the overwrite collision policy.
 *   - TRACE: every successful mutation (without key/value contents, which need not be printable).
 *
 * So at INFO verbosity the library is quiet unless something goes wrong.
 */
enum class Sev : size_t
{
  /// Not a message severity; as a verbosity, it filters out everything.
  S_NONE = 0,
  /// The program cannot continue.
  S_FATAL,
  /// Something failed, with consequences beyond the operation at hand.
  S_ERROR,
  /// Something failed, or looks wrong, but the program carries on normally.
  S_WARNING,
  /// Noteworthy and infrequent.
  S_INFO,
  /// Like S_INFO, but of interest mostly when investigating.
  S_DEBUG,
  /// Potentially very frequent; enabling it may slow things down.
  S_TRACE,
  /// Like S_TRACE, plus contents dumps.
  S_DATA,
  /// Not a severity: one past the last one.
  S_END_SENTINEL
}; // enum class Sev

// Free functions.

/**
 * Prints a Sev as its name without the `S_` prefix, e.g., `WARNING`.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Sev val);

/**
 * Reads a Sev written by `operator<<()` (in any letter case) or as its number.  An unknown token yields
 * Sev::S_NONE.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Sev& val);

/**
 * Same as `val1.swap(val2)`; found by ADL.
 *
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 */
void swap(Log_context& val1, Log_context& val2);

} // namespace bidi::log
