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

#include "bidi/log/log.hpp"
#include <boost/noncopyable.hpp>
#include <ostream>
#include <string>
#include <vector>

namespace bidi::log
{

// Types.

/**
 * Formats log messages into lines and writes them to an `ostream`.  Both bidi loggers delegate their output to it.
 * A line looks like:
 *
 *   `<time stamp> [<sev>]: T<thread id>: <component>: <file>:<function>(<line>): <msg>`
 *
 * The `<component>: ` part appears only if Config::output_component_to_ostream() prints something.  The time stamp
 * is local date and time with microseconds and UTC offset, or (see Config::m_use_human_friendly_time_stamps)
 * `<seconds>.<microseconds>` since the Unix epoch.
 *
 * Not thread-safe: the owning Logger serializes calls to log().
 */
class Ostream_log_msg_writer :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Binds the writer to its settings and stream; nothing is written yet.
   *
   * @param config
   *        Settings; must outlive `*this`.
   * @param os
   *        Destination; must outlive `*this`.
   */
  explicit Ostream_log_msg_writer(const Config& config, std::ostream& os);

  // Methods.

  /**
   * Writes one complete line: prefix built from `metadata`, then `msg`, then a newline; then flushes.
   *
   * @param metadata
   *        Time stamp, severity, thread, component and call site.
   * @param msg
   *        Message text.
   */
  void log(const Msg_metadata& metadata, util::String_view msg);

private:
  // Methods.

  /**
   * Formats the time stamp and the space after it into #m_line.
   *
   * @param metadata
   *        See log().
   */
  void append_time_stamp(const Msg_metadata& metadata);

  // Constants.

  /// Four-letter tag of each Sev, indexed by its numeric value.
  static const std::vector<util::String_view> S_SEV_TAGS;

  // Data.

  /// See constructor.
  const Config& m_config;

  /// See constructor.
  std::ostream& m_os;

  /// Time stamp and severity part of the line being written; reused from one log() to the next.
  std::string m_line;
}; // class Ostream_log_msg_writer

} // namespace bidi::log
