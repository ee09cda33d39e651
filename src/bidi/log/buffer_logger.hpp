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
#include "bidi/log/ostream_log_msg_writer.hpp"
#include "bidi/util/string_ostream.hpp"

namespace bidi::log
{

// Types.

/**
 * Logger that appends every message it accepts to an in-memory string, formatted exactly as
 * Simple_ostream_logger would format it.  The accumulated text is available through buffer_str_copy().
 *
 * Nothing is ever discarded, so memory use grows with the amount logged; it is meant for unit tests (see
 * bidi::test::Test_logger) and short-lived tools.
 *
 * All methods may be called concurrently.
 */
class Buffer_logger :
  public Logger
{
public:
  // Constructors/destructor.

  /**
   * Creates a logger with an empty buffer.
   *
   * @param config
   *        Filtering and formatting settings; must outlive `*this`.
   */
  explicit Buffer_logger(Config* config);

  // Methods.

  /**
   * Delegates to Config::output_whether_should_log().
   *
   * @param sev
   *        Message severity.
   * @param component
   *        Message component, possibly empty.
   * @return See above.
   */
  bool should_log(Sev sev, const Component& component) const override;

  /// Always `false`: do_log() has finished writing by the time it returns.
  bool logs_asynchronously() const override;

  /**
   * Appends one formatted line (metadata prefix, then `msg`) to the buffer.
   *
   * @param metadata
   *        Time stamp, severity, component and call site of the message.
   * @param msg
   *        Message text.
   */
  void do_log(Msg_metadata* metadata, util::String_view msg) override;

  /**
   * Snapshot of everything logged so far.
   *
   * @return Copy of the buffer, taken under the same lock do_log() uses.
   */
  std::string buffer_str_copy() const;

private:
  // Data.

  /// Settings given to the constructor.
  Config* const m_config;

  /// Target of #m_os_writer; owns the buffer.
  util::String_ostream m_buf_os;

  /// Formats each message into #m_buf_os.
  Ostream_log_msg_writer m_os_writer;

  /// Serializes do_log() calls with each other and with buffer_str_copy().
  mutable util::Mutex_non_recursive m_mutex;
}; // class Buffer_logger

} // namespace bidi::log
