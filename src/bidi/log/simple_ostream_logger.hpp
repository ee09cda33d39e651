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
#include <boost/shared_ptr.hpp>
#include <iostream>

namespace bidi::log
{

// Types.

/**
 * Logger that writes each accepted message straight to a standard stream: Sev::S_WARNING and more severe
 * messages to one stream, everything less severe to another (by default `cerr` and `cout` respectively).  A command
 * line tool typically creates one of these at startup and hands it to every bidi object it builds.
 *
 * do_log() holds a single mutex for both streams, so lines from different threads never interleave even when the
 * two streams are the same terminal.
 */
class Simple_ostream_logger :
  public Logger
{
public:
  // Constructors/destructor.

  /**
   * Creates the logger.  Once it exists, other writes to `os` and `os_for_err` may garble its output.
   *
   * @param config
   *        Filtering and formatting settings; must outlive `*this`.
   * @param os
   *        Destination of messages less severe than Sev::S_WARNING.
   * @param os_for_err
   *        Destination of Sev::S_WARNING messages and more severe ones.  May be the same object as `os`.
   */
  explicit Simple_ostream_logger(Config* config,
                                 std::ostream& os = std::cout, std::ostream& os_for_err = std::cerr);

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

  /// Always `false`; the message is on its stream when do_log() returns.
  bool logs_asynchronously() const override;

  /**
   * Formats the message with its metadata prefix and writes it to the stream chosen by its severity.
   *
   * @param metadata
   *        Time stamp, severity, component and call site of the message.
   * @param msg
   *        Message text.
   */
  void do_log(Msg_metadata* metadata, util::String_view msg) override;

private:
  // Data.

  /// Settings given to the constructor.
  Config* const m_config;

  /// Writer for the less severe messages.
  boost::shared_ptr<Ostream_log_msg_writer> m_out_writer;

  /// Writer for warnings and errors; the same object as #m_out_writer when both streams are one.
  boost::shared_ptr<Ostream_log_msg_writer> m_err_writer;

  /// Held for the duration of each do_log().
  util::Mutex_non_recursive m_mutex;
}; // class Simple_ostream_logger

} // namespace bidi::log
