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

#include "bidi/log/buffer_logger.hpp"
#include "bidi/log/config.hpp"
#include "bidi/common.hpp"
#include <string>

namespace bidi::test
{

/**
 * Logger used for testing purposes: logs everything at or above the given severity, for all bidi components, into
 * memory, so that a test both exercises the logging code paths and can check what was logged.
 */
class Test_logger :
  public bidi::log::Logger
{
public:
  /**
   * Creates the logger with bidi's component names registered (prefixed `bidi-`).
   *
   * @param min_severity
   *        Most verbose severity that gets logged.
   */
  explicit Test_logger(log::Sev min_severity = log::Sev::S_TRACE) :
    m_config(min_severity),
    m_logger(&m_config)
  {
    // m_logger only stores the pointer so far; nothing has been logged.
    m_config.init_component_names<Bidi_log_component>(S_BIDI_LOG_COMPONENT_NAME_MAP, false, "bidi-");
  }

  /**
   * Settings, e.g. to change verbosity mid-test.
   * @return See above.
   */
  log::Config& get_config()
  {
    return m_config;
  }

  /**
   * Returns everything logged so far.
   *
   * @return See above.
   */
  std::string logged() const
  {
    return m_logger.buffer_str_copy();
  }

  /// See log::Buffer_logger.
  bool should_log(log::Sev sev, const log::Component& component) const override
  {
    return m_logger.should_log(sev, component);
  }

  /// `false`.
  bool logs_asynchronously() const override
  {
    return false;
  }

  /// See log::Buffer_logger.
  void do_log(log::Msg_metadata* metadata, util::String_view msg) override
  {
    m_logger.do_log(metadata, msg);
  }

private:
  /// Settings used by #m_logger.
  log::Config m_config;

  /// Does the work.
  log::Buffer_logger m_logger;
}; // class Test_logger

} // namespace bidi::test
