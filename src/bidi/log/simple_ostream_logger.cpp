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
#include "bidi/log/simple_ostream_logger.hpp"
#include "bidi/log/config.hpp"
#include <boost/make_shared.hpp>
#include <cassert>

namespace bidi::log
{

Simple_ostream_logger::Simple_ostream_logger(Config* config, std::ostream& os, std::ostream& os_for_err) :
  m_config(config),
  m_out_writer(boost::make_shared<Ostream_log_msg_writer>(*m_config, os))
{
  if (&os_for_err == &os)
  {
    m_err_writer = m_out_writer;
  }
  else
  {
    m_err_writer = boost::make_shared<Ostream_log_msg_writer>(*m_config, os_for_err);
  }
}

bool Simple_ostream_logger::should_log(Sev sev, const Component& component) const // Virtual.
{
  return m_config->output_whether_should_log(sev, component);
}

bool Simple_ostream_logger::logs_asynchronously() const // Virtual.
{
  return false;
}

void Simple_ostream_logger::do_log(Msg_metadata* metadata, util::String_view msg) // Virtual.
{
  assert(metadata);

  const bool is_err = metadata->m_msg_sev <= Sev::S_WARNING;
  util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  (is_err ? m_err_writer : m_out_writer)->log(*metadata, msg);
}

} // namespace bidi::log
