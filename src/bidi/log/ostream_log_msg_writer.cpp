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
#include "bidi/log/ostream_log_msg_writer.hpp"
#include "bidi/log/config.hpp"
#include <fmt/format.h>
#include <fmt/chrono.h>
#include <chrono>
#include <iterator>
#include <cassert>

namespace bidi::log
{

// Static data.

const std::vector<util::String_view> Ostream_log_msg_writer::S_SEV_TAGS
  { "none", "fatl", "eror", "warn", "info", "debg", "trce", "data" };

// Method bodies.

Ostream_log_msg_writer::Ostream_log_msg_writer(const Config& config, std::ostream& os) :
  m_config(config),
  m_os(os)
{
  // Nothing.
}

void Ostream_log_msg_writer::log(const Msg_metadata& metadata, util::String_view msg)
{
  const auto sev_idx = static_cast<size_t>(metadata.m_msg_sev);
  assert((sev_idx != 0) && (sev_idx < S_SEV_TAGS.size()));

  m_line.clear();
  append_time_stamp(metadata);
  fmt::format_to(std::back_inserter(m_line), "[{}]: T", S_SEV_TAGS[sev_idx]);

  m_os << m_line << metadata.m_call_thread_id << ": ";
  if (m_config.output_component_to_ostream(&m_os, metadata.m_msg_component))
  {
    m_os << ": ";
  }
  // else { Component not shown. }

  m_os << BIDI_UTIL_WHERE_AM_I_FROM_ARGS(metadata.m_msg_src_file, metadata.m_msg_src_function, metadata.m_msg_src_line)
       << ": " << msg << '\n' << std::flush;
} // Ostream_log_msg_writer::log

void Ostream_log_msg_writer::append_time_stamp(const Msg_metadata& metadata)
{
  namespace chr = std::chrono;

  const auto when = metadata.m_called_when;
  auto out = std::back_inserter(m_line);

  if (m_config.m_use_human_friendly_time_stamps)
  {
    /* localtime() gives the zone-adjusted calendar fields but only whole seconds; the time_point itself carries
     * the fraction, so %S comes from it. */
    fmt::format_to(out, "{0:%Y-%m-%d %H:%M:}{1:%S} {0:%z} ",
                   fmt::localtime(chr::system_clock::to_time_t(when)), when);
    return;
  }
  // else

  const auto usec = chr::duration_cast<chr::microseconds>(when.time_since_epoch()).count();
  fmt::format_to(out, "{}.{:06} ", usec / 1000000, usec % 1000000);
}

} // namespace bidi::log
