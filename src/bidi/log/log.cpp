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
#include "bidi/log/log.hpp"
#include <cassert>

namespace bidi::log
{

// Component implementations.

Component::Component() :
  m_type(0),
  m_raw_value(0)
{
  // Nothing else.
}

bool Component::empty() const
{
  return m_type == 0;
}

const std::type_info& Component::payload_type() const
{
  assert(!empty());
  return *m_type;
}

std::type_index Component::payload_type_index() const
{
  return std::type_index(payload_type());
}

Component::enum_raw_t Component::payload_enum_raw_value() const
{
  assert(!empty());
  return m_raw_value;
}

// Log_context implementations.

Log_context::Log_context(Logger* logger) :
  m_logger(logger)
{
  // Nothing else.
}

Log_context::Log_context(const Log_context& src) = default;

Log_context::Log_context(Log_context&& src) :
  m_logger(src.m_logger),
  m_component(src.m_component)
{
  src.m_logger = 0;
  src.m_component = Component();
}

Log_context& Log_context::operator=(const Log_context& src) = default;

Log_context& Log_context::operator=(Log_context&& src)
{
  if (&src != this)
  {
    m_logger = src.m_logger;
    m_component = src.m_component;
    src.m_logger = 0;
    src.m_component = Component();
  }
  return *this;
}

Logger* Log_context::get_logger() const
{
  return m_logger;
}

const Component& Log_context::get_log_component() const
{
  return m_component;
}

void Log_context::swap(Log_context& other)
{
  std::swap(m_logger, other.m_logger);
  std::swap(m_component, other.m_component);
}

void swap(Log_context& val1, Log_context& val2)
{
  val1.swap(val2);
}

// Sev implementations.

std::ostream& operator<<(std::ostream& os, Sev val)
{
  // Each name must be readable back by operator>>() (through istream_to_enum()).
  switch (val)
  {
  case Sev::S_NONE: return os << "NONE";
  case Sev::S_FATAL: return os << "FATAL";
  case Sev::S_ERROR: return os << "ERROR";
  case Sev::S_WARNING: return os << "WARNING";
  case Sev::S_INFO: return os << "INFO";
  case Sev::S_DEBUG: return os << "DEBUG";
  case Sev::S_TRACE: return os << "TRACE";
  case Sev::S_DATA: return os << "DATA";
  case Sev::S_END_SENTINEL: break;
  }
  // Sentinel or a value cast from an out-of-range integer.
  return os << static_cast<size_t>(val);
}

std::istream& operator>>(std::istream& is, Sev& val)
{
  // Name (any case) or number; unknown means S_NONE.
  val = util::istream_to_enum(&is, Sev::S_NONE, Sev::S_END_SENTINEL);
  return is;
}

} // namespace bidi::log
