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
#include "bidi/log/config.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/functional/hash.hpp>
#include <cassert>

namespace bidi::log
{
// Static data.

const Sev Config::S_MOST_VERBOSE_SEV_DEFAULT = Sev::S_INFO;

// Method bodies.

Config::Config(Sev most_verbose_sev_default) :
  m_use_human_friendly_time_stamps(true),
  m_verbosity_default(most_verbose_sev_default)
{
  // Nothing.
}

Config::Config(const Config& src) :
  m_use_human_friendly_time_stamps(src.m_use_human_friendly_time_stamps)
{
  util::Lock_guard<decltype(m_mutex)> lock(src.m_mutex);

  m_verbosity_default = src.m_verbosity_default;
  m_verbosities_by_component = src.m_verbosities_by_component;
  m_component_names = src.m_component_names;
  m_registered_payload_types = src.m_registered_payload_types;
  m_component_keys_by_name = src.m_component_keys_by_name;
}

bool Config::output_whether_should_log(Sev sev, const Component& component) const
{
  util::Lock_guard<decltype(m_mutex)> lock(m_mutex);

  if (!component.empty())
  {
    const auto sev_it = m_verbosities_by_component.find(component_to_key(component));
    if (sev_it != m_verbosities_by_component.end())
    {
      return sev <= sev_it->second;
    }
    // else { Component has no verbosity of its own. }
  }

  return sev <= m_verbosity_default;
} // Config::output_whether_should_log

bool Config::output_component_to_ostream(std::ostream* os_ptr, const Component& component) const
{
  assert(os_ptr);
  auto& os = *os_ptr;

  if (component.empty())
  {
    return false;
  }
  // else

  util::Lock_guard<decltype(m_mutex)> lock(m_mutex);

  if (!util::key_exists(m_registered_payload_types, component.payload_type_index()))
  {
    return false; // Its enum was never passed to init_component_names().
  }
  // else

  const auto name_it = m_component_names.find(component_to_key(component));
  if (name_it != m_component_names.end())
  {
    os << name_it->second;
  }
  else
  {
    os << component.payload_enum_raw_value(); // Registered for numeric output.
  }
  return true;
} // Config::output_component_to_ostream

void Config::configure_default_verbosity(Sev most_verbose_sev_default, bool reset)
{
  util::Lock_guard<decltype(m_mutex)> lock(m_mutex);

  m_verbosity_default = most_verbose_sev_default;
  if (reset)
  {
    m_verbosities_by_component.clear();
  }
}

bool Config::configure_component_verbosity_by_name(Sev most_verbose_sev, util::String_view component_name)
{
  Component_key key{ typeid(void), 0 };
  {
    util::Lock_guard<decltype(m_mutex)> lock(m_mutex);

    const auto key_it = m_component_keys_by_name.find(normalized_component_name(component_name));
    if (key_it == m_component_keys_by_name.end())
    {
      return false;
    }
    // else
    key = key_it->second;
  }

  store_severity_by_component(key, most_verbose_sev);
  return true;
} // Config::configure_component_verbosity_by_name

void Config::register_component_name(const Component_key& key, std::string&& name_normalized,
                                     bool output_components_numerically)
{
  util::Lock_guard<decltype(m_mutex)> lock(m_mutex);

  // Names are unique across all registered enums.
  assert(!util::key_exists(m_component_keys_by_name, name_normalized));

  if ((!output_components_numerically) && (!util::key_exists(m_component_names, key)))
  {
    m_component_names.emplace(key, name_normalized); // First name wins for output.
  }
  m_component_keys_by_name.emplace(std::move(name_normalized), key);
}

void Config::store_severity_by_component(const Component_key& key, Sev most_verbose_sev)
{
  util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  m_verbosities_by_component.insert_or_assign(key, most_verbose_sev);
}

Config::Component_key Config::component_to_key(const Component& component) // Static.
{
  return Component_key{ component.payload_type_index(), component.payload_enum_raw_value() };
}

std::string Config::normalized_component_name(util::String_view name) // Static.
{
  std::string result(name);
  boost::algorithm::to_upper(result, std::locale::classic());
  return result;
}

size_t Config::Component_key_hash::operator()(const Component_key& key) const
{
  size_t seed = key.m_payload_type.hash_code();
  boost::hash_combine(seed, key.m_payload_enum_raw_value);
  return seed;
}

bool Config::Component_key_pred::operator()(const Component_key& key1, const Component_key& key2) const
{
  return (key1.m_payload_type == key2.m_payload_type)
         && (key1.m_payload_enum_raw_value == key2.m_payload_enum_raw_value);
}

} // namespace bidi::log
