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
#include <boost/unordered_map.hpp>
#include <boost/unordered_set.hpp>
#include <functional>
#include <string>
#include <typeindex>

namespace bidi::log
{

// Types.

/**
 * Verbosity filter, component naming and time stamp settings shared by the bidi `Logger`s.  Filter settings may be
 * changed at any time, even while other threads are logging through a Logger that points to this Config.
 *
 * The bidi loggers (Simple_ostream_logger, Buffer_logger) each take a `Config*` and use it for:
 *   - should_log() filtering: output_whether_should_log().  Each Component can have its own verbosity
 *     (most-verbose Sev allowed to be logged); otherwise the default verbosity applies.
 *   - Component output: output_component_to_ostream(), which prints the registered name of the message's
 *     Component (or its number, if so configured).  Unregistered or null components are not printed.
 *   - Time stamp format: #m_use_human_friendly_time_stamps.
 *
 * ### Component registration ###
 * An `enum class` (e.g., bidi::Bidi_log_component) is registered via init_component_names(), with a name for each
 * value.  Names are normalized (upper-cased) and may be prefixed by a per-`enum` prefix, so that two `enum`s can
 * both have, say, a `"UTIL"` component.  configure_component_verbosity_by_name() uses those names; it is thus
 * suitable for applying verbosity settings from a config file or command line.
 *
 * ### Thread safety ###
 * All methods are safe to call concurrently with each other, including the configuring ones, except that
 * init_component_names() should be called before logging begins.  #m_use_human_friendly_time_stamps is a plain
 * member: set it before handing the Config to a Logger.
 */
class Config
{
public:
  // Constants.

  /// Default verbosity used when the caller does not supply one: Sev::S_INFO.
  static const Sev S_MOST_VERBOSE_SEV_DEFAULT;

  // Constructors/destructor.

  /**
   * Constructs a conceptually blank but functional set of Config.  Only the default verbosity is set; no
   * components are registered.
   *
   * @param most_verbose_sev_default
   *        Same as in configure_default_verbosity().
   */
  explicit Config(Sev most_verbose_sev_default = S_MOST_VERBOSE_SEV_DEFAULT);

  /**
   * Copies the verbosities and the registered names of `src`.
   *
   * @param src
   *        Config to copy; it is locked for the duration.
   */
  Config(const Config& src);

  /// Not movable (it owns a mutex).
  Config(Config&&) = delete;

  // Methods.

  /// Not assignable.
  void operator=(const Config&) = delete;

  /// Not assignable.
  void operator=(Config&&) = delete;

  /**
   * Answers Logger::should_log() for a given message: `sev` passes if it is no more verbose than the component's
   * own verbosity, or the default verbosity if the component has none.
   *
   * @param sev
   *        Severity of the message.
   * @param component
   *        Component of the message (may be empty).
   * @return Whether the message should be written.
   */
  bool output_whether_should_log(Sev sev, const Component& component) const;

  /**
   * An output of Config, this writes a string representation of the given component value to the given
   * `ostream`, if possible.  Returns `true` if it wrote anything; `false` otherwise (null or unregistered
   * component).
   *
   * @param os
   *        Stream to write to; not null.
   * @param component
   *        The component value from the log call site.  `component.empty()` is allowed.
   * @return `true` if `*os` was modified; `false` otherwise.
   */
  bool output_component_to_ostream(std::ostream* os, const Component& component) const;

  /**
   * Registers the names of each value of `enum class Component_payload`, for output and for
   * configure_component_verbosity_by_name().
   *
   * @tparam Component_payload
   *         An `enum class` usable as a Component payload.
   * @param component_names
   *        Mapping from each `enum` value to its name.  (A multimap: several names may map to one value; the first
   *        one encountered is used for output.)  Names must be non-empty and unique (after normalization and
   *        prefixing) across all calls, else behavior is undefined.
   * @param output_components_numerically
   *        If `true`, output_component_to_ostream() prints the numeric value of the `enum` instead of the name.
   *        The names remain usable for configure_component_verbosity_by_name().
   * @param payload_type_prefix_or_empty
   *        Prefix prepended to each name; empty string for none.
   */
  template<typename Component_payload>
  void init_component_names(const boost::unordered_multimap<Component_payload, std::string>& component_names,
                            bool output_components_numerically = false,
                            util::String_view payload_type_prefix_or_empty = util::String_view());

  /**
   * Sets the default verbosity to the given value, to be used by subsequent output_whether_should_log() calls
   * whenever one is made for a component without its own verbosity.  Optionally also forgets all per-component
   * verbosities.
   *
   * @param most_verbose_sev_default
   *        The most-verbose severity that passes the filter for such components.
   * @param reset
   *        If `true`, forget all per-component verbosities.
   */
  void configure_default_verbosity(Sev most_verbose_sev_default, bool reset);

  /**
   * Sets the per-component verbosity for the given component to the given value.
   *
   * @tparam Component_payload
   *         See init_component_names().
   * @param most_verbose_sev
   *        The most-verbose severity that passes the filter for this component.
   * @param component_payload
   *        The component.
   */
  template<typename Component_payload>
  void configure_component_verbosity(Sev most_verbose_sev, Component_payload component_payload);

  /**
   * Like configure_component_verbosity(), but the component is to be specified by its registered
   * (see init_component_names()) name, case-insensitively (with prefix, if any).
   *
   * @param most_verbose_sev
   *        See configure_component_verbosity().
   * @param component_name
   *        The component's name.
   * @return `true` on success; `false` if the name is not registered.
   */
  bool configure_component_verbosity_by_name(Sev most_verbose_sev, util::String_view component_name);

  // Data.

  /**
   * If `true` (default), loggers print local date and time with microseconds; if `false` they print seconds since the
   * Unix epoch as a decimal number.
   */
  bool m_use_human_friendly_time_stamps;

private:
  // Types.

  /// Identifies a component independently of Component's payload type-erasure: the `enum` type and value.
  struct Component_key
  {
    /// `typeid` of the `enum`.
    std::type_index m_payload_type;
    /// The `enum` value.
    Component::enum_raw_t m_payload_enum_raw_value;
  };

  /// Short-hand for the hasher of the #Component_key-keyed containers.
  struct Component_key_hash
  {
    /**
     * Returns hash of `key`.
     * @param key
     *        Key.
     * @return See above.
     */
    size_t operator()(const Component_key& key) const;
  };

  /// Short-hand for the equality predicate of the #Component_key-keyed containers.
  struct Component_key_pred
  {
    /**
     * Returns `true` if and only if `key1` and `key2` identify the same component.
     * @param key1
     *        Key.
     * @param key2
     *        Key.
     * @return See above.
     */
    bool operator()(const Component_key& key1, const Component_key& key2) const;
  };

  /// Short-hand for map from component to something.
  template<typename Mapped>
  using Component_map = boost::unordered_map<Component_key, Mapped, Component_key_hash, Component_key_pred>;

  // Methods.

  /**
   * Returns the #Component_key of a non-null Component.
   *
   * @param component
   *        Component; `!component.empty()`.
   * @return See above.
   */
  static Component_key component_to_key(const Component& component);

  /**
   * Upper-cases `name` in the classic locale; this is the form under which names are stored and looked up.
   *
   * @param name
   *        Name as given by the user.
   * @return See above.
   */
  static std::string normalized_component_name(util::String_view name);

  /**
   * Helper of init_component_names(): registers one name of one component.
   *
   * @param key
   *        The component.
   * @param name_normalized
   *        Its normalized, prefixed name.
   * @param output_components_numerically
   *        See init_component_names().
   */
  void register_component_name(const Component_key& key, std::string&& name_normalized,
                               bool output_components_numerically);

  /**
   * Helper that sets the verbosity of the given component.
   *
   * @param key
   *        The component.
   * @param most_verbose_sev
   *        The verbosity.
   */
  void store_severity_by_component(const Component_key& key, Sev most_verbose_sev);

  // Data.

  /// Protects all data below.
  mutable util::Mutex_non_recursive m_mutex;

  /// Catch-all verbosity for components without an entry in #m_verbosities_by_component.
  Sev m_verbosity_default;

  /// Per-component verbosity.
  Component_map<Sev> m_verbosities_by_component;

  /// Component names for output; a registered component without an entry here is output numerically.
  Component_map<std::string> m_component_names;

  /// `enum` types registered via init_component_names(); components of other types are not output.
  boost::unordered_set<std::type_index, std::hash<std::type_index>> m_registered_payload_types;

  /// Reverse lookup of #m_component_names (but including the numerically-output components).
  boost::unordered_map<std::string, Component_key> m_component_keys_by_name;
}; // class Config

// Template bodies.

template<typename Component_payload>
void Config::init_component_names
       (const boost::unordered_multimap<Component_payload, std::string>& component_names,
        bool output_components_numerically,
        util::String_view payload_type_prefix_or_empty)
{
  const auto prefix = normalized_component_name(payload_type_prefix_or_empty);

  {
    util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
    m_registered_payload_types.insert(std::type_index(typeid(Component_payload)));
  }

  for (const auto& value_and_name : component_names)
  {
    const auto& name_sans_prefix = value_and_name.second;
    assert(!name_sans_prefix.empty()); // Advertised as not allowed.

    register_component_name(component_to_key(Component(value_and_name.first)),
                            prefix + normalized_component_name(name_sans_prefix),
                            output_components_numerically);
  }
} // Config::init_component_names()

template<typename Component_payload>
void Config::configure_component_verbosity(Sev most_verbose_sev, Component_payload component_payload)
{
  store_severity_by_component(component_to_key(Component(component_payload)), most_verbose_sev);
}

} // namespace bidi::log
