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

#include "bidi/dict/dict_fwd.hpp"
#include "bidi/log/log.hpp"
#include "bidi/util/util_fwd.hpp"
#include <utility>

namespace bidi::dict
{

// Free functions.

/**
 * Returns `true` if and only if the given name is usable as the stem of a generated accessor: non-empty, ASCII
 * letters, digits and underscores only, not starting with a digit.
 *
 * @param name
 *        Candidate name.
 * @return See above.
 */
constexpr bool accessor_name_valid(util::String_view name)
{
  if (name.empty() || ((name.front() >= '0') && (name.front() <= '9')))
  {
    return false;
  }
  // else

  for (const char ch : name)
  {
    if (!(((ch >= 'a') && (ch <= 'z')) || ((ch >= 'A') && (ch <= 'Z')) || ((ch >= '0') && (ch <= '9'))
          || (ch == '_')))
    {
      return false;
    }
  }
  return true;
}

/**
 * Returns `true` if and only if the 2 names are each valid per accessor_name_valid() and differ from each other
 * (otherwise the 2 generated accessors would clash).  `constexpr`, so BIDI_DICT_NAMED_BIDICT() checks it at compile
 * time.
 *
 * @param key_name
 *        Name for the key side.
 * @param value_name
 *        Name for the value side.
 * @return See above.
 */
constexpr bool accessor_names_valid(util::String_view key_name, util::String_view value_name)
{
  return accessor_name_valid(key_name) && accessor_name_valid(value_name) && (key_name != value_name);
}

/**
 * Run-time counterpart of accessor_names_valid(), for names that are only known at run time (e.g., read from
 * configuration by code generators): emits error::Code::S_INVALID_ACCESSOR_NAME if they are not valid.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.  Null allowed.
 * @param key_name
 *        Name for the key side.
 * @param value_name
 *        Name for the value side.
 * @param err_code
 *        See bidi::Error_code docs for error reporting semantics.  Error code generated:
 *        error::Code::S_INVALID_ACCESSOR_NAME.
 * @return `true` if and only if valid; `false` if invalid (if `err_code` is not null).
 */
bool validate_accessor_names(log::Logger* logger_ptr, util::String_view key_name, util::String_view value_name,
                             Error_code* err_code = 0);

} // namespace bidi::dict

// Macros.

/**
 * Defines a class named `ARG_class`, publicly deriving from the bidi::dict container `ARG_base`, that adds
 * accessors with user-chosen names for the 2 directions:
 *   - `ARG_value_name ## _for()`: the forward direction (key to value), i.e., `*this` as `ARG_base`;
 *     `ARG_value_name ## _for(key)` is `get(key)`;
 *   - `ARG_key_name ## _for()`: the inverse direction (value to key), i.e., `inverse()`;
 *     `ARG_key_name ## _for(value)` is `get_key(value)`.
 *
 * Plus `S_KEY_NAME`, `S_VALUE_NAME` constants; and `S_CONTAINER_NAME` is `#ARG_class`, so `operator<<()` prints
 * the new name.  All constructors of `ARG_base` are inherited; anything else is `ARG_base`'s.
 *
 * The names are validated at compile time by accessor_names_valid().
 *
 * Example:
 *
 *   ~~~
 *   using Country_capital_base = bidi::dict::Bidict<std::string, std::string>;
 *   BIDI_DICT_NAMED_BIDICT(Country_capital, Country_capital_base, country, capital);
 *
 *   Country_capital dict(0, { { "France", "Paris" } });
 *   assert(dict.capital_for("France") == "Paris");
 *   assert(dict.country_for("Paris") == "France");
 *   assert(dict.country_for().contains("Paris"));
 *   ~~~
 *
 * @param ARG_class
 *        Name of the class to define.  The macro is used where a class definition may appear.
 * @param ARG_base
 *        A bidi::dict container type (Bidict, Ordered_bidict, Frozen_bidict, Frozen_ordered_bidict
 *        instance).  It must be a single token or at least contain no commas: use an alias for template instances.
 * @param ARG_key_name
 *        Identifier naming the key side.
 * @param ARG_value_name
 *        Identifier naming the value side.
 */
#define BIDI_DICT_NAMED_BIDICT(ARG_class, ARG_base, ARG_key_name, ARG_value_name) \
  class ARG_class : public ARG_base \
  { \
  public: \
    using Base = ARG_base; \
    using Base::Base; \
    static_assert(::bidi::dict::accessor_names_valid(#ARG_key_name, #ARG_value_name), \
                  "Accessor names must be distinct identifiers."); \
    static constexpr ::bidi::util::String_view S_KEY_NAME = #ARG_key_name; \
    static constexpr ::bidi::util::String_view S_VALUE_NAME = #ARG_value_name; \
    static constexpr ::bidi::util::String_view S_CONTAINER_NAME = #ARG_class; \
    ARG_class() = default; \
    ARG_class(const Base& src) : Base(src) {} \
    ARG_class(Base&& src) : Base(std::move(src)) {} \
    Base& ARG_value_name ## _for() { return *this; } \
    const Base& ARG_value_name ## _for() const { return *this; } \
    auto ARG_key_name ## _for() { return this->inverse(); } \
    auto ARG_key_name ## _for() const { return this->inverse(); } \
    Base::Value ARG_value_name ## _for(const Base::Key& key, ::bidi::Error_code* err_code = 0) const \
    { \
      return this->get(key, err_code); \
    } \
    Base::Key ARG_key_name ## _for(const Base::Value& value, ::bidi::Error_code* err_code = 0) const \
    { \
      return this->get_key(value, err_code); \
    } \
  }
