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

#include "bidi/util/util_fwd.hpp"
#include "bidi/util/string_ostream.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <cassert>
#include <cctype>
#include <locale>
#include <type_traits>

namespace bidi::util
{

// Types.

/**
 * Base of interface classes (such as dict::Readable) that supplies the `virtual` destructor they need, so that
 * deleting an implementation through an interface pointer runs the implementation's destructor.  Classes deriving
 * from it need not declare a destructor of their own.
 */
class Null_interface
{
public:
  /// Pure, so Null_interface alone cannot be instantiated; defined (empty) nevertheless.
  virtual ~Null_interface() = 0;
};

// Template bodies.

template<typename Container>
bool key_exists(const Container& container, const typename Container::key_type& key)
{
  return container.find(key) != container.end();
}

template<typename ...T>
void ostream_op_to_string(std::string* target_str, T const &... ostream_args)
{
  // Writes straight into *target_str; no intermediate ostringstream buffer.
  String_ostream str_os(target_str);
  auto& os = str_os.os();
  (os << ... << ostream_args);
  os.flush();
}

template<typename ...T>
std::string ostream_op_string(T const &... ostream_args)
{
  std::string str;
  ostream_op_to_string(&str, ostream_args...);
  return str;
}

template<typename Enum>
Enum istream_to_enum(std::istream* is_ptr, Enum enum_default, Enum enum_sentinel,
                     bool accept_num_encoding, bool case_sensitive,
                     Enum enum_lowest)
{
  using boost::lexical_cast;
  using Traits = std::char_traits<char>;
  using Raw = std::underlying_type_t<Enum>;

  assert(Raw(enum_lowest) >= 0); // No minus sign is ever consumed.

  const auto in_range = [&](Raw raw) -> bool
  {
    return (raw >= Raw(enum_lowest)) && (raw < Raw(enum_sentinel));
  };

  std::string token;
  for (auto ch = is_ptr->peek();
       (ch != Traits::eof()) && ((ch == '_') || std::isalnum(ch));
       ch = is_ptr->peek())
  {
    token.push_back(Traits::to_char_type(is_ptr->get()));
  }

  if (token.empty())
  {
    return enum_default;
  }
  // else

  if (accept_num_encoding && std::isdigit(static_cast<unsigned char>(token[0])))
  {
    Raw raw;
    if (boost::conversion::try_lexical_convert(token, raw) && in_range(raw))
    {
      return Enum(raw);
    }
    // else: not a number (e.g., "1a"), too big, or out of range.
    return enum_default;
  }
  // else

  const std::locale& loc = std::locale::classic();
  for (auto raw = Raw(enum_lowest); in_range(raw); ++raw)
  {
    const auto name = lexical_cast<std::string>(Enum(raw)); // Symbolic, via the enum's operator<<.
    const bool match = case_sensitive ? (token == name) : boost::algorithm::iequals(token, name, loc);
    if (match)
    {
      return Enum(raw);
    }
  }
  return enum_default;
} // istream_to_enum()

} // namespace bidi::util
