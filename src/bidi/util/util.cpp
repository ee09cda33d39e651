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
#include "bidi/util/util.hpp"

namespace bidi::util
{

Null_interface::~Null_interface() = default;

std::string get_where_am_i_str(String_view file, String_view function, unsigned int line)
{
  std::string where;
  where.reserve(file.size() + function.size() + 16);
  ostream_op_to_string(&where, file, ':', function, '(', line, ')');
  return where;
}

} // namespace bidi::util
