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
#include "bidi/dict/named_bidict.hpp"
#include "bidi/dict/error/error.hpp"
#include "bidi/error/error.hpp"

namespace bidi::dict
{

// Implementations.

bool validate_accessor_names(log::Logger* logger_ptr, util::String_view key_name, util::String_view value_name,
                             Error_code* err_code)
{
  BIDI_ERROR_EXEC_AND_THROW_ON_ERROR(bool, validate_accessor_names, logger_ptr, key_name, value_name, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  BIDI_LOG_SET_CONTEXT(logger_ptr, Bidi_log_component::S_DICT);

  if (!accessor_names_valid(key_name, value_name))
  {
    BIDI_LOG_WARNING("Accessor names [" << key_name << "], [" << value_name << "] are not 2 distinct identifiers.");
    BIDI_ERROR_EMIT_ERROR(error::Code::S_INVALID_ACCESSOR_NAME);
    return false;
  }
  // else

  err_code->clear();
  return true;
}

} // namespace bidi::dict
