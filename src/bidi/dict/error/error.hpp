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

#include "bidi/common.hpp"

/**
 * Error codes of the dict module, plugged into boost.system so that each converts implicitly to bidi::Error_code.
 *
 *   ~~~
 *   bidi::Error_code code = bidi::dict::error::Code::S_VALUE_DUPLICATE;
 *   std::cout << code << ": " << code.message() << '\n'; // "bidi_dict:2: Value is already associated ..."
 *   if (code == bidi::dict::error::Code::S_VALUE_DUPLICATE) { ... }
 *   ~~~
 *
 * By kind:
 *   - Collisions: Code::S_KEY_DUPLICATE, Code::S_VALUE_DUPLICATE.
 *   - Lookups: Code::S_KEY_NOT_FOUND, Code::S_VALUE_NOT_FOUND, Code::S_EMPTY.
 *   - Mutating a frozen instance: Code::S_IMMUTABLE.
 *   - Configuration validation: Code::S_INVALID_POLICY, Code::S_INVALID_OPTION, Code::S_INVALID_ACCESSOR_NAME.
 */
namespace bidi::dict::error
{

// Types.

/// All possible errors returned (via bidi::Error_code arguments) by bidi::dict functions/methods.
enum class Code
{
  /**
   * Tried to insert a key already associated with a different value, via an insert-only operation (`put()`).
   * (A plain `set()` replaces the value instead.)
   */
  S_KEY_DUPLICATE = 1,
  /// Tried to associate a value with a key, while the value is already associated with another key (strict policy).
  S_VALUE_DUPLICATE,
  /// Tried to access or remove an association by a key that is not present.
  S_KEY_NOT_FOUND,
  /// Tried to access or remove an association by a value that is not present.
  S_VALUE_NOT_FOUND,
  /// Tried to remove or access an association at an end of an empty container.
  S_EMPTY,
  /// Tried to modify an immutable (frozen) container.
  S_IMMUTABLE,
  /// A collision policy was not one of the supported policies.
  S_INVALID_POLICY,
  /// A configuration option value violates a required condition on that option.
  S_INVALID_OPTION,
  /// A name for a generated accessor was not a valid identifier, or the two names were equal.
  S_INVALID_ACCESSOR_NAME
}; // enum class Code

// Functions.

/**
 * Makes the #Error_code for `err_code`; boost.system finds it by ADL when converting a Code.
 *
 * @param err_code
 *        Code.
 * @return See above.
 */
Error_code make_error_code(Code err_code);

} // namespace bidi::dict::error

namespace boost::system
{

/// Lets dict::error::Code convert implicitly to bidi::Error_code.
template<>
struct is_error_code_enum<::bidi::dict::error::Code>
{
  /// Yes.
  static constexpr bool value = true;
};

} // namespace boost::system
