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
#include "bidi/dict/error/error.hpp"
#include <cassert>

namespace bidi::dict::error
{

// Types.

/**
 * boost.system category of every dict::error::Code; `Error_code::message()` and the `ostream` form of such a code
 * come from here.  Only make_error_code() refers to it directly.
 */
class Category :
  public boost::system::error_category
{
public:
  /**
   * The category instance all dict codes point to.
   * @return See above.
   */
  static const Category& instance();

  /**
   * Category name, printed before the number when a code is streamed.
   * @return `"bidi_dict"`.
   */
  const char* name() const noexcept override;

  /**
   * Description of code `val`.
   *
   * @param val
   *        A Code, as `int`.
   * @return See above.
   */
  std::string message(int val) const override;
}; // class Category

// Method bodies.

Error_code make_error_code(Code err_code)
{
  return Error_code(static_cast<int>(err_code), Category::instance());
}

const Category& Category::instance() // Static.
{
  static const Category s_category;
  return s_category;
}

const char* Category::name() const noexcept // Virtual.
{
  return "bidi_dict";
}

std::string Category::message(int val) const // Virtual.
{
  // Same wording as the Code member docs in error.hpp.
  switch (static_cast<Code>(val))
  {
  case Code::S_KEY_DUPLICATE:
    return "Key is already associated with a different value; insert-only operation refused to replace it.";
  case Code::S_VALUE_DUPLICATE:
    return "Value is already associated with a different key; the strict collision policy refused the operation.";
  case Code::S_KEY_NOT_FOUND:
    return "Key not found.";
  case Code::S_VALUE_NOT_FOUND:
    return "Value not found.";
  case Code::S_EMPTY:
    return "Container is empty.";
  case Code::S_IMMUTABLE:
    return "Container is immutable (frozen); it cannot be modified.";
  case Code::S_INVALID_POLICY:
    return "Collision policy is not one of the supported policies.";
  case Code::S_INVALID_OPTION:
    return "At least one option's value violates a required condition on that option.";
  case Code::S_INVALID_ACCESSOR_NAME:
    return "Accessor name is not a valid identifier, or the forward and inverse accessor names are equal.";
  }
  assert(false && "Not a dict::error::Code.");
  return "Unknown bidi_dict error.";
}

} // namespace bidi::dict::error
