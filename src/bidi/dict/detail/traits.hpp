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
#include <type_traits>

namespace bidi::dict::detail
{

// Types.

/**
 * Empty base of every bidi::dict container type and view: Basic_bidict, Inverse_view, Basic_frozen_bidict.  Used
 * only to detect them (is_dict_v); in particular to restrict the free `operator==()` templates to dict operands.
 */
struct Dict_tag
{
};

/// Empty stand-in base of an unordered Basic_bidict, in place of the Ordered interface.
struct Unordered_tag
{
};

/**
 * `value` is `true` if and only if `T` is an ordered dict type: `T` is a dict type (is_dict_v), and its traversal order
 * is meaningful (`T::S_IS_ORDERED`).
 *
 * @tparam T
 *         Type to check.
 */
template<typename T, typename = void>
struct Is_ordered : std::false_type
{
};

/// Specialization for types with `S_IS_ORDERED`.  See general template.
template<typename T>
struct Is_ordered<T, std::void_t<decltype(T::S_IS_ORDERED)>> :
  std::bool_constant<std::is_base_of_v<Dict_tag, T> && T::S_IS_ORDERED>
{
};

// Constants.

/// `true` if and only if `T` (ignoring `const`/reference) is a bidi::dict container type or view.
template<typename T>
constexpr bool is_dict_v = std::is_base_of_v<Dict_tag, std::decay_t<T>>;

/// See Is_ordered; ignores `const`/reference.
template<typename T>
constexpr bool is_ordered_v = Is_ordered<std::decay_t<T>>::value;

} // namespace bidi::dict::detail
