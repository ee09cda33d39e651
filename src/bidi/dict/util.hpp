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

#include "bidi/dict/detail/traits.hpp"
#include <boost/range/adaptor/transformed.hpp>
#include <algorithm>
#include <ostream>
#include <type_traits>
#include <utility>

namespace bidi::dict
{

namespace detail
{

// Types.

/// Function object turning a (first, second) pair of any pair type into the `std::pair` (second, first).
struct Pair_swapper
{
  /**
   * Returns the swapped copy of `item`.
   *
   * @tparam Pair
   *         Type with members `first` and `second`.
   * @param item
   *        Pair to swap.
   * @return See above.
   */
  template<typename Pair>
  auto operator()(const Pair& item) const
  {
    return std::pair<std::decay_t<decltype(item.second)>, std::decay_t<decltype(item.first)>>
             (item.second, item.first);
  }
};

// Free functions.

/**
 * Returns `true` if and only if `dict` and `other` have the same (key, value) associations, regardless of order:
 * same size, and each association of `other` is found in `dict` by key, with an equal value.
 *
 * @tparam Dict
 *         A bidi::dict container or view.
 * @tparam Mapping
 *         Any container or view of (key, value) pairs with unique keys and `size()`.
 * @param dict
 *        Operand.
 * @param other
 *        Operand.
 * @return See above.
 */
template<typename Dict, typename Mapping>
bool contents_equal(const Dict& dict, const Mapping& other)
{
  if (dict.size() != other.size())
  {
    return false;
  }
  // else

  const auto dict_end_it = dict.end();
  for (const auto& item : other)
  {
    const auto dict_it = dict.find(item.first);
    if ((dict_it == dict_end_it) || (!((*dict_it).second == item.second)))
    {
      return false;
    }
  }
  return true;
}

} // namespace detail

// Free functions.

/**
 * Returns a lazy range over `items`, a range of pairs, yielding each pair swapped: (second, first).  Handy to
 * construct or update a container from the inverse of a mapping, e.g., `b.update(inverted(some_map))`.  `items` must
 * outlive the returned range.
 *
 * @tparam Item_range
 *         Range of pairs (anything with `first` and `second`).
 * @param items
 *        Range to invert.
 * @return See above.
 */
template<typename Item_range>
auto inverted(const Item_range& items)
{
  return boost::adaptors::transform(items, detail::Pair_swapper());
}

/**
 * Returns `true` if and only if the two operands hold the same associations, at least one of them being a bidi::dict
 * container or view, and the other being one too or any associative container of (key, value) pairs
 * (`std::map`, `boost::unordered_map`, ...).  If both are ordered (Ordered_bidict, Frozen_ordered_bidict, or an
 * Inverse_view of either) the comparison is order-sensitive: the traversal sequences must match pairwise.
 * Otherwise it is order-insensitive.
 *
 * @tparam Lhs
 *         See above.
 * @tparam Rhs
 *         See above.
 * @param lhs
 *        Operand.
 * @param rhs
 *        Operand.
 * @return See above.
 */
template<typename Lhs, typename Rhs>
std::enable_if_t<detail::is_dict_v<Lhs> || detail::is_dict_v<Rhs>, bool>
  operator==(const Lhs& lhs, const Rhs& rhs)
{
  if constexpr(detail::is_ordered_v<Lhs> && detail::is_ordered_v<Rhs>)
  {
    return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
                      [](const auto& lhs_item, const auto& rhs_item) -> bool
    {
      return (lhs_item.first == rhs_item.first) && (lhs_item.second == rhs_item.second);
    });
  }
  else if constexpr(detail::is_dict_v<Lhs>)
  {
    return detail::contents_equal(lhs, rhs);
  }
  else
  {
    return detail::contents_equal(rhs, lhs);
  }
}

/**
 * Returns `!(lhs == rhs)`.
 *
 * @tparam Lhs
 *         See `operator==()`.
 * @tparam Rhs
 *         See `operator==()`.
 * @param lhs
 *        Operand.
 * @param rhs
 *        Operand.
 * @return See above.
 */
template<typename Lhs, typename Rhs>
std::enable_if_t<detail::is_dict_v<Lhs> || detail::is_dict_v<Rhs>, bool>
  operator!=(const Lhs& lhs, const Rhs& rhs)
{
  return !(lhs == rhs);
}

/**
 * Prints a bidi::dict container or view in the form `Class_name({k1: v1, k2: v2})` (or `Class_name()` if empty),
 * associations in traversal order.  Keys and values must be printable with `<<`.
 *
 * @tparam Dict
 *         A bidi::dict container or view type.
 * @param os
 *        Stream to which to write.
 * @param dict
 *        Object to print.
 * @return `os`.
 */
template<typename Dict>
std::enable_if_t<detail::is_dict_v<Dict>, std::ostream&>
  operator<<(std::ostream& os, const Dict& dict)
{
  os << Dict::S_CONTAINER_NAME << '(';
  if (dict.size() != 0)
  {
    os << '{';
    bool first = true;
    for (const auto& item : dict)
    {
      if (!first)
      {
        os << ", ";
      }
      first = false;
      os << item.first << ": " << item.second;
    }
    os << '}';
  }
  return os << ')';
}

} // namespace bidi::dict
