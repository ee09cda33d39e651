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


#pragma once

#include "bidi/dict/basic_bidict.hpp"
#include "bidi/dict/frozen_bidict.hpp"
#include <boost/serialization/collection_size_type.hpp>
#include <boost/serialization/nvp.hpp>
#include <boost/serialization/split_free.hpp>
#include <utility>

/**
 * @file
 *
 * Boost.Serialization support for every bidi::dict container: include this header, then `ar << dict` /
 * `ar >> dict` with any Boost archive (text, binary, XML; names are provided for XML).  The persisted form is:
 * the collision policy (as its integer value); the number of associations; then each association as a
 * (`key`, `value`) pair, in iteration order.  Loading re-applies the pairs, in that order, via `set()` to an empty
 * container with the persisted policy (and the loading object's Logger), then replaces the loading object's
 * content with the result; so an ordered container comes back in the same order, and a corrupt archive (e.g., one
 * with a repeated value under Collision_policy::S_RAISE) results in a thrown bidi::error::Runtime_error, the loading
 * object unchanged.  `Key` and `Value` must themselves be serializable (e.g., for `std::string` include
 * `<boost/serialization/string.hpp>`).
 *
 * Basic_frozen_bidict serializes its inner container as above (see its private `serialize()`).
 */

namespace boost::serialization
{

// Free function implementations.

/**
 * Boost.Serialization save hook for bidi::dict::Basic_bidict; see file doc header.
 *
 * @tparam Archive
 *         Output archive type.
 * @tparam Index
 *         See bidi::dict::Basic_bidict.
 * @param ar
 *        Archive.
 * @param dict
 *        Container to save.
 * @param version
 *        Ignored.
 */
template<typename Archive, typename Index>
void save(Archive& ar, const bidi::dict::Basic_bidict<Index>& dict, const unsigned int version)
{
  const int policy = static_cast<int>(dict.collision_policy());
  const collection_size_type count(dict.size());

  ar << make_nvp("policy", policy);
  ar << make_nvp("count", count);
  for (const auto& item : dict)
  {
    ar << make_nvp("key", item.first);
    ar << make_nvp("value", item.second);
  }
}

/**
 * Boost.Serialization load hook for bidi::dict::Basic_bidict; see file doc header.
 *
 * @tparam Archive
 *         Input archive type.
 * @tparam Index
 *         See bidi::dict::Basic_bidict.
 * @param ar
 *        Archive.
 * @param dict
 *        Container to load into.  Its content and policy are replaced; its Logger is kept.
 * @param version
 *        Ignored.
 */
template<typename Archive, typename Index>
void load(Archive& ar, bidi::dict::Basic_bidict<Index>& dict, const unsigned int version)
{
  using Dict = bidi::dict::Basic_bidict<Index>;
  using Key = typename Dict::Key;
  using Value = typename Dict::Value;

  int policy;
  collection_size_type count;
  ar >> make_nvp("policy", policy);
  ar >> make_nvp("count", count);

  // Throws on an invalid policy or a set() failure; dict is untouched until the end.
  Dict result(dict.get_logger(), static_cast<bidi::dict::Collision_policy>(policy));
  for (size_t idx = 0; idx != static_cast<size_t>(count); ++idx)
  {
    Key key;
    Value value;
    ar >> make_nvp("key", key);
    ar >> make_nvp("value", value);
    result.set(key, value);
  }

  dict = std::move(result);
}

/**
 * Boost.Serialization hook for bidi::dict::Basic_bidict: dispatches to save() or load().
 *
 * @tparam Archive
 *         Archive type.
 * @tparam Index
 *         See bidi::dict::Basic_bidict.
 * @param ar
 *        Archive.
 * @param dict
 *        Container.
 * @param version
 *        Archive version.
 */
template<typename Archive, typename Index>
void serialize(Archive& ar, bidi::dict::Basic_bidict<Index>& dict, const unsigned int version)
{
  split_free(ar, dict, version);
}

} // namespace boost::serialization
