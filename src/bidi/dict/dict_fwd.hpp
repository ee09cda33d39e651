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
#include "bidi/util/util_fwd.hpp"
#include <boost/functional/hash.hpp>
#include <functional>
#include <iosfwd>

/**
 * bidi module containing the bidirectional map ("bidict"): an associative container of (key, value) associations
 * maintaining both a forward index (key to value) and an inverse index (value to key), kept consistent after every
 * operation, each direction offering average O(1) lookup.
 *
 * ### Synopsis ###
 *
 *   ~~~
 *   namespace dict = bidi::dict;
 *   dict::Bidict<std::string, int> b(logger_ptr, { { "one", 1 }, { "two", 2 } });
 *   b.get("one");           // 1.
 *   b.inverse().get(2);     // "two".
 *   b.set("three", 2);      // Throws: 2 is already associated with "two"; b unchanged.
 *   b.force_set("three", 2) // Evicts ("two", 2); b == { one: 1, three: 2 }.
 *   ~~~
 *
 * ### Variants ###
 *   - Bidict: unordered; iteration order is unspecified.
 *   - Ordered_bidict: iteration follows insertion order, adjustable with move_to_front()/move_to_back(); and
 *     pop_first()/pop_last() remove from the ends.  All still average O(1).
 *   - Frozen_bidict, Frozen_ordered_bidict: immutable, hashable snapshots of the above.
 *   - Inverse_view: obtained from `inverse()` of any of the above; the same container seen value-to-key.
 *
 * All of these are built on one engine, Basic_bidict, parameterized on an index type (detail::Hashed_dual_index or
 * detail::Linked_dual_index); the ordered index adds the Ordered capability; Basic_frozen_bidict wraps an engine
 * and removes the Mutable capability.  The interfaces Readable, Mutable, Ordered can be used for runtime
 * polymorphism across variants.
 *
 * ### Collisions ###
 * A key collision in `set()` (the key is already present with another value) is not an error: the value is
 * replaced.  A value collision (the value is already associated with another key) is resolved per the
 * instance's Collision_policy: rejected (Collision_policy::S_RAISE, error::Code::S_VALUE_DUPLICATE) or resolved by
 * evicting the other association (Collision_policy::S_OVERWRITE).  A rejected operation never modifies anything.
 *
 * ### Thread safety ###
 * As for standard containers: concurrent reads are safe; any write requires external synchronization.
 */
namespace bidi::dict
{

// Types.

/**
 * How a container resolves an attempt to associate a value with a key, while that value is already associated with
 * another key (a *value collision*).  A key collision is never an error for `set()`-like operations.
 *
 * Can be serialized/deserialized via `<<`/`>>` (`"RAISE"`, `"OVERWRITE"`, case-insensitively, or the numeric value);
 * hence usable in boost.program_options-parsed configuration (see Bidict_options).
 */
enum class Collision_policy
{
  /// Strict: reject the operation with error::Code::S_VALUE_DUPLICATE, changing nothing.
  S_RAISE = 0,
  /// Evict the pre-existing association holding the value, then proceed.
  S_OVERWRITE,
  /// Not an actual value but rather stores the highest numerical payload, useful for validity checks.
  S_END_SENTINEL
};

/// Result of decide_on_collision(): what a mutating operation should do given the collision situation.
enum class Collision_decision
{
  /// No value collision (or a key collision only): install the association, replacing the key's old value if any.
  S_PROCEED,
  /// Value collision, resolved by first removing the other association holding the value; then as S_PROCEED.
  S_PROCEED_AFTER_EVICTING_OTHER,
  /// Value collision not allowed by policy: change nothing and fail.
  S_REJECT
};

struct Bidict_options;

template<typename Key, typename Value>
class Readable;
template<typename Key, typename Value>
class Mutable;
template<typename Key, typename Value>
class Ordered;

template<typename Index>
class Basic_bidict;
template<typename Owner>
class Inverse_view;
template<typename Dict>
class Basic_frozen_bidict;

/// Internal implementation details of the dict module.
namespace detail
{

struct Dict_tag;
struct Unordered_tag;

template<typename Key, typename Value, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
class Hashed_dual_index;
template<typename Key, typename Value, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
class Linked_dual_index;

} // namespace detail

/**
 * Unordered bidirectional map.  Iteration order is unspecified (and may change with any mutation).
 *
 * @tparam Key
 *         Key type: copyable; for value-returning lookups (get_key(), `pop()` of the inverse, etc.) also
 *         default-constructible.
 * @tparam Value
 *         Value type: same requirements as `Key`.
 * @tparam Key_hash
 *         Hasher of `Key`.
 * @tparam Key_pred
 *         Equality predicate of `Key`.
 * @tparam Value_hash
 *         Hasher of `Value`.
 * @tparam Value_pred
 *         Equality predicate of `Value`.
 */
template<typename Key, typename Value,
         typename Key_hash = boost::hash<Key>, typename Key_pred = std::equal_to<Key>,
         typename Value_hash = boost::hash<Value>, typename Value_pred = std::equal_to<Value>>
using Bidict = Basic_bidict<detail::Hashed_dual_index<Key, Value, Key_hash, Key_pred, Value_hash, Value_pred>>;

/**
 * Insertion-ordered bidirectional map; see Bidict for template parameters.
 */
template<typename Key, typename Value,
         typename Key_hash = boost::hash<Key>, typename Key_pred = std::equal_to<Key>,
         typename Value_hash = boost::hash<Value>, typename Value_pred = std::equal_to<Value>>
using Ordered_bidict = Basic_bidict<detail::Linked_dual_index<Key, Value, Key_hash, Key_pred, Value_hash, Value_pred>>;

/// Immutable, hashable Bidict; see Bidict for template parameters.
template<typename Key, typename Value,
         typename Key_hash = boost::hash<Key>, typename Key_pred = std::equal_to<Key>,
         typename Value_hash = boost::hash<Value>, typename Value_pred = std::equal_to<Value>>
using Frozen_bidict = Basic_frozen_bidict<Bidict<Key, Value, Key_hash, Key_pred, Value_hash, Value_pred>>;

/// Immutable, hashable Ordered_bidict; see Bidict for template parameters.
template<typename Key, typename Value,
         typename Key_hash = boost::hash<Key>, typename Key_pred = std::equal_to<Key>,
         typename Value_hash = boost::hash<Value>, typename Value_pred = std::equal_to<Value>>
using Frozen_ordered_bidict
  = Basic_frozen_bidict<Ordered_bidict<Key, Value, Key_hash, Key_pred, Value_hash, Value_pred>>;

// Free functions.

/**
 * The collision decision table: given a collision policy and the situation facing a mutating operation, returns what
 * the operation should do.  The decision is made before anything is modified, so a rejection leaves the container
 * unchanged.
 *
 *   | `value_exists_elsewhere` | S_RAISE  | S_OVERWRITE                    |
 *   |--------------------------|----------|--------------------------------|
 *   | `false`                  | S_PROCEED | S_PROCEED                     |
 *   | `true`                   | S_REJECT  | S_PROCEED_AFTER_EVICTING_OTHER |
 *
 * `key_exists` does not change the decision: replacing the value of an existing key is always allowed.  A
 * `policy` outside the enumeration yields S_REJECT.
 *
 * @param policy
 *        The policy in force.
 * @param key_exists
 *        Whether the key being written is already present (with a different value).
 * @param value_exists_elsewhere
 *        Whether the value being written is already associated with a key other than the one being written.
 * @return See above.
 */
Collision_decision decide_on_collision(Collision_policy policy, bool key_exists, bool value_exists_elsewhere);

/**
 * Returns `true` if and only if `policy` is one of the supported policies (not the sentinel, nor an arbitrary
 * integer cast to the `enum`).
 *
 * @param policy
 *        Value to check.
 * @return See above.
 */
bool collision_policy_valid(Collision_policy policy);

/**
 * Serializes a Collision_policy to a standard output stream: `"RAISE"` or `"OVERWRITE"`.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Collision_policy val);

/**
 * Deserializes a Collision_policy from a standard input stream: the `<<` encoding, case-insensitively; or the
 * numeric value.  Anything else yields Collision_policy::S_END_SENTINEL, which validate_options() rejects.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Collision_policy& val);

/**
 * Serializes a Collision_decision to a standard output stream.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Collision_decision val);

} // namespace bidi::dict
