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
#include "bidi/util/util.hpp"
#include <utility>

namespace bidi::dict
{

// Types.

/**
 * Interface: the read-only capability of a bidirectional map with key type `Key` and value type `Value`.  Implemented
 * by every variant (Bidict, Ordered_bidict, the frozen variants) and by Inverse_view (with the roles swapped, so an
 * `Inverse_view` of a `Bidict<K, V>` is a `Readable<V, K>`).
 *
 * The concrete classes offer more (iteration via iterators, inverse(), etc.), which are not virtual; use this
 * interface where a function must accept any variant through one non-template signature.
 *
 * @tparam Key
 *         Key type.
 * @tparam Value
 *         Value type.
 */
template<typename Key, typename Value>
class Readable :
  public util::Null_interface
{
public:
  // Methods.

  /**
   * Returns number of associations stored.
   * @return See above.
   */
  virtual size_t size() const = 0;

  /**
   * Returns `size() == 0`.
   * @return See above.
   */
  bool empty() const;

  /**
   * Returns `true` if and only if `key` is associated with some value.
   *
   * @param key
   *        Key to look up.
   * @return See above.
   */
  virtual bool contains(const Key& key) const = 0;

  /**
   * Returns `true` if and only if `value` is associated with some key.
   *
   * @param value
   *        Value to look up.
   * @return See above.
   */
  virtual bool contains_value(const Value& value) const = 0;

  /**
   * Returns (a copy of) the value associated with `key`.
   *
   * @param key
   *        Key to look up.
   * @param err_code
   *        See bidi::Error_code docs for error reporting semantics.  Error code generated:
   *        error::Code::S_KEY_NOT_FOUND.
   * @return The value; or default-constructed `Value` on error.
   */
  virtual Value get(const Key& key, Error_code* err_code = 0) const = 0;

  /**
   * Returns (a copy of) the key associated with `value`.
   *
   * @param value
   *        Value to look up.
   * @param err_code
   *        See bidi::Error_code docs for error reporting semantics.  Error code generated:
   *        error::Code::S_VALUE_NOT_FOUND.
   * @return The key; or default-constructed `Key` on error.
   */
  virtual Key get_key(const Value& value, Error_code* err_code = 0) const = 0;

  /**
   * Invokes `func(key, value)` for each association in traversal order.  `func` must not modify `*this`.
   *
   * @param func
   *        Function to invoke.
   */
  virtual void for_each(const Function<void (const Key&, const Value&)>& func) const = 0;
}; // class Readable

/**
 * Interface: the write capability of a bidirectional map.  Implemented by Bidict and Ordered_bidict; not by the
 * frozen variants (which do offer the same-named methods, failing with error::Code::S_IMMUTABLE).
 *
 * @tparam Key
 *         Key type.
 * @tparam Value
 *         Value type.
 */
template<typename Key, typename Value>
class Mutable :
  public util::Null_interface
{
public:
  // Methods.

  /**
   * Associates `key` with `value`, under the collision policy of `*this`.  See Basic_bidict::set().
   *
   * @param key
   *        Key.
   * @param value
   *        Value.
   * @param err_code
   *        See bidi::Error_code docs for error reporting semantics.  Error code generated:
   *        error::Code::S_VALUE_DUPLICATE.
   */
  virtual void set(const Key& key, const Value& value, Error_code* err_code = 0) = 0;

  /**
   * Removes the association of `key`.
   *
   * @param key
   *        Key.
   * @param err_code
   *        See bidi::Error_code docs for error reporting semantics.  Error code generated:
   *        error::Code::S_KEY_NOT_FOUND.
   */
  virtual void erase(const Key& key, Error_code* err_code = 0) = 0;

  /// Removes all associations.
  virtual void clear() = 0;
}; // class Mutable

/**
 * Interface: the traversal-order capability of a bidirectional map: removal at, and relocation to, either end of the
 * order.  Implemented by Ordered_bidict.
 *
 * @tparam Key
 *         Key type.
 * @tparam Value
 *         Value type.
 */
template<typename Key, typename Value>
class Ordered :
  public util::Null_interface
{
public:
  // Methods.

  /**
   * Removes the first association in traversal order and returns it.
   *
   * @param err_code
   *        See bidi::Error_code docs for error reporting semantics.  Error code generated:
   *        error::Code::S_EMPTY.
   * @return The removed association; or default-constructed pair on error.
   */
  virtual std::pair<Key, Value> pop_first(Error_code* err_code = 0) = 0;

  /**
   * Removes the last association in traversal order and returns it.
   *
   * @param err_code
   *        See bidi::Error_code docs for error reporting semantics.  Error code generated:
   *        error::Code::S_EMPTY.
   * @return The removed association; or default-constructed pair on error.
   */
  virtual std::pair<Key, Value> pop_last(Error_code* err_code = 0) = 0;

  /**
   * Moves the association of `key` to the front of the traversal order.
   *
   * @param key
   *        Key.
   * @param err_code
   *        See bidi::Error_code docs for error reporting semantics.  Error code generated:
   *        error::Code::S_KEY_NOT_FOUND.
   */
  virtual void move_to_front(const Key& key, Error_code* err_code = 0) = 0;

  /**
   * Moves the association of `key` to the back of the traversal order.
   *
   * @param key
   *        Key.
   * @param err_code
   *        See bidi::Error_code docs for error reporting semantics.  Error code generated:
   *        error::Code::S_KEY_NOT_FOUND.
   */
  virtual void move_to_back(const Key& key, Error_code* err_code = 0) = 0;
}; // class Ordered

// Template implementations.

template<typename Key, typename Value>
bool Readable<Key, Value>::empty() const
{
  return size() == 0;
}

} // namespace bidi::dict
