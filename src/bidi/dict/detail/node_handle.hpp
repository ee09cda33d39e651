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
#include <variant>

namespace bidi::dict::detail
{

// Types.

/**
 * The element type of each of the two hash sets in a Linked_dual_index: a handle to one field (key or value) of an
 * association stored in the index's `std::list`.  The hash set is hashed and compared by the field, but stores only a
 * list iterator, so each association is stored exactly once, in the list, and is reachable in O(1) from either field.
 *
 * A handle is in one of two states:
 *   - Stored in a hash set: holds an `Iterator` into the list; field() is the field of the pointed-to `std::pair`.
 *   - Used as a lookup argument (`set.find(field)`, via the implicit constructor from `const Field&`): holds a
 *     pointer to the user's field object, valid only for the duration of that lookup.
 *
 * Node_handle_hash and Node_handle_pred adapt the user's hasher and predicate to this type.
 *
 * @tparam Field_t
 *         Type of the field: `Key` or `Value`.
 * @tparam Iterator_t
 *         List iterator type; `*it` is `std::pair<Key, Value>`.
 * @tparam IS_SECOND
 *         `false` if the field is `pair::first` (key handle); `true` if `pair::second` (value handle).
 */
template<typename Field_t, typename Iterator_t, bool IS_SECOND>
class Node_handle
{
public:
  // Types.

  /// Convenience alias for template arg.
  using Field = Field_t;

  /// Convenience alias for template arg.
  using Iterator = Iterator_t;

  // Constants.

  /// Convenience alias for template arg.
  static constexpr bool S_IS_SECOND = IS_SECOND;

  // Constructors/destructor.

  /**
   * Constructs a lookup handle referring to `field`, which must remain valid while `*this` exists.
   *
   * @param field
   *        Field to which to refer.
   */
  Node_handle(const Field& field);

  /**
   * Constructs a stored handle referring to the association at `it`.
   *
   * @param it
   *        List iterator to association.
   */
  Node_handle(const Iterator& it);

  // Methods.

  /**
   * Returns reference to the field, whichever state `*this` is in.
   * @return See above.
   */
  const Field& field() const;

  /**
   * Returns the list iterator; behavior undefined if `*this` is a lookup handle.
   * @return See above.
   */
  Iterator iter() const;

private:
  // Types.

  /// Short-hand for pointer to the field in the lookup state.
  using Field_ptr = Field const *;

  // Data.

  /// Either a pointer to an external field (lookup state) or iterator to the association (stored state).
  std::variant<Field_ptr, Iterator> m_hndl;
}; // class Node_handle

/**
 * Hasher of Node_handle objects in terms of the user's hasher of the field type.
 *
 * @tparam Hash
 *         Hasher of Node_handle::Field.
 */
template<typename Hash>
class Node_handle_hash :
  private Hash
{
public:
  // Constructors/destructor.

  /**
   * Saves a copy of the field hasher.
   *
   * @param hasher
   *        Field hasher.
   */
  Node_handle_hash(const Hash& hasher = Hash{});

  // Methods.

  /**
   * Returns the field hasher's hash of `hndl.field()`.
   *
   * @tparam Node_handle_t
   *         Node_handle type.
   * @param hndl
   *        Handle.
   * @return See above.
   */
  template<typename Node_handle_t>
  size_t operator()(const Node_handle_t& hndl) const;

  /**
   * Returns the stored field hasher.
   * @return See above.
   */
  const Hash& field_hasher() const;
}; // class Node_handle_hash

/**
 * Equality predicate of Node_handle objects in terms of the user's predicate of the field type.
 *
 * @tparam Pred
 *         Equality predicate of Node_handle::Field.
 */
template<typename Pred>
class Node_handle_pred :
  private Pred
{
public:
  // Constructors/destructor.

  /**
   * Saves a copy of the field predicate.
   *
   * @param pred
   *        Field predicate.
   */
  Node_handle_pred(const Pred& pred = Pred{});

  // Methods.

  /**
   * Returns the field predicate's verdict on `lhs.field()` and `rhs.field()`.
   *
   * @tparam Node_handle_t
   *         Node_handle type.
   * @param lhs
   *        Handle.
   * @param rhs
   *        Handle.
   * @return See above.
   */
  template<typename Node_handle_t>
  bool operator()(const Node_handle_t& lhs, const Node_handle_t& rhs) const;

  /**
   * Returns the stored field predicate.
   * @return See above.
   */
  const Pred& field_pred() const;
}; // class Node_handle_pred

// Template implementations.

template<typename Field_t, typename Iterator_t, bool IS_SECOND>
Node_handle<Field_t, Iterator_t, IS_SECOND>::Node_handle(const Field& field) :
  m_hndl(&field)
{
  // Nothing else.
}

template<typename Field_t, typename Iterator_t, bool IS_SECOND>
Node_handle<Field_t, Iterator_t, IS_SECOND>::Node_handle(const Iterator& it) :
  m_hndl(it)
{
  // Nothing else.
}

template<typename Field_t, typename Iterator_t, bool IS_SECOND>
const Field_t& Node_handle<Field_t, Iterator_t, IS_SECOND>::field() const
{
  using std::holds_alternative;
  using std::get;

  if (holds_alternative<Field_ptr>(m_hndl))
  {
    return *(get<Field_ptr>(m_hndl));
  }
  // else

  if constexpr(S_IS_SECOND)
  {
    return get<Iterator>(m_hndl)->second;
  }
  else
  {
    return get<Iterator>(m_hndl)->first;
  }
}

template<typename Field_t, typename Iterator_t, bool IS_SECOND>
Iterator_t Node_handle<Field_t, Iterator_t, IS_SECOND>::iter() const
{
  return std::get<Iterator>(m_hndl);
}

template<typename Hash>
Node_handle_hash<Hash>::Node_handle_hash(const Hash& hasher) :
  Hash(hasher) // Empty Base-class Optimization (EBO) applies to the typical stateless hasher.
{
  // Nothing else.
}

template<typename Hash>
template<typename Node_handle_t>
size_t Node_handle_hash<Hash>::operator()(const Node_handle_t& hndl) const
{
  return this->Hash::operator()(hndl.field());
}

template<typename Hash>
const Hash& Node_handle_hash<Hash>::field_hasher() const
{
  return *this;
}

template<typename Pred>
Node_handle_pred<Pred>::Node_handle_pred(const Pred& pred) :
  Pred(pred) // Same deal as Node_handle_hash.
{
  // Nothing else.
}

template<typename Pred>
template<typename Node_handle_t>
bool Node_handle_pred<Pred>::operator()(const Node_handle_t& lhs, const Node_handle_t& rhs) const
{
  return this->Pred::operator()(lhs.field(), rhs.field());
}

template<typename Pred>
const Pred& Node_handle_pred<Pred>::field_pred() const
{
  return *this;
}

} // namespace bidi::dict::detail
