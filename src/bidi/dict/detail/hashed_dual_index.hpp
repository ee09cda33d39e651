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
#include "bidi/util/util_fwd.hpp"
#include <boost/unordered_map.hpp>
#include <cassert>
#include <type_traits>
#include <utility>

namespace bidi::dict::detail
{

// Types.

/**
 * The storage of a Bidict: two hash maps, key to value and value to key, kept mirror images of each other.  Same API
 * and same preconditions-instead-of-checks approach as Linked_dual_index (see its doc header, including the meaning of
 * `INV`), minus the order-specific methods; iteration is over the forward map, so its order is unspecified.
 *
 * @tparam Key_t
 *         See Bidict.
 * @tparam Value_t
 *         See Bidict.
 * @tparam Key_hash
 *         See Bidict.
 * @tparam Key_pred
 *         See Bidict.
 * @tparam Value_hash
 *         See Bidict.
 * @tparam Value_pred
 *         See Bidict.
 */
template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
class Hashed_dual_index
{
public:
  // Types.

  /// Convenience alias for template arg.
  using Key = Key_t;

  /// Convenience alias for template arg.
  using Value = Value_t;

  /// `Key` if `!INV`, else `Value`.
  template<bool INV>
  using Side = std::conditional_t<INV, Value, Key>;

  /// `Value` if `!INV`, else `Key`.
  template<bool INV>
  using Other = std::conditional_t<INV, Key, Value>;

private:
  // Types.

  /// Key to value.
  using Fwd_map = boost::unordered_map<Key, Value, Key_hash, Key_pred>;

  /// Value to key.
  using Inv_map = boost::unordered_map<Value, Key, Value_hash, Value_pred>;

public:
  /// Iterator over the associations (in unspecified order).
  using Const_iterator = typename Fwd_map::const_iterator;

  /// For container compliance (hence the irregular capitalization): the type of `*Const_iterator`.
  using value_type = typename Fwd_map::value_type;

  // Constants.

  /// Traversal order is unspecified.
  static constexpr bool S_IS_ORDERED = false;

  /// Human-readable name of the container class using this index, for `operator<<()`.
  static constexpr util::String_view S_CONTAINER_NAME = "Bidict";

  // Constructors/destructor.

  /**
   * Constructs empty index.
   *
   * @param n_buckets_hint
   *        Initial bucket count of each hash map; 0 means default.
   */
  explicit Hashed_dual_index(size_t n_buckets_hint = 0);

  // Methods.

  /**
   * Swaps contents with `other` in constant time.
   *
   * @param other
   *        Other index.
   */
  void swap(Hashed_dual_index& other);

  /**
   * Returns number of associations.
   * @return See above.
   */
  size_t size() const;

  /**
   * Returns the bucket count of the key-side hash map (the value side's is kept the same until they diverge through
   * growth).
   * @return See above.
   */
  size_t bucket_count() const;

  /**
   * See Linked_dual_index::find().
   *
   * @tparam INV
   *         See Linked_dual_index.
   * @param a
   *        See Linked_dual_index::find().
   * @return See Linked_dual_index::find().
   */
  template<bool INV>
  const Other<INV>* find(const Side<INV>& a) const;

  /**
   * See Linked_dual_index::find_item().  For `INV == true` this costs two lookups, not one.
   *
   * @tparam INV
   *         See Linked_dual_index.
   * @param a
   *        See Linked_dual_index::find_item().
   * @return See Linked_dual_index::find_item().
   */
  template<bool INV>
  Const_iterator find_item(const Side<INV>& a) const;

  /**
   * See Linked_dual_index::equal().
   *
   * @tparam INV
   *         See Linked_dual_index.
   * @param x
   *        Operand.
   * @param y
   *        Operand.
   * @return See Linked_dual_index::equal().
   */
  template<bool INV>
  bool equal(const Side<INV>& x, const Side<INV>& y) const;

  /**
   * See Linked_dual_index::hash().
   *
   * @tparam INV
   *         See Linked_dual_index.
   * @param x
   *        Operand.
   * @return See Linked_dual_index::hash().
   */
  template<bool INV>
  size_t hash(const Side<INV>& x) const;

  /**
   * See Linked_dual_index::emplace(); except there is no position.
   *
   * @tparam INV
   *         See Linked_dual_index.
   * @param a
   *        See Linked_dual_index::emplace().
   * @param b
   *        See Linked_dual_index::emplace().
   */
  template<bool INV>
  void emplace(const Side<INV>& a, const Other<INV>& b);

  /**
   * See Linked_dual_index::erase().
   *
   * @tparam INV
   *         See Linked_dual_index.
   * @param a
   *        See Linked_dual_index::erase().
   * @return See Linked_dual_index::erase().
   */
  template<bool INV>
  bool erase(const Side<INV>& a);

  /**
   * See Linked_dual_index::reassign(); except there is no position.
   *
   * @tparam INV
   *         See Linked_dual_index.
   * @param a
   *        See Linked_dual_index::reassign().
   * @param b
   *        See Linked_dual_index::reassign().
   */
  template<bool INV>
  void reassign(const Side<INV>& a, const Other<INV>& b);

  /// Removes all associations.
  void clear();

  /**
   * Returns iterator to the first association (in unspecified order).
   * @return See above.
   */
  Const_iterator begin() const;

  /**
   * Returns past-the-end iterator.
   * @return See above.
   */
  Const_iterator end() const;

private:
  // Methods.

  /**
   * Returns #m_fwd (`!INV`) or #m_inv (`INV`).
   *
   * @tparam INV
   *         See Linked_dual_index.
   * @return See above.
   */
  template<bool INV>
  const auto& map() const;

  /**
   * Returns #m_fwd (`!INV`) or #m_inv (`INV`).
   *
   * @tparam INV
   *         See Linked_dual_index.
   * @return See above.
   */
  template<bool INV>
  auto& map();

  // Data.

  /// Key to value.  Always the mirror image of #m_inv.
  Fwd_map m_fwd;

  /// Value to key.  Always the mirror image of #m_fwd.
  Inv_map m_inv;
}; // class Hashed_dual_index

// Template implementations.

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
Hashed_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::Hashed_dual_index
  (size_t n_buckets_hint)
{
  if (n_buckets_hint != 0)
  {
    m_fwd.rehash(n_buckets_hint);
    m_inv.rehash(n_buckets_hint);
  }
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
void Hashed_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::swap(Hashed_dual_index& other)
{
  using std::swap;

  swap(m_fwd, other.m_fwd);
  swap(m_inv, other.m_inv);
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
size_t Hashed_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::bucket_count() const
{
  return m_fwd.bucket_count();
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
size_t Hashed_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::size() const
{
  assert(m_fwd.size() == m_inv.size());
  return m_fwd.size();
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
template<bool INV>
const typename Hashed_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::template Other<INV>*
  Hashed_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::find(const Side<INV>& a) const
{
  const auto& side_map = map<INV>();
  const auto it = side_map.find(a);
  return (it == side_map.end()) ? 0 : &it->second;
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
template<bool INV>
typename Hashed_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::Const_iterator
  Hashed_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::find_item(const Side<INV>& a) const
{
  if constexpr(INV)
  {
    const auto inv_it = m_inv.find(a);
    return (inv_it == m_inv.end()) ? m_fwd.end() : m_fwd.find(inv_it->second);
  }
  else
  {
    return m_fwd.find(a);
  }
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
template<bool INV>
bool Hashed_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::equal
       (const Side<INV>& x, const Side<INV>& y) const
{
  return map<INV>().key_eq()(x, y);
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
template<bool INV>
size_t Hashed_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::hash(const Side<INV>& x) const
{
  return map<INV>().hash_function()(x);
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
template<bool INV>
void Hashed_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::emplace
       (const Side<INV>& a, const Other<INV>& b)
{
  assert((!find<INV>(a)) && (!find<!INV>(b)));

  map<INV>().emplace(a, b);
  map<!INV>().emplace(b, a);
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
template<bool INV>
bool Hashed_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::erase(const Side<INV>& a)
{
  auto& side_map = map<INV>();
  const auto it = side_map.find(a);
  if (it == side_map.end())
  {
    return false;
  }
  // else

  // Mirror entry first: `a` may refer into *it.
  map<!INV>().erase(it->second);
  side_map.erase(it);
  return true;
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
template<bool INV>
void Hashed_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::reassign
       (const Side<INV>& a, const Other<INV>& b)
{
  assert(find<INV>(a) && (!find<!INV>(b)));

  auto& side_map = map<INV>();
  auto& other_map = map<!INV>();
  const auto it = side_map.find(a);

  /* Add the new mirror entry before removing the old one: if the former throws (allocation), nothing has changed.
   * it->first is a stable copy of `a`, unlike `a` itself (which may be the caller's reference into other_map). */
  other_map.emplace(b, it->first);
  other_map.erase(it->second);
  it->second = b;
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
void Hashed_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::clear()
{
  m_fwd.clear();
  m_inv.clear();
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
typename Hashed_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::Const_iterator
  Hashed_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::begin() const
{
  return m_fwd.cbegin();
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
typename Hashed_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::Const_iterator
  Hashed_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::end() const
{
  return m_fwd.cend();
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
template<bool INV>
const auto& Hashed_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::map() const
{
  if constexpr(INV)
  {
    return m_inv;
  }
  else
  {
    return m_fwd;
  }
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
template<bool INV>
auto& Hashed_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::map()
{
  if constexpr(INV)
  {
    return m_inv;
  }
  else
  {
    return m_fwd;
  }
}

} // namespace bidi::dict::detail
