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

#include "bidi/dict/detail/node_handle.hpp"
#include "bidi/util/util_fwd.hpp"
#include <boost/unordered_set.hpp>
#include <cassert>
#include <iterator>
#include <list>
#include <type_traits>
#include <utility>

namespace bidi::dict::detail
{

// Types.

/**
 * The storage of an Ordered_bidict: a doubly linked list of (key, value) associations in traversal order, plus two hash
 * sets of Node_handle, one hashed by key and one by value, each element of which refers to one list node.  This is the
 * linked-hash-map technique with a second hash index, so every operation on an association is O(1) average: lookup
 * by either field; appending; erasing from an arbitrary position; relocating to either end (list splice); and
 * replacing either field in place (which keeps the association's position).
 *
 * This class only stores; it does not decide.  The methods have preconditions (documented on each) about presence of
 * the fields, which Basic_bidict establishes before calling them; in particular nothing here checks for collisions.
 * Hence after any sequence of calls meeting the preconditions: each list node is referred to by exactly one key
 * handle and one value handle; and no key, nor value, appears twice.
 *
 * Many methods are templated on `bool INV`: `INV == false` means the argument named `a` is a key and `b` a value;
 * `INV == true` means the reverse.  Side<INV> and Other<INV> are the corresponding types.  Hashed_dual_index has
 * the same API (minus the order-specific methods), so Basic_bidict is written once for both.
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
class Linked_dual_index
{
public:
  // Types.

  /// Convenience alias for template arg.
  using Key = Key_t;

  /// Convenience alias for template arg.
  using Value = Value_t;

  /// One association as stored.
  using Item = std::pair<Key, Value>;

  /// `Key` if `!INV`, else `Value`.
  template<bool INV>
  using Side = std::conditional_t<INV, Value, Key>;

  /// `Value` if `!INV`, else `Key`.
  template<bool INV>
  using Other = std::conditional_t<INV, Key, Value>;

private:
  // Types.

  /// The list storing the associations in traversal order.
  using Item_list = std::list<Item>;

  /// Short-hand for mutable iterator into #Item_list.
  using List_iterator = typename Item_list::iterator;

  /// Handle by key.
  using Key_handle = Node_handle<Key, List_iterator, false>;

  /// Handle by value.
  using Value_handle = Node_handle<Value, List_iterator, true>;

  /// Hash set of key handles.
  using Key_handle_set = boost::unordered_set<Key_handle, Node_handle_hash<Key_hash>, Node_handle_pred<Key_pred>>;

  /// Hash set of value handles.
  using Value_handle_set
    = boost::unordered_set<Value_handle, Node_handle_hash<Value_hash>, Node_handle_pred<Value_pred>>;

public:
  /// Iterator over the associations in traversal order.
  using Const_iterator = typename Item_list::const_iterator;

  /// Iterator over the associations in reverse traversal order.
  using Const_reverse_iterator = typename Item_list::const_reverse_iterator;

  /// For container compliance (hence the irregular capitalization): the type of `*Const_iterator`.
  using value_type = Item;

  // Constants.

  /// Traversal order is meaningful and stable.
  static constexpr bool S_IS_ORDERED = true;

  /// Human-readable name of the container class using this index, for `operator<<()`.
  static constexpr util::String_view S_CONTAINER_NAME = "Ordered_bidict";

  // Constructors/destructor.

  /**
   * Constructs empty index.
   *
   * @param n_buckets_hint
   *        Initial bucket count of each hash set; 0 means default.
   */
  explicit Linked_dual_index(size_t n_buckets_hint = 0);

  /**
   * Copy-constructs.
   *
   * @param src
   *        Source.
   */
  Linked_dual_index(const Linked_dual_index& src);

  /**
   * Move-constructs; `src` becomes empty.
   *
   * @param src
   *        Source.
   */
  Linked_dual_index(Linked_dual_index&& src);

  // Methods.

  /**
   * Copy-assigns: the associations are copied; the handles are rebuilt to refer to the copies.
   *
   * @param src
   *        Source.
   * @return `*this`.
   */
  Linked_dual_index& operator=(const Linked_dual_index& src);

  /**
   * Move-assigns; `src` becomes empty.
   *
   * @param src
   *        Source.
   * @return `*this`.
   */
  Linked_dual_index& operator=(Linked_dual_index&& src);

  /**
   * Swaps contents with `other` in constant time.  Iterators remain valid, now referring into the other index.
   *
   * @param other
   *        Other index.
   */
  void swap(Linked_dual_index& other);

  /**
   * Returns number of associations.
   * @return See above.
   */
  size_t size() const;

  /**
   * Returns the bucket count of the key-handle hash set.
   * @return See above.
   */
  size_t bucket_count() const;

  /**
   * Returns pointer to the field associated with `a`; or null if `a` is not present.  The pointer is invalidated by
   * any mutating call.
   *
   * @tparam INV
   *         See class doc header.
   * @param a
   *        Key (`!INV`) or value (`INV`).
   * @return See above.
   */
  template<bool INV>
  const Other<INV>* find(const Side<INV>& a) const;

  /**
   * Returns iterator to the association containing `a`; or end() if not present.
   *
   * @tparam INV
   *         See class doc header.
   * @param a
   *        Key (`!INV`) or value (`INV`).
   * @return See above.
   */
  template<bool INV>
  Const_iterator find_item(const Side<INV>& a) const;

  /**
   * Returns the user-supplied predicate's verdict on whether the two keys (`!INV`) or values (`INV`) are equal.
   *
   * @tparam INV
   *         See class doc header.
   * @param x
   *        Operand.
   * @param y
   *        Operand.
   * @return See above.
   */
  template<bool INV>
  bool equal(const Side<INV>& x, const Side<INV>& y) const;

  /**
   * Returns the user-supplied hasher's hash of the key (`!INV`) or value (`INV`).
   *
   * @tparam INV
   *         See class doc header.
   * @param x
   *        Operand.
   * @return See above.
   */
  template<bool INV>
  size_t hash(const Side<INV>& x) const;

  /**
   * Appends the association of `a` and `b` at the back of the order.  Precondition: neither is present.
   *
   * @tparam INV
   *         See class doc header.
   * @param a
   *        Key (`!INV`) or value (`INV`).
   * @param b
   *        Value (`!INV`) or key (`INV`).
   */
  template<bool INV>
  void emplace(const Side<INV>& a, const Other<INV>& b);

  /**
   * Removes the association containing `a`, if present.
   *
   * @tparam INV
   *         See class doc header.
   * @param a
   *        Key (`!INV`) or value (`INV`).
   * @return `true` if and only if it was present.
   */
  template<bool INV>
  bool erase(const Side<INV>& a);

  /**
   * Replaces, in the association containing `a`, the other field with `b`; the association keeps its position.
   * Precondition: `a` is present; `b` is not.
   *
   * @tparam INV
   *         See class doc header.
   * @param a
   *        Key (`!INV`) or value (`INV`).
   * @param b
   *        Value (`!INV`) or key (`INV`).
   */
  template<bool INV>
  void reassign(const Side<INV>& a, const Other<INV>& b);

  /// Removes all associations.
  void clear();

  /**
   * Removes the first association and returns it.  Precondition: not empty.
   * @return See above.
   */
  Item pop_front();

  /**
   * Removes the last association and returns it.  Precondition: not empty.
   * @return See above.
   */
  Item pop_back();

  /**
   * Moves the association containing `a` to the front of the order, if present.
   *
   * @tparam INV
   *         See class doc header.
   * @param a
   *        Key (`!INV`) or value (`INV`).
   * @return `true` if and only if it was present.
   */
  template<bool INV>
  bool move_to_front(const Side<INV>& a);

  /**
   * Moves the association containing `a` to the back of the order, if present.
   *
   * @tparam INV
   *         See class doc header.
   * @param a
   *        Key (`!INV`) or value (`INV`).
   * @return `true` if and only if it was present.
   */
  template<bool INV>
  bool move_to_back(const Side<INV>& a);

  /**
   * Returns the first association.  Precondition: not empty.
   * @return See above.
   */
  const Item& front() const;

  /**
   * Returns the last association.  Precondition: not empty.
   * @return See above.
   */
  const Item& back() const;

  /**
   * Returns iterator to the first association in traversal order.
   * @return See above.
   */
  Const_iterator begin() const;

  /**
   * Returns past-the-end iterator.
   * @return See above.
   */
  Const_iterator end() const;

  /**
   * Returns iterator to the last association, for traversal in reverse order.
   * @return See above.
   */
  Const_reverse_iterator rbegin() const;

  /**
   * Returns reverse past-the-end iterator.
   * @return See above.
   */
  Const_reverse_iterator rend() const;

private:
  // Methods.

  /**
   * Returns the handle set by key (`!INV`) or by value (`INV`).
   *
   * @tparam INV
   *         See class doc header.
   * @return See above.
   */
  template<bool INV>
  const auto& handles() const;

  /**
   * Returns the handle set by key (`!INV`) or by value (`INV`).
   *
   * @tparam INV
   *         See class doc header.
   * @return See above.
   */
  template<bool INV>
  auto& handles();

  /**
   * Returns the key (`!INV`) or value (`INV`) of `item`, `const` or not according to `Item_ref`.
   *
   * @tparam INV
   *         See class doc header.
   * @tparam Item_ref
   *         `Item` or `const Item`.
   * @param item
   *        Association.
   * @return See above.
   */
  template<bool INV, typename Item_ref>
  static auto& field_of(Item_ref& item);

  /// Inserts a handle of each kind for every association in the list; the handle sets must be empty.
  void index_all();

  // Data.

  /// The associations in traversal order.
  Item_list m_items;

  /// Handles, hashed by key, to every element of #m_items.
  Key_handle_set m_key_hndls;

  /// Handles, hashed by value, to every element of #m_items.
  Value_handle_set m_value_hndls;
}; // class Linked_dual_index

// Template implementations.

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::Linked_dual_index
  (size_t n_buckets_hint)
{
  if (n_buckets_hint != 0)
  {
    m_key_hndls.rehash(n_buckets_hint);
    m_value_hndls.rehash(n_buckets_hint);
  }
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::Linked_dual_index
  (const Linked_dual_index& src)
{
  operator=(src);
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::Linked_dual_index
  (Linked_dual_index&& src)
{
  operator=(std::move(src));
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>&
  Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::operator=
    (const Linked_dual_index& src)
{
  if (&src == this)
  {
    return *this;
  }
  // else

  m_items = src.m_items;

  /* The handles in src point into src.m_items, so they're useless to us; build the sets from scratch, with the same
   * bucket count and functors as src's. */
  m_key_hndls = Key_handle_set{src.m_key_hndls.bucket_count(),
                               src.m_key_hndls.hash_function(),
                               src.m_key_hndls.key_eq()};
  m_value_hndls = Value_handle_set{src.m_value_hndls.bucket_count(),
                                   src.m_value_hndls.hash_function(),
                                   src.m_value_hndls.key_eq()};
  index_all();

  return *this;
} // Linked_dual_index::operator=()

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>&
  Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::operator=(Linked_dual_index&& src)
{
  if (&src != this)
  {
    clear();
    swap(src); // Handles keep referring to the same list nodes, which now belong to our list.
  }
  return *this;
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
void Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::swap(Linked_dual_index& other)
{
  using std::swap;

  swap(m_key_hndls, other.m_key_hndls);
  swap(m_value_hndls, other.m_value_hndls);
  swap(m_items, other.m_items);
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
size_t Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::bucket_count() const
{
  return m_key_hndls.bucket_count();
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
size_t Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::size() const
{
  return m_items.size();
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
template<bool INV>
const typename Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::template Other<INV>*
  Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::find(const Side<INV>& a) const
{
  const auto& hndls = handles<INV>();
  const auto hndl_it = hndls.find(a); // Implicitly constructs a lookup handle referring to `a`.
  return (hndl_it == hndls.end()) ? 0 : &(field_of<!INV>(*(hndl_it->iter())));
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
template<bool INV>
typename Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::Const_iterator
  Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::find_item(const Side<INV>& a) const
{
  const auto& hndls = handles<INV>();
  const auto hndl_it = hndls.find(a);
  return (hndl_it == hndls.end()) ? m_items.cend() : Const_iterator(hndl_it->iter());
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
template<bool INV>
bool Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::equal
       (const Side<INV>& x, const Side<INV>& y) const
{
  return handles<INV>().key_eq().field_pred()(x, y);
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
template<bool INV>
size_t Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::hash(const Side<INV>& x) const
{
  return handles<INV>().hash_function().field_hasher()(x);
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
template<bool INV>
void Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::emplace
       (const Side<INV>& a, const Other<INV>& b)
{
  assert((!find<INV>(a)) && (!find<!INV>(b)));

  if constexpr(INV)
  {
    m_items.emplace_back(b, a);
  }
  else
  {
    m_items.emplace_back(a, b);
  }

  const auto list_it = std::prev(m_items.end());
  m_key_hndls.insert(Key_handle(list_it));
  m_value_hndls.insert(Value_handle(list_it));
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
template<bool INV>
bool Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::erase(const Side<INV>& a)
{
  auto& hndls = handles<INV>();
  const auto hndl_it = hndls.find(a);
  if (hndl_it == hndls.end())
  {
    return false;
  }
  // else

  /* Remove both handles before the node: the handles' hashing/comparison dereference the node.  Careful: `a` may well
   * refer into the node itself, so don't touch it after the first erase(). */
  const auto list_it = hndl_it->iter();
  hndls.erase(hndl_it);
  handles<!INV>().erase(field_of<!INV>(*list_it));
  m_items.erase(list_it);
  return true;
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
template<bool INV>
void Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::reassign
       (const Side<INV>& a, const Other<INV>& b)
{
  assert(find<INV>(a) && (!find<!INV>(b)));

  using Other_handle = std::conditional_t<INV, Key_handle, Value_handle>;

  const auto list_it = handles<INV>().find(a)->iter();
  auto& other_hndls = handles<!INV>();

  /* The other-side handle is hashed by the very field we're about to replace, so it must leave the set first and come
   * back after.  The `a` side handle and the node's position in m_items are untouched: hence position is kept. */
  other_hndls.erase(field_of<!INV>(*list_it));
  field_of<!INV>(*list_it) = b;
  other_hndls.insert(Other_handle(list_it));
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
void Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::clear()
{
  m_key_hndls.clear();
  m_value_hndls.clear();
  m_items.clear();
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
typename Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::Item
  Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::pop_front()
{
  assert(!m_items.empty());

  const auto list_it = m_items.begin();
  m_key_hndls.erase(list_it->first);
  m_value_hndls.erase(list_it->second);
  Item item(std::move(*list_it));
  m_items.erase(list_it);
  return item;
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
typename Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::Item
  Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::pop_back()
{
  assert(!m_items.empty());

  const auto list_it = std::prev(m_items.end());
  m_key_hndls.erase(list_it->first);
  m_value_hndls.erase(list_it->second);
  Item item(std::move(*list_it));
  m_items.erase(list_it);
  return item;
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
template<bool INV>
bool Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::move_to_front(const Side<INV>& a)
{
  const auto& hndls = handles<INV>();
  const auto hndl_it = hndls.find(a);
  if (hndl_it == hndls.end())
  {
    return false;
  }
  // else

  // Splicing within the same list invalidates no iterators, so the handles remain correct.
  m_items.splice(m_items.begin(), m_items, hndl_it->iter());
  return true;
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
template<bool INV>
bool Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::move_to_back(const Side<INV>& a)
{
  const auto& hndls = handles<INV>();
  const auto hndl_it = hndls.find(a);
  if (hndl_it == hndls.end())
  {
    return false;
  }
  // else

  m_items.splice(m_items.end(), m_items, hndl_it->iter());
  return true;
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
const typename Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::Item&
  Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::front() const
{
  assert(!m_items.empty());
  return m_items.front();
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
const typename Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::Item&
  Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::back() const
{
  assert(!m_items.empty());
  return m_items.back();
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
typename Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::Const_iterator
  Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::begin() const
{
  return m_items.cbegin();
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
typename Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::Const_iterator
  Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::end() const
{
  return m_items.cend();
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
typename Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::Const_reverse_iterator
  Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::rbegin() const
{
  return m_items.crbegin();
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
typename Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::Const_reverse_iterator
  Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::rend() const
{
  return m_items.crend();
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
template<bool INV>
const auto& Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::handles() const
{
  if constexpr(INV)
  {
    return m_value_hndls;
  }
  else
  {
    return m_key_hndls;
  }
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
template<bool INV>
auto& Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::handles()
{
  if constexpr(INV)
  {
    return m_value_hndls;
  }
  else
  {
    return m_key_hndls;
  }
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
template<bool INV, typename Item_ref>
auto& Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::field_of(Item_ref& item)
{
  if constexpr(INV)
  {
    return item.second;
  }
  else
  {
    return item.first;
  }
}

template<typename Key_t, typename Value_t, typename Key_hash, typename Key_pred, typename Value_hash, typename Value_pred>
void Linked_dual_index<Key_t, Value_t, Key_hash, Key_pred, Value_hash, Value_pred>::index_all()
{
  assert(m_key_hndls.empty() && m_value_hndls.empty());

  const auto list_end_it = m_items.end();
  for (auto list_it = m_items.begin(); list_it != list_end_it; ++list_it)
  {
    m_key_hndls.insert(Key_handle(list_it));
    m_value_hndls.insert(Value_handle(list_it));
  }
}

} // namespace bidi::dict::detail
