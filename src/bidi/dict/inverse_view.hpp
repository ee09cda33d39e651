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
#include "bidi/dict/interfaces.hpp"
#include "bidi/dict/util.hpp"
#include "bidi/dict/detail/traits.hpp"
#include <boost/iterator/transform_iterator.hpp>
#include <initializer_list>
#include <type_traits>
#include <utility>

namespace bidi::dict
{

// Types.

/**
 * The inverse of a bidirectional map: the same associations seen value-to-key.  Obtained from `inverse()` of any
 * bidi::dict container; does not own or copy anything: it holds a pointer to the owning container (which must outlive
 * it), and every operation is the owner's corresponding operation with the roles swapped.  Hence, for an
 * `Inverse_view<Bidict<K, V>>` `inv`: `Key` is `V` and `Value` is `K`; `inv.get(v)` is `owner.get_key(v)`;
 * `inv.set(v, k)` writes the association (k, v) into the owner, under the owner's collision policy, reacting to
 * collisions as a container holding the inverted associations would: a `v` already present is re-keyed, while a `k`
 * already associated with another value is a value collision from the view's side (error::Code::S_VALUE_DUPLICATE
 * under Collision_policy::S_RAISE).  Iteration yields (value, key) pairs in the owner's iteration order.
 * `inv.inverse()` is the owner again.
 *
 * An ordered owner's order is shared, so e.g. `inv.move_to_front(v)` moves the association of `v` in the owner.
 * `owner.inverse().force_set(v, k2)` where `(k1, v)` is present and `k2` is not re-keys `v` to `k2` in place: the
 * association keeps its position.  If `k2` is present too, the association of `k2` is the one that stays (taking
 * `v`), exactly as after `owner.force_set(k2, v)`.
 *
 * Write methods are available only if `Owner` is not `const` (the view of a `const` or frozen container is read-only).
 *
 * @tparam Owner
 *         A Basic_bidict type, possibly `const`.
 */
template<typename Owner>
class Inverse_view :
  public Readable<typename std::remove_const_t<Owner>::Value, typename std::remove_const_t<Owner>::Key>,
  private detail::Dict_tag
{
public:
  // Types.

  /// The owner type without `const`.
  using Dict = std::remove_const_t<Owner>;

  /// Key type of the view: the owner's `Value`.
  using Key = typename Dict::Value;

  /// Value type of the view: the owner's `Key`.
  using Value = typename Dict::Key;

  /// An association of the view, as returned by value.
  using Item = std::pair<Key, Value>;

  /// Iterator over the view's (value, key) associations, in the owner's iteration order.
  using Const_iterator = boost::transform_iterator<detail::Pair_swapper, typename Dict::Const_iterator>;

  /// For container compliance (hence the irregular capitalization): `Key` type.
  using key_type = Key;
  /// For container compliance (hence the irregular capitalization): `Value` type.
  using mapped_type = Value;
  /// For container compliance (hence the irregular capitalization): `*Const_iterator` type.
  using value_type = Item;
  /// For container compliance (hence the irregular capitalization): #Const_iterator type.
  using const_iterator = Const_iterator;
  /// For container compliance (hence the irregular capitalization): same as #Const_iterator.
  using iterator = Const_iterator;

  // Constants.

  /// Same as the owner's.
  static constexpr bool S_IS_ORDERED = Dict::S_IS_ORDERED;

  /// Class name for `operator<<()`.
  static constexpr util::String_view S_CONTAINER_NAME = "Inverse_view";

  // Constructors/destructor.

  /**
   * Constructs view of `*owner`.
   *
   * @param owner
   *        The container; must outlive `*this`.
   */
  explicit Inverse_view(Owner* owner);

  // Methods.

  /**
   * Implements Readable API: the owner's size().
   * @return See above.
   */
  size_t size() const override;

  /**
   * Implements Readable API: the owner's `contains_value(key)`.
   *
   * @param key
   *        See Readable.
   * @return See Readable.
   */
  bool contains(const Key& key) const override;

  /**
   * Implements Readable API: the owner's `contains(value)`.
   *
   * @param value
   *        See Readable.
   * @return See Readable.
   */
  bool contains_value(const Value& value) const override;

  /**
   * Implements Readable API: the owner's `get_key(key)`.
   *
   * @param key
   *        See Readable.
   * @param err_code
   *        See Readable.  Error code generated: error::Code::S_VALUE_NOT_FOUND (in the owner's terms).
   * @return See Readable.
   */
  Value get(const Key& key, Error_code* err_code = 0) const override;

  /**
   * Implements Readable API: the owner's `get(value)`.
   *
   * @param value
   *        See Readable.
   * @param err_code
   *        See Readable.  Error code generated: error::Code::S_KEY_NOT_FOUND (in the owner's terms).
   * @return See Readable.
   */
  Key get_key(const Value& value, Error_code* err_code = 0) const override;

  /**
   * Implements Readable API.
   *
   * @param func
   *        See Readable.
   */
  void for_each(const Function<void (const Key&, const Value&)>& func) const override;

  /**
   * See Basic_bidict::get_or().
   *
   * @param key
   *        Key of the view.
   * @param default_value
   *        Fallback.
   * @return See above.
   */
  Value get_or(const Key& key, const Value& default_value) const;

  /**
   * See Basic_bidict::find().
   *
   * @param key
   *        Key of the view.
   * @return See above.
   */
  Const_iterator find(const Key& key) const;

  /**
   * See Basic_bidict::find_value().
   *
   * @param value
   *        Value of the view.
   * @return See above.
   */
  Const_iterator find_value(const Value& value) const;

  /**
   * See Basic_bidict::begin().
   * @return See above.
   */
  Const_iterator begin() const;

  /**
   * See Basic_bidict::end().
   * @return See above.
   */
  Const_iterator end() const;

  /**
   * Returns reverse iterator to the last (value, key) association.  Ordered owners only.
   * @return See above.
   */
  auto rbegin() const;

  /**
   * Returns reverse past-the-end iterator.  Ordered owners only.
   * @return See above.
   */
  auto rend() const;

  /**
   * Returns a lazy range over the view's keys: the owner's values.
   * @return See above.
   */
  auto keys() const;

  /**
   * Returns a lazy range over the view's values: the owner's keys.
   * @return See above.
   */
  auto values() const;

  /**
   * Returns the owner.
   * @return See above.
   */
  Owner& inverse() const;

  /**
   * Returns the owner's collision policy.
   * @return See above.
   */
  Collision_policy collision_policy() const;

  /**
   * See Basic_bidict::set(); `key` is the owner's value, `value` the owner's key.
   *
   * @param key
   *        Key of the view.
   * @param value
   *        Value of the view.
   * @param err_code
   *        See Basic_bidict::set(), with the roles swapped: error::Code::S_VALUE_DUPLICATE if `value` is already
   *        associated with another key of the view.
   */
  void set(const Key& key, const Value& value, Error_code* err_code = 0);

  /**
   * See Basic_bidict::put().
   *
   * @param key
   *        Key of the view.
   * @param value
   *        Value of the view.
   * @param err_code
   *        See Basic_bidict::put(), with the roles swapped.
   */
  void put(const Key& key, const Value& value, Error_code* err_code = 0);

  /**
   * See Basic_bidict::force_set().
   *
   * @param key
   *        Key of the view.
   * @param value
   *        Value of the view.
   */
  void force_set(const Key& key, const Value& value);

  /**
   * See Basic_bidict::update(); items are (view key, view value) pairs.
   *
   * @tparam Item_range
   *         See Basic_bidict::update().
   * @param items
   *        Associations.
   * @param err_code
   *        See Basic_bidict::update().
   */
  template<typename Item_range>
  void update(const Item_range& items, Error_code* err_code = 0);

  /**
   * See Basic_bidict::update().
   *
   * @param items
   *        Associations.
   * @param err_code
   *        See Basic_bidict::update().
   */
  void update(std::initializer_list<Item> items, Error_code* err_code = 0);

  /**
   * See Basic_bidict::force_update().
   *
   * @tparam Item_range
   *         See Basic_bidict::update().
   * @param items
   *        Associations.
   */
  template<typename Item_range>
  void force_update(const Item_range& items);

  /**
   * The owner's erase_value().
   *
   * @param key
   *        Key of the view.
   * @param err_code
   *        See Basic_bidict::erase_value().
   */
  void erase(const Key& key, Error_code* err_code = 0);

  /**
   * The owner's erase().
   *
   * @param value
   *        Value of the view.
   * @param err_code
   *        See Basic_bidict::erase().
   */
  void erase_value(const Value& value, Error_code* err_code = 0);

  /**
   * See Basic_bidict::pop().
   *
   * @param key
   *        Key of the view.
   * @param err_code
   *        See Basic_bidict::pop().
   * @return See Basic_bidict::pop().
   */
  Value pop(const Key& key, Error_code* err_code = 0);

  /**
   * See Basic_bidict::set_default().
   *
   * @param key
   *        Key of the view.
   * @param value
   *        Value of the view.
   * @param err_code
   *        See Basic_bidict::set_default().
   * @return See Basic_bidict::set_default().
   */
  Value set_default(const Key& key, const Value& value, Error_code* err_code = 0);

  /// The owner's clear().
  void clear();

  /**
   * The owner's pop_first(), swapped.  Ordered owners only.
   *
   * @param err_code
   *        See Basic_bidict::pop_first().
   * @return See Basic_bidict::pop_first().
   */
  Item pop_first(Error_code* err_code = 0);

  /**
   * The owner's pop_last(), swapped.  Ordered owners only.
   *
   * @param err_code
   *        See Basic_bidict::pop_last().
   * @return See Basic_bidict::pop_last().
   */
  Item pop_last(Error_code* err_code = 0);

  /**
   * Moves the association of `key` (an owner's value) to the front.  Ordered owners only.
   *
   * @param key
   *        Key of the view.
   * @param err_code
   *        See Basic_bidict::move_to_front().
   */
  void move_to_front(const Key& key, Error_code* err_code = 0);

  /**
   * Moves the association of `key` (an owner's value) to the back.  Ordered owners only.
   *
   * @param key
   *        Key of the view.
   * @param err_code
   *        See Basic_bidict::move_to_back().
   */
  void move_to_back(const Key& key, Error_code* err_code = 0);

private:
  // Methods.

  /// `static_assert()`s that the owner is writable.  Called by each write method.
  static constexpr void assert_writable();

  // Data.

  /// The owner.
  Owner* m_owner;
}; // class Inverse_view

// Template implementations.

template<typename Owner>
Inverse_view<Owner>::Inverse_view(Owner* owner) :
  m_owner(owner)
{
  // Nothing else.
}

template<typename Owner>
size_t Inverse_view<Owner>::size() const
{
  return m_owner->size();
}

template<typename Owner>
bool Inverse_view<Owner>::contains(const Key& key) const
{
  return m_owner->template contains_directed<true>(key);
}

template<typename Owner>
bool Inverse_view<Owner>::contains_value(const Value& value) const
{
  return m_owner->template contains_directed<false>(value);
}

template<typename Owner>
typename Inverse_view<Owner>::Value Inverse_view<Owner>::get(const Key& key, Error_code* err_code) const
{
  return m_owner->template get_directed<true>(key, err_code);
}

template<typename Owner>
typename Inverse_view<Owner>::Key Inverse_view<Owner>::get_key(const Value& value, Error_code* err_code) const
{
  return m_owner->template get_directed<false>(value, err_code);
}

template<typename Owner>
void Inverse_view<Owner>::for_each(const Function<void (const Key&, const Value&)>& func) const
{
  m_owner->for_each([&](const Value& owner_key, const Key& owner_value) { func(owner_value, owner_key); });
}

template<typename Owner>
typename Inverse_view<Owner>::Value Inverse_view<Owner>::get_or(const Key& key, const Value& default_value) const
{
  return m_owner->template get_or_directed<true>(key, default_value);
}

template<typename Owner>
typename Inverse_view<Owner>::Const_iterator Inverse_view<Owner>::find(const Key& key) const
{
  return Const_iterator(m_owner->template find_directed<true>(key), detail::Pair_swapper());
}

template<typename Owner>
typename Inverse_view<Owner>::Const_iterator Inverse_view<Owner>::find_value(const Value& value) const
{
  return Const_iterator(m_owner->template find_directed<false>(value), detail::Pair_swapper());
}

template<typename Owner>
typename Inverse_view<Owner>::Const_iterator Inverse_view<Owner>::begin() const
{
  return Const_iterator(m_owner->begin(), detail::Pair_swapper());
}

template<typename Owner>
typename Inverse_view<Owner>::Const_iterator Inverse_view<Owner>::end() const
{
  return Const_iterator(m_owner->end(), detail::Pair_swapper());
}

template<typename Owner>
auto Inverse_view<Owner>::rbegin() const
{
  return boost::make_transform_iterator(m_owner->rbegin(), detail::Pair_swapper());
}

template<typename Owner>
auto Inverse_view<Owner>::rend() const
{
  return boost::make_transform_iterator(m_owner->rend(), detail::Pair_swapper());
}

template<typename Owner>
auto Inverse_view<Owner>::keys() const
{
  return m_owner->values();
}

template<typename Owner>
auto Inverse_view<Owner>::values() const
{
  return m_owner->keys();
}

template<typename Owner>
Owner& Inverse_view<Owner>::inverse() const
{
  return *m_owner;
}

template<typename Owner>
Collision_policy Inverse_view<Owner>::collision_policy() const
{
  return m_owner->collision_policy();
}

template<typename Owner>
void Inverse_view<Owner>::set(const Key& key, const Value& value, Error_code* err_code)
{
  assert_writable();
  m_owner->template set_directed<true>(key, value, Dict::Put_mode::S_POLICY, err_code);
}

template<typename Owner>
void Inverse_view<Owner>::put(const Key& key, const Value& value, Error_code* err_code)
{
  assert_writable();
  m_owner->template set_directed<true>(key, value, Dict::Put_mode::S_INSERT_ONLY, err_code);
}

template<typename Owner>
void Inverse_view<Owner>::force_set(const Key& key, const Value& value)
{
  assert_writable();
  m_owner->template set_directed<true>(key, value, Dict::Put_mode::S_FORCE, 0);
}

template<typename Owner>
template<typename Item_range>
void Inverse_view<Owner>::update(const Item_range& items, Error_code* err_code)
{
  assert_writable();
  m_owner->template update_directed<true>(items, Dict::Put_mode::S_POLICY, err_code);
}

template<typename Owner>
void Inverse_view<Owner>::update(std::initializer_list<Item> items, Error_code* err_code)
{
  assert_writable();
  m_owner->template update_directed<true>(items, Dict::Put_mode::S_POLICY, err_code);
}

template<typename Owner>
template<typename Item_range>
void Inverse_view<Owner>::force_update(const Item_range& items)
{
  assert_writable();
  m_owner->template update_directed<true>(items, Dict::Put_mode::S_FORCE, 0);
}

template<typename Owner>
void Inverse_view<Owner>::erase(const Key& key, Error_code* err_code)
{
  assert_writable();
  m_owner->template erase_directed<true>(key, err_code);
}

template<typename Owner>
void Inverse_view<Owner>::erase_value(const Value& value, Error_code* err_code)
{
  assert_writable();
  m_owner->template erase_directed<false>(value, err_code);
}

template<typename Owner>
typename Inverse_view<Owner>::Value Inverse_view<Owner>::pop(const Key& key, Error_code* err_code)
{
  assert_writable();
  return m_owner->template pop_directed<true>(key, err_code);
}

template<typename Owner>
typename Inverse_view<Owner>::Value
  Inverse_view<Owner>::set_default(const Key& key, const Value& value, Error_code* err_code)
{
  assert_writable();
  return m_owner->template set_default_directed<true>(key, value, err_code);
}

template<typename Owner>
void Inverse_view<Owner>::clear()
{
  assert_writable();
  m_owner->clear();
}

template<typename Owner>
typename Inverse_view<Owner>::Item Inverse_view<Owner>::pop_first(Error_code* err_code)
{
  assert_writable();
  auto owner_item = m_owner->pop_first(err_code);
  return Item(std::move(owner_item.second), std::move(owner_item.first));
}

template<typename Owner>
typename Inverse_view<Owner>::Item Inverse_view<Owner>::pop_last(Error_code* err_code)
{
  assert_writable();
  auto owner_item = m_owner->pop_last(err_code);
  return Item(std::move(owner_item.second), std::move(owner_item.first));
}

template<typename Owner>
void Inverse_view<Owner>::move_to_front(const Key& key, Error_code* err_code)
{
  assert_writable();
  m_owner->template move_directed<true>(key, true, err_code);
}

template<typename Owner>
void Inverse_view<Owner>::move_to_back(const Key& key, Error_code* err_code)
{
  assert_writable();
  m_owner->template move_directed<true>(key, false, err_code);
}

template<typename Owner>
constexpr void Inverse_view<Owner>::assert_writable() // Static.
{
  static_assert(!std::is_const_v<Owner>, "The inverse view of a const or frozen container is read-only.");
}

} // namespace bidi::dict
