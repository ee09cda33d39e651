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

#include "bidi/dict/basic_bidict.hpp"
#include "bidi/dict/error/error.hpp"
#include "bidi/error/error.hpp"
#include "bidi/log/log.hpp"
#include <boost/serialization/access.hpp>
#include <boost/serialization/nvp.hpp>
#include <functional>
#include <initializer_list>
#include <utility>

namespace bidi::dict
{

// Types.

/**
 * Immutable, hashable wrapper around a fully built Basic_bidict: Frozen_bidict or Frozen_ordered_bidict.  It owns
 * its `Dict` by value, built once at construction (from items, or by copying/moving in a finished `Dict`), and
 * afterwards never changes.  It implements Readable only; however every write method of `Dict` also exists here
 * (so that generic code can call it) and always fails with error::Code::S_IMMUTABLE, changing nothing.
 *
 * ### Hash ###
 * hash_value() is computed once at construction, from content: the multiset of associations.  It is insensitive
 * to order even for Frozen_ordered_bidict, consistently with equality against an unordered container (which is
 * order-insensitive); two ordered frozen containers with the same items in different orders are unequal, and their
 * hashes are merely allowed (not required) to coincide.  The `std::hash` specialization below and boost::hash (via
 * free function hash_value()) both yield it, so `Basic_frozen_bidict` works as a key of standard and boost
 * unordered containers.
 *
 * ### Thread safety ###
 * Since nothing changes after construction, concurrent reads are safe.
 *
 * @tparam Dict
 *         A Basic_bidict: Bidict or Ordered_bidict.
 */
template<typename Dict>
class Basic_frozen_bidict :
  public Readable<typename Dict::Key, typename Dict::Value>,
  public log::Log_context,
  private detail::Dict_tag
{
public:
  // Types.

  /// Short-hand for the key type.
  using Key = typename Dict::Key;

  /// Short-hand for the value type.
  using Value = typename Dict::Value;

  /// Short-hand for an association returned by value.
  using Item = typename Dict::Item;

  /// Iterator over the associations (in order, if ordered).
  using Const_iterator = typename Dict::Const_iterator;

  /// Read-only inverse view.
  using Const_inverse = Inverse_view<const Dict>;

  /// For container compliance (hence the irregular capitalization): `Key` type.
  using key_type = Key;
  /// For container compliance (hence the irregular capitalization): `Value` type.
  using mapped_type = Value;
  /// For container compliance (hence the irregular capitalization): `*Const_iterator` type.
  using value_type = typename Dict::value_type;
  /// For container compliance (hence the irregular capitalization): #Const_iterator type.
  using const_iterator = Const_iterator;
  /// For container compliance (hence the irregular capitalization): same as #Const_iterator.
  using iterator = Const_iterator;

  // Constants.

  /// Same as `Dict`'s.
  static constexpr bool S_IS_ORDERED = Dict::S_IS_ORDERED;

  /// Class name for `operator<<()`.
  static constexpr util::String_view S_CONTAINER_NAME = S_IS_ORDERED ? "Frozen_ordered_bidict" : "Frozen_bidict";

  // Constructors/destructor.

  /**
   * Constructs empty container.
   *
   * @param logger_ptr
   *        The Logger implementation to use subsequently.  Null allowed.
   */
  explicit Basic_frozen_bidict(log::Logger* logger_ptr = 0);

  /**
   * Constructs container with a copy of the given container's content (and logger, and policy).
   *
   * @param src
   *        Container to freeze.
   */
  explicit Basic_frozen_bidict(const Dict& src);

  /**
   * Constructs container by taking over the given container's content (and logger, and policy).
   *
   * @param src
   *        Container to freeze.  It becomes empty.
   */
  explicit Basic_frozen_bidict(Dict&& src);

  /**
   * Constructs container by applying the given items, as if by `Dict::update()`, to an empty `Dict` with the given
   * policy.  The same errors (and in the same way) as there can result; `*this` is then whatever was built
   * (per-item atomicity) but is still frozen.
   *
   * @param logger_ptr
   *        The Logger implementation to use subsequently.  Null allowed.
   * @param items
   *        Associations.
   * @param policy
   *        Collision policy applied while building.
   * @param err_code
   *        See `Dict::update()`; plus error::Code::S_INVALID_POLICY.
   */
  explicit Basic_frozen_bidict(log::Logger* logger_ptr, std::initializer_list<Item> items,
                               Collision_policy policy = Collision_policy::S_RAISE, Error_code* err_code = 0);

  /**
   * Identical to the other items-constructor but takes any range of pair-like items.
   *
   * @tparam Item_range
   *         Type with `begin()` and `end()` iterating over objects with `first` and `second` members.
   * @param logger_ptr
   *        See above.
   * @param items
   *        See above.
   * @param policy
   *        See above.
   * @param err_code
   *        See above.
   */
  template<typename Item_range>
  explicit Basic_frozen_bidict(log::Logger* logger_ptr, const Item_range& items,
                               Collision_policy policy = Collision_policy::S_RAISE, Error_code* err_code = 0);

  /**
   * Copy constructor.
   * @param src
   *        Source.
   */
  Basic_frozen_bidict(const Basic_frozen_bidict& src) = default;

  /**
   * Move constructor.  `src` is left as an empty frozen container (with a stale hash), which is safe only to destroy.
   * @param src
   *        Source.
   */
  Basic_frozen_bidict(Basic_frozen_bidict&& src) = default;

  /// Disallowed: content never changes after construction.
  Basic_frozen_bidict& operator=(const Basic_frozen_bidict&) = delete;
  /// Disallowed: content never changes after construction.
  Basic_frozen_bidict& operator=(Basic_frozen_bidict&&) = delete;

  // Methods.

  /**
   * Implements Readable API.
   * @return See Readable.
   */
  size_t size() const override;

  /**
   * Implements Readable API.
   *
   * @param key
   *        See Readable.
   * @return See Readable.
   */
  bool contains(const Key& key) const override;

  /**
   * Implements Readable API.
   *
   * @param value
   *        See Readable.
   * @return See Readable.
   */
  bool contains_value(const Value& value) const override;

  /**
   * Implements Readable API.
   *
   * @param key
   *        See Readable.
   * @param err_code
   *        See Readable.
   * @return See Readable.
   */
  Value get(const Key& key, Error_code* err_code = 0) const override;

  /**
   * Implements Readable API.
   *
   * @param value
   *        See Readable.
   * @param err_code
   *        See Readable.
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
   *        Key.
   * @param default_value
   *        Fallback.
   * @return See above.
   */
  Value get_or(const Key& key, const Value& default_value) const;

  /**
   * See Basic_bidict::find().
   *
   * @param key
   *        Key.
   * @return See above.
   */
  Const_iterator find(const Key& key) const;

  /**
   * See Basic_bidict::find_value().
   *
   * @param value
   *        Value.
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
   * See Basic_bidict::keys().
   * @return See above.
   */
  auto keys() const;

  /**
   * See Basic_bidict::values().
   * @return See above.
   */
  auto values() const;

  /**
   * Read-only inverse view.
   * @return See above.
   */
  Const_inverse inverse() const;

  /**
   * Policy with which the content was built.
   * @return See above.
   */
  Collision_policy collision_policy() const;

  /**
   * The frozen `Dict` itself, e.g., to copy it into a mutable container.
   * @return See above.
   */
  const Dict& dict() const;

  /**
   * Content hash; see class doc header.
   * @return See above.
   */
  size_t hash_value() const;

  /**
   * See Basic_bidict::front().  Ordered only.
   * @return See above.
   */
  const value_type& front() const;

  /**
   * See Basic_bidict::back().  Ordered only.
   * @return See above.
   */
  const value_type& back() const;

  /**
   * See Basic_bidict::rbegin().  Ordered only.
   * @return See above.
   */
  auto rbegin() const;

  /**
   * See Basic_bidict::rend().  Ordered only.
   * @return See above.
   */
  auto rend() const;

  /**
   * Fails with error::Code::S_IMMUTABLE.
   *
   * @param key
   *        Ignored.
   * @param value
   *        Ignored.
   * @param err_code
   *        See bidi::Error_code docs for error reporting semantics.
   */
  void set(const Key& key, const Value& value, Error_code* err_code = 0);

  /**
   * Fails with error::Code::S_IMMUTABLE.
   *
   * @param key
   *        Ignored.
   * @param value
   *        Ignored.
   * @param err_code
   *        See set().
   */
  void put(const Key& key, const Value& value, Error_code* err_code = 0);

  /**
   * Fails with error::Code::S_IMMUTABLE.  Unlike Basic_bidict::force_set() it can fail, hence takes `err_code`.
   *
   * @param key
   *        Ignored.
   * @param value
   *        Ignored.
   * @param err_code
   *        See set().
   */
  void force_set(const Key& key, const Value& value, Error_code* err_code = 0);

  /**
   * Fails with error::Code::S_IMMUTABLE.
   *
   * @tparam Item_range
   *         Any.
   * @param items
   *        Ignored.
   * @param err_code
   *        See set().
   */
  template<typename Item_range>
  void update(const Item_range& items, Error_code* err_code = 0);

  /**
   * Fails with error::Code::S_IMMUTABLE.
   *
   * @param items
   *        Ignored.
   * @param err_code
   *        See set().
   */
  void update(std::initializer_list<Item> items, Error_code* err_code = 0);

  /**
   * Fails with error::Code::S_IMMUTABLE.
   *
   * @tparam Item_range
   *         Any.
   * @param items
   *        Ignored.
   * @param err_code
   *        See set().
   */
  template<typename Item_range>
  void force_update(const Item_range& items, Error_code* err_code = 0);

  /**
   * Fails with error::Code::S_IMMUTABLE.
   *
   * @param key
   *        Ignored.
   * @param err_code
   *        See set().
   */
  void erase(const Key& key, Error_code* err_code = 0);

  /**
   * Fails with error::Code::S_IMMUTABLE.
   *
   * @param value
   *        Ignored.
   * @param err_code
   *        See set().
   */
  void erase_value(const Value& value, Error_code* err_code = 0);

  /**
   * Fails with error::Code::S_IMMUTABLE.
   *
   * @param key
   *        Ignored.
   * @param err_code
   *        See set().
   * @return Default-constructed `Value` (if `err_code` is not null).
   */
  Value pop(const Key& key, Error_code* err_code = 0);

  /**
   * Fails with error::Code::S_IMMUTABLE, even if `key` is present (in which case Basic_bidict would not have
   * modified anything either; but the caller intends a write).
   *
   * @param key
   *        Ignored.
   * @param value
   *        Ignored.
   * @param err_code
   *        See set().
   * @return Default-constructed `Value` (if `err_code` is not null).
   */
  Value set_default(const Key& key, const Value& value, Error_code* err_code = 0);

  /**
   * Fails with error::Code::S_IMMUTABLE.
   *
   * @param err_code
   *        See set().
   */
  void clear(Error_code* err_code = 0);

  /**
   * Fails with error::Code::S_IMMUTABLE.
   *
   * @param err_code
   *        See set().
   * @return Default-constructed `Item` (if `err_code` is not null).
   */
  Item pop_first(Error_code* err_code = 0);

  /**
   * Fails with error::Code::S_IMMUTABLE.
   *
   * @param err_code
   *        See set().
   * @return Default-constructed `Item` (if `err_code` is not null).
   */
  Item pop_last(Error_code* err_code = 0);

  /**
   * Fails with error::Code::S_IMMUTABLE.
   *
   * @param key
   *        Ignored.
   * @param err_code
   *        See set().
   */
  void move_to_front(const Key& key, Error_code* err_code = 0);

  /**
   * Fails with error::Code::S_IMMUTABLE.
   *
   * @param key
   *        Ignored.
   * @param err_code
   *        See set().
   */
  void move_to_back(const Key& key, Error_code* err_code = 0);

private:
  // Friends.

  /// Boost.Serialization calls serialize().
  friend class boost::serialization::access;

  // Methods.

  /**
   * Emits (or throws) error::Code::S_IMMUTABLE on behalf of the named write method.
   *
   * @param op_name
   *        Name of the rejected method, for logging.
   * @param err_code
   *        See set().
   */
  void reject_mutation(util::String_view op_name, Error_code* err_code) const;

  /**
   * Boost.Serialization hook: saves or loads the frozen `Dict`; on load recomputes the hash.  Loading is the only
   * way content changes after construction, and it is meant to be done on a freshly constructed object only.
   *
   * @tparam Archive
   *         Boost.Serialization archive type.
   * @param ar
   *        Archive.
   * @param version
   *        Ignored.
   */
  template<typename Archive>
  void serialize(Archive& ar, const unsigned int version);

  // Data.

  /// The content.
  Dict m_dict;

  /// `m_dict.content_hash()`, cached since #m_dict does not change.
  size_t m_hash;
}; // class Basic_frozen_bidict

// Template implementations.

template<typename Dict>
Basic_frozen_bidict<Dict>::Basic_frozen_bidict(log::Logger* logger_ptr) :
  log::Log_context(logger_ptr, Bidi_log_component::S_DICT),
  m_dict(logger_ptr),
  m_hash(m_dict.content_hash())
{
  // Nothing else.
}

template<typename Dict>
Basic_frozen_bidict<Dict>::Basic_frozen_bidict(const Dict& src) :
  log::Log_context(src.get_logger(), Bidi_log_component::S_DICT),
  m_dict(src),
  m_hash(m_dict.content_hash())
{
  BIDI_LOG_TRACE(S_CONTAINER_NAME << " [" << this << "]: Frozen a copy of [" << &src << "]; "
                 "size [" << m_dict.size() << "].");
}

template<typename Dict>
Basic_frozen_bidict<Dict>::Basic_frozen_bidict(Dict&& src) :
  log::Log_context(src.get_logger(), Bidi_log_component::S_DICT),
  m_dict(std::move(src)),
  m_hash(m_dict.content_hash())
{
  BIDI_LOG_TRACE(S_CONTAINER_NAME << " [" << this << "]: Frozen the content of [" << &src << "]; "
                 "size [" << m_dict.size() << "].");
}

template<typename Dict>
Basic_frozen_bidict<Dict>::Basic_frozen_bidict(log::Logger* logger_ptr, std::initializer_list<Item> items,
                                               Collision_policy policy, Error_code* err_code) :
  log::Log_context(logger_ptr, Bidi_log_component::S_DICT),
  m_dict(logger_ptr, items, policy, err_code),
  m_hash(m_dict.content_hash())
{
  // Nothing else.
}

template<typename Dict>
template<typename Item_range>
Basic_frozen_bidict<Dict>::Basic_frozen_bidict(log::Logger* logger_ptr, const Item_range& items,
                                               Collision_policy policy, Error_code* err_code) :
  log::Log_context(logger_ptr, Bidi_log_component::S_DICT),
  m_dict(logger_ptr, items, policy, err_code),
  m_hash(m_dict.content_hash())
{
  // Nothing else.
}

template<typename Dict>
size_t Basic_frozen_bidict<Dict>::size() const
{
  return m_dict.size();
}

template<typename Dict>
bool Basic_frozen_bidict<Dict>::contains(const Key& key) const
{
  return m_dict.contains(key);
}

template<typename Dict>
bool Basic_frozen_bidict<Dict>::contains_value(const Value& value) const
{
  return m_dict.contains_value(value);
}

template<typename Dict>
typename Basic_frozen_bidict<Dict>::Value Basic_frozen_bidict<Dict>::get(const Key& key, Error_code* err_code) const
{
  return m_dict.get(key, err_code);
}

template<typename Dict>
typename Basic_frozen_bidict<Dict>::Key
  Basic_frozen_bidict<Dict>::get_key(const Value& value, Error_code* err_code) const
{
  return m_dict.get_key(value, err_code);
}

template<typename Dict>
void Basic_frozen_bidict<Dict>::for_each(const Function<void (const Key&, const Value&)>& func) const
{
  m_dict.for_each(func);
}

template<typename Dict>
typename Basic_frozen_bidict<Dict>::Value
  Basic_frozen_bidict<Dict>::get_or(const Key& key, const Value& default_value) const
{
  return m_dict.get_or(key, default_value);
}

template<typename Dict>
typename Basic_frozen_bidict<Dict>::Const_iterator Basic_frozen_bidict<Dict>::find(const Key& key) const
{
  return m_dict.find(key);
}

template<typename Dict>
typename Basic_frozen_bidict<Dict>::Const_iterator Basic_frozen_bidict<Dict>::find_value(const Value& value) const
{
  return m_dict.find_value(value);
}

template<typename Dict>
typename Basic_frozen_bidict<Dict>::Const_iterator Basic_frozen_bidict<Dict>::begin() const
{
  return m_dict.begin();
}

template<typename Dict>
typename Basic_frozen_bidict<Dict>::Const_iterator Basic_frozen_bidict<Dict>::end() const
{
  return m_dict.end();
}

template<typename Dict>
auto Basic_frozen_bidict<Dict>::keys() const
{
  return m_dict.keys();
}

template<typename Dict>
auto Basic_frozen_bidict<Dict>::values() const
{
  return m_dict.values();
}

template<typename Dict>
typename Basic_frozen_bidict<Dict>::Const_inverse Basic_frozen_bidict<Dict>::inverse() const
{
  return m_dict.inverse();
}

template<typename Dict>
Collision_policy Basic_frozen_bidict<Dict>::collision_policy() const
{
  return m_dict.collision_policy();
}

template<typename Dict>
const Dict& Basic_frozen_bidict<Dict>::dict() const
{
  return m_dict;
}

template<typename Dict>
size_t Basic_frozen_bidict<Dict>::hash_value() const
{
  return m_hash;
}

template<typename Dict>
const typename Basic_frozen_bidict<Dict>::value_type& Basic_frozen_bidict<Dict>::front() const
{
  return m_dict.front();
}

template<typename Dict>
const typename Basic_frozen_bidict<Dict>::value_type& Basic_frozen_bidict<Dict>::back() const
{
  return m_dict.back();
}

template<typename Dict>
auto Basic_frozen_bidict<Dict>::rbegin() const
{
  return m_dict.rbegin();
}

template<typename Dict>
auto Basic_frozen_bidict<Dict>::rend() const
{
  return m_dict.rend();
}

template<typename Dict>
void Basic_frozen_bidict<Dict>::set(const Key&, const Value&, Error_code* err_code)
{
  reject_mutation("set", err_code);
}

template<typename Dict>
void Basic_frozen_bidict<Dict>::put(const Key&, const Value&, Error_code* err_code)
{
  reject_mutation("put", err_code);
}

template<typename Dict>
void Basic_frozen_bidict<Dict>::force_set(const Key&, const Value&, Error_code* err_code)
{
  reject_mutation("force_set", err_code);
}

template<typename Dict>
template<typename Item_range>
void Basic_frozen_bidict<Dict>::update(const Item_range&, Error_code* err_code)
{
  reject_mutation("update", err_code);
}

template<typename Dict>
void Basic_frozen_bidict<Dict>::update(std::initializer_list<Item>, Error_code* err_code)
{
  reject_mutation("update", err_code);
}

template<typename Dict>
template<typename Item_range>
void Basic_frozen_bidict<Dict>::force_update(const Item_range&, Error_code* err_code)
{
  reject_mutation("force_update", err_code);
}

template<typename Dict>
void Basic_frozen_bidict<Dict>::erase(const Key&, Error_code* err_code)
{
  reject_mutation("erase", err_code);
}

template<typename Dict>
void Basic_frozen_bidict<Dict>::erase_value(const Value&, Error_code* err_code)
{
  reject_mutation("erase_value", err_code);
}

template<typename Dict>
typename Basic_frozen_bidict<Dict>::Value Basic_frozen_bidict<Dict>::pop(const Key&, Error_code* err_code)
{
  reject_mutation("pop", err_code);
  return Value();
}

template<typename Dict>
typename Basic_frozen_bidict<Dict>::Value
  Basic_frozen_bidict<Dict>::set_default(const Key&, const Value&, Error_code* err_code)
{
  reject_mutation("set_default", err_code);
  return Value();
}

template<typename Dict>
void Basic_frozen_bidict<Dict>::clear(Error_code* err_code)
{
  reject_mutation("clear", err_code);
}

template<typename Dict>
typename Basic_frozen_bidict<Dict>::Item Basic_frozen_bidict<Dict>::pop_first(Error_code* err_code)
{
  reject_mutation("pop_first", err_code);
  return Item();
}

template<typename Dict>
typename Basic_frozen_bidict<Dict>::Item Basic_frozen_bidict<Dict>::pop_last(Error_code* err_code)
{
  reject_mutation("pop_last", err_code);
  return Item();
}

template<typename Dict>
void Basic_frozen_bidict<Dict>::move_to_front(const Key&, Error_code* err_code)
{
  reject_mutation("move_to_front", err_code);
}

template<typename Dict>
void Basic_frozen_bidict<Dict>::move_to_back(const Key&, Error_code* err_code)
{
  reject_mutation("move_to_back", err_code);
}

template<typename Dict>
void Basic_frozen_bidict<Dict>::reject_mutation(util::String_view op_name, Error_code* err_code) const
{
  BIDI_ERROR_EXEC_VOID_AND_THROW_ON_ERROR(reject_mutation, op_name, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  BIDI_LOG_INFO(S_CONTAINER_NAME << " [" << this << "]: Rejecting [" << op_name << "()] on immutable container.");
  BIDI_ERROR_EMIT_ERROR(error::Code::S_IMMUTABLE);
}

template<typename Dict>
template<typename Archive>
void Basic_frozen_bidict<Dict>::serialize(Archive& ar, const unsigned int)
{
  ar & boost::serialization::make_nvp("dict", m_dict);
  if (Archive::is_loading::value)
  {
    m_hash = m_dict.content_hash();
  }
}

// Free function implementations.

/**
 * Equivalent to `val.hash_value()`.  Lets boost::hash (and therefore `boost::unordered_*`) hash
 * Basic_frozen_bidict objects.
 *
 * @relatesalso Basic_frozen_bidict
 *
 * @param val
 *        Object.
 * @return See above.
 */
template<typename Dict>
size_t hash_value(const Basic_frozen_bidict<Dict>& val)
{
  return val.hash_value();
}

} // namespace bidi::dict

namespace std
{

/// Lets `std::unordered_*` hash bidi::dict::Basic_frozen_bidict objects: equivalent to `val.hash_value()`.
template<typename Dict>
struct hash<bidi::dict::Basic_frozen_bidict<Dict>>
{
  /**
   * See above.
   *
   * @param val
   *        Object.
   * @return See above.
   */
  size_t operator()(const bidi::dict::Basic_frozen_bidict<Dict>& val) const
  {
    return val.hash_value();
  }
}; // struct hash

} // namespace std
