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
#include "bidi/dict/inverse_view.hpp"
#include "bidi/dict/options.hpp"
#include "bidi/dict/util.hpp"
#include "bidi/dict/detail/traits.hpp"
#include "bidi/dict/error/error.hpp"
#include "bidi/error/error.hpp"
#include "bidi/log/log.hpp"
#include <boost/functional/hash.hpp>
#include <boost/range/adaptor/map.hpp>
#include <initializer_list>
#include <type_traits>
#include <utility>

namespace bidi::dict
{

// Types.

/**
 * The bidirectional map engine: a set of (key, value) associations in which no key, and no value, appears twice,
 * offering average O(1) lookup by key, by value (get_key(), or any method of inverse()), insertion, and removal.
 * Normally used via its aliases Bidict (unordered) and Ordered_bidict (insertion-ordered); see the namespace
 * bidi::dict doc header for an overview.
 *
 * ### Writes and collisions ###
 * Every write is decided before anything is modified: it either commits fully, leaving both directions (and the
 * order) consistent, or fails and changes nothing at all.  Failure is reported per bidi::Error_code semantics: if
 * `err_code` is null, bidi::error::Runtime_error is thrown; else `*err_code` is set (and a neutral value returned).
 * In either case a WARNING is logged.
 *
 * set(k, v):
 *   - `(k, v)` already present: no-op.
 *   - `k` present (with another value), `v` not: `k`'s value is replaced.  (Ordered: position kept.)
 *   - `v` present (with another key `k2`): a *value collision*: resolved per collision_policy():
 *     - Collision_policy::S_RAISE: fails with error::Code::S_VALUE_DUPLICATE.
 *     - Collision_policy::S_OVERWRITE: `(k2, v)` is evicted first.  If `k` was not present, then in effect `v` is
 *       re-keyed from `k2` to `k`; in an Ordered_bidict the association keeps `(k2, v)`'s position.  If `k` was
 *       present too, `(k, old value)` becomes `(k, v)` in place, and `(k2, v)` is simply removed.
 *   - Neither present: `(k, v)` is added (ordered: at the back).
 *
 * force_set() is set() with S_OVERWRITE for the one call; put() is insert-only (fails on any collision, key or value).
 * The same operations exist on inverse() with the roles swapped: there `v` plays the key, so under S_RAISE
 * `b.inverse().set(v, k)` fails if `k` is present with another value.  Whatever the direction, a write that finds
 * both sides present in different associations keeps the one holding the key `k`, so the resulting state (order
 * included) does not depend on the direction.  `b.inverse().force_set(v, k)` re-keys `v` in place if only `v` is
 * present.
 *
 * ### Copying, comparing, printing ###
 * Copyable, movable, swappable; a copy is independent and carries the same policy and logger.  `==` compares with any
 * bidi::dict type or plain map (see `operator==()`); `<<` prints `Bidict({k: v, ...})` if the types are printable.
 *
 * ### Thread safety ###
 * As for standard containers.
 *
 * @tparam Index
 *         detail::Hashed_dual_index or detail::Linked_dual_index.
 */
template<typename Index>
class Basic_bidict :
  public Readable<typename Index::Key, typename Index::Value>,
  public Mutable<typename Index::Key, typename Index::Value>,
  public std::conditional_t<Index::S_IS_ORDERED,
                            Ordered<typename Index::Key, typename Index::Value>,
                            detail::Unordered_tag>,
  public log::Log_context,
  private detail::Dict_tag
{
public:
  // Types.

  /// Key type.
  using Key = typename Index::Key;

  /// Value type.
  using Value = typename Index::Value;

  /// An association, as returned by value (e.g., by pop_first()).
  using Item = std::pair<Key, Value>;

  /// Iterator over the associations (`const` only: associations are modified only through the API).
  using Const_iterator = typename Index::Const_iterator;

  /// Inverse view of a mutable container.
  using Inverse = Inverse_view<Basic_bidict>;

  /// Inverse view of a `const` container.
  using Const_inverse = Inverse_view<const Basic_bidict>;

  /// For container compliance (hence the irregular capitalization): `Key` type.
  using key_type = Key;
  /// For container compliance (hence the irregular capitalization): `Value` type.
  using mapped_type = Value;
  /// For container compliance (hence the irregular capitalization): `*Const_iterator` type.
  using value_type = typename Index::value_type;
  /// For container compliance (hence the irregular capitalization): #Const_iterator type.
  using const_iterator = Const_iterator;
  /// For container compliance (hence the irregular capitalization): same as #Const_iterator.
  using iterator = Const_iterator;

  // Constants.

  /// `true` for Ordered_bidict: traversal order is meaningful; the Ordered capability is implemented.
  static constexpr bool S_IS_ORDERED = Index::S_IS_ORDERED;

  /// Class name for `operator<<()`.
  static constexpr util::String_view S_CONTAINER_NAME = Index::S_CONTAINER_NAME;

  // Constructors/destructor.

  /**
   * Constructs empty container.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging; null means no logging.
   * @param policy
   *        Collision policy.
   * @param err_code
   *        See bidi::Error_code docs for error reporting semantics.  Error code generated:
   *        error::Code::S_INVALID_POLICY (`policy` is not a supported policy; the container is usable, with
   *        Collision_policy::S_RAISE).
   */
  explicit Basic_bidict(log::Logger* logger_ptr = 0, Collision_policy policy = Collision_policy::S_RAISE,
                        Error_code* err_code = 0);

  /**
   * Constructs empty container, configured by `opts`.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging; null means no logging.
   * @param opts
   *        Options, checked by validate_options().
   * @param err_code
   *        See bidi::Error_code docs for error reporting semantics.  Error codes generated:
   *        error::Code::S_INVALID_POLICY, error::Code::S_INVALID_OPTION (the container is usable, with default
   *        options).
   */
  explicit Basic_bidict(log::Logger* logger_ptr, const Bidict_options& opts, Error_code* err_code = 0);

  /**
   * Constructs container, then applies set() to each of `items` in order, as update() does.  Hence a key appearing
   * twice ends up with the later value; a value appearing twice with two keys fails under
   * Collision_policy::S_RAISE, while under Collision_policy::S_OVERWRITE the later key wins.
   *
   * @param logger_ptr
   *        See other constructors.
   * @param items
   *        Associations.
   * @param policy
   *        See other constructors.
   * @param err_code
   *        See bidi::Error_code docs for error reporting semantics.  Error codes generated:
   *        error::Code::S_INVALID_POLICY, error::Code::S_VALUE_DUPLICATE (the container holds the items preceding
   *        the offending one).
   */
  explicit Basic_bidict(log::Logger* logger_ptr, std::initializer_list<Item> items,
                        Collision_policy policy = Collision_policy::S_RAISE, Error_code* err_code = 0);

  /**
   * Constructs container from a range of pairs; same as the `initializer_list` overload otherwise.  In particular
   * `Ordered_bidict(logger, some_bidict)` and `Bidict(logger, some_std_map)` work.
   *
   * @tparam Item_range
   *         Range whose elements have `first` and `second` convertible to `Key` and `Value`.
   * @param logger_ptr
   *        See other constructors.
   * @param items
   *        Associations.
   * @param policy
   *        See other constructors.
   * @param err_code
   *        See `initializer_list` overload.
   */
  template<typename Item_range>
  explicit Basic_bidict(log::Logger* logger_ptr, const Item_range& items,
                        Collision_policy policy = Collision_policy::S_RAISE, Error_code* err_code = 0);

  /**
   * Copy-constructs: same associations (and order), policy, logger.
   *
   * @param src
   *        Source.
   */
  Basic_bidict(const Basic_bidict& src) = default;

  /**
   * Move-constructs; `src` becomes empty.
   *
   * @param src
   *        Source.
   */
  Basic_bidict(Basic_bidict&& src) = default;

  // Methods.

  /**
   * Copy-assigns.
   *
   * @param src
   *        Source.
   * @return `*this`.
   */
  Basic_bidict& operator=(const Basic_bidict& src) = default;

  /**
   * Move-assigns.
   *
   * @param src
   *        Source.
   * @return `*this`.
   */
  Basic_bidict& operator=(Basic_bidict&& src) = default;

  /**
   * Associates `key` with `value`; see class doc header for the full semantics.
   *
   * @param key
   *        Key.
   * @param value
   *        Value.
   * @param err_code
   *        See bidi::Error_code docs for error reporting semantics.  Error code generated:
   *        error::Code::S_VALUE_DUPLICATE (only under Collision_policy::S_RAISE).
   */
  void set(const Key& key, const Value& value, Error_code* err_code = 0) override;

  /**
   * Insert-only: adds `(key, value)`, failing if either is already present in another association, regardless of
   * collision_policy().  Same-pair is a no-op.
   *
   * @param key
   *        Key.
   * @param value
   *        Value.
   * @param err_code
   *        See bidi::Error_code docs for error reporting semantics.  Error codes generated:
   *        error::Code::S_KEY_DUPLICATE (checked first), error::Code::S_VALUE_DUPLICATE.
   */
  void put(const Key& key, const Value& value, Error_code* err_code = 0);

  /**
   * Same as set() but with Collision_policy::S_OVERWRITE regardless of collision_policy(); hence never fails.
   *
   * @param key
   *        Key.
   * @param value
   *        Value.
   */
  void force_set(const Key& key, const Value& value);

  /**
   * Applies set() to each of `items` in order, stopping at the first failure.  Each pair's effect is all-or-nothing,
   * but the batch is not: on failure the pairs preceding the offending one remain applied.
   *
   * @tparam Item_range
   *         Range whose elements have `first` and `second` convertible to `Key` and `Value`.
   * @param items
   *        Associations.
   * @param err_code
   *        See bidi::Error_code docs for error reporting semantics.  Error code generated:
   *        error::Code::S_VALUE_DUPLICATE.
   */
  template<typename Item_range>
  void update(const Item_range& items, Error_code* err_code = 0);

  /**
   * Same as the other update() but for an `initializer_list`, e.g., `b.update({ { "a", 1 }, { "b", 2 } })`.
   *
   * @param items
   *        Associations.
   * @param err_code
   *        See other update().
   */
  void update(std::initializer_list<Item> items, Error_code* err_code = 0);

  /**
   * Applies force_set() to each of `items` in order.
   *
   * @tparam Item_range
   *         See update().
   * @param items
   *        Associations.
   */
  template<typename Item_range>
  void force_update(const Item_range& items);

  /**
   * Removes the association of `key`.
   *
   * @param key
   *        Key.
   * @param err_code
   *        See bidi::Error_code docs for error reporting semantics.  Error code generated:
   *        error::Code::S_KEY_NOT_FOUND.
   */
  void erase(const Key& key, Error_code* err_code = 0) override;

  /**
   * Removes the association of `value`.
   *
   * @param value
   *        Value.
   * @param err_code
   *        See bidi::Error_code docs for error reporting semantics.  Error code generated:
   *        error::Code::S_VALUE_NOT_FOUND.
   */
  void erase_value(const Value& value, Error_code* err_code = 0);

  /**
   * Removes the association of `key` and returns its value.
   *
   * @param key
   *        Key.
   * @param err_code
   *        See bidi::Error_code docs for error reporting semantics.  Error code generated:
   *        error::Code::S_KEY_NOT_FOUND.
   * @return The value; or default-constructed `Value` on error.
   */
  Value pop(const Key& key, Error_code* err_code = 0);

  /**
   * If `key` is present returns its value; else performs `set(key, value)` and returns `value`.
   *
   * @param key
   *        Key.
   * @param value
   *        Value to set if `key` is not present.
   * @param err_code
   *        See bidi::Error_code docs for error reporting semantics.  Error code generated:
   *        error::Code::S_VALUE_DUPLICATE.
   * @return See above; or default-constructed `Value` on error.
   */
  Value set_default(const Key& key, const Value& value, Error_code* err_code = 0);

  /// Removes all associations.
  void clear() override;

  /**
   * Swaps everything (associations, policy, logger) with `other` in constant time.
   *
   * @param other
   *        Other container.
   */
  void swap(Basic_bidict& other);

  /**
   * Implements Readable API.
   * @return See Readable.
   */
  size_t size() const override;

  /**
   * Bucket count of the key-side hash table: at least Bidict_options::m_st_n_buckets_hint, if that was given,
   * until the table is rehashed by growth or by assignment.
   * @return See above.
   */
  size_t bucket_count() const;

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
   * Returns the value of `key`, or `default_value` if not present.  Never fails.
   *
   * @param key
   *        Key.
   * @param default_value
   *        Fallback.
   * @return See above.
   */
  Value get_or(const Key& key, const Value& default_value) const;

  /**
   * Returns iterator to the association of `key`, or end().
   *
   * @param key
   *        Key.
   * @return See above.
   */
  Const_iterator find(const Key& key) const;

  /**
   * Returns iterator to the association of `value`, or end().
   *
   * @param value
   *        Value.
   * @return See above.
   */
  Const_iterator find_value(const Value& value) const;

  /**
   * Returns iterator to the first association (in traversal order, if #S_IS_ORDERED).  Any write may invalidate
   * iterators (for Ordered_bidict: only those to removed associations).
   *
   * @return See above.
   */
  Const_iterator begin() const;

  /**
   * Returns past-the-end iterator.
   * @return See above.
   */
  Const_iterator end() const;

  /**
   * Returns a lazy range over the keys, in iteration order.
   * @return See above.
   */
  auto keys() const;

  /**
   * Returns a lazy range over the values, in iteration order.
   * @return See above.
   */
  auto values() const;

  /**
   * Returns the inverse view: the same container seen value-to-key; writes through it modify `*this`.  The view
   * refers to `*this` and must not outlive it.
   *
   * @return See above.
   */
  Inverse inverse();

  /**
   * Returns the read-only inverse view.
   * @return See above.
   */
  Const_inverse inverse() const;

  /**
   * Returns the collision policy.
   * @return See above.
   */
  Collision_policy collision_policy() const;

  // Ordered-only methods.  Each `static_assert()`s #S_IS_ORDERED.

  /**
   * Implements Ordered API.
   *
   * @param err_code
   *        See Ordered.
   * @return See Ordered.
   */
  Item pop_first(Error_code* err_code = 0);

  /**
   * Implements Ordered API.
   *
   * @param err_code
   *        See Ordered.
   * @return See Ordered.
   */
  Item pop_last(Error_code* err_code = 0);

  /**
   * Implements Ordered API.
   *
   * @param key
   *        See Ordered.
   * @param err_code
   *        See Ordered.
   */
  void move_to_front(const Key& key, Error_code* err_code = 0);

  /**
   * Implements Ordered API.
   *
   * @param key
   *        See Ordered.
   * @param err_code
   *        See Ordered.
   */
  void move_to_back(const Key& key, Error_code* err_code = 0);

  /**
   * Returns the first association.  Behavior undefined if empty.
   * @return See above.
   */
  const value_type& front() const;

  /**
   * Returns the last association.  Behavior undefined if empty.
   * @return See above.
   */
  const value_type& back() const;

  /**
   * Returns reverse iterator to the last association.
   * @return See above.
   */
  auto rbegin() const;

  /**
   * Returns reverse past-the-end iterator.
   * @return See above.
   */
  auto rend() const;

private:
  // Friends.

  /// The view routes every operation into our `*_directed()` methods.
  template<typename>
  friend class Inverse_view;

  /// Needs content_hash().
  template<typename>
  friend class Basic_frozen_bidict;

  // Types.

  /// The flavor of a set()-like write.
  enum class Put_mode
  {
    /// Collisions resolved per #m_policy: set().
    S_POLICY,
    /// Collisions resolved per Collision_policy::S_OVERWRITE: force_set().
    S_FORCE,
    /// Any collision fails: put().
    S_INSERT_ONLY
  };

  /// `Key` if `!INV`, else `Value`.
  template<bool INV>
  using Side = typename Index::template Side<INV>;

  /// `Value` if `!INV`, else `Key`.
  template<bool INV>
  using Other = typename Index::template Other<INV>;

  // Methods.

  /**
   * The write algorithm behind set(), put(), force_set() and their inverse-view versions.  `INV == false`: `a` is a
   * key and `b` a value; `INV == true`: the reverse (write through inverse()).
   *
   * @tparam INV
   *         See above.
   * @param a
   *        Key or value written from.
   * @param b
   *        Value or key written.
   * @param mode
   *        See #Put_mode.
   * @param err_code
   *        See set() and put().
   */
  template<bool INV>
  void set_directed(const Side<INV>& a, const Other<INV>& b, Put_mode mode, Error_code* err_code);

  /**
   * Applies set_directed() to each item in order, stopping at the first failure.
   *
   * @tparam INV
   *         See set_directed().
   * @tparam Item_range
   *         See update().
   * @param items
   *        Items: `first` is written from, `second` is written.
   * @param mode
   *        See set_directed().
   * @param err_code
   *        See update().
   */
  template<bool INV, typename Item_range>
  void update_directed(const Item_range& items, Put_mode mode, Error_code* err_code);

  /**
   * erase() and erase_value().
   *
   * @tparam INV
   *         See set_directed().
   * @param a
   *        Key or value.
   * @param err_code
   *        See erase().
   */
  template<bool INV>
  void erase_directed(const Side<INV>& a, Error_code* err_code);

  /**
   * get() and get_key().
   *
   * @tparam INV
   *         See set_directed().
   * @param a
   *        Key or value.
   * @param err_code
   *        See get().
   * @return See get().
   */
  template<bool INV>
  Other<INV> get_directed(const Side<INV>& a, Error_code* err_code) const;

  /**
   * get_or() and its inverse-view version.
   *
   * @tparam INV
   *         See set_directed().
   * @param a
   *        Key or value.
   * @param default_b
   *        Fallback.
   * @return See get_or().
   */
  template<bool INV>
  Other<INV> get_or_directed(const Side<INV>& a, const Other<INV>& default_b) const;

  /**
   * contains() and contains_value().
   *
   * @tparam INV
   *         See set_directed().
   * @param a
   *        Key or value.
   * @return See contains().
   */
  template<bool INV>
  bool contains_directed(const Side<INV>& a) const;

  /**
   * find() and find_value().
   *
   * @tparam INV
   *         See set_directed().
   * @param a
   *        Key or value.
   * @return See find().
   */
  template<bool INV>
  Const_iterator find_directed(const Side<INV>& a) const;

  /**
   * pop() and its inverse-view version.
   *
   * @tparam INV
   *         See set_directed().
   * @param a
   *        Key or value.
   * @param err_code
   *        See pop().
   * @return See pop().
   */
  template<bool INV>
  Other<INV> pop_directed(const Side<INV>& a, Error_code* err_code);

  /**
   * set_default() and its inverse-view version.
   *
   * @tparam INV
   *         See set_directed().
   * @param a
   *        Key or value.
   * @param b
   *        Value or key to set if `a` not present.
   * @param err_code
   *        See set_default().
   * @return See set_default().
   */
  template<bool INV>
  Other<INV> set_default_directed(const Side<INV>& a, const Other<INV>& b, Error_code* err_code);

  /**
   * move_to_front(), move_to_back(), and their inverse-view versions.
   *
   * @tparam INV
   *         See set_directed().
   * @param a
   *        Key or value.
   * @param to_front
   *        `true` for move_to_front(); `false` for move_to_back().
   * @param err_code
   *        See move_to_front().
   */
  template<bool INV>
  void move_directed(const Side<INV>& a, bool to_front, Error_code* err_code);

  /**
   * pop_first() and pop_last().
   *
   * @param at_front
   *        `true` for pop_first(); `false` for pop_last().
   * @param err_code
   *        See pop_first().
   * @return See pop_first().
   */
  Item pop_end(bool at_front, Error_code* err_code);

  /**
   * Checks #m_policy; on failure resets it to Collision_policy::S_RAISE.
   *
   * @param err_code
   *        See constructor.
   */
  void validate_policy(Error_code* err_code);

  /**
   * Constructor helper: validates `opts` and, if OK, applies them.
   *
   * @param opts
   *        See constructor.
   * @param err_code
   *        See constructor.
   */
  void init_from_options(const Bidict_options& opts, Error_code* err_code);

  /**
   * Returns a hash of the set of associations, independent of their order: equal contents yield equal results
   * regardless of iteration order or variant.
   *
   * @return See above.
   */
  size_t content_hash() const;

  /**
   * Returns the "not found" error code for the key side (`!INV`) or value side (`INV`).
   *
   * @tparam INV
   *         See set_directed().
   * @return See above.
   */
  template<bool INV>
  static error::Code not_found_code();

  /**
   * Returns `"forward"` or `"inverse"` for logging.
   *
   * @tparam INV
   *         See set_directed().
   * @return See above.
   */
  template<bool INV>
  static util::String_view direction_str();

  // Data.

  /// See collision_policy().
  Collision_policy m_policy;

  /// The associations, indexed both ways.
  Index m_index;
}; // class Basic_bidict

// Template implementations.

template<typename Index>
Basic_bidict<Index>::Basic_bidict(log::Logger* logger_ptr, Collision_policy policy, Error_code* err_code) :
  log::Log_context(logger_ptr, Bidi_log_component::S_DICT),
  m_policy(policy)
{
  validate_policy(err_code);
}

template<typename Index>
Basic_bidict<Index>::Basic_bidict(log::Logger* logger_ptr, const Bidict_options& opts, Error_code* err_code) :
  log::Log_context(logger_ptr, Bidi_log_component::S_DICT),
  m_policy(Collision_policy::S_RAISE)
{
  init_from_options(opts, err_code);
}

template<typename Index>
Basic_bidict<Index>::Basic_bidict(log::Logger* logger_ptr, std::initializer_list<Item> items,
                                  Collision_policy policy, Error_code* err_code) :
  Basic_bidict(logger_ptr, policy, err_code)
{
  if (err_code && *err_code)
  {
    return;
  }
  // else
  update_directed<false>(items, Put_mode::S_POLICY, err_code);
}

template<typename Index>
template<typename Item_range>
Basic_bidict<Index>::Basic_bidict(log::Logger* logger_ptr, const Item_range& items,
                                  Collision_policy policy, Error_code* err_code) :
  Basic_bidict(logger_ptr, policy, err_code)
{
  if (err_code && *err_code)
  {
    return;
  }
  // else
  update_directed<false>(items, Put_mode::S_POLICY, err_code);
}

template<typename Index>
void Basic_bidict<Index>::validate_policy(Error_code* err_code)
{
  BIDI_ERROR_EXEC_VOID_AND_THROW_ON_ERROR(validate_policy, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (!collision_policy_valid(m_policy))
  {
    BIDI_LOG_WARNING("Collision policy [" << m_policy << "] is not a supported policy; using "
                     "[" << Collision_policy::S_RAISE << "].");
    m_policy = Collision_policy::S_RAISE;
    BIDI_ERROR_EMIT_ERROR(error::Code::S_INVALID_POLICY);
    return;
  }
  // else

  err_code->clear();
  BIDI_LOG_TRACE(S_CONTAINER_NAME << " [" << this << "]: Created with collision policy [" << m_policy << "].");
}

template<typename Index>
void Basic_bidict<Index>::init_from_options(const Bidict_options& opts, Error_code* err_code)
{
  BIDI_ERROR_EXEC_VOID_AND_THROW_ON_ERROR(init_from_options, opts, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (!validate_options(get_logger(), opts, err_code))
  {
    // It set *err_code and logged.
    return;
  }
  // else

  m_policy = opts.m_st_collision_policy;
  Index(opts.m_st_n_buckets_hint).swap(m_index);

  BIDI_LOG_TRACE(S_CONTAINER_NAME << " [" << this << "]: Created with options:\n" << opts);
}

template<typename Index>
void Basic_bidict<Index>::set(const Key& key, const Value& value, Error_code* err_code)
{
  set_directed<false>(key, value, Put_mode::S_POLICY, err_code);
}

template<typename Index>
void Basic_bidict<Index>::put(const Key& key, const Value& value, Error_code* err_code)
{
  set_directed<false>(key, value, Put_mode::S_INSERT_ONLY, err_code);
}

template<typename Index>
void Basic_bidict<Index>::force_set(const Key& key, const Value& value)
{
  set_directed<false>(key, value, Put_mode::S_FORCE, 0); // Cannot fail.
}

template<typename Index>
template<typename Item_range>
void Basic_bidict<Index>::update(const Item_range& items, Error_code* err_code)
{
  update_directed<false>(items, Put_mode::S_POLICY, err_code);
}

template<typename Index>
void Basic_bidict<Index>::update(std::initializer_list<Item> items, Error_code* err_code)
{
  update_directed<false>(items, Put_mode::S_POLICY, err_code);
}

template<typename Index>
template<typename Item_range>
void Basic_bidict<Index>::force_update(const Item_range& items)
{
  update_directed<false>(items, Put_mode::S_FORCE, 0); // Cannot fail.
}

template<typename Index>
void Basic_bidict<Index>::erase(const Key& key, Error_code* err_code)
{
  erase_directed<false>(key, err_code);
}

template<typename Index>
void Basic_bidict<Index>::erase_value(const Value& value, Error_code* err_code)
{
  erase_directed<true>(value, err_code);
}

template<typename Index>
typename Basic_bidict<Index>::Value Basic_bidict<Index>::pop(const Key& key, Error_code* err_code)
{
  return pop_directed<false>(key, err_code);
}

template<typename Index>
typename Basic_bidict<Index>::Value
  Basic_bidict<Index>::set_default(const Key& key, const Value& value, Error_code* err_code)
{
  return set_default_directed<false>(key, value, err_code);
}

template<typename Index>
void Basic_bidict<Index>::clear()
{
  BIDI_LOG_TRACE(S_CONTAINER_NAME << " [" << this << "]: Clearing [" << m_index.size() << "] associations.");
  m_index.clear();
}

template<typename Index>
void Basic_bidict<Index>::swap(Basic_bidict& other)
{
  using std::swap;

  if (&other != this)
  {
    log::Log_context::swap(other);
    swap(m_policy, other.m_policy);
    m_index.swap(other.m_index);
  }
}

template<typename Index>
size_t Basic_bidict<Index>::size() const
{
  return m_index.size();
}

template<typename Index>
size_t Basic_bidict<Index>::bucket_count() const
{
  return m_index.bucket_count();
}

template<typename Index>
bool Basic_bidict<Index>::contains(const Key& key) const
{
  return contains_directed<false>(key);
}

template<typename Index>
bool Basic_bidict<Index>::contains_value(const Value& value) const
{
  return contains_directed<true>(value);
}

template<typename Index>
typename Basic_bidict<Index>::Value Basic_bidict<Index>::get(const Key& key, Error_code* err_code) const
{
  return get_directed<false>(key, err_code);
}

template<typename Index>
typename Basic_bidict<Index>::Key Basic_bidict<Index>::get_key(const Value& value, Error_code* err_code) const
{
  return get_directed<true>(value, err_code);
}

template<typename Index>
void Basic_bidict<Index>::for_each(const Function<void (const Key&, const Value&)>& func) const
{
  for (const auto& item : m_index)
  {
    func(item.first, item.second);
  }
}

template<typename Index>
typename Basic_bidict<Index>::Value
  Basic_bidict<Index>::get_or(const Key& key, const Value& default_value) const
{
  return get_or_directed<false>(key, default_value);
}

template<typename Index>
typename Basic_bidict<Index>::Const_iterator Basic_bidict<Index>::find(const Key& key) const
{
  return find_directed<false>(key);
}

template<typename Index>
typename Basic_bidict<Index>::Const_iterator Basic_bidict<Index>::find_value(const Value& value) const
{
  return find_directed<true>(value);
}

template<typename Index>
typename Basic_bidict<Index>::Const_iterator Basic_bidict<Index>::begin() const
{
  return m_index.begin();
}

template<typename Index>
typename Basic_bidict<Index>::Const_iterator Basic_bidict<Index>::end() const
{
  return m_index.end();
}

template<typename Index>
auto Basic_bidict<Index>::keys() const
{
  return boost::adaptors::keys(*this);
}

template<typename Index>
auto Basic_bidict<Index>::values() const
{
  return boost::adaptors::values(*this);
}

template<typename Index>
typename Basic_bidict<Index>::Inverse Basic_bidict<Index>::inverse()
{
  return Inverse(this);
}

template<typename Index>
typename Basic_bidict<Index>::Const_inverse Basic_bidict<Index>::inverse() const
{
  return Const_inverse(this);
}

template<typename Index>
Collision_policy Basic_bidict<Index>::collision_policy() const
{
  return m_policy;
}

template<typename Index>
typename Basic_bidict<Index>::Item Basic_bidict<Index>::pop_first(Error_code* err_code)
{
  static_assert(S_IS_ORDERED, "pop_first() is available only in ordered containers.");
  return pop_end(true, err_code);
}

template<typename Index>
typename Basic_bidict<Index>::Item Basic_bidict<Index>::pop_last(Error_code* err_code)
{
  static_assert(S_IS_ORDERED, "pop_last() is available only in ordered containers.");
  return pop_end(false, err_code);
}

template<typename Index>
void Basic_bidict<Index>::move_to_front(const Key& key, Error_code* err_code)
{
  static_assert(S_IS_ORDERED, "move_to_front() is available only in ordered containers.");
  move_directed<false>(key, true, err_code);
}

template<typename Index>
void Basic_bidict<Index>::move_to_back(const Key& key, Error_code* err_code)
{
  static_assert(S_IS_ORDERED, "move_to_back() is available only in ordered containers.");
  move_directed<false>(key, false, err_code);
}

template<typename Index>
const typename Basic_bidict<Index>::value_type& Basic_bidict<Index>::front() const
{
  static_assert(S_IS_ORDERED, "front() is available only in ordered containers.");
  return m_index.front();
}

template<typename Index>
const typename Basic_bidict<Index>::value_type& Basic_bidict<Index>::back() const
{
  static_assert(S_IS_ORDERED, "back() is available only in ordered containers.");
  return m_index.back();
}

template<typename Index>
auto Basic_bidict<Index>::rbegin() const
{
  static_assert(S_IS_ORDERED, "rbegin() is available only in ordered containers.");
  return m_index.rbegin();
}

template<typename Index>
auto Basic_bidict<Index>::rend() const
{
  static_assert(S_IS_ORDERED, "rend() is available only in ordered containers.");
  return m_index.rend();
}

template<typename Index>
template<bool INV>
void Basic_bidict<Index>::set_directed(const Side<INV>& a, const Other<INV>& b, Put_mode mode, Error_code* err_code)
{
  BIDI_ERROR_EXEC_VOID_AND_THROW_ON_ERROR(set_directed<INV>, a, b, mode, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  /* Decide everything before touching m_index, so that a rejection leaves *this exactly as it was.  Careful: the
   * pointers below are invalidated once m_index is modified. */
  const Other<INV>* const b_of_a = m_index.template find<INV>(a);
  if (b_of_a && m_index.template equal<!INV>(*b_of_a, b))
  {
    // (a, b) already present: nothing to do, whatever the mode.
    err_code->clear();
    return;
  }
  // else

  const bool a_exists = b_of_a;
  // If b is present it's certainly not with a (we just checked that), so it's a value collision (by a-side's view).
  const bool b_exists_elsewhere = m_index.template find<!INV>(b);

  if ((mode == Put_mode::S_INSERT_ONLY) && (a_exists || b_exists_elsewhere))
  {
    // Named from the written-from side, so an inverse view reports what an inverted container would.
    BIDI_ERROR_EMIT_ERROR(a_exists ? error::Code::S_KEY_DUPLICATE : error::Code::S_VALUE_DUPLICATE);
    return;
  }
  // else

  const auto policy = (mode == Put_mode::S_FORCE) ? Collision_policy::S_OVERWRITE : m_policy;
  const auto decision = decide_on_collision(policy, a_exists, b_exists_elsewhere);

  switch (decision)
  {
  case Collision_decision::S_REJECT:
    // Only a collision on the written value is ever refused; see decide_on_collision().
    BIDI_ERROR_EMIT_ERROR(error::Code::S_VALUE_DUPLICATE);
    return;

  case Collision_decision::S_PROCEED_AFTER_EVICTING_OTHER:
    if (a_exists)
    {
      /* Both a and b are present, in 2 different associations.  Whatever the direction, the association holding
       * the key survives (with its position, if ordered) and takes the new value; the one holding the value is
       * evicted.  So inverse().set(v, k) leaves the same state as set(k, v). */
      BIDI_LOG_DEBUG(S_CONTAINER_NAME << " [" << this << "]: Write (" << direction_str<INV>() << ") collides with "
                     "an existing association on both sides; evicting the one holding the value.");
      if constexpr (INV)
      {
        const Side<INV> value_copy(a); // `a` may refer into the association being evicted.
        m_index.template erase<INV>(value_copy);
        m_index.template reassign<!INV>(b, value_copy);
      }
      else
      {
        const Other<INV> value_copy(b); // Ditto for `b`.
        m_index.template erase<!INV>(value_copy);
        m_index.template reassign<INV>(a, value_copy);
      }
    }
    else
    {
      /* Only b is present.  Evicting its association and adding (a, b) anew would be correct but would lose the
       * position; instead change the a-side field of b's association in place: it's the same result, with order
       * attributed to the surviving b. */
      BIDI_LOG_DEBUG(S_CONTAINER_NAME << " [" << this << "]: Write (" << direction_str<INV>() << ") collides with "
                     "an existing association on the written value; re-pointing that association in place.");
      m_index.template reassign<!INV>(b, a);
    }
    break;

  case Collision_decision::S_PROCEED:
    if (a_exists)
    {
      m_index.template reassign<INV>(a, b);
    }
    else
    {
      m_index.template emplace<INV>(a, b);
    }
    break;
  }

  err_code->clear();
  BIDI_LOG_TRACE(S_CONTAINER_NAME << " [" << this << "]: Write (" << direction_str<INV>() << ") committed "
                 "(decision [" << decision << "]); size [" << m_index.size() << "].");
} // Basic_bidict::set_directed()

template<typename Index>
template<bool INV, typename Item_range>
void Basic_bidict<Index>::update_directed(const Item_range& items, Put_mode mode, Error_code* err_code)
{
  BIDI_ERROR_EXEC_VOID_AND_THROW_ON_ERROR(update_directed<INV>, items, mode, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  err_code->clear();

  size_t n_applied = 0;
  for (const auto& item : items)
  {
    set_directed<INV>(item.first, item.second, mode, err_code);
    if (*err_code)
    {
      /* Per-pair atomicity only: the pairs before this one stay applied.  (Undoing them would require keeping
       * a copy of every association they displaced.) */
      BIDI_LOG_WARNING(S_CONTAINER_NAME << " [" << this << "]: Batch update (" << direction_str<INV>() << ") "
                       "stopped at item [" << n_applied << "]; the [" << n_applied << "] preceding items remain "
                       "applied.");
      return;
    }
    // else
    ++n_applied;
  }

  BIDI_LOG_TRACE(S_CONTAINER_NAME << " [" << this << "]: Batch update (" << direction_str<INV>() << ") applied "
                 "[" << n_applied << "] items; size [" << m_index.size() << "].");
}

template<typename Index>
template<bool INV>
void Basic_bidict<Index>::erase_directed(const Side<INV>& a, Error_code* err_code)
{
  BIDI_ERROR_EXEC_VOID_AND_THROW_ON_ERROR(erase_directed<INV>, a, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (!m_index.template erase<INV>(a))
  {
    BIDI_ERROR_EMIT_ERROR(not_found_code<INV>());
    return;
  }
  // else

  err_code->clear();
  BIDI_LOG_TRACE(S_CONTAINER_NAME << " [" << this << "]: Erase (" << direction_str<INV>() << ") committed; "
                 "size [" << m_index.size() << "].");
}

template<typename Index>
template<bool INV>
typename Basic_bidict<Index>::template Other<INV>
  Basic_bidict<Index>::get_directed(const Side<INV>& a, Error_code* err_code) const
{
  BIDI_ERROR_EXEC_AND_THROW_ON_ERROR(Other<INV>, get_directed<INV>, a, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  const auto b_ptr = m_index.template find<INV>(a);
  if (!b_ptr)
  {
    BIDI_ERROR_EMIT_ERROR(not_found_code<INV>());
    return Other<INV>();
  }
  // else

  err_code->clear();
  return *b_ptr;
}

template<typename Index>
template<bool INV>
typename Basic_bidict<Index>::template Other<INV>
  Basic_bidict<Index>::get_or_directed(const Side<INV>& a, const Other<INV>& default_b) const
{
  const auto b_ptr = m_index.template find<INV>(a);
  return b_ptr ? *b_ptr : default_b;
}

template<typename Index>
template<bool INV>
bool Basic_bidict<Index>::contains_directed(const Side<INV>& a) const
{
  return m_index.template find<INV>(a);
}

template<typename Index>
template<bool INV>
typename Basic_bidict<Index>::Const_iterator Basic_bidict<Index>::find_directed(const Side<INV>& a) const
{
  return m_index.template find_item<INV>(a);
}

template<typename Index>
template<bool INV>
typename Basic_bidict<Index>::template Other<INV>
  Basic_bidict<Index>::pop_directed(const Side<INV>& a, Error_code* err_code)
{
  BIDI_ERROR_EXEC_AND_THROW_ON_ERROR(Other<INV>, pop_directed<INV>, a, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  const auto b_ptr = m_index.template find<INV>(a);
  if (!b_ptr)
  {
    BIDI_ERROR_EMIT_ERROR(not_found_code<INV>());
    return Other<INV>();
  }
  // else

  Other<INV> b(*b_ptr); // Copy it out before the association is gone.
  m_index.template erase<INV>(a);

  err_code->clear();
  BIDI_LOG_TRACE(S_CONTAINER_NAME << " [" << this << "]: Pop (" << direction_str<INV>() << ") committed; "
                 "size [" << m_index.size() << "].");
  return b;
}

template<typename Index>
template<bool INV>
typename Basic_bidict<Index>::template Other<INV>
  Basic_bidict<Index>::set_default_directed(const Side<INV>& a, const Other<INV>& b, Error_code* err_code)
{
  BIDI_ERROR_EXEC_AND_THROW_ON_ERROR(Other<INV>, set_default_directed<INV>, a, b, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  const auto existing_b_ptr = m_index.template find<INV>(a);
  if (existing_b_ptr)
  {
    err_code->clear();
    return *existing_b_ptr;
  }
  // else

  set_directed<INV>(a, b, Put_mode::S_POLICY, err_code);
  return (*err_code) ? Other<INV>() : b;
}

template<typename Index>
template<bool INV>
void Basic_bidict<Index>::move_directed(const Side<INV>& a, bool to_front, Error_code* err_code)
{
  static_assert(S_IS_ORDERED, "Relocation is available only in ordered containers.");

  BIDI_ERROR_EXEC_VOID_AND_THROW_ON_ERROR(move_directed<INV>, a, to_front, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  const bool found = to_front ? m_index.template move_to_front<INV>(a)
                              : m_index.template move_to_back<INV>(a);
  if (!found)
  {
    BIDI_ERROR_EMIT_ERROR(not_found_code<INV>());
    return;
  }
  // else

  err_code->clear();
  BIDI_LOG_TRACE(S_CONTAINER_NAME << " [" << this << "]: Moved association (" << direction_str<INV>() << ") "
                 "to the " << (to_front ? "front" : "back") << ".");
}

template<typename Index>
typename Basic_bidict<Index>::Item Basic_bidict<Index>::pop_end(bool at_front, Error_code* err_code)
{
  BIDI_ERROR_EXEC_AND_THROW_ON_ERROR(Item, pop_end, at_front, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (m_index.size() == 0)
  {
    BIDI_ERROR_EMIT_ERROR(error::Code::S_EMPTY);
    return Item();
  }
  // else

  Item item = at_front ? m_index.pop_front() : m_index.pop_back();

  err_code->clear();
  BIDI_LOG_TRACE(S_CONTAINER_NAME << " [" << this << "]: Popped the " << (at_front ? "first" : "last") << " "
                 "association; size [" << m_index.size() << "].");
  return item;
}

template<typename Index>
size_t Basic_bidict<Index>::content_hash() const
{
  /* Sum (commutative, so order-independent) of a hash per association; then mix in the size.  Each association's
   * hash uses the container's own hashers, consistent with its notion of key/value equality. */
  size_t sum = 0;
  for (const auto& item : m_index)
  {
    size_t item_hash = m_index.template hash<false>(item.first);
    boost::hash_combine(item_hash, m_index.template hash<true>(item.second));
    sum += item_hash;
  }

  size_t result = m_index.size();
  boost::hash_combine(result, sum);
  return result;
}

template<typename Index>
template<bool INV>
error::Code Basic_bidict<Index>::not_found_code() // Static.
{
  return INV ? error::Code::S_VALUE_NOT_FOUND : error::Code::S_KEY_NOT_FOUND;
}

template<typename Index>
template<bool INV>
util::String_view Basic_bidict<Index>::direction_str() // Static.
{
  return INV ? "inverse" : "forward";
}

// Free function implementations.

/**
 * Equivalent to `val1.swap(val2)`.
 *
 * @relatesalso Basic_bidict
 *
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 */
template<typename Index>
void swap(Basic_bidict<Index>& val1, Basic_bidict<Index>& val2)
{
  val1.swap(val2);
}

} // namespace bidi::dict
