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


#include "bidi/dict/bidict.hpp"
#include "bidi/test/test_common_util.hpp"
#include "bidi/test/test_logger.hpp"
#include <gtest/gtest.h>
#include <map>
#include <string>
#include <vector>

namespace bidi::dict::test
{

namespace
{
using std::string;
using std::vector;
using bidi::test::Test_logger;
using bidi::test::expect_throw_code;
using Dict = Bidict<int, string>;
using Odict = Ordered_bidict<int, string>;
using Map = std::map<int, string>;
using Inv_map = std::map<string, int>;

template<typename Dict_t>
vector<std::pair<typename Dict_t::Key, typename Dict_t::Value>> items_of(const Dict_t& dict)
{
  vector<std::pair<typename Dict_t::Key, typename Dict_t::Value>> items;
  for (const auto& item : dict)
  {
    items.emplace_back(item.first, item.second);
  }
  return items;
}

} // Anonymous namespace

TEST(Inverse_view, Reads)
{
  Test_logger logger;
  Dict dict(&logger, { { 1, "a" }, { 2, "b" } });
  const auto inv = dict.inverse();

  static_assert(std::is_same_v<Dict::Inverse::Key, string>);
  static_assert(std::is_same_v<Dict::Inverse::Value, int>);

  EXPECT_EQ(inv.size(), 2u);
  EXPECT_EQ(inv.get("a"), 1);
  EXPECT_EQ(inv.get_key(2), "b");
  EXPECT_TRUE(inv.contains("b"));
  EXPECT_FALSE(inv.contains("c"));
  EXPECT_TRUE(inv.contains_value(1));
  EXPECT_FALSE(inv.contains_value(3));
  EXPECT_EQ(inv.get_or("z", 9), 9);
  EXPECT_EQ(inv.collision_policy(), Collision_policy::S_RAISE);

  auto it = inv.find("b");
  ASSERT_NE(it, inv.end());
  EXPECT_EQ((*it).first, "b");
  EXPECT_EQ((*it).second, 2);
  EXPECT_EQ(inv.find("z"), inv.end());
  it = inv.find_value(1);
  ASSERT_NE(it, inv.end());
  EXPECT_EQ((*it).first, "a");

  // Misses report the errors of the owner's corresponding lookup.
  expect_throw_code([&]() { inv.get("z"); }, error::Code::S_VALUE_NOT_FOUND, CTX);
  expect_throw_code([&]() { inv.get_key(9); }, error::Code::S_KEY_NOT_FOUND, CTX);

  // Iteration yields swapped items; it's the same content.
  Inv_map seen;
  for (const auto& item : inv)
  {
    seen.emplace(item.first, item.second);
  }
  EXPECT_EQ(seen, (Inv_map{ { "a", 1 }, { "b", 2 } }));
  Inv_map seen_for_each;
  inv.for_each([&](const string& key, const int& value) { seen_for_each.emplace(key, value); });
  EXPECT_EQ(seen_for_each, seen);
  EXPECT_TRUE(inv == (Inv_map{ { "b", 2 }, { "a", 1 } }));
  EXPECT_TRUE(inv != (Inv_map{ { "b", 1 }, { "a", 2 } }));

  // The view reflects later changes: it owns nothing.
  dict.set(3, "c");
  EXPECT_EQ(inv.get("c"), 3);
  EXPECT_EQ(inv.size(), 3u);

  // Inverse of inverse is the owner itself.
  EXPECT_EQ(&inv.inverse(), &dict);
  EXPECT_EQ(&dict.inverse().inverse(), &dict);
} // TEST(Inverse_view, Reads)

TEST(Inverse_view, Writes)
{
  Test_logger logger;
  Dict dict(&logger, { { 1, "a" }, { 2, "b" } });
  auto inv = dict.inverse();

  inv.set("c", 3);
  EXPECT_EQ(dict.get(3), "c");

  // Re-keying the value "a": under strict policy the key collision on the view's side is just a replacement...
  inv.set("a", 4);
  EXPECT_EQ(dict.get(4), "a");
  EXPECT_FALSE(dict.contains(1));
  // ...while a collision on the owner's key is, seen from the view, a value collision: it fails.
  expect_throw_code([&]() { inv.set("z", 2); }, error::Code::S_VALUE_DUPLICATE, CTX);
  Error_code err_code;
  inv.set("a", 2, &err_code);
  EXPECT_EQ(err_code, error::Code::S_VALUE_DUPLICATE);
  EXPECT_EQ(dict, (Map{ { 2, "b" }, { 3, "c" }, { 4, "a" } }));

  // put(): codes name the view's own sides.
  expect_throw_code([&]() { inv.put("a", 9); }, error::Code::S_KEY_DUPLICATE, CTX);
  expect_throw_code([&]() { inv.put("z", 4); }, error::Code::S_VALUE_DUPLICATE, CTX);
  inv.put("d", 5);
  EXPECT_EQ(dict.get(5), "d");

  // force_set(): evicts the owner's association holding the key.
  inv.force_set("z", 2);
  EXPECT_EQ(dict.get(2), "z");
  EXPECT_FALSE(dict.contains_value("b"));

  inv.erase("z");
  EXPECT_FALSE(dict.contains(2));
  inv.erase_value(5);
  EXPECT_FALSE(dict.contains_value("d"));
  expect_throw_code([&]() { inv.erase("z"); }, error::Code::S_VALUE_NOT_FOUND, CTX);
  expect_throw_code([&]() { inv.erase_value(5); }, error::Code::S_KEY_NOT_FOUND, CTX);

  EXPECT_EQ(inv.pop("c"), 3);
  EXPECT_EQ(inv.set_default("a", 99), 4);
  EXPECT_EQ(inv.set_default("e", 7), 7);
  EXPECT_EQ(dict, (Map{ { 4, "a" }, { 7, "e" } }));

  inv.update({ { "f", 8 }, { "g", 9 } });
  const vector<std::pair<string, int>> forced{ { "h", 8 } };
  inv.force_update(forced);
  EXPECT_EQ(dict, (Map{ { 4, "a" }, { 7, "e" }, { 8, "h" }, { 9, "g" } }));

  inv.clear();
  EXPECT_TRUE(dict.empty());
} // TEST(Inverse_view, Writes)

TEST(Inverse_view, Mirrors_inverted_container)
{
  /* Writing (v, k) through dict.inverse() must leave the same associations (and report the same error) as writing
   * (v, k) into a separate container holding the swapped associations. */
  using Mirror = Bidict<string, int>;
  const vector<std::pair<int, string>> initial{ { 1, "a" }, { 2, "b" }, { 3, "c" } };

  for (const auto policy : { Collision_policy::S_RAISE, Collision_policy::S_OVERWRITE })
  {
    for (const auto& pair : vector<std::pair<string, int>>{ { "a", 1 }, { "a", 2 }, { "a", 4 }, { "d", 1 },
                                                            { "d", 4 }, { "b", 3 } })
    {
      Odict dict(0, initial, policy);
      Mirror mirror(0, inverted(initial), policy);
      Error_code err_view;
      Error_code err_mirror;

      dict.inverse().set(pair.first, pair.second, &err_view);
      mirror.set(pair.first, pair.second, &err_mirror);

      const auto ctx = util::ostream_op_string(CTX, " policy [", policy, "] pair [", pair.first, ", ",
                                               pair.second, "]");
      EXPECT_EQ(err_view, err_mirror) << ctx;
      EXPECT_TRUE(dict.inverse() == mirror) << ctx;
    }
  }
} // TEST(Inverse_view, Mirrors_inverted_container)

TEST(Inverse_view, Ordered_overwrite_same_as_forward)
{
  // Both sides present in different associations: the key's association stays put, in either direction.
  const vector<std::pair<int, string>> initial{ { 1, "a" }, { 3, "c" }, { 2, "b" } };
  Odict forward(0, initial, Collision_policy::S_OVERWRITE);
  Odict via_view(0, initial, Collision_policy::S_OVERWRITE);

  forward.set(2, "a");
  via_view.inverse().set("a", 2);
  EXPECT_EQ(items_of(forward), (vector<std::pair<int, string>>{ { 3, "c" }, { 2, "a" } }));
  EXPECT_EQ(items_of(via_view), items_of(forward));
  EXPECT_TRUE(via_view == forward);

  // Same under a strict policy with force_set(), from every starting shape.
  for (const auto& pair : vector<std::pair<int, string>>{ { 2, "a" }, { 1, "c" }, { 3, "b" }, { 1, "z" },
                                                          { 9, "a" }, { 9, "z" }, { 3, "c" } })
  {
    Odict fwd(0, initial);
    Odict inv(0, initial);
    fwd.force_set(pair.first, pair.second);
    inv.inverse().force_set(pair.second, pair.first);

    const auto ctx = util::ostream_op_string(CTX, " pair [", pair.first, ", ", pair.second, "]");
    EXPECT_EQ(items_of(inv), items_of(fwd)) << ctx;
    EXPECT_EQ(inv.get(pair.first), pair.second) << ctx;
  }
} // TEST(Inverse_view, Ordered_overwrite_same_as_forward)

TEST(Inverse_view, Ordered_owner)
{
  Odict dict(0, { { 1, "a" }, { 2, "b" }, { 3, "c" } });
  auto inv = dict.inverse();
  static_assert(Odict::Inverse::S_IS_ORDERED);

  // Iterates in the owner's order, forward and reverse.
  EXPECT_EQ(items_of(inv), (vector<std::pair<string, int>>{ { "a", 1 }, { "b", 2 }, { "c", 3 } }));
  auto rit = inv.rbegin();
  EXPECT_EQ((*rit).first, "c");
  EXPECT_EQ((*rit).second, 3);

  vector<string> keys;
  for (const auto& key : inv.keys())
  {
    keys.push_back(key);
  }
  EXPECT_EQ(keys, (vector<string>{ "a", "b", "c" }));
  vector<int> values;
  for (const auto& value : inv.values())
  {
    values.push_back(value);
  }
  EXPECT_EQ(values, (vector<int>{ 1, 2, 3 }));

  inv.move_to_front("c");
  EXPECT_EQ(items_of(dict), (vector<std::pair<int, string>>{ { 3, "c" }, { 1, "a" }, { 2, "b" } }));
  inv.move_to_back("c");
  EXPECT_EQ(items_of(dict), (vector<std::pair<int, string>>{ { 1, "a" }, { 2, "b" }, { 3, "c" } }));
  expect_throw_code([&]() { inv.move_to_front("z"); }, error::Code::S_VALUE_NOT_FOUND, CTX);

  EXPECT_EQ(inv.pop_first(), (std::pair<string, int>("a", 1)));
  EXPECT_EQ(inv.pop_last(), (std::pair<string, int>("c", 3)));
  EXPECT_EQ(items_of(dict), (vector<std::pair<int, string>>{ { 2, "b" } }));

  // Order-sensitive equality between ordered views.
  const Odict other(0, { { 2, "b" } });
  EXPECT_TRUE(inv == other.inverse());
  dict.set(4, "d");
  const Odict reversed(0, { { 4, "d" }, { 2, "b" } });
  EXPECT_TRUE(inv != reversed.inverse());
  EXPECT_TRUE(inv == (Inv_map{ { "b", 2 }, { "d", 4 } }));

  EXPECT_EQ(util::ostream_op_string(inv), "Inverse_view({b: 2, d: 4})");

  inv.pop_first();
  inv.pop_first();
  expect_throw_code([&]() { inv.pop_last(); }, error::Code::S_EMPTY, CTX);
} // TEST(Inverse_view, Ordered_owner)

TEST(Inverse_view, Const_owner)
{
  const Dict dict(0, { { 1, "a" } });
  const auto inv = dict.inverse();
  static_assert(std::is_same_v<std::remove_const_t<decltype(inv)>, Inverse_view<const Dict>>);
  EXPECT_EQ(inv.get("a"), 1);
  EXPECT_EQ(&inv.inverse(), &dict);
  // (inv.set() etc. would not compile.)
} // TEST(Inverse_view, Const_owner)

} // namespace bidi::dict::test
