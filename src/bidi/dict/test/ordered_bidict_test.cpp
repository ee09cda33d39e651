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
using Odict = Ordered_bidict<int, string>;
using Items = vector<std::pair<int, string>>;

/// Traversal sequence of `dict`, checking on the way that each association is also found through both indices.
Items items_of(const Odict& dict, const string& ctx)
{
  Items items;
  for (const auto& item : dict)
  {
    items.emplace_back(item.first, item.second);
    EXPECT_EQ(dict.get(item.first), item.second) << ctx;
    EXPECT_EQ(dict.get_key(item.second), item.first) << ctx;
  }
  EXPECT_EQ(items.size(), dict.size()) << ctx;
  return items;
}

} // Anonymous namespace

TEST(Ordered_bidict, Write_positions)
{
  Test_logger logger;
  Odict dict(&logger, { { 1, "a" }, { 2, "b" }, { 3, "c" } });
  EXPECT_EQ(items_of(dict, CTX), (Items{ { 1, "a" }, { 2, "b" }, { 3, "c" } }));

  // New association: at the back.
  dict.set(4, "d");
  EXPECT_EQ(items_of(dict, CTX), (Items{ { 1, "a" }, { 2, "b" }, { 3, "c" }, { 4, "d" } }));

  // Value replaced in place.
  dict.set(2, "x");
  EXPECT_EQ(items_of(dict, CTX), (Items{ { 1, "a" }, { 2, "x" }, { 3, "c" }, { 4, "d" } }));

  // Key renamed (through the inverse) in place.
  dict.inverse().set("a", 9);
  EXPECT_EQ(items_of(dict, CTX), (Items{ { 9, "a" }, { 2, "x" }, { 3, "c" }, { 4, "d" } }));

  // Value re-keyed by an overwriting write: the association keeps its position.
  dict.force_set(5, "c");
  EXPECT_EQ(items_of(dict, CTX), (Items{ { 9, "a" }, { 2, "x" }, { 5, "c" }, { 4, "d" } }));

  // Both sides collide: the written key's association keeps its position; the written value's is evicted.
  dict.force_set(2, "d");
  EXPECT_EQ(items_of(dict, CTX), (Items{ { 9, "a" }, { 2, "d" }, { 5, "c" } }));

  // Same from the inverse side: still the key's association (5's, not 9's) keeps its position.
  dict.inverse().force_set("a", 5);
  EXPECT_EQ(items_of(dict, CTX), (Items{ { 2, "d" }, { 5, "a" } }));

  // Removal then re-insertion: at the back.
  dict.erase(2);
  dict.set(2, "d");
  EXPECT_EQ(items_of(dict, CTX), (Items{ { 5, "a" }, { 2, "d" } }));

  // Rejected write: order untouched too.
  expect_throw_code([&]() { dict.set(7, "d"); }, error::Code::S_VALUE_DUPLICATE, CTX);
  EXPECT_EQ(items_of(dict, CTX), (Items{ { 5, "a" }, { 2, "d" } }));
} // TEST(Ordered_bidict, Write_positions)

TEST(Ordered_bidict, Ends)
{
  Test_logger logger;
  Odict dict(&logger, { { 1, "a" }, { 2, "b" }, { 3, "c" }, { 4, "d" } });

  EXPECT_EQ(dict.front().first, 1);
  EXPECT_EQ(dict.back().second, "d");
  Items reversed(dict.rbegin(), dict.rend());
  EXPECT_EQ(reversed, (Items{ { 4, "d" }, { 3, "c" }, { 2, "b" }, { 1, "a" } }));

  EXPECT_EQ(dict.pop_first(), (std::pair<int, string>(1, "a")));
  EXPECT_EQ(dict.pop_last(), (std::pair<int, string>(4, "d")));
  EXPECT_EQ(items_of(dict, CTX), (Items{ { 2, "b" }, { 3, "c" } }));
  EXPECT_FALSE(dict.contains(1));
  EXPECT_FALSE(dict.contains_value("d"));

  dict.move_to_front(3);
  EXPECT_EQ(items_of(dict, CTX), (Items{ { 3, "c" }, { 2, "b" } }));
  dict.move_to_back(3);
  EXPECT_EQ(items_of(dict, CTX), (Items{ { 2, "b" }, { 3, "c" } }));
  dict.move_to_back(3); // Already there: no-op.
  EXPECT_EQ(items_of(dict, CTX), (Items{ { 2, "b" }, { 3, "c" } }));

  expect_throw_code([&]() { dict.move_to_front(9); }, error::Code::S_KEY_NOT_FOUND, CTX);
  Error_code err_code;
  dict.move_to_back(9, &err_code);
  EXPECT_EQ(err_code, error::Code::S_KEY_NOT_FOUND);
  EXPECT_EQ(items_of(dict, CTX), (Items{ { 2, "b" }, { 3, "c" } }));

  dict.pop_last();
  dict.pop_first();
  EXPECT_TRUE(dict.empty());
  expect_throw_code([&]() { dict.pop_first(); }, error::Code::S_EMPTY, CTX);
  EXPECT_EQ(dict.pop_last(&err_code), (std::pair<int, string>()));
  EXPECT_EQ(err_code, error::Code::S_EMPTY);
  EXPECT_EQ(dict.rbegin(), dict.rend());
} // TEST(Ordered_bidict, Ends)

TEST(Ordered_bidict, Equality)
{
  const Odict dict1(0, { { 1, "a" }, { 2, "b" } });
  const Odict dict2(0, { { 2, "b" }, { 1, "a" } });
  const Bidict<int, string> unordered(0, { { 2, "b" }, { 1, "a" } });
  const std::map<int, string> map{ { 1, "a" }, { 2, "b" } };

  // Both ordered: order matters.
  EXPECT_TRUE(dict1 != dict2);
  EXPECT_TRUE(dict1 == Odict(0, { { 1, "a" }, { 2, "b" } }));
  // Otherwise it does not.
  EXPECT_TRUE(dict1 == unordered);
  EXPECT_TRUE(unordered == dict2);
  EXPECT_TRUE(dict1 == map);
  EXPECT_TRUE(map == dict2);
  EXPECT_FALSE(dict1 == (std::map<int, string>{ { 1, "a" } }));

  EXPECT_EQ(util::ostream_op_string(dict2), "Ordered_bidict({2: b, 1: a})");
  EXPECT_EQ(util::ostream_op_string(Odict()), "Ordered_bidict()");
} // TEST(Ordered_bidict, Equality)

TEST(Ordered_bidict, Copy_move_swap)
{
  using std::swap; // This enables proper ADL.

  Test_logger logger;
  Odict dict(&logger, { { 1, "a" }, { 2, "b" }, { 3, "c" } });

  // The copy's indices refer to its own nodes: mutate it heavily, then check both.
  Odict copy(dict);
  copy.move_to_front(3);
  copy.set(2, "x");
  copy.erase_value("a");
  copy.force_set(4, "c");
  EXPECT_EQ(items_of(copy, CTX), (Items{ { 4, "c" }, { 2, "x" } }));
  EXPECT_EQ(items_of(dict, CTX), (Items{ { 1, "a" }, { 2, "b" }, { 3, "c" } }));

  copy = dict;
  EXPECT_EQ(items_of(copy, CTX), (Items{ { 1, "a" }, { 2, "b" }, { 3, "c" } }));
  copy.pop_first();
  EXPECT_EQ(dict.size(), 3u);

  Odict moved(std::move(dict));
  EXPECT_EQ(items_of(moved, CTX), (Items{ { 1, "a" }, { 2, "b" }, { 3, "c" } }));
  moved.move_to_back(1);
  moved.set(5, "e");
  EXPECT_EQ(items_of(moved, CTX), (Items{ { 2, "b" }, { 3, "c" }, { 1, "a" }, { 5, "e" } }));

  swap(moved, copy);
  EXPECT_EQ(items_of(moved, CTX), (Items{ { 2, "b" }, { 3, "c" } }));
  EXPECT_EQ(items_of(copy, CTX), (Items{ { 2, "b" }, { 3, "c" }, { 1, "a" }, { 5, "e" } }));
  moved.set(1, "z");
  EXPECT_EQ(copy.get(1), "a");

  dict = std::move(copy);
  EXPECT_EQ(items_of(dict, CTX), (Items{ { 2, "b" }, { 3, "c" }, { 1, "a" }, { 5, "e" } }));
  dict.move_to_front(5);
  EXPECT_EQ(dict.front().second, "e");
} // TEST(Ordered_bidict, Copy_move_swap)

TEST(Ordered_bidict, Update_order)
{
  Odict dict(0, { { 1, "a" } }, Collision_policy::S_OVERWRITE);
  dict.update(Items{ { 3, "c" }, { 2, "b" }, { 1, "z" }, { 4, "c" } });
  EXPECT_EQ(items_of(dict, CTX), (Items{ { 1, "z" }, { 4, "c" }, { 2, "b" } }));

  // Constructing from a range keeps the range's order, after collision resolution.
  const Odict from_range(0, Items{ { 5, "e" }, { 6, "f" }, { 7, "e" } }, Collision_policy::S_OVERWRITE);
  EXPECT_EQ(items_of(from_range, CTX), (Items{ { 7, "e" }, { 6, "f" } }));
} // TEST(Ordered_bidict, Update_order)

} // namespace bidi::dict::test
