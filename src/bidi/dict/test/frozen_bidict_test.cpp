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
#include <boost/unordered_set.hpp>
#include <gtest/gtest.h>
#include <functional>
#include <map>
#include <string>
#include <unordered_set>
#include <vector>

namespace bidi::dict::test
{

namespace
{
using std::string;
using std::vector;
using bidi::test::Test_logger;
using bidi::test::expect_throw_code;
using Frozen = Frozen_bidict<int, string>;
using Ofrozen = Frozen_ordered_bidict<int, string>;
using Map = std::map<int, string>;

/**
 * Tries every mutator of `frozen`, each of which must fail with S_IMMUTABLE, by exception and by error code; and
 * must leave content and hash as they were.
 */
template<typename Frozen_t>
void check_all_mutators_rejected(Frozen_t& frozen, const string& ctx)
{
  using Item = typename Frozen_t::Item;
  const Map before(frozen.begin(), frozen.end());
  const size_t hash_before = frozen.hash_value();

  const vector<std::function<void (Error_code*)>> mutators
    {
      [&](Error_code* err_code) { frozen.set(9, "z", err_code); },
      [&](Error_code* err_code) { frozen.set(1, "z", err_code); },
      [&](Error_code* err_code) { frozen.put(9, "z", err_code); },
      [&](Error_code* err_code) { frozen.force_set(9, "a", err_code); },
      [&](Error_code* err_code) { frozen.update({ Item(9, "z") }, err_code); },
      [&](Error_code* err_code) { frozen.update(vector<Item>{ Item(9, "z") }, err_code); },
      [&](Error_code* err_code) { frozen.force_update(vector<Item>{ Item(9, "a") }, err_code); },
      [&](Error_code* err_code) { frozen.erase(1, err_code); },
      [&](Error_code* err_code) { frozen.erase_value("a", err_code); },
      [&](Error_code* err_code) { EXPECT_EQ(frozen.pop(1, err_code), ""); },
      [&](Error_code* err_code) { EXPECT_EQ(frozen.set_default(9, "z", err_code), ""); },
      [&](Error_code* err_code) { frozen.clear(err_code); }
    };

  for (size_t idx = 0; idx != mutators.size(); ++idx)
  {
    const auto mutator_ctx = util::ostream_op_string(ctx, " mutator [", idx, "]");
    expect_throw_code([&]() { mutators[idx](0); }, error::Code::S_IMMUTABLE, mutator_ctx);
    Error_code err_code;
    mutators[idx](&err_code);
    EXPECT_EQ(err_code, error::Code::S_IMMUTABLE) << mutator_ctx;
    EXPECT_EQ(Map(frozen.begin(), frozen.end()), before) << mutator_ctx;
    EXPECT_EQ(frozen.hash_value(), hash_before) << mutator_ctx;
  }
} // check_all_mutators_rejected()

} // Anonymous namespace

TEST(Frozen_bidict, Reads)
{
  Test_logger logger;
  const Frozen frozen(&logger, { { 1, "a" }, { 2, "b" } });

  EXPECT_EQ(frozen.size(), 2u);
  EXPECT_EQ(frozen.get(1), "a");
  EXPECT_EQ(frozen.get_key("b"), 2);
  EXPECT_TRUE(frozen.contains(2));
  EXPECT_FALSE(frozen.contains(3));
  EXPECT_TRUE(frozen.contains_value("a"));
  EXPECT_EQ(frozen.get_or(3, "z"), "z");
  EXPECT_NE(frozen.find(1), frozen.end());
  EXPECT_EQ(frozen.find_value("c"), frozen.end());
  EXPECT_EQ(frozen.inverse().get("b"), 2);
  EXPECT_EQ(&frozen.inverse().inverse(), &frozen.dict());
  EXPECT_EQ(frozen.get_logger(), &logger);
  expect_throw_code([&]() { frozen.get(3); }, error::Code::S_KEY_NOT_FOUND, CTX);

  Map keys_and_values;
  frozen.for_each([&](const int& key, const string& value) { keys_and_values.emplace(key, value); });
  EXPECT_EQ(keys_and_values, (Map{ { 1, "a" }, { 2, "b" } }));
  const auto keys = frozen.keys();
  EXPECT_EQ(vector<int>(keys.begin(), keys.end()).size(), 2u);

  // Read through the interface too.
  const Readable<int, string>& readable = frozen;
  EXPECT_EQ(readable.get(2), "b");
  EXPECT_FALSE(readable.empty());
} // TEST(Frozen_bidict, Reads)

TEST(Frozen_bidict, Immutable)
{
  Test_logger logger;
  Frozen frozen(&logger, { { 1, "a" }, { 2, "b" } });
  check_all_mutators_rejected(frozen, CTX);
  EXPECT_NE(logger.logged().find("Rejecting [set()] on immutable container"), string::npos) << logger.logged();

  Ofrozen ofrozen(&logger, { { 1, "a" }, { 2, "b" } });
  check_all_mutators_rejected(ofrozen, CTX);
  Error_code err_code;
  EXPECT_EQ(ofrozen.pop_first(&err_code), (std::pair<int, string>()));
  EXPECT_EQ(err_code, error::Code::S_IMMUTABLE);
  expect_throw_code([&]() { ofrozen.pop_last(); }, error::Code::S_IMMUTABLE, CTX);
  expect_throw_code([&]() { ofrozen.move_to_front(2); }, error::Code::S_IMMUTABLE, CTX);
  ofrozen.move_to_back(1, &err_code);
  EXPECT_EQ(err_code, error::Code::S_IMMUTABLE);
  EXPECT_EQ(ofrozen.front().first, 1);
  EXPECT_EQ(ofrozen.back().first, 2);
} // TEST(Frozen_bidict, Immutable)

TEST(Frozen_bidict, From_mutable)
{
  Test_logger logger;
  Bidict<int, string> dict(&logger, { { 1, "a" }, { 2, "b" } }, Collision_policy::S_OVERWRITE);

  const Frozen copied(dict);
  dict.set(3, "c"); // Snapshot: unaffected.
  EXPECT_EQ(copied.size(), 2u);
  EXPECT_EQ(copied.collision_policy(), Collision_policy::S_OVERWRITE);
  EXPECT_EQ(copied.get_logger(), &logger);

  const Frozen moved(std::move(dict));
  EXPECT_EQ(moved, (Map{ { 1, "a" }, { 2, "b" }, { 3, "c" } }));

  // Building from items applies the policy, as for the mutable kind.
  const Frozen built(0, vector<std::pair<int, string>>{ { 1, "a" }, { 2, "a" } }, Collision_policy::S_OVERWRITE);
  EXPECT_EQ(built, (Map{ { 2, "a" } }));
  Error_code err_code;
  const Frozen partial(0, { { 1, "a" }, { 2, "a" } }, Collision_policy::S_RAISE, &err_code);
  EXPECT_EQ(err_code, error::Code::S_VALUE_DUPLICATE);
  EXPECT_EQ(partial, (Map{ { 1, "a" } }));

  // A copy of the frozen kind is frozen too, with the same hash.
  const Frozen copy(moved);
  EXPECT_EQ(copy, moved);
  EXPECT_EQ(copy.hash_value(), moved.hash_value());
} // TEST(Frozen_bidict, From_mutable)

TEST(Frozen_bidict, Hash_and_equality)
{
  const Frozen frozen1(0, { { 1, "a" }, { 2, "b" }, { 3, "c" } });
  const Frozen frozen2(0, { { 3, "c" }, { 1, "a" }, { 2, "b" } });
  const Frozen other(0, { { 1, "b" }, { 2, "a" }, { 3, "c" } });

  EXPECT_EQ(frozen1, frozen2);
  EXPECT_EQ(frozen1.hash_value(), frozen2.hash_value());
  EXPECT_EQ(hash_value(frozen1), frozen1.hash_value());
  EXPECT_EQ(std::hash<Frozen>()(frozen1), frozen1.hash_value());
  EXPECT_NE(frozen1, other);
  EXPECT_EQ(Frozen().hash_value(), Frozen().hash_value());

  // The ordered kind: equality with another ordered one is order-sensitive; the hash is not; both stay consistent.
  const Ofrozen ofrozen1(0, { { 1, "a" }, { 2, "b" } });
  const Ofrozen ofrozen2(0, { { 2, "b" }, { 1, "a" } });
  EXPECT_TRUE(ofrozen1 != ofrozen2);
  EXPECT_EQ(ofrozen1.hash_value(), ofrozen2.hash_value());
  EXPECT_TRUE(ofrozen1 == Frozen(0, { { 2, "b" }, { 1, "a" } }));
  EXPECT_TRUE((ofrozen1 == Ordered_bidict<int, string>(0, { { 1, "a" }, { 2, "b" } })));

  std::unordered_set<Frozen> std_set;
  EXPECT_TRUE(std_set.insert(frozen1).second);
  EXPECT_FALSE(std_set.insert(frozen2).second);
  EXPECT_TRUE(std_set.insert(other).second);
  EXPECT_EQ(std_set.size(), 2u);
  EXPECT_EQ(std_set.count(Frozen(0, { { 2, "b" }, { 3, "c" }, { 1, "a" } })), 1u);

  boost::unordered_set<Ofrozen> boost_set;
  boost_set.insert(ofrozen1);
  boost_set.insert(ofrozen2); // Same hash, yet not equal: both kept.
  boost_set.insert(Ofrozen(0, { { 1, "a" }, { 2, "b" } }));
  EXPECT_EQ(boost_set.size(), 2u);
} // TEST(Frozen_bidict, Hash_and_equality)

TEST(Frozen_bidict, Print)
{
  EXPECT_EQ(util::ostream_op_string(Frozen(0, { { 1, "a" } })), "Frozen_bidict({1: a})");
  EXPECT_EQ(util::ostream_op_string(Ofrozen(0, { { 2, "b" }, { 1, "a" } })), "Frozen_ordered_bidict({2: b, 1: a})");
  EXPECT_EQ(util::ostream_op_string(Ofrozen()), "Frozen_ordered_bidict()");

  const Ofrozen ofrozen(0, { { 2, "b" }, { 1, "a" } });
  EXPECT_EQ(util::ostream_op_string(ofrozen.inverse()), "Inverse_view({b: 2, a: 1})");
  const auto values = ofrozen.values();
  EXPECT_EQ(vector<string>(values.begin(), values.end()), (vector<string>{ "b", "a" }));
  EXPECT_EQ(ofrozen.rbegin()->first, 1);
} // TEST(Frozen_bidict, Print)

} // namespace bidi::dict::test
