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
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/unordered_map.hpp>
#include <gtest/gtest.h>
#include <map>
#include <string>
#include <unordered_map>
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
using Map = std::map<int, string>;

/// Copies content into a `std::map` (whose order is deterministic), checking inverse consistency on the way.
template<typename Dict_t>
std::map<typename Dict_t::Key, typename Dict_t::Value> to_map(const Dict_t& dict, const string& ctx)
{
  std::map<typename Dict_t::Key, typename Dict_t::Value> result;
  for (const auto& item : dict)
  {
    EXPECT_TRUE(result.emplace(item.first, item.second).second) << ctx;
    EXPECT_EQ(dict.get_key(item.second), item.first) << ctx;
    EXPECT_TRUE(dict.contains_value(item.second)) << ctx;
  }
  EXPECT_EQ(result.size(), dict.size()) << ctx;
  return result;
}

/// Case-insensitive string hash, for the custom predicate test.
struct Ihash
{
  size_t operator()(const string& str) const
  {
    return boost::hash<string>()(boost::algorithm::to_lower_copy(str));
  }
};

/// Case-insensitive string equality, for the custom predicate test.
struct Iequal
{
  bool operator()(const string& lhs, const string& rhs) const
  {
    return boost::algorithm::to_lower_copy(lhs) == boost::algorithm::to_lower_copy(rhs);
  }
};

} // Anonymous namespace

TEST(Bidict, Lookups)
{
  Test_logger logger;
  const Dict dict(&logger, { { 1, "a" }, { 2, "b" } });

  EXPECT_EQ(dict.size(), 2u);
  EXPECT_FALSE(dict.empty());
  EXPECT_EQ(dict.collision_policy(), Collision_policy::S_RAISE);
  EXPECT_EQ(to_map(dict, CTX), (Map{ { 1, "a" }, { 2, "b" } }));

  EXPECT_EQ(dict.get(1), "a");
  EXPECT_EQ(dict.get_key("b"), 2);
  EXPECT_TRUE(dict.contains(2));
  EXPECT_FALSE(dict.contains(3));
  EXPECT_TRUE(dict.contains_value("a"));
  EXPECT_FALSE(dict.contains_value("c"));
  EXPECT_EQ(dict.get_or(1, "z"), "a");
  EXPECT_EQ(dict.get_or(3, "z"), "z");

  auto it = dict.find(2);
  ASSERT_NE(it, dict.end());
  EXPECT_EQ(it->first, 2);
  EXPECT_EQ(it->second, "b");
  EXPECT_EQ(dict.find(3), dict.end());
  it = dict.find_value("a");
  ASSERT_NE(it, dict.end());
  EXPECT_EQ(it->first, 1);
  EXPECT_EQ(dict.find_value("c"), dict.end());

  // Misses: exception, or error code plus neutral value.
  expect_throw_code([&]() { dict.get(3); }, error::Code::S_KEY_NOT_FOUND, CTX);
  expect_throw_code([&]() { dict.get_key("c"); }, error::Code::S_VALUE_NOT_FOUND, CTX);
  Error_code err_code;
  EXPECT_EQ(dict.get(3, &err_code), "");
  EXPECT_EQ(err_code, error::Code::S_KEY_NOT_FOUND);
  EXPECT_EQ(dict.get_key("c", &err_code), 0);
  EXPECT_EQ(err_code, error::Code::S_VALUE_NOT_FOUND);
  EXPECT_EQ(dict.get(1, &err_code), "a");
  EXPECT_FALSE(err_code);

  const Dict empty_dict;
  EXPECT_TRUE(empty_dict.empty());
  EXPECT_EQ(empty_dict.begin(), empty_dict.end());
} // TEST(Bidict, Lookups)

TEST(Bidict, Set)
{
  Test_logger logger;
  Dict dict(&logger);

  dict.set(1, "a");
  dict.set(2, "b");
  EXPECT_EQ(to_map(dict, CTX), (Map{ { 1, "a" }, { 2, "b" } }));

  // Same pair: no-op.
  dict.set(1, "a");
  EXPECT_EQ(to_map(dict, CTX), (Map{ { 1, "a" }, { 2, "b" } }));

  // Existing key, new value: value replaced; the old value is gone from the inverse direction too.
  dict.set(1, "x");
  EXPECT_EQ(to_map(dict, CTX), (Map{ { 1, "x" }, { 2, "b" } }));
  EXPECT_FALSE(dict.contains_value("a"));

  // New key, existing value: rejected under the default strict policy; nothing changes.
  expect_throw_code([&]() { dict.set(3, "b"); }, error::Code::S_VALUE_DUPLICATE, CTX);
  Error_code err_code;
  dict.set(3, "b", &err_code);
  EXPECT_EQ(err_code, error::Code::S_VALUE_DUPLICATE);
  // Existing key, value of another key: also rejected.
  dict.set(1, "b", &err_code);
  EXPECT_EQ(err_code, error::Code::S_VALUE_DUPLICATE);
  EXPECT_EQ(to_map(dict, CTX), (Map{ { 1, "x" }, { 2, "b" } }));

  dict.set(3, "c", &err_code);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(dict.size(), 3u);
} // TEST(Bidict, Set)

TEST(Bidict, Set_overwrite)
{
  Test_logger logger;
  Dict dict(&logger, { { 1, "a" }, { 2, "b" }, { 3, "c" } }, Collision_policy::S_OVERWRITE);
  EXPECT_EQ(dict.collision_policy(), Collision_policy::S_OVERWRITE);

  // New key, existing value: the value is re-keyed.
  dict.set(4, "a");
  EXPECT_EQ(to_map(dict, CTX), (Map{ { 2, "b" }, { 3, "c" }, { 4, "a" } }));

  // Existing key, value of another key: the other association is evicted.
  dict.set(2, "c");
  EXPECT_EQ(to_map(dict, CTX), (Map{ { 2, "c" }, { 4, "a" } }));
} // TEST(Bidict, Set_overwrite)

TEST(Bidict, Put_and_force_set)
{
  Test_logger logger;
  Dict dict(&logger, { { 1, "a" }, { 2, "b" } });

  dict.put(3, "c");
  dict.put(3, "c"); // Same pair: no-op, not an error.
  EXPECT_EQ(dict.size(), 3u);

  // Insert-only: any collision fails, key collisions first.
  expect_throw_code([&]() { dict.put(1, "z"); }, error::Code::S_KEY_DUPLICATE, CTX);
  expect_throw_code([&]() { dict.put(9, "a"); }, error::Code::S_VALUE_DUPLICATE, CTX);
  expect_throw_code([&]() { dict.put(1, "b"); }, error::Code::S_KEY_DUPLICATE, CTX);
  EXPECT_EQ(to_map(dict, CTX), (Map{ { 1, "a" }, { 2, "b" }, { 3, "c" } }));

  // Even under OVERWRITE policy put() fails on collision.
  Dict dict2(&logger, { { 1, "a" } }, Collision_policy::S_OVERWRITE);
  Error_code err_code;
  dict2.put(2, "a", &err_code);
  EXPECT_EQ(err_code, error::Code::S_VALUE_DUPLICATE);

  // force_set(): overwrite for this one call, though the policy is strict.
  dict.force_set(4, "a");
  EXPECT_EQ(to_map(dict, CTX), (Map{ { 2, "b" }, { 3, "c" }, { 4, "a" } }));
  dict.force_set(2, "c");
  EXPECT_EQ(to_map(dict, CTX), (Map{ { 2, "c" }, { 4, "a" } }));
  EXPECT_EQ(dict.collision_policy(), Collision_policy::S_RAISE);
} // TEST(Bidict, Put_and_force_set)

TEST(Bidict, Update)
{
  Test_logger logger;
  Dict dict(&logger);

  dict.update({ { 1, "a" }, { 2, "b" } });
  const vector<std::pair<int, string>> more{ { 3, "c" }, { 1, "x" } };
  dict.update(more);
  EXPECT_EQ(to_map(dict, CTX), (Map{ { 1, "x" }, { 2, "b" }, { 3, "c" } }));

  // Ranges of swapped pairs via inverted(); any pair range works, e.g., another map.
  const std::map<string, int> by_name{ { "d", 4 } };
  dict.update(inverted(by_name));
  EXPECT_EQ(dict.get(4), "d");
  const boost::unordered_map<int, string> hashed{ { 5, "e" } };
  dict.update(hashed);
  EXPECT_EQ(dict.get_key("e"), 5);

  // force_update(): each pair as force_set().
  const vector<std::pair<int, string>> forced{ { 6, "b" }, { 1, "c" } };
  dict.force_update(forced);
  EXPECT_EQ(to_map(dict, CTX), (Map{ { 1, "c" }, { 4, "d" }, { 5, "e" }, { 6, "b" } }));
} // TEST(Bidict, Update)

TEST(Bidict, Erase_pop_set_default)
{
  Test_logger logger;
  Dict dict(&logger, { { 1, "a" }, { 2, "b" }, { 3, "c" } });

  dict.erase(1);
  EXPECT_FALSE(dict.contains(1));
  EXPECT_FALSE(dict.contains_value("a"));
  expect_throw_code([&]() { dict.erase(1); }, error::Code::S_KEY_NOT_FOUND, CTX);

  dict.erase_value("b");
  EXPECT_EQ(to_map(dict, CTX), (Map{ { 3, "c" } }));
  Error_code err_code;
  dict.erase_value("b", &err_code);
  EXPECT_EQ(err_code, error::Code::S_VALUE_NOT_FOUND);

  EXPECT_EQ(dict.pop(3), "c");
  EXPECT_TRUE(dict.empty());
  EXPECT_EQ(dict.pop(3, &err_code), "");
  EXPECT_EQ(err_code, error::Code::S_KEY_NOT_FOUND);

  // set_default(): existing value returned as is; else set.
  EXPECT_EQ(dict.set_default(1, "a"), "a");
  EXPECT_EQ(dict.set_default(1, "z"), "a");
  EXPECT_EQ(dict.get(1), "a");
  // Setting can fail like set().
  EXPECT_EQ(dict.set_default(2, "a", &err_code), "");
  EXPECT_EQ(err_code, error::Code::S_VALUE_DUPLICATE);
  EXPECT_EQ(to_map(dict, CTX), (Map{ { 1, "a" } }));

  dict.clear();
  EXPECT_TRUE(dict.empty());
  dict.set(1, "a"); // Still usable.
  EXPECT_EQ(dict.size(), 1u);
} // TEST(Bidict, Erase_pop_set_default)

TEST(Bidict, Construction)
{
  Test_logger logger;

  // Value duplicates in the items: strict policy fails; with err_code, the preceding items remain.
  expect_throw_code([&]() { Dict dict(&logger, { { 1, "a" }, { 2, "a" } }); }, error::Code::S_VALUE_DUPLICATE, CTX);
  Error_code err_code;
  const Dict partial(&logger, { { 1, "a" }, { 2, "a" }, { 3, "c" } }, Collision_policy::S_RAISE, &err_code);
  EXPECT_EQ(err_code, error::Code::S_VALUE_DUPLICATE);
  EXPECT_EQ(to_map(partial, CTX), (Map{ { 1, "a" } }));

  // Overwrite policy: the later key wins.  Key duplicates: the later value wins, under either policy.
  const Dict overwritten(&logger, { { 1, "a" }, { 2, "a" } }, Collision_policy::S_OVERWRITE);
  EXPECT_EQ(to_map(overwritten, CTX), (Map{ { 2, "a" } }));
  const Dict rekeyed(&logger, { { 1, "a" }, { 1, "b" } });
  EXPECT_EQ(to_map(rekeyed, CTX), (Map{ { 1, "b" } }));

  // From any range.
  const std::unordered_map<int, string> src{ { 1, "a" }, { 2, "b" } };
  const Dict from_range(&logger, src);
  EXPECT_EQ(to_map(from_range, CTX), (Map{ { 1, "a" }, { 2, "b" } }));

  // Invalid policy: rejected; with err_code the container is usable with the strict policy.
  expect_throw_code([&]() { Dict dict(&logger, Collision_policy::S_END_SENTINEL); },
                    error::Code::S_INVALID_POLICY, CTX);
  Dict fallback(&logger, static_cast<Collision_policy>(42), &err_code);
  EXPECT_EQ(err_code, error::Code::S_INVALID_POLICY);
  EXPECT_EQ(fallback.collision_policy(), Collision_policy::S_RAISE);
  fallback.set(1, "a");
  EXPECT_EQ(fallback.size(), 1u);
} // TEST(Bidict, Construction)

TEST(Bidict, Copy_move_swap)
{
  using std::swap; // This enables proper ADL.

  Test_logger logger;
  Dict dict1(&logger, { { 1, "a" }, { 2, "b" } }, Collision_policy::S_OVERWRITE);
  Dict dict2(&logger, { { 3, "c" } });

  Dict copy(dict1);
  copy.set(3, "a"); // Independent of dict1.
  EXPECT_EQ(to_map(dict1, CTX), (Map{ { 1, "a" }, { 2, "b" } }));
  EXPECT_EQ(to_map(copy, CTX), (Map{ { 2, "b" }, { 3, "a" } }));
  EXPECT_EQ(copy.collision_policy(), Collision_policy::S_OVERWRITE);
  EXPECT_EQ(copy.get_logger(), &logger);

  swap(dict1, dict2);
  EXPECT_EQ(to_map(dict1, CTX), (Map{ { 3, "c" } }));
  EXPECT_EQ(dict1.collision_policy(), Collision_policy::S_RAISE);
  EXPECT_EQ(to_map(dict2, CTX), (Map{ { 1, "a" }, { 2, "b" } }));
  EXPECT_EQ(dict2.collision_policy(), Collision_policy::S_OVERWRITE);

  copy = dict1;
  EXPECT_EQ(to_map(copy, CTX), (Map{ { 3, "c" } }));
  copy.set(4, "d");
  EXPECT_EQ(dict1.size(), 1u);

  Dict moved(std::move(dict2));
  EXPECT_EQ(to_map(moved, CTX), (Map{ { 1, "a" }, { 2, "b" } }));
  EXPECT_EQ(moved.collision_policy(), Collision_policy::S_OVERWRITE);
  moved.set(5, "a"); // Indices carried over intact.
  EXPECT_EQ(to_map(moved, CTX), (Map{ { 2, "b" }, { 5, "a" } }));

  dict1 = std::move(moved);
  EXPECT_EQ(to_map(dict1, CTX), (Map{ { 2, "b" }, { 5, "a" } }));
} // TEST(Bidict, Copy_move_swap)

TEST(Bidict, Iteration_and_ranges)
{
  const Dict dict(0, { { 1, "a" }, { 2, "b" }, { 3, "c" } });

  std::map<int, string> seen;
  dict.for_each([&](const int& key, const string& value) { seen.emplace(key, value); });
  EXPECT_EQ(seen, (Map{ { 1, "a" }, { 2, "b" }, { 3, "c" } }));

  // keys() and values() are in the same (iteration) order, and restartable.
  vector<int> keys;
  vector<string> values;
  for (const auto& key : dict.keys())
  {
    keys.push_back(key);
  }
  for (const auto& value : dict.values())
  {
    values.push_back(value);
  }
  ASSERT_EQ(keys.size(), 3u);
  ASSERT_EQ(values.size(), 3u);
  for (size_t idx = 0; idx != keys.size(); ++idx)
  {
    EXPECT_EQ(dict.get(keys[idx]), values[idx]);
  }
  size_t n_keys = 0;
  for (const auto& key : dict.keys())
  {
    EXPECT_EQ(key, keys[n_keys++]);
  }
  EXPECT_EQ(n_keys, 3u);
} // TEST(Bidict, Iteration_and_ranges)

TEST(Bidict, Equality_and_print)
{
  const Dict dict(0, { { 1, "a" }, { 2, "b" } });

  EXPECT_TRUE(dict == (Map{ { 2, "b" }, { 1, "a" } }));
  EXPECT_TRUE((Map{ { 2, "b" }, { 1, "a" } }) == dict);
  EXPECT_TRUE(dict == (std::unordered_map<int, string>{ { 1, "a" }, { 2, "b" } }));
  EXPECT_TRUE(dict != (Map{ { 1, "a" } }));
  EXPECT_TRUE(dict != (Map{ { 1, "a" }, { 2, "c" } }));
  EXPECT_TRUE(dict != (Map{ { 1, "a" }, { 3, "b" } }));
  EXPECT_TRUE(dict == Dict(0, { { 2, "b" }, { 1, "a" } }));
  EXPECT_TRUE(dict == (Ordered_bidict<int, string>(0, { { 2, "b" }, { 1, "a" } })));

  EXPECT_EQ(util::ostream_op_string(Dict(0, { { 1, "a" } })), "Bidict({1: a})");
  EXPECT_EQ(util::ostream_op_string(Dict()), "Bidict()");
} // TEST(Bidict, Equality_and_print)

TEST(Bidict, Interfaces)
{
  Dict dict;
  Mutable<int, string>& writable = dict;
  const Readable<int, string>& readable = dict;

  writable.set(1, "a");
  writable.set(2, "b");
  EXPECT_EQ(readable.size(), 2u);
  EXPECT_EQ(readable.get(2), "b");
  EXPECT_EQ(readable.get_key("a"), 1);
  EXPECT_TRUE(readable.contains(1));
  EXPECT_TRUE(readable.contains_value("b"));
  writable.erase(1);
  EXPECT_FALSE(readable.contains(1));
  writable.clear();
  EXPECT_TRUE(readable.empty());

  static_assert(!Dict::S_IS_ORDERED);
  static_assert(!std::is_base_of_v<Ordered<int, string>, Dict>);
  static_assert(detail::is_dict_v<Dict>);
  static_assert(!detail::is_dict_v<Map>);
} // TEST(Bidict, Interfaces)

TEST(Bidict, Custom_hash)
{
  using Idict = Bidict<string, int, Ihash, Iequal>;
  Idict dict(0, { { "Alpha", 1 } });

  EXPECT_TRUE(dict.contains("ALPHA"));
  EXPECT_EQ(dict.get("alpha"), 1);
  dict.set("ALPHA", 2); // Same key (per the predicate): value replaced.
  EXPECT_EQ(dict.size(), 1u);
  EXPECT_EQ(dict.get_key(2), "Alpha"); // The stored key is unchanged.
} // TEST(Bidict, Custom_hash)

TEST(Bidict, Logging)
{
  Test_logger logger;
  Dict dict(&logger, { { 1, "a" }, { 2, "b" } });

  dict.set(3, "c");
  EXPECT_NE(logger.logged().find("[trce]: "), string::npos) << logger.logged();
  EXPECT_NE(logger.logged().find("Write (forward) committed"), string::npos) << logger.logged();

  dict.force_set(4, "a");
  EXPECT_NE(logger.logged().find("[debg]: "), string::npos) << logger.logged();

  Error_code err_code;
  dict.set(5, "b", &err_code);
  EXPECT_NE(logger.logged().find("[warn]: "), string::npos) << logger.logged();
  EXPECT_NE(logger.logged().find("BIDI-DICT"), string::npos) << logger.logged();

  // Filtered: nothing at TRACE when the logger is at INFO.
  Test_logger quiet_logger(log::Sev::S_INFO);
  Dict quiet(&quiet_logger, { { 1, "a" } });
  quiet.set(2, "b");
  EXPECT_EQ(quiet_logger.logged(), "");
} // TEST(Bidict, Logging)

} // namespace bidi::dict::test
