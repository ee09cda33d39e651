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

namespace bidi::dict::test
{

namespace
{
using std::string;
using bidi::test::Test_logger;
using bidi::test::expect_throw_code;

using Country_capital_base = Bidict<string, string>;
BIDI_DICT_NAMED_BIDICT(Country_capital, Country_capital_base, country, capital);

using Id_name_base = Ordered_bidict<int, string>;
BIDI_DICT_NAMED_BIDICT(Id_name, Id_name_base, id, name);

using Frozen_id_name_base = Frozen_bidict<int, string>;
BIDI_DICT_NAMED_BIDICT(Frozen_id_name, Frozen_id_name_base, id, name);

} // Anonymous namespace

TEST(Named_bidict, Names)
{
  static_assert(accessor_names_valid("country", "capital"));
  static_assert(accessor_names_valid("_key", "value2"));
  static_assert(!accessor_names_valid("same", "same"));
  static_assert(!accessor_names_valid("", "value"));
  static_assert(!accessor_names_valid("2nd", "value"));
  static_assert(!accessor_names_valid("key", "a-b"));
  static_assert(!accessor_names_valid("key", "a b"));

  EXPECT_EQ(Country_capital::S_KEY_NAME, "country");
  EXPECT_EQ(Country_capital::S_VALUE_NAME, "capital");

  Test_logger logger;
  Error_code err_code;
  EXPECT_TRUE(validate_accessor_names(&logger, "country", "capital", &err_code));
  EXPECT_FALSE(err_code);
  EXPECT_FALSE(validate_accessor_names(&logger, "country", "country", &err_code));
  EXPECT_EQ(err_code, error::Code::S_INVALID_ACCESSOR_NAME);
  expect_throw_code([&]() { validate_accessor_names(&logger, "x.y", "z"); },
                    error::Code::S_INVALID_ACCESSOR_NAME, CTX);
  EXPECT_NE(logger.logged().find("[x.y]"), string::npos) << logger.logged();
} // TEST(Named_bidict, Names)

TEST(Named_bidict, Accessors)
{
  Test_logger logger;
  Country_capital dict(&logger, { { "France", "Paris" }, { "Japan", "Tokyo" } });

  EXPECT_EQ(dict.capital_for("France"), "Paris");
  EXPECT_EQ(dict.country_for("Tokyo"), "Japan");
  EXPECT_TRUE(dict.country_for().contains("Paris"));
  EXPECT_EQ(dict.capital_for().size(), 2u);
  EXPECT_EQ(&dict.capital_for(), &dict);
  expect_throw_code([&]() { dict.capital_for("Spain"); }, error::Code::S_KEY_NOT_FOUND, CTX);
  Error_code err_code;
  EXPECT_EQ(dict.country_for("Madrid", &err_code), "");
  EXPECT_EQ(err_code, error::Code::S_VALUE_NOT_FOUND);

  // Writes through either direction; the base API is all there.
  dict.country_for().set("Madrid", "Spain");
  EXPECT_EQ(dict.capital_for("Spain"), "Madrid");
  dict.capital_for().erase("Japan");
  dict.set("Italy", "Rome");
  EXPECT_EQ(dict, (std::map<string, string>{ { "France", "Paris" }, { "Spain", "Madrid" }, { "Italy", "Rome" } }));

  const Country_capital& const_dict = dict;
  EXPECT_EQ(const_dict.country_for().get("Rome"), "Italy");
  EXPECT_EQ(const_dict.capital_for().get("France"), "Paris");

  EXPECT_EQ(util::ostream_op_string(Country_capital(0, { { "Peru", "Lima" } })), "Country_capital({Peru: Lima})");
  EXPECT_EQ(util::ostream_op_string(Country_capital()), "Country_capital()");
} // TEST(Named_bidict, Accessors)

TEST(Named_bidict, Conversions)
{
  const Country_capital_base plain(0, { { "France", "Paris" } }, Collision_policy::S_OVERWRITE);

  Country_capital named(plain);
  EXPECT_EQ(named.collision_policy(), Collision_policy::S_OVERWRITE);
  EXPECT_EQ(named.country_for("Paris"), "France");
  named.set("Gaul", "Paris");
  EXPECT_EQ(plain.get("France"), "Paris");

  const Country_capital_base& as_base = named;
  EXPECT_EQ(as_base.get("Gaul"), "Paris");
  EXPECT_TRUE(as_base != plain);

  Country_capital copy(named);
  EXPECT_EQ(copy, named);
  Country_capital moved(Country_capital_base(0, { { "Chile", "Santiago" } }));
  EXPECT_EQ(moved.capital_for("Chile"), "Santiago");
} // TEST(Named_bidict, Conversions)

TEST(Named_bidict, Other_bases)
{
  Id_name ids(0, { { 1, "a" }, { 2, "b" } });
  ids.move_to_front(2);
  EXPECT_EQ(ids.front().first, 2);
  EXPECT_EQ(ids.name_for(1), "a");
  EXPECT_EQ(ids.id_for("b"), 2);
  ids.id_for().force_set("c", 1);
  EXPECT_EQ(util::ostream_op_string(ids), "Id_name({2: b, 1: c})");

  const Frozen_id_name frozen(0, { { 1, "a" } });
  EXPECT_EQ(frozen.id_for("a"), 1);
  EXPECT_EQ(frozen.name_for().get(1), "a");
  EXPECT_EQ(frozen.id_for().size(), 1u);
  EXPECT_EQ(hash_value(frozen), frozen.hash_value());

  Frozen_id_name frozen2(0, { { 1, "a" } });
  expect_throw_code([&]() { frozen2.set(2, "b"); }, error::Code::S_IMMUTABLE, CTX);
  EXPECT_EQ(frozen2, frozen);
} // TEST(Named_bidict, Other_bases)

} // namespace bidi::dict::test
