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


#include "bidi/error/error.hpp"
#include "bidi/log/log.hpp"
#include "bidi/test/test_logger.hpp"
#include <boost/system/error_code.hpp>
#include <gtest/gtest.h>

namespace bidi::error::test
{

namespace
{
using std::string;
using boost::system::errc::errc_t;
using boost::system::errc::make_error_code;

/// Toy class with methods reporting errors the way bidi APIs do.
class Divider :
  public log::Log_context
{
public:
  explicit Divider(log::Logger* logger_ptr) :
    log::Log_context(logger_ptr, Bidi_log_component::S_ERROR),
    m_n_calls(0)
  {
    // Nothing else.
  }

  int divide(int num, int den, Error_code* err_code = 0)
  {
    BIDI_ERROR_EXEC_AND_THROW_ON_ERROR(int, divide, num, den, _1);
    // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

    ++m_n_calls;
    if (den == 0)
    {
      BIDI_ERROR_EMIT_ERROR(make_error_code(errc_t::invalid_argument));
      return 0;
    }
    // else

    err_code->clear();
    return num / den;
  }

  void check_positive(int num, Error_code* err_code = 0)
  {
    BIDI_ERROR_EXEC_VOID_AND_THROW_ON_ERROR(check_positive, num, _1);
    // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

    ++m_n_calls;
    if (num <= 0)
    {
      BIDI_ERROR_EMIT_ERROR(make_error_code(errc_t::result_out_of_range));
      return;
    }
    // else
    err_code->clear();
  }

  unsigned int m_n_calls;
}; // class Divider

} // Anonymous namespace

TEST(Runtime_error, Interface)
{
  const Error_code code = make_error_code(errc_t::invalid_argument);

  const Runtime_error with_code(code, "ctx-a");
  EXPECT_EQ(with_code.code(), code);
  const string what_with_code = with_code.what();
  EXPECT_NE(what_with_code.find("ctx-a"), string::npos) << what_with_code;
  EXPECT_NE(what_with_code.find(code.message()), string::npos) << what_with_code;

  const Runtime_error without_code("ctx-b");
  EXPECT_FALSE(without_code.code());
  EXPECT_EQ(string(without_code.what()), "ctx-b");
} // TEST(Runtime_error, Interface)

TEST(Error_exec_and_throw, Interface)
{
  bidi::test::Test_logger logger;
  Divider divider(&logger);

  // Non-null err_code: success clears it; failure sets it, logs a warning, and returns the neutral value.
  Error_code err_code = make_error_code(errc_t::io_error);
  EXPECT_EQ(divider.divide(6, 3, &err_code), 2);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(divider.divide(6, 0, &err_code), 0);
  EXPECT_EQ(err_code, make_error_code(errc_t::invalid_argument));
  EXPECT_NE(logger.logged().find("[warn]: "), string::npos) << logger.logged();
  EXPECT_NE(logger.logged().find("Failing with"), string::npos) << logger.logged();
  EXPECT_EQ(divider.m_n_calls, 2u);

  // Null err_code: success returns normally, via exactly one inner call.
  EXPECT_EQ(divider.divide(7, 7), 1);
  EXPECT_EQ(divider.m_n_calls, 3u);

  // Null err_code: failure throws, with the code and the source location of the throwing method.
  try
  {
    divider.divide(1, 0);
    ADD_FAILURE() << "Should have thrown.";
  }
  catch (const Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), make_error_code(errc_t::invalid_argument));
    EXPECT_NE(string(exc.what()).find("divide"), string::npos) << exc.what();
  }

  divider.check_positive(1);
  EXPECT_THROW(divider.check_positive(0), Runtime_error);
  divider.check_positive(-1, &err_code);
  EXPECT_EQ(err_code, make_error_code(errc_t::result_out_of_range));
  divider.check_positive(5, &err_code);
  EXPECT_FALSE(err_code);
} // TEST(Error_exec_and_throw, Interface)

} // namespace bidi::error::test
