/* Flow-GELF: Client
 * Copyright 2023 Akamai Technologies, Inc.
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

#include "gelf/error.hpp"
#include "gelf/test/test_common_util.hpp"
#include <gtest/gtest.h>
#include <boost/lexical_cast.hpp>
#include <flow/error/error.hpp>

namespace gelf::error::test
{

using gelf::test::to_underlying;

TEST(Error_code, Category)
{
  const Error_code err_code = Code::S_CHUNK_COUNT_EXCEEDED;
  EXPECT_TRUE(err_code);
  EXPECT_STREQ(err_code.category().name(), "gelf");
  EXPECT_FALSE(err_code.message().empty());
  EXPECT_EQ(err_code, make_error_code(Code::S_CHUNK_COUNT_EXCEEDED));
  EXPECT_NE(err_code, make_error_code(Code::S_COMPRESSION_FAILED));
}

TEST(Error_code, Distinct_messages)
{
  for (auto code_int = S_CODE_LOWEST_INT_VALUE; code_int != to_underlying(Code::S_END_SENTINEL); ++code_int)
  {
    const Error_code err_code = Code(code_int);
    for (auto other_int = code_int + 1; other_int != to_underlying(Code::S_END_SENTINEL); ++other_int)
    {
      EXPECT_NE(err_code.message(), make_error_code(Code(other_int)).message());
    }
  }
}

TEST(Error_code, Symbolic_io)
{
  using boost::lexical_cast;
  using std::string;

  EXPECT_EQ(lexical_cast<string>(Code::S_URI_MALFORMED), "URI_MALFORMED");
  EXPECT_EQ(lexical_cast<Code>("URI_UNSUPPORTED_SCHEME"), Code::S_URI_UNSUPPORTED_SCHEME);
  EXPECT_EQ(lexical_cast<Code>("invalid_frame_size"), Code::S_INVALID_FRAME_SIZE);

  for (auto code_int = S_CODE_LOWEST_INT_VALUE; code_int != to_underlying(Code::S_END_SENTINEL); ++code_int)
  {
    const auto code = Code(code_int);
    EXPECT_EQ(lexical_cast<Code>(lexical_cast<string>(code)), code);
  }
}

TEST(Error_code, Runtime_error)
{
  const Error_code err_code = Code::S_NOT_CONNECTED;
  try
  {
    throw flow::error::Runtime_error(err_code, "context");
  }
  catch (const flow::error::Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), err_code);
  }
}

} // namespace gelf::error::test
