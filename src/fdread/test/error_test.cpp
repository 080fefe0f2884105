/* fdread: Asynchronous descriptor reader
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

#include "fdread/error.hpp"
#include "fdread/test/test_common_util.hpp"
#include <gtest/gtest.h>
#include <flow/util/util.hpp>
#include <boost/lexical_cast.hpp>
#include <set>

namespace fdread::error::test
{

/// Tests the error category: name, messages, and that each code converts to a truthy #Error_code.
TEST(Error, Category)
{
  using fdread::test::to_underlying;

  std::set<std::string> messages;
  for (auto code_int = to_underlying(Code::S_READER_OPEN_FAILED);
       code_int != to_underlying(Code::S_END_SENTINEL);
       ++code_int)
  {
    const Error_code err_code = Code(code_int);
    EXPECT_TRUE(err_code);
    EXPECT_STREQ(err_code.category().name(), "fdread");
    EXPECT_FALSE(err_code.message().empty());
    EXPECT_TRUE(messages.insert(err_code.message()).second) << "Messages should be distinct.";
  }
  EXPECT_EQ(to_underlying(Code::S_READER_OPEN_FAILED), S_CODE_LOWEST_INT_VALUE);

  EXPECT_NE(Error_code(Code::S_READER_NOT_STARTED), Error_code(Code::S_READER_ALREADY_STARTED));
}

/// Tests `<<` and `>>` on Code.
TEST(Error, Code_symbols)
{
  using boost::lexical_cast;

  EXPECT_EQ(flow::util::ostream_op_string(Code::S_READER_NOT_STARTED), "READER_NOT_STARTED");
  EXPECT_EQ(flow::util::ostream_op_string(Code::S_FUTURE_CANCELED), "FUTURE_CANCELED");

  EXPECT_EQ(lexical_cast<Code>("READER_ALREADY_STARTED"), Code::S_READER_ALREADY_STARTED);
  EXPECT_EQ(lexical_cast<Code>("READER_CHANNEL_CREATION_FAILED"), Code::S_READER_CHANNEL_CREATION_FAILED);
  EXPECT_EQ(lexical_cast<Code>(flow::util::ostream_op_string(Code::S_READER_OPEN_FAILED)),
            Code::S_READER_OPEN_FAILED);
}

} // namespace fdread::error::test
