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

#include "gelf/util/util_fwd.hpp"
#include "gelf/client.hpp"
#include "gelf/error.hpp"
#include "gelf/test/test_logger.hpp"
#include <gtest/gtest.h>

namespace gelf::util::test
{

TEST(Util, Local_host_name)
{
  gelf::test::Test_logger logger;

  /* The only failure this can report is error::Code::S_HOSTNAME_UNAVAILABLE (a gethostname() failure is not
   * passed through raw); on a sane machine there is no failure at all, and the name matches the OS one. */
  Error_code err_code = error::Code::S_HOSTNAME_UNAVAILABLE;
  const auto name = local_host_name(&logger, &err_code);
  ASSERT_FALSE(err_code) << "Got [" << err_code << "] [" << err_code.message() << "].";
  EXPECT_FALSE(name.empty());
  EXPECT_EQ(name, boost::asio::ip::host_name());

  EXPECT_EQ(local_host_name(&logger), name); // Throwing form.
  EXPECT_EQ(local_host_name(nullptr), name); // No logging.

  // Client takes the same name for the GELF host field.
  EXPECT_EQ(Client(&logger).hostname(), name);
}

TEST(Util, To_blob)
{
  const std::string str("abc");
  const auto blob = to_blob(str);
  EXPECT_EQ(blob.data(), static_cast<const void*>(str.data()));
  EXPECT_EQ(blob.size(), 3u);
  EXPECT_EQ(to_blob(EMPTY_STRING).size(), 0u);
}

} // namespace gelf::util::test
