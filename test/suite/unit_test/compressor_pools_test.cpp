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

#include "gelf/transport/compressor_pools.hpp"
#include "gelf/transport/compressor.hpp"
#include "gelf/transport/chunk_encoder.hpp"
#include "gelf/error.hpp"
#include "gelf/test/test_common_util.hpp"
#include "gelf/test/test_logger.hpp"
#include <gtest/gtest.h>
#include <boost/lexical_cast.hpp>

namespace gelf::transport::test
{

namespace
{

using gelf::test::Capturing_sink;
using gelf::test::reassemble_gelf;
using gelf::test::inflate_any;
using gelf::test::pseudo_random_bytes;
using std::string;

constexpr size_t S_FRAME_SIZE = 200;

/// A readable, highly compressible message of the given size.
string text_msg(size_t size)
{
  string msg;
  while (msg.size() < size)
  {
    msg += "{\"short_message\":\"the quick brown fox\",\"level\":6}";
  }
  msg.resize(size);
  return msg;
}

} // Anonymous namespace

TEST(Compressor_pools, Round_trip)
{
  gelf::test::Test_logger logger;
  Capturing_sink sink;
  Chunk_encoder encoder(&logger, "pools", &sink, S_FRAME_SIZE);
  Compressor_pools pools(&logger, &encoder);

  const auto small_msg = text_msg(150);
  // Incompressible, so that compressed it still needs several chunks.
  const auto big_msg = pseudo_random_bytes(S_FRAME_SIZE * 10);

  for (const auto compression : { Compression::S_NONE, Compression::S_GZIP, Compression::S_ZLIB })
  {
    for (const auto& msg : { small_msg, big_msg })
    {
      sink.clear();
      Error_code err_code;
      pools.write_msg(util::to_blob(msg), compression, &err_code);
      ASSERT_FALSE(err_code) << "Compression [" << compression << "]; size [" << msg.size() << "].";

      const auto payload = reassemble_gelf(sink.frames());
      ASSERT_TRUE(payload);
      if (compression == Compression::S_NONE)
      {
        EXPECT_EQ(*payload, msg);
        continue;
      }
      // else

      ASSERT_GE(payload->size(), 2u);
      if (compression == Compression::S_GZIP)
      {
        EXPECT_EQ(uint8_t((*payload)[0]), 0x1f);
        EXPECT_EQ(uint8_t((*payload)[1]), 0x8b);
      }
      else
      {
        EXPECT_EQ(uint8_t((*payload)[0]), 0x78);
      }
      const auto inflated = inflate_any(*payload);
      ASSERT_TRUE(inflated);
      EXPECT_EQ(*inflated, msg);
    }
  }

  EXPECT_EQ(encoder.sent_message_count(), 6u);
}

TEST(Compressor_pools, Compressors_are_reused)
{
  gelf::test::Test_logger logger;
  Capturing_sink sink;
  Chunk_encoder encoder(&logger, "reuse", &sink, S_FRAME_SIZE);
  Compressor_pools pools(&logger, &encoder);

  for (int idx = 0; idx != 5; ++idx)
  {
    pools.write_msg(util::to_blob(text_msg(1000 + idx)), Compression::S_GZIP);
  }
  pools.write_msg(util::to_blob(text_msg(100)), Compression::S_ZLIB);

  EXPECT_EQ(pools.pool(Compression::S_GZIP).created_count(), 1u);
  EXPECT_EQ(pools.pool(Compression::S_GZIP).idle_count(), 1u);
  EXPECT_EQ(pools.pool(Compression::S_ZLIB).created_count(), 1u);
  EXPECT_EQ(pools.pool(Compression::S_ZLIB).idle_count(), 1u);
  EXPECT_EQ(encoder.sent_message_count(), 6u);
}

TEST(Compressor_pools, Too_large)
{
  gelf::test::Test_logger logger;
  Capturing_sink sink;
  Chunk_encoder encoder(&logger, "too_large", &sink, S_FRAME_SIZE);
  Compressor_pools pools(&logger, &encoder);

  const auto huge_msg = pseudo_random_bytes(encoder.max_message_size() * 2);

  for (const auto compression : { Compression::S_NONE, Compression::S_GZIP })
  {
    Error_code err_code;
    pools.write_msg(util::to_blob(huge_msg), compression, &err_code);
    EXPECT_EQ(err_code, error::Code::S_CHUNK_COUNT_EXCEEDED);
  }
  EXPECT_TRUE(sink.frames().empty());

  // The failed compressor was discarded rather than returned to the pool.
  EXPECT_EQ(pools.pool(Compression::S_GZIP).created_count(), 1u);
  EXPECT_EQ(pools.pool(Compression::S_GZIP).idle_count(), 0u);

  // Everything works normally afterwards, with a fresh compressor.
  const auto msg = text_msg(500);
  Error_code err_code;
  pools.write_msg(util::to_blob(msg), Compression::S_GZIP, &err_code);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(pools.pool(Compression::S_GZIP).created_count(), 2u);
  const auto payload = reassemble_gelf(sink.frames());
  ASSERT_TRUE(payload);
  EXPECT_EQ(inflate_any(*payload), msg);
}

TEST(Compression, Symbolic_io)
{
  using boost::lexical_cast;

  EXPECT_EQ(lexical_cast<std::string>(Compression::S_GZIP), "GZIP");
  EXPECT_EQ(lexical_cast<Compression>("zlib"), Compression::S_ZLIB);
  EXPECT_EQ(lexical_cast<Compression>("None"), Compression::S_NONE);
  EXPECT_EQ(lexical_cast<Compression>("GZIP"), Compression::S_GZIP);
  EXPECT_EQ(lexical_cast<std::string>(static_cast<Compression>(42)), "UNKNOWN(42)");
}

} // namespace gelf::transport::test
