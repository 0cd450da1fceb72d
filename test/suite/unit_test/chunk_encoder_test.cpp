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

#include "gelf/transport/chunk_encoder.hpp"
#include "gelf/error.hpp"
#include "gelf/test/test_common_util.hpp"
#include "gelf/test/test_logger.hpp"
#include <gtest/gtest.h>
#include <flow/error/error.hpp>
#include <boost/random/mersenne_twister.hpp>
#include <algorithm>
#include <set>

namespace gelf::transport::test
{

namespace
{

using gelf::test::Capturing_sink;
using gelf::test::reassemble_gelf;
using gelf::test::pseudo_random_bytes;
using std::string;

constexpr size_t S_FRAME_SIZE = 100;
constexpr size_t S_PAYLOAD_SIZE = S_FRAME_SIZE - Chunk_encoder::S_HEADER_SIZE;

/// Writes `msg` in pieces of (at most) `piece_size`, then flushes; returns the flush result.
Error_code send_msg(Chunk_encoder* encoder, const string& msg, size_t piece_size = 7)
{
  Error_code err_code;
  for (size_t pos = 0; pos < msg.size(); pos += piece_size)
  {
    const auto piece = msg.substr(pos, piece_size);
    encoder->write(util::to_blob(piece), &err_code);
    if (err_code)
    {
      break;
    }
  }
  Error_code flush_err_code;
  encoder->flush(&flush_err_code);
  return err_code ? err_code : flush_err_code;
}

} // Anonymous namespace

TEST(Chunk_encoder, Invalid_frame_size)
{
  gelf::test::Test_logger logger;
  Capturing_sink sink;
  Error_code err_code;

  Chunk_encoder bad(&logger, "bad", &sink, Chunk_encoder::S_HEADER_SIZE, &err_code);
  EXPECT_EQ(err_code, error::Code::S_INVALID_FRAME_SIZE);

  EXPECT_THROW(Chunk_encoder bad2(&logger, "bad2", &sink, 5), flow::error::Runtime_error);

  Chunk_encoder good(&logger, "good", &sink, Chunk_encoder::S_HEADER_SIZE + 1, &err_code);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(good.chunk_payload_size(), 1u);
  EXPECT_EQ(good.max_message_size(), Chunk_encoder::S_MAX_CHUNK_COUNT);
}

TEST(Chunk_encoder, Single_frame)
{
  gelf::test::Test_logger logger;
  Capturing_sink sink;
  Chunk_encoder encoder(&logger, "single", &sink, S_FRAME_SIZE);

  // Empty flush: nothing to send.
  encoder.flush();
  EXPECT_TRUE(sink.frames().empty());
  EXPECT_EQ(encoder.sent_message_count(), 0u);

  // Up to the full frame size: sent raw, without chunk header.
  for (const size_t size : { size_t(1), S_PAYLOAD_SIZE, S_FRAME_SIZE })
  {
    sink.clear();
    const auto msg = pseudo_random_bytes(size, unsigned(size));
    ASSERT_FALSE(send_msg(&encoder, msg));
    ASSERT_EQ(sink.frames().size(), 1u);
    EXPECT_EQ(sink.frames().front(), msg);
    EXPECT_EQ(encoder.pending_size(), 0u);
  }
  EXPECT_EQ(encoder.sent_message_count(), 3u);
}

TEST(Chunk_encoder, Chunked)
{
  gelf::test::Test_logger logger;
  Capturing_sink sink;
  Chunk_encoder encoder(&logger, "chunked", &sink, S_FRAME_SIZE);

  std::set<string> msg_ids;
  for (const size_t size : { S_FRAME_SIZE + 1, S_PAYLOAD_SIZE * 2, (S_PAYLOAD_SIZE * 2) + 1,
                             S_PAYLOAD_SIZE * Chunk_encoder::S_MAX_CHUNK_COUNT })
  {
    sink.clear();
    const auto msg = pseudo_random_bytes(size, unsigned(size));
    ASSERT_FALSE(send_msg(&encoder, msg, 13));

    const size_t n_chunks = (size + S_PAYLOAD_SIZE - 1) / S_PAYLOAD_SIZE;
    ASSERT_EQ(sink.frames().size(), n_chunks) << "Message size [" << size << "].";

    for (size_t idx = 0; idx != n_chunks; ++idx)
    {
      const auto& frame = sink.frames()[idx];
      EXPECT_LE(frame.size(), S_FRAME_SIZE);
      EXPECT_EQ(uint8_t(frame[0]), Chunk_encoder::S_MAGIC_BYTE_0);
      EXPECT_EQ(uint8_t(frame[1]), Chunk_encoder::S_MAGIC_BYTE_1);
      EXPECT_EQ(size_t(uint8_t(frame[10])), idx); // Sent in order.
      EXPECT_EQ(size_t(uint8_t(frame[11])), n_chunks);
      if (idx != (n_chunks - 1))
      {
        EXPECT_EQ(frame.size(), S_FRAME_SIZE); // All but the last one are full.
      }
    }
    msg_ids.insert(sink.frames().front().substr(2, Chunk_encoder::S_MESSAGE_ID_SIZE));

    const auto reassembled = reassemble_gelf(sink.frames());
    ASSERT_TRUE(reassembled);
    EXPECT_EQ(*reassembled, msg);

    // Datagrams may arrive in any order: the headers alone must suffice to put the message back together.
    auto shuffled = sink.frames();
    std::shuffle(shuffled.begin(), shuffled.end(), boost::random::mt19937(unsigned(size)));
    const auto reassembled_shuffled = reassemble_gelf(shuffled);
    ASSERT_TRUE(reassembled_shuffled);
    EXPECT_EQ(*reassembled_shuffled, msg);

    // A missing frame is detected, not papered over.
    shuffled.pop_back();
    EXPECT_FALSE(reassemble_gelf(shuffled));
  }
  EXPECT_EQ(msg_ids.size(), 4u); // Each message gets its own ID.
  EXPECT_EQ(encoder.sent_message_count(), 4u);
}

TEST(Chunk_encoder, Too_large)
{
  gelf::test::Test_logger logger;
  Capturing_sink sink;
  Chunk_encoder encoder(&logger, "too_large", &sink, S_FRAME_SIZE);

  const auto msg = pseudo_random_bytes(encoder.max_message_size() + 1);
  Error_code err_code;
  encoder.write(util::to_blob(msg.substr(0, 10)), &err_code);
  EXPECT_FALSE(err_code);
  encoder.write(util::to_blob(msg.substr(10)), &err_code);
  EXPECT_EQ(err_code, error::Code::S_CHUNK_COUNT_EXCEEDED);
  EXPECT_EQ(encoder.pending_size(), 0u);

  // The message is lost: further writes fail too, and flush sends nothing.
  encoder.write(util::to_blob(msg.substr(0, 1)), &err_code);
  EXPECT_EQ(err_code, error::Code::S_CHUNK_COUNT_EXCEEDED);
  encoder.flush(&err_code);
  EXPECT_EQ(err_code, error::Code::S_CHUNK_COUNT_EXCEEDED);
  EXPECT_TRUE(sink.frames().empty());
  EXPECT_EQ(encoder.sent_message_count(), 0u);

  // The flush reset it: the next message is fine.
  const string next_msg = "next";
  EXPECT_FALSE(send_msg(&encoder, next_msg));
  ASSERT_EQ(sink.frames().size(), 1u);
  EXPECT_EQ(sink.frames().front(), next_msg);
}

TEST(Chunk_encoder, Send_failure)
{
  gelf::test::Test_logger logger;
  Capturing_sink sink;
  Chunk_encoder encoder(&logger, "send_failure", &sink, S_FRAME_SIZE);

  // Fail the 2nd chunk of the 1st message: the remaining chunks are not sent.
  sink.fail_at(1, boost::asio::error::connection_refused);
  const auto msg = pseudo_random_bytes(S_PAYLOAD_SIZE * 3);
  EXPECT_EQ(send_msg(&encoder, msg), boost::asio::error::connection_refused);
  EXPECT_EQ(sink.frames().size(), 1u);
  EXPECT_EQ(encoder.sent_message_count(), 0u);
  EXPECT_EQ(encoder.pending_size(), 0u);

  // Unaffected afterwards.
  sink.clear();
  EXPECT_FALSE(send_msg(&encoder, msg));
  EXPECT_EQ(sink.frames().size(), 3u);
  EXPECT_EQ(encoder.sent_message_count(), 1u);
}

} // namespace gelf::transport::test
