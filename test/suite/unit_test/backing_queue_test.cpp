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

#include "gelf/detail/backing_queue.hpp"
#include <gtest/gtest.h>
#include <boost/make_shared.hpp>
#include <boost/thread/thread.hpp>

namespace gelf::detail::test
{

namespace
{
using flow::Fine_clock;
using boost::chrono::milliseconds;
using boost::chrono::seconds;

const milliseconds S_SHORT_TIMEOUT(100);
const seconds S_LONG_TIMEOUT(10);

Message::Const_ptr make_msg(int seq)
{
  return boost::make_shared<Message>(Message::Fields{ { "_seq", seq } });
}

int seq_of(const Message::Const_ptr& msg)
{
  return msg->fields().at("_seq").get<int>();
}
} // Anonymous namespace

TEST(Backing_queue, Fifo)
{
  Backing_queue queue;
  Message::Const_ptr msg;
  EXPECT_EQ(queue.size(), 0u);
  EXPECT_FALSE(queue.pop_front(&msg));
  EXPECT_FALSE(msg);

  for (int seq = 0; seq != 3; ++seq)
  {
    queue.push_back(make_msg(seq));
  }
  EXPECT_EQ(queue.size(), 3u);

  ASSERT_TRUE(queue.pop_front(&msg));
  EXPECT_EQ(seq_of(msg), 0);
  ASSERT_TRUE(queue.wait_pop_front(&msg, S_SHORT_TIMEOUT)); // Non-empty: no waiting.
  EXPECT_EQ(seq_of(msg), 1);
  ASSERT_TRUE(queue.pop_front(&msg));
  EXPECT_EQ(seq_of(msg), 2);
  EXPECT_EQ(queue.size(), 0u);
}

TEST(Backing_queue, Wait_times_out)
{
  Backing_queue queue;
  Message::Const_ptr msg;

  const auto start = Fine_clock::now();
  EXPECT_FALSE(queue.wait_pop_front(&msg, S_SHORT_TIMEOUT));
  const auto elapsed = Fine_clock::now() - start;
  EXPECT_FALSE(msg);
  EXPECT_GE(elapsed, S_SHORT_TIMEOUT / 2); // Leave slack for clock granularity.
  EXPECT_LT(elapsed, S_LONG_TIMEOUT);
}

TEST(Backing_queue, Wake_is_sticky_until_consumed)
{
  Backing_queue queue;
  Message::Const_ptr msg;

  // wake() ahead of the wait is not lost: the wait returns at once.
  queue.wake();
  auto start = Fine_clock::now();
  EXPECT_FALSE(queue.wait_pop_front(&msg, S_LONG_TIMEOUT));
  EXPECT_LT(Fine_clock::now() - start, S_LONG_TIMEOUT / 2);

  // ...and that consumed it: the next wait runs to its timeout.
  start = Fine_clock::now();
  EXPECT_FALSE(queue.wait_pop_front(&msg, S_SHORT_TIMEOUT));
  EXPECT_GE(Fine_clock::now() - start, S_SHORT_TIMEOUT / 2);

  // A wake() that coincides with a message yields the message; the wake-up stays pending for the next wait.
  queue.wake();
  queue.push_back(make_msg(7));
  ASSERT_TRUE(queue.wait_pop_front(&msg, S_LONG_TIMEOUT));
  EXPECT_EQ(seq_of(msg), 7);
  start = Fine_clock::now();
  EXPECT_FALSE(queue.wait_pop_front(&msg, S_LONG_TIMEOUT));
  EXPECT_LT(Fine_clock::now() - start, S_LONG_TIMEOUT / 2);
}

TEST(Backing_queue, Waiter_woken_from_other_thread)
{
  Backing_queue queue;

  // By a message.
  {
    Message::Const_ptr msg;
    boost::thread pusher([&]()
    {
      boost::this_thread::sleep_for(S_SHORT_TIMEOUT);
      queue.push_back(make_msg(1));
    });
    const auto start = Fine_clock::now();
    ASSERT_TRUE(queue.wait_pop_front(&msg, S_LONG_TIMEOUT));
    EXPECT_LT(Fine_clock::now() - start, S_LONG_TIMEOUT / 2);
    EXPECT_EQ(seq_of(msg), 1);
    pusher.join();
  }

  // By wake().
  {
    Message::Const_ptr msg;
    boost::thread waker([&]()
    {
      boost::this_thread::sleep_for(S_SHORT_TIMEOUT);
      queue.wake();
    });
    const auto start = Fine_clock::now();
    EXPECT_FALSE(queue.wait_pop_front(&msg, S_LONG_TIMEOUT));
    EXPECT_LT(Fine_clock::now() - start, S_LONG_TIMEOUT / 2);
    waker.join();
  }
}

} // namespace gelf::detail::test
