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

#include "gelf/util/worker_ctl.hpp"
#include "gelf/test/test_logger.hpp"
#include <gtest/gtest.h>
#include <boost/lexical_cast.hpp>
#include <boost/thread/thread.hpp>
#include <atomic>

namespace gelf::util::test
{

using Signal = Worker_ctl::Signal;
using State = Worker_ctl::State;

TEST(Worker_ctl, Handshake_steps)
{
  gelf::test::Test_logger logger;
  size_t n_wakes = 0;
  Worker_ctl ctl(&logger, "steps", [&]() { ++n_wakes; });

  EXPECT_EQ(ctl.state(), State::S_RUNNING);
  EXPECT_EQ(ctl.nickname(), "steps");

  // Nothing requested: worker keeps going.
  EXPECT_FALSE(ctl.process_request([]() -> bool { return true; }));
  EXPECT_EQ(ctl.state(), State::S_RUNNING);

  // Request while backlog remains: "not yet."
  ctl.send_request(Signal::S_CONTINUE_REQUEST);
  EXPECT_EQ(n_wakes, 1u);
  EXPECT_FALSE(ctl.process_request([]() -> bool { return true; }));
  EXPECT_EQ(ctl.await_reply(), Signal::S_CONTINUE_REQUEST);
  EXPECT_EQ(ctl.state(), State::S_RUNNING);
  EXPECT_EQ(ctl.continue_reply_count(), 1u);

  // Asked again with empty backlog: acknowledged; worker must stop.
  ctl.send_request(Signal::S_CONTINUE_REQUEST);
  EXPECT_EQ(n_wakes, 2u);
  EXPECT_TRUE(ctl.process_request([]() -> bool { return false; }));
  EXPECT_EQ(ctl.await_reply(), Signal::S_ACKNOWLEDGED);
  EXPECT_EQ(ctl.state(), State::S_STOPPED);
  EXPECT_EQ(ctl.continue_reply_count(), 1u);
}

TEST(Worker_ctl, Poll_and_reply)
{
  gelf::test::Test_logger logger;
  Worker_ctl ctl(&logger, "manual", []() {});

  Signal sig;
  EXPECT_FALSE(ctl.poll_request(&sig));

  ctl.send_request(Signal::S_CONTINUE_REQUEST);
  ASSERT_TRUE(ctl.poll_request(&sig));
  EXPECT_EQ(sig, Signal::S_CONTINUE_REQUEST);
  EXPECT_EQ(ctl.state(), State::S_DRAIN_REQUESTED);
  EXPECT_FALSE(ctl.poll_request(&sig)); // Mailbox is one-shot.

  ctl.reply(Signal::S_ACKNOWLEDGED);
  EXPECT_EQ(ctl.await_reply(), Signal::S_ACKNOWLEDGED);
  EXPECT_EQ(ctl.state(), State::S_STOPPED);
}

TEST(Worker_ctl, Drain_and_stop_waits_for_backlog)
{
  constexpr int N_ITEMS = 200;

  gelf::test::Test_logger logger;
  std::atomic<int> backlog(N_ITEMS);
  std::atomic<int> n_processed(0);
  Worker_ctl ctl(&logger, "drain", []() {});

  boost::thread worker([&]()
  {
    while (!ctl.process_request([&]() -> bool { return backlog != 0; }))
    {
      if (backlog != 0)
      {
        --backlog;
        ++n_processed;
        boost::this_thread::sleep_for(boost::chrono::microseconds(200));
      }
      else
      {
        boost::this_thread::sleep_for(boost::chrono::milliseconds(1));
      }
    }
  });

  ctl.drain_and_stop(); // Must not return before backlog is gone.
  EXPECT_EQ(backlog.load(), 0);
  EXPECT_EQ(n_processed.load(), N_ITEMS);
  EXPECT_EQ(ctl.state(), State::S_STOPPED);
  worker.join();
}

TEST(Worker_ctl, Symbolic_output)
{
  using boost::lexical_cast;
  using std::string;

  EXPECT_EQ(lexical_cast<string>(Signal::S_CONTINUE_REQUEST), "CONTINUE_REQUEST");
  EXPECT_EQ(lexical_cast<string>(Signal::S_ACKNOWLEDGED), "ACKNOWLEDGED");
  EXPECT_EQ(lexical_cast<string>(State::S_DRAIN_REQUESTED), "DRAIN_REQUESTED");
  EXPECT_EQ(int(Signal::S_CONTINUE_REQUEST), 1);
  EXPECT_EQ(int(Signal::S_ACKNOWLEDGED), 2);
}

} // namespace gelf::util::test
