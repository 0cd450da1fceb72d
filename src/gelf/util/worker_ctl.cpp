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

/// @file
#include "gelf/util/worker_ctl.hpp"

namespace gelf::util
{

Worker_ctl::Worker_ctl(flow::log::Logger* logger_ptr, String_view nickname_str, Task&& wake_worker_func) :
  flow::log::Log_context(logger_ptr, Log_component::S_UTIL),
  m_nickname(nickname_str),
  m_wake_worker_func(std::move(wake_worker_func)),
  m_state(State::S_RUNNING),
  m_n_continue_replies(0)
{
  assert(m_wake_worker_func && "Worker_ctl needs a way to wake its worker.");
}

void Worker_ctl::send_request(Signal sig)
{
  {
    Lock lock(m_mutex);
    m_request_taken_cond.wait(lock, [&]() -> bool { return !m_request; });
    m_request = sig;
  } // Lock lock(m_mutex)

  FLOW_LOG_TRACE("Worker_ctl [" << m_nickname << "]: Sent request [" << sig << "]; waking worker.");
  m_wake_worker_func();
}

Worker_ctl::Signal Worker_ctl::await_reply()
{
  Lock lock(m_mutex);
  m_reply_ready_cond.wait(lock, [&]() -> bool { return bool(m_reply); });

  const auto sig = *m_reply;
  m_reply.reset();
  return sig;
}

void Worker_ctl::drain_and_stop()
{
  FLOW_LOG_INFO("Worker_ctl [" << m_nickname << "]: Asking worker to drain its backlog and stop.");

  send_request(Signal::S_CONTINUE_REQUEST);
  for (auto sig = await_reply(); sig != Signal::S_ACKNOWLEDGED; sig = await_reply())
  {
    // Worker still busy; ask again (echo what we got).
    send_request(sig);
  }

  FLOW_LOG_INFO("Worker_ctl [" << m_nickname << "]: Worker acknowledged; it has stopped after answering "
                "[" << continue_reply_count() << "] continue-replies.");
}

bool Worker_ctl::poll_request(Signal* sig)
{
  {
    Lock lock(m_mutex);
    if (!m_request)
    {
      return false;
    }
    // else

    *sig = *m_request;
    m_request.reset();
    m_state = State::S_DRAIN_REQUESTED;
  } // Lock lock(m_mutex)

  m_request_taken_cond.notify_all();
  return true;
}

void Worker_ctl::reply(Signal sig)
{
  {
    Lock lock(m_mutex);
    assert((m_state == State::S_DRAIN_REQUESTED) && "reply() must answer exactly one poll_request()ed request.");
    assert((!m_reply) && "Requester must consume each reply before the next one is sent.");

    m_reply = sig;
    if (sig == Signal::S_ACKNOWLEDGED)
    {
      m_state = State::S_STOPPED;
    }
    else
    {
      m_state = State::S_RUNNING;
      ++m_n_continue_replies;
    }
  } // Lock lock(m_mutex)

  m_reply_ready_cond.notify_all();
}

bool Worker_ctl::process_request(const Function<bool ()>& backlog_remains_func)
{
  Signal sig;
  if (!poll_request(&sig))
  {
    return false;
  }
  // else

  if ((sig == Signal::S_CONTINUE_REQUEST) && backlog_remains_func())
  {
    FLOW_LOG_TRACE("Worker_ctl [" << m_nickname << "]: Stop requested, but backlog remains; replying "
                   "[" << Signal::S_CONTINUE_REQUEST << "].");
    reply(Signal::S_CONTINUE_REQUEST);
    return false;
  }
  // else

  FLOW_LOG_TRACE("Worker_ctl [" << m_nickname << "]: Stop requested, and backlog is empty; replying "
                 "[" << Signal::S_ACKNOWLEDGED << "]; worker shall now stop.");
  reply(Signal::S_ACKNOWLEDGED);
  return true;
} // Worker_ctl::process_request()

Worker_ctl::State Worker_ctl::state() const
{
  Lock lock(m_mutex);
  return m_state;
}

size_t Worker_ctl::continue_reply_count() const
{
  Lock lock(m_mutex);
  return m_n_continue_replies;
}

const std::string& Worker_ctl::nickname() const
{
  return m_nickname;
}

std::ostream& operator<<(std::ostream& os, Worker_ctl::Signal val)
{
  switch (val)
  {
  case Worker_ctl::Signal::S_CONTINUE_REQUEST:
    return os << "CONTINUE_REQUEST";
  case Worker_ctl::Signal::S_ACKNOWLEDGED:
    return os << "ACKNOWLEDGED";
  }
  return os << "UNKNOWN(" << int(val) << ')';
}

std::ostream& operator<<(std::ostream& os, Worker_ctl::State val)
{
  switch (val)
  {
  case Worker_ctl::State::S_RUNNING:
    return os << "RUNNING";
  case Worker_ctl::State::S_DRAIN_REQUESTED:
    return os << "DRAIN_REQUESTED";
  case Worker_ctl::State::S_STOPPED:
    return os << "STOPPED";
  }
  return os << "UNKNOWN(" << int(val) << ')';
}

} // namespace gelf::util
