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
#include "gelf/detail/backing_queue.hpp"

namespace gelf::detail
{

Backing_queue::Backing_queue() :
  m_woken(false)
{
  // Yay.
}

void Backing_queue::push_back(Message::Const_ptr&& msg)
{
  assert(msg && "Queue holds non-null messages only.");
  {
    Lock lock(m_mutex);
    m_msgs.emplace_back(std::move(msg));
  }
  m_cond.notify_all();
}

bool Backing_queue::pop_front(Message::Const_ptr* msg)
{
  Lock lock(m_mutex);
  if (m_msgs.empty())
  {
    return false;
  }
  // else

  *msg = std::move(m_msgs.front());
  m_msgs.pop_front();
  return true;
}

bool Backing_queue::wait_pop_front(Message::Const_ptr* msg, util::Fine_duration timeout)
{
  Lock lock(m_mutex);
  m_cond.wait_for(lock, timeout, [&]() -> bool { return m_woken || (!m_msgs.empty()); });

  if (m_msgs.empty())
  {
    // Timeout or wake().
    m_woken = false;
    return false;
  }
  // else

  *msg = std::move(m_msgs.front());
  m_msgs.pop_front();
  return true;
}

void Backing_queue::wake()
{
  {
    Lock lock(m_mutex);
    m_woken = true;
  }
  m_cond.notify_all();
}

size_t Backing_queue::size() const
{
  Lock lock(m_mutex);
  return m_msgs.size();
}

} // namespace gelf::detail
