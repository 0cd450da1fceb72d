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
#pragma once

#include "gelf/message.hpp"
#include "gelf/util/util_fwd.hpp"
#include <flow/util/util.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/noncopyable.hpp>
#include <deque>

namespace gelf::detail
{

// Types.

/**
 * The client's unbounded FIFO of messages awaiting dispatch.  The intake worker appends; the dispatcher pops from
 * the front.  The lock is held only for the duration of an append or pop, never across I/O.
 *
 * Besides non-blocking pop_front(), the dispatcher can wait for a message with a timeout (wait_pop_front()); wake()
 * makes such a wait return early even though nothing was queued, which is how a stop request reaches an idle
 * dispatcher promptly.
 */
class Backing_queue :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /// Constructs empty queue.
  Backing_queue();

  // Methods.

  /**
   * Appends message; wakes a wait_pop_front() if any.
   *
   * @param msg
   *        Message.  Not null.
   */
  void push_back(Message::Const_ptr&& msg);

  /**
   * Pops front message if any.
   *
   * @param msg
   *        Target.  Untouched if `false` returned.
   * @return `true` if popped.
   */
  bool pop_front(Message::Const_ptr* msg);

  /**
   * Pops front message, first waiting up to `timeout` for one to appear.  Returns early without a message if
   * wake() is (or was, since the last return of this method) called while the queue is empty.
   *
   * @param msg
   *        Target.  Untouched if `false` returned.
   * @param timeout
   *        Max wait.
   * @return `true` if popped.
   */
  bool wait_pop_front(Message::Const_ptr* msg, util::Fine_duration timeout);

  /// See wait_pop_front().
  void wake();

  /**
   * Number of messages queued.
   *
   * @return See above.
   */
  size_t size() const;

private:
  // Types.

  /// Short-hand for the mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for the lock type.
  using Lock = flow::util::Lock_guard<Mutex>;

  // Data.

  /// Protects the rest.
  mutable Mutex m_mutex;

  /// The messages.
  std::deque<Message::Const_ptr> m_msgs;

  /// Whether wake() has been called and not yet consumed by wait_pop_front().
  bool m_woken;

  /// Notified on push_back() and wake().
  boost::condition_variable m_cond;
}; // class Backing_queue

} // namespace gelf::detail
