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

#include "gelf/util/util_fwd.hpp"
#include <flow/log/log.hpp>
#include <flow/util/util.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/noncopyable.hpp>
#include <optional>

namespace gelf::util
{

// Types.

/**
 * Control link between a *requester* thread (the one wanting a worker to finish) and a long-running *worker* loop,
 * implementing a two-phase drain-then-stop handshake.  The worker is never told to stop outright: it is asked
 * whether it is done; it answers "not yet" while it still has backlog, and "done" exactly once, right before its
 * loop returns.  Hence a worker is only ever stopped with an empty backlog, and the requester knows for sure when
 * that has happened.
 *
 * ### Protocol ###
 * There are two one-slot mailboxes: requester-to-worker and worker-to-requester.  Each carries a Signal.
 *   -# Requester: send_request(Signal::S_CONTINUE_REQUEST).
 *   -# Worker, at a convenient point in its loop: poll_request().  Seeing a request, it examines its backlog
 *      at that instant.
 *      - Backlog non-empty: reply(Signal::S_CONTINUE_REQUEST); keep working.
 *      - Backlog empty: reply(Signal::S_ACKNOWLEDGED); return from the loop.
 *   -# Requester: await_reply().  On Signal::S_ACKNOWLEDGED, done.  Otherwise it echoes back what it got (i.e.,
 *      asks again), and continues awaiting.
 *
 * drain_and_stop() is the requester's side in its entirety; process_request() is the worker's.
 *
 * ### Waking the worker ###
 * A worker loop is typically blocked waiting for work (e.g., Bounded_channel::receive()), not on our mailbox.
 * Hence the ctor takes a function that we invoke after every send_request(); it must cause the worker's wait
 * to end soon, so that it gets to poll_request().  E.g., Bounded_channel::interrupt() does that.
 *
 * ### Thread safety ###
 * One requester thread and one worker thread may use an object concurrently.  The requester methods block;
 * the worker methods do not.
 */
class Worker_ctl :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// A control signal traveling in either direction.  The numeric values are part of the protocol description.
  enum class Signal
  {
    /// From requester: "finish up if you can."  From worker: "not yet; work remains."
    S_CONTINUE_REQUEST = 1,

    /// From worker only: "backlog empty; I am terminating now."
    S_ACKNOWLEDGED = 2
  }; // enum class Signal

  /// Lifecycle of the worker as seen through this control link.
  enum class State
  {
    /// Working normally; no request being considered.
    S_RUNNING,

    /// Worker has taken a request from the mailbox and is about to answer it.
    S_DRAIN_REQUESTED,

    /// Worker answered Signal::S_ACKNOWLEDGED; it will not process anything more.
    S_STOPPED
  }; // enum class State

  // Constructors/destructor.

  /**
   * Constructs the link in State::S_RUNNING with both mailboxes empty.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname_str
   *        Human-readable name of the worker, for logging.
   * @param wake_worker_func
   *        See class doc header.  Invoked from the requester thread, without any internal lock held.
   */
  explicit Worker_ctl(flow::log::Logger* logger_ptr, String_view nickname_str, Task&& wake_worker_func);

  // Methods.

  /**
   * Requester side: places `sig` into the requester-to-worker mailbox, first blocking until that mailbox is empty;
   * then wakes the worker.
   *
   * @param sig
   *        Signal to send.  Realistically Signal::S_CONTINUE_REQUEST.
   */
  void send_request(Signal sig);

  /**
   * Requester side: blocks until the worker-to-requester mailbox is non-empty; then empties it and returns its value.
   *
   * @return The worker's reply.
   */
  Signal await_reply();

  /**
   * Requester side: executes the entire handshake (see class doc header), returning once the worker has replied
   * Signal::S_ACKNOWLEDGED.  There is no timeout: if the worker never drains its backlog, this never returns.
   */
  void drain_and_stop();

  /**
   * Worker side: if the requester-to-worker mailbox is non-empty, empties it, moves to State::S_DRAIN_REQUESTED, and
   * returns the request.  Non-blocking.
   *
   * @param sig
   *        Target for the request.  Untouched if `false` returned.
   * @return `true` if and only if a request was taken.
   */
  bool poll_request(Signal* sig);

  /**
   * Worker side: places `sig` into the worker-to-requester mailbox; updates state() accordingly.  Must be called
   * exactly once per request obtained via poll_request().
   *
   * @param sig
   *        The reply.
   */
  void reply(Signal sig);

  /**
   * Worker side: the worker's half of the handshake in one call.  If there is a pending request, evaluates
   * `backlog_remains_func()` and replies Signal::S_CONTINUE_REQUEST if it returns `true`, else
   * Signal::S_ACKNOWLEDGED.  If there is no request, does nothing.
   *
   * @param backlog_remains_func
   *        Returns whether the worker still has items to process at the instant of the call.
   * @return `true` if and only if the worker acknowledged and must now return from its loop.
   */
  bool process_request(const Function<bool ()>& backlog_remains_func);

  /**
   * Current worker state, per class doc header.
   *
   * @return See above.
   */
  State state() const;

  /**
   * How many times the worker answered Signal::S_CONTINUE_REQUEST so far.
   *
   * @return See above.
   */
  size_t continue_reply_count() const;

  /**
   * Nickname from ctor.
   *
   * @return See above.
   */
  const std::string& nickname() const;

private:
  // Types.

  /// Short-hand for the mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for the lock type.
  using Lock = flow::util::Lock_guard<Mutex>;

  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// See ctor.
  const Task m_wake_worker_func;

  /// Protects the rest of the data (excluding the `const`s above and the condition variables).
  mutable Mutex m_mutex;

  /// Requester-to-worker mailbox.
  std::optional<Signal> m_request;

  /// Worker-to-requester mailbox.
  std::optional<Signal> m_reply;

  /// See state().
  State m_state;

  /// See continue_reply_count().
  size_t m_n_continue_replies;

  /// Notified when #m_request is emptied.
  boost::condition_variable m_request_taken_cond;

  /// Notified when #m_reply is filled.
  boost::condition_variable m_reply_ready_cond;
}; // class Worker_ctl

// Free functions.

/**
 * Prints string representation of the given Worker_ctl::Signal to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Worker_ctl::Signal val);

/**
 * Prints string representation of the given Worker_ctl::State to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Worker_ctl::State val);

} // namespace gelf::util
