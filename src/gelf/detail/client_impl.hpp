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

#include "gelf/client.hpp"
#include "gelf/detail/backing_queue.hpp"
#include "gelf/util/bounded_channel.hpp"
#include "gelf/util/worker_ctl.hpp"
#include "gelf/transport/asio_socket_sink.hpp"
#include "gelf/transport/chunk_encoder.hpp"
#include "gelf/transport/compressor_pools.hpp"
#include <flow/async/single_thread_task_loop.hpp>
#include <flow/log/log.hpp>
#include <boost/move/unique_ptr.hpp>
#include <boost/noncopyable.hpp>
#include <atomic>

namespace gelf
{

// Types.

/**
 * Internal, non-movable pImpl implementation of Client class.  In and of itself it would have been directly
 * and publicly usable; however Client adds move semantics; this class does not.
 *
 * @see Client doc header for the public behavior, and the delivery pipeline in particular.
 *
 * ### Threads ###
 * Up to three threads touch `*this`:
 *   - Thread U: the user's, calling the public methods.  (Multiple threads may call queue_msg().)
 *   - Thread I: the intake worker, #m_intake_worker, while connected.  Runs intake_loop().
 *   - Thread D: the dispatcher, #m_dispatch_worker, while connected.  Runs dispatch_loop().
 *
 * The message path (#m_intake, #m_queue) persists across connections; everything else connection-related is
 * created by dial() and destroyed by close(), both in thread U while threads I and D are not running.  Thread D
 * alone uses #m_sink, #m_encoder and #m_compressor_pools while they exist; so none of those needs locking.
 *
 * ### Shutdown ###
 * close() stops the workers in pipeline order, using the Worker_ctl handshake with each: first the intake worker,
 * which agrees to stop only once the intake channel is empty; then the dispatcher, which agrees only once the
 * backing queue is empty.  Once both have agreed, everything queued before close() has been processed, and
 * no thread but U touches `*this`.
 */
class Client::Impl :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * See Client ctor.
   *
   * @param logger_ptr
   *        See Client ctor.
   * @param config
   *        See Client ctor.
   * @param err_code
   *        See Client ctor.
   */
  explicit Impl(flow::log::Logger* logger_ptr, const Client_config& config, Error_code* err_code);

  /// See Client dtor.
  ~Impl();

  // Methods.

  /**
   * See Client counterpart.
   *
   * @param uri
   *        See Client counterpart.
   * @param err_code
   *        See Client counterpart.
   */
  void dial(util::String_view uri, Error_code* err_code);

  /**
   * See Client counterpart.
   *
   * @param msg
   *        See Client counterpart.
   * @param err_code
   *        See Client counterpart.
   */
  void queue_msg(const Message::Ptr& msg, Error_code* err_code);

  /**
   * See Client counterpart.
   *
   * @param err_code
   *        See Client counterpart.
   */
  void close(Error_code* err_code);

  /**
   * See Client counterpart.
   *
   * @param handler
   *        See Client counterpart.
   */
  void set_dispatch_error_handler(Dispatch_error_handler&& handler);

  /**
   * See Client counterpart.
   *
   * @return See Client counterpart.
   */
  bool connected() const;

  /**
   * See Client counterpart.
   *
   * @return See Client counterpart.
   */
  Client_config config() const;

  /**
   * See Client counterpart.
   *
   * @return See Client counterpart.
   */
  const std::string& hostname() const;

  /**
   * See Client counterpart.
   *
   * @return See Client counterpart.
   */
  size_t sent_msg_count() const;

  /**
   * See Client counterpart.
   *
   * @return See Client counterpart.
   */
  size_t dropped_msg_count() const;

  /**
   * See Client counterpart.
   *
   * @return See Client counterpart.
   */
  size_t pending_msg_count() const;

private:
  // Types.

  /// Short-hand for the mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for the lock type.
  using Lock = flow::util::Lock_guard<Mutex>;

  /// Short-hand for the intake channel type.
  using Intake_channel = util::Bounded_channel<Message::Const_ptr>;

  // Methods.

  /**
   * Body of thread I: moves messages from #m_intake to #m_queue until told to stop with #m_intake empty.
   * Returns once it has acknowledged the stop request via #m_intake_ctl.
   */
  void intake_loop();

  /**
   * Body of thread D: sends messages from #m_queue until told to stop with #m_queue empty.  Returns once it has
   * acknowledged the stop request via #m_dispatch_ctl.
   *
   * @param compression
   *        Compression to apply to each message.
   */
  void dispatch_loop(transport::Compression compression);

  /**
   * In thread D: serializes, compresses, chunks, and sends one message; or drops it and reports why.
   *
   * @param msg
   *        The message.
   * @param compression
   *        See dispatch_loop().
   * @param fill_gelf_defaults
   *        Client_config::m_fill_gelf_defaults as of dispatch_loop() start.
   */
  void dispatch(const Message::Const_ptr& msg, transport::Compression compression, bool fill_gelf_defaults);

  // Data.

  /// Protects #m_config (its `m_compression` can change in dial(); config() may be called from any thread).
  mutable Mutex m_config_mutex;

  /// See config().
  Client_config m_config;

  /// See hostname().
  std::string m_hostname;

  /// The intake channel: fed by queue_msg(); drained by thread I.  Null only if ctor failed.
  boost::movelib::unique_ptr<Intake_channel> m_intake;

  /// The backing queue: fed by thread I; drained by thread D.
  detail::Backing_queue m_queue;

  /// See connected().
  std::atomic<bool> m_connected;

  /// While connected: the connection.
  boost::movelib::unique_ptr<transport::Asio_socket_sink> m_sink;

  /// While connected: turns each message into frames for #m_sink.
  boost::movelib::unique_ptr<transport::Chunk_encoder> m_encoder;

  /// While connected: compressors feeding #m_encoder.
  boost::movelib::unique_ptr<transport::Compressor_pools> m_compressor_pools;

  /// While connected: control link to thread I.
  boost::movelib::unique_ptr<util::Worker_ctl> m_intake_ctl;

  /// While connected: control link to thread D.
  boost::movelib::unique_ptr<util::Worker_ctl> m_dispatch_ctl;

  /// While connected: thread I.
  boost::movelib::unique_ptr<flow::async::Single_thread_task_loop> m_intake_worker;

  /// While connected: thread D.
  boost::movelib::unique_ptr<flow::async::Single_thread_task_loop> m_dispatch_worker;

  /// See sent_msg_count().
  std::atomic<size_t> m_n_sent_msgs;

  /// See dropped_msg_count().
  std::atomic<size_t> m_n_dropped_msgs;

  /// Protects #m_on_dispatch_error_func.
  mutable Mutex m_handler_mutex;

  /// See set_dispatch_error_handler().
  Dispatch_error_handler m_on_dispatch_error_func;
}; // class Client::Impl

} // namespace gelf
