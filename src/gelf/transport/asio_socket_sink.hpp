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

#include "gelf/transport/frame_sink.hpp"
#include <flow/log/log.hpp>
#include <boost/asio.hpp>
#include <boost/noncopyable.hpp>

namespace gelf::transport
{

// Types.

/**
 * The connection to the GELF endpoint: a connected UDP or TCP socket, acting as a Frame_sink.  For UDP each
 * frame becomes one datagram; for TCP the frames are written back-to-back onto the stream, in order.
 *
 * The ctor resolves the host and connects (trying each resolved endpoint in turn, as `boost::asio::connect()` does);
 * afterwards send_frame() writes synchronously (blocking) in the calling thread.  There is no background thread
 * and no `async_*()` use: the dispatcher thread already serializes all access.
 *
 * ### Thread safety ###
 * Not thread-safe for concurrent access to a given `*this`.
 */
class Asio_socket_sink :
  public Frame_sink,
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Resolves and connects.  On failure `*this` is unusable except for destruction (and is_open() is `false`).
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname_str
   *        Human-readable nickname of the new object, as of this writing for use in `operator<<(ostream)` and
   *        logging only.
   * @param protocol
   *        UDP or TCP.
   * @param host
   *        Host name or IP address literal.
   * @param port
   *        Port.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        `boost::asio::error::*` and system error codes from name resolution and connect.
   */
  explicit Asio_socket_sink(flow::log::Logger* logger_ptr, util::String_view nickname_str, Protocol protocol,
                            const std::string& host, uint16_t port, Error_code* err_code = 0);

  /// Closes the socket if still open, ignoring any error (use close() first to learn of one).
  ~Asio_socket_sink() override;

  // Methods.

  /**
   * Implements Frame_sink API: sends the frame as one datagram (UDP) or writes it entirely (TCP).
   *
   * @param frame
   *        See Frame_sink.
   * @param err_code
   *        See Frame_sink.  A short datagram write yields `boost::asio::error::message_size`; a send after
   *        close() yields error::Code::S_NOT_CONNECTED.
   */
  void send_frame(const util::Blob_const& frame, Error_code* err_code) override;

  /**
   * Closes the socket.  Any subsequent send_frame() fails.  No-op if already closed.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        system error codes from `close()`.  The socket is closed in any case.
   */
  void close(Error_code* err_code = 0);

  /**
   * Whether the socket is open (connected successfully, not yet closed).
   *
   * @return See above.
   */
  bool is_open() const;

  /**
   * The protocol.
   *
   * @return See above.
   */
  Protocol protocol() const;

  /**
   * The remote endpoint connected to; or default-constructed if not open.
   *
   * @return See above.
   */
  boost::asio::ip::address remote_address() const;

  /**
   * The remote port connected to; or 0 if not open.
   *
   * @return See above.
   */
  uint16_t remote_port() const;

  /**
   * Number of frames sent successfully so far.
   *
   * @return See above.
   */
  size_t sent_frame_count() const;

  /**
   * Nickname as passed to ctor.
   *
   * @return See above.
   */
  const std::string& nickname() const;

private:
  // Types.

  /// Short-hand for UDP protocol.
  using Udp = boost::asio::ip::udp;

  /// Short-hand for TCP protocol.
  using Tcp = boost::asio::ip::tcp;

  // Methods.

  /**
   * Resolves and connects the socket of type `Protocol_t`.
   *
   * @tparam Protocol_t
   *         `Udp` or `Tcp`.
   * @param socket
   *        The socket to connect.
   * @param host
   *        See ctor.
   * @param port
   *        See ctor.
   * @return Success or the last resolve/connect error.
   */
  template<typename Protocol_t>
  Error_code resolve_and_connect(typename Protocol_t::socket* socket, const std::string& host, uint16_t port);

  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// See protocol().
  const Protocol m_protocol;

  /// Execution context required by the sockets and resolvers.  It is never `run()`: all I/O is synchronous.
  boost::asio::io_context m_io_context;

  /// The socket if #m_protocol is UDP; otherwise never opened.
  Udp::socket m_udp_socket;

  /// The socket if #m_protocol is TCP; otherwise never opened.
  Tcp::socket m_tcp_socket;

  /// See sent_frame_count().
  size_t m_n_sent_frames;
}; // class Asio_socket_sink

} // namespace gelf::transport
