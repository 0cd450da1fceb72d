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

#include "gelf/client_config.hpp"
#include "gelf/message.hpp"
#include <flow/log/log.hpp>
#include <boost/move/unique_ptr.hpp>
#include <experimental/propagate_const>

namespace gelf
{

// Types.

/**
 * Asynchronous GELF log client: accepts Message objects from any number of threads via queue_msg() and delivers
 * them, in order, to a GELF server (such as Graylog) over UDP or TCP, compressed and chunked as the GELF protocol
 * prescribes, from background threads.
 *
 * ### Lifecycle ###
 * A Client starts out *inert*: not connected, no threads.  dial() connects to the server given by a URI and starts
 * the background workers.  close() delivers everything accepted so far, stops the workers and disconnects; after
 * that dial() may be called again.  The destructor does close() if needed.
 *
 * Messages may be queued while inert (e.g., before dial()): they are accepted (up to the intake capacity; beyond
 * that queue_msg() blocks) and delivered once connected.
 *
 * URI format: `scheme://host[:port][?compress=KIND]`, where `scheme` is `udp` or `tcp`; `port` defaults to
 * the standard GELF port 12201; `KIND` is `none`, `zlib`, or `gzip` and, if present, overrides
 * Client_config::m_compression.  An IPv6 address is given in brackets: `udp://[::1]:12201`.
 *
 * ### Delivery pipeline ###
 *   -# queue_msg() (any thread): stamps the message with the current time unless already stamped; puts it into the
 *      bounded *intake channel* (capacity Client_config::m_intake_capacity).  This only blocks if the channel is
 *      full.
 *   -# Intake worker thread: moves each message from the intake channel to the unbounded *backing queue*, so that
 *      a slow network does not back-pressure the callers until memory is exhausted.
 *   -# Dispatcher thread: pops each message from the backing queue; serializes it to GELF JSON; compresses it
 *      (gzip, zlib, or not at all) using a pooled compressor; splits the result into GELF chunks if it does not fit
 *      into one frame (Client_config::m_frame_size); sends the frame(s).
 *
 * Order is preserved end to end: for messages queued by one thread in order A then B, A's frames are all sent
 * before B's.
 *
 * ### Errors ###
 * API errors (bad URI, connect failure, ...) are reported the Flow way via the trailing `Error_code*` argument.
 * A failure in the dispatcher regarding one message (cannot serialize, too large for 128 chunks, network send error)
 * cannot be reported to the caller of queue_msg(), who has long moved on.  Such a message is dropped; it is
 * logged at WARNING level, counted in dropped_msg_count(), and passed to the handler given to
 * set_dispatch_error_handler() if any.  Delivery then continues with the next message.  Note that UDP being
 * UDP, a message sent successfully may still never arrive.
 *
 * ### Thread safety ###
 * queue_msg() may be called concurrently from any number of threads, including concurrently with the other
 * methods.  dial(), close() and set_dispatch_error_handler() must not be called concurrently with each other.
 * The accessors are safe to call at any time.
 *
 * ### Implementation ###
 * Client uses the pImpl idiom: the true implementation is Client::Impl (see client_impl.hpp).  This keeps the
 * public header free of the various implementation headers and makes move semantics trivial.  A moved-from
 * Client must not be used except to be destroyed or assigned-to.
 */
class Client
{
public:
  // Types.

  /**
   * Handler signature for set_dispatch_error_handler(): the error that caused a message to be dropped, and that
   * message.  Invoked from the dispatcher thread; it must not block for long, must not throw, and must not call
   * close() on the same Client.
   */
  using Dispatch_error_handler = Function<void (const Error_code& err_code, const Message& msg)>;

  // Constructors/destructor.

  /**
   * Constructs inert (not connected) client.  Determines the local host name (used as the GELF `host` field,
   * unless a message sets its own) right away.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.  Null means no logging.
   * @param config
   *        Configuration.  It is copied.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_HOSTNAME_UNAVAILABLE, error::Code::S_INVALID_FRAME_SIZE (frame size does not exceed
   *        the GELF chunk header size), error::Code::S_INVALID_ARGUMENT (zero intake capacity, compression
   *        not a valid Compression value, or non-positive idle interval).
   *        On error `*this` must not be used, except to be destroyed.
   */
  explicit Client(flow::log::Logger* logger_ptr, const Client_config& config = Client_config(),
                  Error_code* err_code = 0);

  /**
   * Move-constructs from `src`; `src` becomes unusable (see class doc header).
   *
   * @param src
   *        Source object.
   */
  Client(Client&& src);

  /// Copy construction is disallowed.
  Client(const Client&) = delete;

  /// If connected does close(), logging but otherwise ignoring any error.  Hence it may block while delivering.
  ~Client();

  // Methods.

  /**
   * Move-assigns from `src`; any connection of `*this` is closed first, as if by its destructor.
   *
   * @param src
   *        Source object.
   * @return `*this`.
   */
  Client& operator=(Client&& src);

  /// Copy assignment is disallowed.
  Client& operator=(const Client&) = delete;

  /**
   * Connects to the GELF server given by `uri` and starts delivering messages (those already queued included).
   * See class doc header for URI format.  A `compress` parameter, if present and valid, changes config() for the
   * rest of `*this` lifetime.  An unrecognized `compress` value is logged and ignored.
   *
   * For UDP, a successful dial() does not mean a server is listening; merely that the address resolved.
   * Since UDP cannot tell which of a host's addresses has a listener, an IPv4 address is used if the host has
   * one (e.g., `udp://localhost` sends to 127.0.0.1 even if ::1 resolves first).  Use an IPv6 literal to force IPv6.
   *
   * @param uri
   *        Server URI.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_ALREADY_CONNECTED, error::Code::S_URI_MALFORMED, error::Code::S_URI_UNSUPPORTED_SCHEME,
   *        `boost::asio::error::*` and system error codes from name resolution and connect.
   *        On error `*this` remains not connected.
   */
  void dial(util::String_view uri, Error_code* err_code = 0);

  /**
   * Accepts the message for delivery.  Stamps it with the current time unless it already has a timestamp.
   * Blocks only while the intake channel is full.  The caller must not modify `*msg` after this call.
   *
   * @param msg
   *        Message.  Not null.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INVALID_ARGUMENT (null `msg`).
   */
  void queue_msg(const Message::Ptr& msg, Error_code* err_code = 0);

  /**
   * Delivers every message accepted by queue_msg() (before this call), stops the background threads, and closes
   * the connection.  Blocks until all of that is done.  No-op if not connected.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        system error codes from closing the socket.  Even then `*this` is no longer connected.
   */
  void close(Error_code* err_code = 0);

  /**
   * Sets (replacing any previous one) or, if `handler` is empty, unsets the handler of dispatcher errors.  See
   * class doc header.
   *
   * @param handler
   *        Handler.
   */
  void set_dispatch_error_handler(Dispatch_error_handler&& handler);

  /**
   * Whether dial() has succeeded, and close() has not been called since.
   *
   * @return See above.
   */
  bool connected() const;

  /**
   * Current configuration: as given to ctor, except the compression reflects any dial() URI override.
   *
   * @return See above.
   */
  Client_config config() const;

  /**
   * Local host name, as determined in ctor.
   *
   * @return See above.
   */
  const std::string& hostname() const;

  /**
   * Number of messages sent successfully so far (over `*this` lifetime).
   *
   * @return See above.
   */
  size_t sent_msg_count() const;

  /**
   * Number of messages dropped due to dispatcher errors so far (over `*this` lifetime).
   *
   * @return See above.
   */
  size_t dropped_msg_count() const;

  /**
   * Number of messages accepted by queue_msg() but not yet sent or dropped.
   *
   * @return See above.
   */
  size_t pending_msg_count() const;

private:
  // Types.

  // Forward declare the pImpl-idiom true implementation of this class.  See client_impl.hpp.
  class Impl;

  /// Short-hand for `const`-respecting wrapper around Client::Impl for the pImpl idiom.
  using Impl_ptr = std::experimental::propagate_const<boost::movelib::unique_ptr<Impl>>;

  // Friends.

  /// Friend of Client.
  friend std::ostream& operator<<(std::ostream& os, const Client& val);

  // Data.

  /// The true implementation of this class.  Null only in a moved-from `*this`.
  Impl_ptr m_impl;
}; // class Client

// Free functions.

/**
 * Prints string representation of the given Client to the given `ostream`.
 *
 * @relatesalso Client
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Client& val);

} // namespace gelf
