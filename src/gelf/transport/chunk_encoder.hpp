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
#include <boost/random/mersenne_twister.hpp>
#include <boost/noncopyable.hpp>

namespace gelf::transport
{

// Types.

/**
 * Splits each logical message written into it into one or more GELF frames of bounded size and hands them to a
 * Frame_sink.  It is a buffered writer with an explicit message boundary: write() (any number of times) appends
 * payload bytes to the pending message; flush() ends the message, transmits its frames, and resets for the next one.
 *
 * ### Frame format ###
 * Let F = max_frame_size() and S = size of the message at flush() time.
 *   - S <= F: the message is sent as exactly 1 frame consisting of just the payload, with no chunk header.  GELF
 *     receivers tell such a frame from a chunk by the absence of the chunk magic bytes (a compressed or JSON
 *     payload never starts with them).
 *   - S > F: the message is sent as N = ceil(S / (F - 12)) frames, each carrying a 12-byte header followed by the
 *     next (up to) F - 12 payload bytes:
 *     - bytes 0-1: magic 0x1e 0x0f;
 *     - bytes 2-9: message ID, 8 bytes, random per message, the same in all frames of a message;
 *     - byte 10: sequence number, 0-based;
 *     - byte 11: sequence count N.
 *     N may not exceed #S_MAX_CHUNK_COUNT (128); hence max_message_size() = 128 x (F - 12).
 *
 * ### Failure semantics ###
 * A write() that would take the pending message past max_message_size() fails with
 * error::Code::S_CHUNK_COUNT_EXCEEDED; the whole pending message is discarded, and further write()s of the same
 * message fail likewise, until flush(), which also reports that error and then resets.  A Frame_sink failure during
 * flush() aborts the remaining frames of that message (the receiver could not reassemble it anyway); flush()
 * reports the sink's error and resets.  Either way, the next write() begins a fresh message.
 *
 * ### Thread safety ###
 * Not thread-safe for concurrent access to a given `*this`.
 */
class Chunk_encoder :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// Type of the per-message random identifier placed in each chunk header.
  using message_id_t = uint64_t;

  // Constants.

  /// First magic byte of a chunk header.
  static constexpr uint8_t S_MAGIC_BYTE_0 = 0x1e;

  /// Second magic byte of a chunk header.
  static constexpr uint8_t S_MAGIC_BYTE_1 = 0x0f;

  /// Size of the message ID in a chunk header.
  static constexpr size_t S_MESSAGE_ID_SIZE = sizeof(message_id_t);

  /// Size of a chunk header: magic, ID, sequence number, sequence count.
  static constexpr size_t S_HEADER_SIZE = 2 + S_MESSAGE_ID_SIZE + 1 + 1;

  /// Max number of chunks a message may be split into.
  static constexpr size_t S_MAX_CHUNK_COUNT = 128;

  // Constructors/destructor.

  /**
   * Constructs encoder with nothing pending.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname_str
   *        Human-readable nickname of the new object, for logging.
   * @param sink
   *        Where frames go.  Not null; must outlive `*this`.
   * @param max_frame_size
   *        Max size of each frame, chunk header included.  Must exceed #S_HEADER_SIZE.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INVALID_FRAME_SIZE.  On error `*this` must not be used, except to be destroyed.
   */
  explicit Chunk_encoder(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                         Frame_sink* sink, size_t max_frame_size, Error_code* err_code = 0);

  // Methods.

  /**
   * Appends bytes to the pending message.  Nothing is transmitted until flush().
   *
   * @param data
   *        The bytes.  May be empty (no-op).
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_CHUNK_COUNT_EXCEEDED (see class doc header).
   */
  void write(const util::Blob_const& data, Error_code* err_code = 0);

  /**
   * Ends the pending message: transmits its frames (if any, and if it did not overflow), then resets so the next
   * write() begins a new message.  No-op if nothing is pending.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_CHUNK_COUNT_EXCEEDED; any error from Frame_sink::send_frame().
   */
  void flush(Error_code* err_code = 0);

  /**
   * Max frame size given to ctor.
   *
   * @return See above.
   */
  size_t max_frame_size() const;

  /**
   * Payload bytes carried per chunk: `max_frame_size() - S_HEADER_SIZE`.
   *
   * @return See above.
   */
  size_t chunk_payload_size() const;

  /**
   * Max size of a message: `S_MAX_CHUNK_COUNT * chunk_payload_size()`.
   *
   * @return See above.
   */
  size_t max_message_size() const;

  /**
   * Number of bytes pending (written since last flush()).  0 if pending message overflowed.
   *
   * @return See above.
   */
  size_t pending_size() const;

  /**
   * Number of messages whose frames were all transmitted so far.
   *
   * @return See above.
   */
  size_t sent_message_count() const;

  /**
   * Nickname as passed to ctor.
   *
   * @return See above.
   */
  const std::string& nickname() const;

private:
  // Methods.

  /**
   * Sends the pending message as chunks per class doc header.
   *
   * @param err_code
   *        Not null.  Success or the first Frame_sink error.
   */
  void send_chunked(Error_code* err_code);

  /// Discards pending message and overflow state.
  void reset();

  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// See ctor.
  Frame_sink* const m_sink;

  /// See max_frame_size().
  const size_t m_max_frame_size;

  /// Bytes written since last flush().
  util::Byte_buffer m_pending;

  /// Whether a write() since last flush() exceeded max_message_size().
  bool m_overflowed;

  /// Scratch area where each chunk (header + payload slice) is assembled before being sent.
  util::Byte_buffer m_chunk_buf;

  /// Source of message IDs.
  boost::random::mt19937_64 m_id_generator;

  /// See sent_message_count().
  size_t m_n_sent_messages;
}; // class Chunk_encoder

} // namespace gelf::transport
