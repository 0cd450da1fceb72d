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

#include "gelf/transport/transport_fwd.hpp"

namespace gelf::transport
{

// Types.

/**
 * Interface of something that transmits *frames*: each frame is a complete, already-encoded unit handed to the
 * lower level in one go (for a datagram socket, exactly one datagram).  Chunk_encoder writes into one of these.
 * The production implementation is Asio_socket_sink; tests substitute an in-memory one.
 *
 * Implementations need not be thread-safe: a given sink is used by one thread at a time.
 */
class Frame_sink
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Frame_sink();

  // Methods.

  /**
   * Transmits the frame synchronously: upon return the frame's bytes are no longer needed by the sink.
   *
   * @param frame
   *        The frame.  Non-empty.
   * @param err_code
   *        Not null.  Set to success, or to the failure (typically a system error); in the latter case the frame
   *        was not (entirely) transmitted.
   */
  virtual void send_frame(const util::Blob_const& frame, Error_code* err_code) = 0;
}; // class Frame_sink

} // namespace gelf::transport
