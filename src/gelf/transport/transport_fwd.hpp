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

/**
 * Flow-GELF module providing everything between a serialized message and the wire: compression (identity, gzip,
 * zlib) with pooled compressor streams; GELF chunking of a compressed message into bounded-size frames; and the
 * connected UDP or TCP socket that carries the frames.  The data flow is
 *
 *   Compressor_pools::write_msg() -> (Zlib_compressor) -> Chunk_encoder -> Frame_sink (Asio_socket_sink) -> socket.
 *
 * Dial URI parsing (parse_dial_uri()) also lives here, as it selects the protocol, endpoint and compression.
 */
namespace gelf::transport
{

// Types.

// Find doc headers near the bodies of these compound types.

class Frame_sink;
class Asio_socket_sink;
class Chunk_encoder;
class Zlib_compressor;
class Compressor_pools;
struct Dial_target;

/// Compression applied to each serialized message before chunking.
enum class Compression
{
  /// No compression: the serialized message is chunked as-is.
  S_NONE = 0,

  /// gzip (RFC 1952) format.
  S_GZIP,

  /// zlib (RFC 1950) format.
  S_ZLIB,

  /// Sentinel: not a valid value.  Used for `istream>>` failure and for iteration.
  S_END_SENTINEL
}; // enum class Compression

/// Transport protocol of the connection.
enum class Protocol
{
  /// Datagram socket: each frame is one datagram.
  S_UDP = 0,

  /// Stream socket: frames are written back-to-back onto the stream.
  S_TCP,

  /// Sentinel: not a valid value.
  S_END_SENTINEL
}; // enum class Protocol

// Free functions.

/**
 * Serializes a Compression to a standard output stream: `"NONE"`, `"GZIP"` or `"ZLIB"`.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Compression val);

/**
 * Deserializes a Compression from a standard input stream; the reverse of `ostream<<`, case-insensitive,
 * also accepting the numeric value.  Unrecognized input yields Compression::S_END_SENTINEL.  This enables
 * `boost::lexical_cast<Compression>("gzip")` and reading it from config files.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Compression& val);

/**
 * Serializes a Protocol to a standard output stream: `"udp"` or `"tcp"` (i.e., as in the dial URI scheme).
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Protocol val);

/**
 * Prints string representation of the given Dial_target to the given `ostream`.
 *
 * @relatesalso Dial_target
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Dial_target& val);

/**
 * Prints string representation of the given Asio_socket_sink to the given `ostream`.
 *
 * @relatesalso Asio_socket_sink
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Asio_socket_sink& val);

/**
 * Prints string representation of the given Chunk_encoder to the given `ostream`.
 *
 * @relatesalso Chunk_encoder
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Chunk_encoder& val);

} // namespace gelf::transport
