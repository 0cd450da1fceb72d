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

#include "gelf/transport/compressor.hpp"
#include "gelf/util/object_pool.hpp"
#include <flow/log/log.hpp>
#include <boost/noncopyable.hpp>

namespace gelf::transport
{

// Types.

/**
 * Writes whole serialized messages into a Chunk_encoder, compressed as requested, using pooled Zlib_compressor
 * objects (one pool for gzip, one for zlib) bound to that encoder.  This is the top of the encoding pipeline:
 * one write_msg() call = one GELF message on the wire (as 1+ frames).
 *
 * Compressors are created lazily, when a pool is empty; given back after each successful message; and discarded
 * after a failed one.  The pools are internally locked: write_msg() may be called concurrently, and no compressor
 * is ever used by two calls at once.  However Chunk_encoder is not thread-safe, so realistically there is one
 * caller thread (the dispatcher).
 */
class Compressor_pools :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for the pool type.
  using Pool = util::Object_pool<Zlib_compressor>;

  // Constructors/destructor.

  /**
   * Constructs empty pools.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param encoder
   *        Where messages go.  Not null; must outlive `*this`.
   */
  explicit Compressor_pools(flow::log::Logger* logger_ptr, Chunk_encoder* encoder);

  // Methods.

  /**
   * Writes the message into the encoder, compressed per `compression`, and then flushes the encoder, thus
   * transmitting the message's frames.  The flush happens regardless of success of the preceding steps, so that
   * the encoder always begins the next message afresh.
   *
   * @param data
   *        The serialized message.
   * @param compression
   *        Compression to apply.  Not Compression::S_END_SENTINEL.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_COMPRESSION_FAILED; error::Code::S_CHUNK_COUNT_EXCEEDED; any error from
   *        Frame_sink::send_frame().  If both the write and the flush fail, the former's error is reported.
   */
  void write_msg(const util::Blob_const& data, Compression compression, Error_code* err_code = 0);

  /**
   * The pool for the given compression format.  Exposed for observation (e.g., idle/created counts).
   *
   * @param format
   *        Compression::S_GZIP or Compression::S_ZLIB.
   * @return See above.
   */
  const Pool& pool(Compression format) const;

private:
  // Methods.

  /**
   * Compresses `data` into the encoder using a compressor from `*pool`; gives it back if all went well.
   *
   * @param pool
   *        #m_gzip_pool or #m_zlib_pool.
   * @param data
   *        See write_msg().
   * @param err_code
   *        Not null.
   */
  void compress(Pool* pool, const util::Blob_const& data, Error_code* err_code);

  // Data.

  /// See ctor.
  Chunk_encoder* const m_encoder;

  /// Idle gzip compressors.
  Pool m_gzip_pool;

  /// Idle zlib compressors.
  Pool m_zlib_pool;
}; // class Compressor_pools

} // namespace gelf::transport
