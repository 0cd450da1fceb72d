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
#include <flow/log/log.hpp>
#include <boost/noncopyable.hpp>
#include <zlib.h>

namespace gelf::transport
{

// Types.

/**
 * Streaming deflate compressor, in gzip or zlib container format, whose output goes into a Chunk_encoder as it is
 * produced.  One compressed stream per message: write() the message (in any number of pieces), then close(), which
 * emits the trailer.  Then reset() readies it for the next stream, cheaply, reusing zlib's internal state; this is
 * what makes pooling these (see Compressor_pools) worthwhile.
 *
 * The object does not flush the Chunk_encoder: that is the caller's job, as the encoder's flush() is what marks
 * the message boundary.
 *
 * Once any zlib or sink error has occurred, the object is permanently unusable (healthy() returns `false`), and it
 * should be discarded rather than reset() and reused.
 */
class Zlib_compressor :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constants.

  /// Size of the buffer into which zlib deflates, before it is written to the sink.
  static constexpr size_t S_OUT_BUF_SIZE = 16 * 1024;

  // Constructors/destructor.

  /**
   * Initializes zlib deflate state with default compression level.  If that fails (realistically only on memory
   * exhaustion) it is logged, healthy() returns `false`, and write() reports error::Code::S_COMPRESSION_FAILED.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param format
   *        Compression::S_GZIP or Compression::S_ZLIB.
   * @param sink
   *        Where the compressed bytes go.  Not null.
   */
  explicit Zlib_compressor(flow::log::Logger* logger_ptr, Compression format, Chunk_encoder* sink);

  /// Releases zlib state.
  ~Zlib_compressor();

  // Methods.

  /**
   * Compresses the given bytes into the current stream, writing any output produced so far to the sink.
   *
   * @param data
   *        Uncompressed bytes.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_COMPRESSION_FAILED; any error from Chunk_encoder::write().
   */
  void write(const util::Blob_const& data, Error_code* err_code = 0);

  /**
   * Finishes the current stream: writes all remaining output, including the format trailer, to the sink.
   * After this only reset() (or destruction) is allowed.
   *
   * @param err_code
   *        See write().
   */
  void close(Error_code* err_code = 0);

  /**
   * Begins a new stream, with output going to the given sink.  Must be healthy().
   *
   * @param sink
   *        Where the compressed bytes go.  Not null.
   */
  void reset(Chunk_encoder* sink);

  /**
   * Whether no error has occurred (including at construction).
   *
   * @return See above.
   */
  bool healthy() const;

  /**
   * Format given to ctor.
   *
   * @return See above.
   */
  Compression format() const;

private:
  // Methods.

  /**
   * Runs `deflate()` with the given flush mode over whatever input is set up in #m_stream, writing all produced
   * output to #m_sink.
   *
   * @param flush_mode
   *        `Z_NO_FLUSH` or `Z_FINISH`.
   * @param err_code
   *        Not null.
   */
  void deflate_to_sink(int flush_mode, Error_code* err_code);

  // Data.

  /// See format().
  const Compression m_format;

  /// See ctor and reset().
  Chunk_encoder* m_sink;

  /// zlib deflate state.
  z_stream m_stream;

  /// Whether `deflateInit2()` succeeded, so that `deflateEnd()` is needed.
  bool m_initialized;

  /// Whether close() has finished the current stream.
  bool m_finished;

  /// See healthy().
  bool m_healthy;

  /// Where `deflate()` puts output, before it goes to #m_sink.
  util::Byte_buffer m_out_buf;
}; // class Zlib_compressor

} // namespace gelf::transport
