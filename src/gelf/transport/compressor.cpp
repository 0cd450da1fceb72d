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
#include "gelf/transport/compressor.hpp"
#include "gelf/transport/chunk_encoder.hpp"
#include "gelf/error.hpp"
#include <flow/error/error.hpp>

namespace gelf::transport
{

// Zlib_compressor implementations.

Zlib_compressor::Zlib_compressor(flow::log::Logger* logger_ptr, Compression format, Chunk_encoder* sink) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_format(format),
  m_sink(sink),
  m_stream(),
  m_initialized(false),
  m_finished(false),
  m_healthy(false),
  m_out_buf(S_OUT_BUF_SIZE)
{
  assert(((m_format == Compression::S_GZIP) || (m_format == Compression::S_ZLIB)) && "Only gzip and zlib deflate.");
  assert(m_sink && "Sink must not be null.");

  // 15 = max window (32KiB); +16 tells zlib to emit the gzip header/trailer instead of the zlib one.
  constexpr int WINDOW_BITS = 15;
  constexpr int MEM_LEVEL = 8;

  m_stream.zalloc = Z_NULL;
  m_stream.zfree = Z_NULL;
  m_stream.opaque = Z_NULL;
  const auto rc = deflateInit2(&m_stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED,
                               (m_format == Compression::S_GZIP) ? (WINDOW_BITS + 16) : WINDOW_BITS,
                               MEM_LEVEL, Z_DEFAULT_STRATEGY);
  if (rc != Z_OK)
  {
    FLOW_LOG_WARNING("Zlib_compressor [" << m_format << "]@" << this << ": deflateInit2() failed with code "
                     "[" << rc << "] [" << (m_stream.msg ? m_stream.msg : "") << "]; compressor unusable.");
    return;
  }
  // else

  m_initialized = true;
  m_healthy = true;
  FLOW_LOG_TRACE("Zlib_compressor [" << m_format << "]@" << this << ": Created.");
} // Zlib_compressor::Zlib_compressor()

Zlib_compressor::~Zlib_compressor()
{
  if (m_initialized)
  {
    // Z_DATA_ERROR here merely means an unfinished stream was discarded, which is fine.
    deflateEnd(&m_stream);
  }
}

void Zlib_compressor::write(const util::Blob_const& data, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { write(data, actual_err_code); },
         err_code, "Zlib_compressor::write()"))
  {
    return;
  }
  // else

  assert((!m_finished) && "write() after close() without reset().");

  if (!m_healthy)
  {
    *err_code = error::Code::S_COMPRESSION_FAILED;
    return;
  }
  // else

  m_stream.next_in = const_cast<Bytef*>(static_cast<const Bytef*>(data.data())); // zlib API lacks const.
  m_stream.avail_in = static_cast<uInt>(data.size());
  deflate_to_sink(Z_NO_FLUSH, err_code);
  m_stream.next_in = Z_NULL; // Don't leave a pointer to caller's data lying around.
  m_stream.avail_in = 0;
}

void Zlib_compressor::close(Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { close(actual_err_code); },
         err_code, "Zlib_compressor::close()"))
  {
    return;
  }
  // else

  assert((!m_finished) && "close() twice without reset().");

  if (!m_healthy)
  {
    *err_code = error::Code::S_COMPRESSION_FAILED;
    return;
  }
  // else

  m_stream.next_in = Z_NULL;
  m_stream.avail_in = 0;
  deflate_to_sink(Z_FINISH, err_code);
  m_finished = true;
}

void Zlib_compressor::reset(Chunk_encoder* sink)
{
  assert(m_healthy && "Do not reuse a compressor that has failed; discard it.");
  assert(sink && "Sink must not be null.");

  m_sink = sink;
  m_finished = false;
  if (deflateReset(&m_stream) != Z_OK)
  {
    // Realistically impossible given m_healthy; but if so then it's no longer healthy.
    FLOW_LOG_WARNING("Zlib_compressor [" << m_format << "]@" << this << ": deflateReset() failed; "
                     "compressor unusable.");
    m_healthy = false;
  }
}

void Zlib_compressor::deflate_to_sink(int flush_mode, Error_code* err_code)
{
  int rc;
  do
  {
    m_stream.next_out = m_out_buf.data();
    m_stream.avail_out = static_cast<uInt>(m_out_buf.size());

    rc = deflate(&m_stream, flush_mode);
    if ((rc != Z_OK) && (rc != Z_STREAM_END) && (rc != Z_BUF_ERROR)) // Z_BUF_ERROR = no progress; not fatal.
    {
      FLOW_LOG_WARNING("Zlib_compressor [" << m_format << "]@" << this << ": deflate() failed with code "
                       "[" << rc << "] [" << (m_stream.msg ? m_stream.msg : "") << "]; compressor unusable.");
      m_healthy = false;
      *err_code = error::Code::S_COMPRESSION_FAILED;
      return;
    }
    // else

    const size_t n_out = m_out_buf.size() - m_stream.avail_out;
    if (n_out != 0)
    {
      m_sink->write(util::Blob_const(m_out_buf.data(), n_out), err_code);
      if (*err_code)
      {
        // Encoder logged it.  The stream is now missing bytes: useless.
        m_healthy = false;
        return;
      }
    }
  }
  // Without finishing: done once deflate() did not fill the buffer.  Finishing: done once it says so.
  while ((flush_mode == Z_FINISH) ? (rc != Z_STREAM_END) : (m_stream.avail_out == 0));

  err_code->clear();
} // Zlib_compressor::deflate_to_sink()

bool Zlib_compressor::healthy() const
{
  return m_healthy;
}

Compression Zlib_compressor::format() const
{
  return m_format;
}

// Free function implementations.

std::ostream& operator<<(std::ostream& os, Compression val)
{
  // Note: Must satisfy istream_to_enum() requirements.
  switch (val)
  {
  case Compression::S_NONE:
    return os << "NONE";
  case Compression::S_GZIP:
    return os << "GZIP";
  case Compression::S_ZLIB:
    return os << "ZLIB";
  case Compression::S_END_SENTINEL:
    return os << "END_SENTINEL";
  }
  return os << "UNKNOWN(" << int(val) << ')';
}

std::istream& operator>>(std::istream& is, Compression& val)
{
  // Range [NONE, END_SENTINEL); no match => END_SENTINEL; allow for number; case-insensitive.
  val = flow::util::istream_to_enum(&is, Compression::S_END_SENTINEL, Compression::S_END_SENTINEL, true, false,
                                    Compression::S_NONE);
  return is;
}

} // namespace gelf::transport
