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
#include "gelf/transport/compressor_pools.hpp"
#include "gelf/transport/chunk_encoder.hpp"
#include "gelf/error.hpp"
#include <flow/error/error.hpp>
#include <flow/util/util.hpp>
#include <boost/move/make_unique.hpp>

namespace gelf::transport
{

Compressor_pools::Compressor_pools(flow::log::Logger* logger_ptr, Chunk_encoder* encoder) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_encoder(encoder),
  m_gzip_pool([this]() -> Pool::Ptr
              { return boost::movelib::make_unique<Zlib_compressor>(get_logger(), Compression::S_GZIP, m_encoder); }),
  m_zlib_pool([this]() -> Pool::Ptr
              { return boost::movelib::make_unique<Zlib_compressor>(get_logger(), Compression::S_ZLIB, m_encoder); })
{
  assert(m_encoder && "Encoder must not be null.");
}

void Compressor_pools::write_msg(const util::Blob_const& data, Compression compression, Error_code* err_code)
{
  using flow::util::setup_auto_cleanup;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { write_msg(data, compression, actual_err_code); },
         err_code, "Compressor_pools::write_msg()"))
  {
    return;
  }
  // else

  FLOW_LOG_TRACE("Compressor_pools [" << this << "]: Writing message of size [" << data.size() << "] with "
                 "compression [" << compression << "].");

  Error_code write_err_code;
  Error_code flush_err_code;
  {
    // Whatever happens below, the message ends here: flush on scope exit.
    const auto flush_on_exit = setup_auto_cleanup([&]() { m_encoder->flush(&flush_err_code); });

    switch (compression)
    {
    case Compression::S_GZIP:
      compress(&m_gzip_pool, data, &write_err_code);
      break;
    case Compression::S_ZLIB:
      compress(&m_zlib_pool, data, &write_err_code);
      break;
    case Compression::S_NONE:
      m_encoder->write(data, &write_err_code);
      break;
    case Compression::S_END_SENTINEL:
    default:
      assert(false && "Invalid compression; Client rejects it at construction.");
      write_err_code = error::Code::S_INVALID_ARGUMENT;
    }
  } // const auto flush_on_exit = ...: Flushed now.

  *err_code = write_err_code ? write_err_code : flush_err_code;
} // Compressor_pools::write_msg()

void Compressor_pools::compress(Pool* pool, const util::Blob_const& data, Error_code* err_code)
{
  auto compressor = pool->check_out();

  compressor->write(data, err_code);
  if (!*err_code)
  {
    compressor->close(err_code);
  }

  if (*err_code)
  {
    FLOW_LOG_WARNING("Compressor_pools [" << this << "]: Compression of message of size [" << data.size() << "] "
                     "failed with [" << *err_code << "] [" << err_code->message() << "]; discarding the "
                     "compressor (it will not return to the pool).");
    return; // compressor is destroyed.
  }
  // else

  compressor->reset(m_encoder);
  pool->give_back(std::move(compressor));
}

const Compressor_pools::Pool& Compressor_pools::pool(Compression format) const
{
  assert(((format == Compression::S_GZIP) || (format == Compression::S_ZLIB)) && "Only gzip and zlib are pooled.");
  return (format == Compression::S_GZIP) ? m_gzip_pool : m_zlib_pool;
}

} // namespace gelf::transport
