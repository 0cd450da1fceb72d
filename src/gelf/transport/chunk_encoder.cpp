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
#include "gelf/transport/chunk_encoder.hpp"
#include "gelf/error.hpp"
#include <flow/error/error.hpp>
#include <boost/random/random_device.hpp>

namespace gelf::transport
{

Chunk_encoder::Chunk_encoder(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                             Frame_sink* sink, size_t max_frame_size, Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_nickname(nickname_str),
  m_sink(sink),
  m_max_frame_size(max_frame_size),
  m_overflowed(false),
  m_id_generator(boost::random::random_device()()),
  m_n_sent_messages(0)
{
  using flow::error::Runtime_error;

  assert(m_sink && "Frame_sink must not be null.");

  if (m_max_frame_size <= S_HEADER_SIZE)
  {
    FLOW_LOG_WARNING("Chunk_encoder [" << *this << "]: Max frame size [" << m_max_frame_size << "] does not "
                     "exceed chunk header size [" << S_HEADER_SIZE << "]; no chunk could carry payload.");
    const Error_code our_err_code = error::Code::S_INVALID_FRAME_SIZE;
    if (err_code)
    {
      *err_code = our_err_code;
      return;
    }
    // else
    throw Runtime_error(our_err_code, FLOW_UTIL_WHERE_AM_I_STR());
  }
  // else

  m_chunk_buf.reserve(m_max_frame_size);

  FLOW_LOG_INFO("Chunk_encoder [" << *this << "]: Max frame size [" << m_max_frame_size << "]; hence chunk payload "
                "size [" << chunk_payload_size() << "], max message size [" << max_message_size() << "].");
  if (err_code)
  {
    err_code->clear();
  }
} // Chunk_encoder::Chunk_encoder()

void Chunk_encoder::write(const util::Blob_const& data, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { write(data, actual_err_code); },
         err_code, "Chunk_encoder::write()"))
  {
    return;
  }
  // else

  if (m_overflowed)
  {
    // Already logged; the message is lost; keep failing until they flush().
    *err_code = error::Code::S_CHUNK_COUNT_EXCEEDED;
    return;
  }
  // else

  if ((m_pending.size() + data.size()) > max_message_size())
  {
    FLOW_LOG_WARNING("Chunk_encoder [" << *this << "]: Pending message size [" << m_pending.size() << "] plus "
                     "write of size [" << data.size() << "] exceeds max message size [" << max_message_size() << "] "
                     "(that is [" << S_MAX_CHUNK_COUNT << "] chunks); discarding the message.");
    m_pending.clear();
    m_pending.shrink_to_fit(); // It may be huge; don't keep it around.
    m_overflowed = true;
    *err_code = error::Code::S_CHUNK_COUNT_EXCEEDED;
    return;
  }
  // else

  const auto bytes = static_cast<const uint8_t*>(data.data());
  m_pending.insert(m_pending.end(), bytes, bytes + data.size());
  err_code->clear();
} // Chunk_encoder::write()

void Chunk_encoder::flush(Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { flush(actual_err_code); },
         err_code, "Chunk_encoder::flush()"))
  {
    return;
  }
  // else

  if (m_overflowed)
  {
    FLOW_LOG_TRACE("Chunk_encoder [" << *this << "]: Flush of overflowed message: nothing sent; resetting.");
    reset();
    *err_code = error::Code::S_CHUNK_COUNT_EXCEEDED;
    return;
  }
  // else

  if (m_pending.empty())
  {
    err_code->clear();
    return;
  }
  // else

  if (m_pending.size() <= m_max_frame_size)
  {
    FLOW_LOG_TRACE("Chunk_encoder [" << *this << "]: Message of size [" << m_pending.size() << "] fits into "
                   "1 frame; sending without chunk header.");
    m_sink->send_frame(util::Blob_const(m_pending.data(), m_pending.size()), err_code);
  }
  else
  {
    send_chunked(err_code);
  }

  if (!*err_code)
  {
    ++m_n_sent_messages;
  }
  reset();
} // Chunk_encoder::flush()

void Chunk_encoder::send_chunked(Error_code* err_code)
{
  const auto payload_size = chunk_payload_size();
  const size_t n_chunks = (m_pending.size() + payload_size - 1) / payload_size;
  assert((n_chunks <= S_MAX_CHUNK_COUNT) && "write() should have prevented this.");

  const message_id_t msg_id = m_id_generator();

  FLOW_LOG_TRACE("Chunk_encoder [" << *this << "]: Message of size [" << m_pending.size() << "] needs "
                 "[" << n_chunks << "] chunks; message ID [" << std::hex << msg_id << std::dec << "].");

  // The header is the same in all chunks, except for the sequence number.
  m_chunk_buf.resize(S_HEADER_SIZE);
  m_chunk_buf[0] = S_MAGIC_BYTE_0;
  m_chunk_buf[1] = S_MAGIC_BYTE_1;
  for (size_t idx = 0; idx != S_MESSAGE_ID_SIZE; ++idx)
  {
    // Big-endian; though to the receiver it is an opaque 8 bytes.
    m_chunk_buf[2 + idx] = static_cast<uint8_t>(msg_id >> (8 * (S_MESSAGE_ID_SIZE - 1 - idx)));
  }
  m_chunk_buf[S_HEADER_SIZE - 1] = static_cast<uint8_t>(n_chunks);

  for (size_t seq_num = 0; seq_num != n_chunks; ++seq_num)
  {
    const auto slice_start = m_pending.begin() + (seq_num * payload_size);
    const auto slice_end = (seq_num == (n_chunks - 1)) ? m_pending.end() : (slice_start + payload_size);

    m_chunk_buf.resize(S_HEADER_SIZE);
    m_chunk_buf[S_HEADER_SIZE - 2] = static_cast<uint8_t>(seq_num);
    m_chunk_buf.insert(m_chunk_buf.end(), slice_start, slice_end);

    m_sink->send_frame(util::Blob_const(m_chunk_buf.data(), m_chunk_buf.size()), err_code);
    if (*err_code)
    {
      FLOW_LOG_WARNING("Chunk_encoder [" << *this << "]: Chunk [" << seq_num << "] of [" << n_chunks << "] could "
                       "not be sent; the remaining chunks of this message are abandoned, as it could not be "
                       "reassembled anyway.  Error: [" << *err_code << "] [" << err_code->message() << "].");
      return;
    }
  }
} // Chunk_encoder::send_chunked()

void Chunk_encoder::reset()
{
  m_pending.clear();
  m_overflowed = false;
}

size_t Chunk_encoder::max_frame_size() const
{
  return m_max_frame_size;
}

size_t Chunk_encoder::chunk_payload_size() const
{
  return m_max_frame_size - S_HEADER_SIZE;
}

size_t Chunk_encoder::max_message_size() const
{
  return S_MAX_CHUNK_COUNT * chunk_payload_size();
}

size_t Chunk_encoder::pending_size() const
{
  return m_pending.size();
}

size_t Chunk_encoder::sent_message_count() const
{
  return m_n_sent_messages;
}

const std::string& Chunk_encoder::nickname() const
{
  return m_nickname;
}

std::ostream& operator<<(std::ostream& os, const Chunk_encoder& val)
{
  return os << '[' << val.nickname() << "]@" << static_cast<const void*>(&val);
}

} // namespace gelf::transport
