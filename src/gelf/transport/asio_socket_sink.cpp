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
#include "gelf/transport/asio_socket_sink.hpp"
#include "gelf/error.hpp"
#include <flow/error/error.hpp>
#include <flow/util/util.hpp>
#include <algorithm>
#include <type_traits>
#include <vector>

namespace gelf::transport
{

// Frame_sink implementations.

Frame_sink::~Frame_sink() = default;

// Asio_socket_sink implementations.

Asio_socket_sink::Asio_socket_sink(flow::log::Logger* logger_ptr, util::String_view nickname_str, Protocol protocol,
                                   const std::string& host, uint16_t port, Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_nickname(nickname_str),
  m_protocol(protocol),
  m_udp_socket(m_io_context),
  m_tcp_socket(m_io_context),
  m_n_sent_frames(0)
{
  using flow::error::Runtime_error;

  FLOW_LOG_INFO("Socket sink [" << *this << "]: Resolving [" << host << "] port [" << port << "] and connecting "
                "(protocol [" << m_protocol << "]).");

  const auto sys_err_code = (m_protocol == Protocol::S_UDP)
                              ? resolve_and_connect<Udp>(&m_udp_socket, host, port)
                              : resolve_and_connect<Tcp>(&m_tcp_socket, host, port);
  if (sys_err_code)
  {
    // Details already logged.
    if (err_code)
    {
      *err_code = sys_err_code;
    }
    else
    {
      throw Runtime_error(sys_err_code, FLOW_UTIL_WHERE_AM_I_STR());
    }
    return;
  }
  // else

  FLOW_LOG_INFO("Socket sink [" << *this << "]: Connected to [" << remote_address() << "]:[" << remote_port() << "].");
  if (err_code)
  {
    err_code->clear();
  }
} // Asio_socket_sink::Asio_socket_sink()

Asio_socket_sink::~Asio_socket_sink()
{
  if (is_open())
  {
    Error_code sys_err_code;
    close(&sys_err_code);
    // It's logged inside close().  Nothing else to do about it here.
  }
}

template<typename Protocol_t>
Error_code Asio_socket_sink::resolve_and_connect(typename Protocol_t::socket* socket,
                                                 const std::string& host, uint16_t port)
{
  using boost::asio::connect;
  using std::to_string;

  typename Protocol_t::resolver resolver(m_io_context);

  Error_code sys_err_code;
  const auto endpoints = resolver.resolve(host, to_string(port), sys_err_code);
  if (sys_err_code)
  {
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    FLOW_LOG_WARNING("Socket sink [" << *this << "]: Could not resolve [" << host << "]; see above error.");
    return sys_err_code;
  }
  // else

  /* For TCP, connect() performs the handshake, so trying endpoints in resolver order finds one that listens.
   * For UDP it merely fixes the peer address and never fails for lack of a listener: the first endpoint always
   * wins.  GELF servers commonly listen on IPv4 only, while e.g. `localhost` may resolve to ::1 first; hence for UDP
   * IPv4 endpoints go ahead of IPv6 ones (resolver order is otherwise kept). */
  if (endpoints.empty())
  {
    FLOW_LOG_WARNING("Socket sink [" << *this << "]: [" << host << "] resolved to no endpoints.");
    return boost::asio::error::host_not_found;
  }
  // else

  std::vector<typename Protocol_t::endpoint> ordered_endpoints;
  ordered_endpoints.reserve(endpoints.size());
  for (const auto& entry : endpoints)
  {
    ordered_endpoints.push_back(entry.endpoint());
  }
  if (std::is_same_v<Protocol_t, Udp>)
  {
    std::stable_partition(ordered_endpoints.begin(), ordered_endpoints.end(),
                          [](const typename Protocol_t::endpoint& endpoint) -> bool
                            { return endpoint.address().is_v4(); });
  }

  FLOW_LOG_TRACE("Socket sink [" << *this << "]: [" << host << "] resolved to [" << ordered_endpoints.size() << "] "
                 "endpoint(s); first to try is [" << ordered_endpoints.front() << "].");

  connect(*socket, ordered_endpoints, sys_err_code);
  if (sys_err_code)
  {
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    FLOW_LOG_WARNING("Socket sink [" << *this << "]: Could not connect to any endpoint of "
                     "[" << host << "]:[" << port << "]; see above error.");
  }
  return sys_err_code;
} // Asio_socket_sink::resolve_and_connect()

void Asio_socket_sink::send_frame(const util::Blob_const& frame, Error_code* err_code)
{
  using flow::util::buffers_dump_string;
  using boost::asio::write;

  assert(err_code && "Frame_sink::send_frame() requires a non-null err_code.");
  assert((frame.size() != 0) && "Frame_sink::send_frame() requires a non-empty frame.");

  if (!is_open())
  {
    FLOW_LOG_WARNING("Socket sink [" << *this << "]: Frame of size [" << frame.size() << "] cannot be sent: "
                     "socket already closed.");
    *err_code = error::Code::S_NOT_CONNECTED;
    return;
  }
  // else

  FLOW_LOG_TRACE("Socket sink [" << *this << "]: Sending frame of size [" << frame.size() << "].");
  FLOW_LOG_DATA("Frame contents: [\n" << buffers_dump_string(frame, "  ") << "].");

  Error_code sys_err_code;
  if (m_protocol == Protocol::S_UDP)
  {
    const auto n_sent = m_udp_socket.send(frame, 0, sys_err_code);
    if ((!sys_err_code) && (n_sent != frame.size()))
    {
      sys_err_code = boost::asio::error::message_size;
    }
  }
  else
  {
    write(m_tcp_socket, frame, sys_err_code);
  }

  if (sys_err_code)
  {
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    FLOW_LOG_WARNING("Socket sink [" << *this << "]: Frame of size [" << frame.size() << "] could not be sent.");
    *err_code = sys_err_code;
    return;
  }
  // else

  ++m_n_sent_frames;
  err_code->clear();
} // Asio_socket_sink::send_frame()

void Asio_socket_sink::close(Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { close(actual_err_code); },
         err_code, "Asio_socket_sink::close()"))
  {
    return;
  }
  // else

  if (!is_open())
  {
    err_code->clear();
    return;
  }
  // else

  FLOW_LOG_INFO("Socket sink [" << *this << "]: Closing after [" << m_n_sent_frames << "] frames sent.");

  Error_code sys_err_code;
  if (m_protocol == Protocol::S_UDP)
  {
    m_udp_socket.close(sys_err_code);
  }
  else
  {
    m_tcp_socket.close(sys_err_code);
  }

  if (sys_err_code)
  {
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    FLOW_LOG_WARNING("Socket sink [" << *this << "]: Error while closing; the socket is released regardless.");
  }
  *err_code = sys_err_code;
} // Asio_socket_sink::close()

bool Asio_socket_sink::is_open() const
{
  return (m_protocol == Protocol::S_UDP) ? m_udp_socket.is_open() : m_tcp_socket.is_open();
}

Protocol Asio_socket_sink::protocol() const
{
  return m_protocol;
}

boost::asio::ip::address Asio_socket_sink::remote_address() const
{
  Error_code sys_err_code; // Not open => default-cted address, as advertised; no need to log.
  return (m_protocol == Protocol::S_UDP) ? m_udp_socket.remote_endpoint(sys_err_code).address()
                                         : m_tcp_socket.remote_endpoint(sys_err_code).address();
}

uint16_t Asio_socket_sink::remote_port() const
{
  Error_code sys_err_code; // Ditto.
  return (m_protocol == Protocol::S_UDP) ? m_udp_socket.remote_endpoint(sys_err_code).port()
                                         : m_tcp_socket.remote_endpoint(sys_err_code).port();
}

size_t Asio_socket_sink::sent_frame_count() const
{
  return m_n_sent_frames;
}

const std::string& Asio_socket_sink::nickname() const
{
  return m_nickname;
}

std::ostream& operator<<(std::ostream& os, const Asio_socket_sink& val)
{
  return os << '[' << val.nickname() << "]@" << static_cast<const void*>(&val);
}

} // namespace gelf::transport
