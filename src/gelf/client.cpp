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
#include "gelf/client.hpp"
#include "gelf/detail/client_impl.hpp"

namespace gelf
{

// Implementations (strict forwarding to m_impl).

Client::Client(flow::log::Logger* logger_ptr, const Client_config& config, Error_code* err_code) :
  m_impl(boost::movelib::make_unique<Impl>(logger_ptr, config, err_code))
{
  // Yay.
}

Client::Client(Client&&) = default;
Client& Client::operator=(Client&&) = default;
Client::~Client() = default; // It's only explicitly defined to formally document it.

void Client::dial(util::String_view uri, Error_code* err_code)
{
  assert(m_impl && "Moved-from Client used.");
  m_impl->dial(uri, err_code);
}

void Client::queue_msg(const Message::Ptr& msg, Error_code* err_code)
{
  assert(m_impl && "Moved-from Client used.");
  m_impl->queue_msg(msg, err_code);
}

void Client::close(Error_code* err_code)
{
  assert(m_impl && "Moved-from Client used.");
  m_impl->close(err_code);
}

void Client::set_dispatch_error_handler(Dispatch_error_handler&& handler)
{
  assert(m_impl && "Moved-from Client used.");
  m_impl->set_dispatch_error_handler(std::move(handler));
}

bool Client::connected() const
{
  assert(m_impl && "Moved-from Client used.");
  return m_impl->connected();
}

Client_config Client::config() const
{
  assert(m_impl && "Moved-from Client used.");
  return m_impl->config();
}

const std::string& Client::hostname() const
{
  assert(m_impl && "Moved-from Client used.");
  return m_impl->hostname();
}

size_t Client::sent_msg_count() const
{
  assert(m_impl && "Moved-from Client used.");
  return m_impl->sent_msg_count();
}

size_t Client::dropped_msg_count() const
{
  assert(m_impl && "Moved-from Client used.");
  return m_impl->dropped_msg_count();
}

size_t Client::pending_msg_count() const
{
  assert(m_impl && "Moved-from Client used.");
  return m_impl->pending_msg_count();
}

std::ostream& operator<<(std::ostream& os, const Client& val)
{
  os << "Client@" << static_cast<const void*>(&val);
  if (!val.m_impl)
  {
    return os << " (moved-from)";
  }
  // else
  return os << " [" << (val.connected() ? "connected" : "not connected") << ']';
}

} // namespace gelf
