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
#include "gelf/transport/uri.hpp"
#include "gelf/error.hpp"
#include <flow/error/error.hpp>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

namespace gelf::transport
{

// Implementations.

Dial_target parse_dial_uri(flow::log::Logger* logger_ptr, util::String_view uri, Error_code* err_code)
{
  using util::String_view;
  using boost::algorithm::to_lower_copy;
  using boost::algorithm::all;
  using boost::algorithm::is_digit;
  using boost::algorithm::split;
  using boost::lexical_cast;
  using std::string;
  using std::vector;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Dial_target, parse_dial_uri, logger_ptr, uri, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_TRANSPORT);

  Dial_target target;
  target.m_protocol = Protocol::S_END_SENTINEL;
  target.m_port = Dial_target::S_DEFAULT_PORT;

  // Scheme.

  const auto scheme_end = uri.find("://");
  if ((scheme_end == String_view::npos) || (scheme_end == 0))
  {
    FLOW_LOG_WARNING("Dial URI [" << uri << "] lacks the `scheme://` prefix.");
    *err_code = error::Code::S_URI_MALFORMED;
    return target;
  }
  // else

  const auto scheme = to_lower_copy(string(uri.substr(0, scheme_end)));
  if (scheme == "udp")
  {
    target.m_protocol = Protocol::S_UDP;
  }
  else if (scheme == "tcp")
  {
    target.m_protocol = Protocol::S_TCP;
  }
  else
  {
    FLOW_LOG_WARNING("Dial URI [" << uri << "] has scheme [" << scheme << "]; only udp and tcp are supported.");
    *err_code = error::Code::S_URI_UNSUPPORTED_SCHEME;
    return target;
  }

  // Split the rest into authority and query; path and fragment are of no interest.

  auto rest = uri.substr(scheme_end + 3);
  const auto fragment_start = rest.find('#');
  if (fragment_start != String_view::npos)
  {
    rest = rest.substr(0, fragment_start);
  }
  String_view query;
  const auto query_start = rest.find('?');
  if (query_start != String_view::npos)
  {
    query = rest.substr(query_start + 1);
    rest = rest.substr(0, query_start);
  }
  auto authority = rest.substr(0, rest.find('/'));
  const auto user_info_end = authority.rfind('@');
  if (user_info_end != String_view::npos)
  {
    authority = authority.substr(user_info_end + 1);
  }

  // Host and port.

  String_view port_str;
  bool has_port = false;
  if ((!authority.empty()) && (authority.front() == '['))
  {
    const auto bracket_end = authority.find(']');
    if (bracket_end == String_view::npos)
    {
      FLOW_LOG_WARNING("Dial URI [" << uri << "] has an unterminated `[` in its host.");
      *err_code = error::Code::S_URI_MALFORMED;
      return target;
    }
    // else

    target.m_host = string(authority.substr(1, bracket_end - 1));
    const auto after = authority.substr(bracket_end + 1);
    if (!after.empty())
    {
      if (after.front() != ':')
      {
        FLOW_LOG_WARNING("Dial URI [" << uri << "] has junk after the bracketed host.");
        *err_code = error::Code::S_URI_MALFORMED;
        return target;
      }
      // else
      port_str = after.substr(1);
      has_port = true;
    }
  }
  else
  {
    const auto colon_pos = authority.find(':');
    if (colon_pos == String_view::npos)
    {
      target.m_host = string(authority);
    }
    else
    {
      if (authority.find(':', colon_pos + 1) != String_view::npos)
      {
        FLOW_LOG_WARNING("Dial URI [" << uri << "] has more than one `:` in its host; an IPv6 literal host must be "
                         "enclosed in brackets.");
        *err_code = error::Code::S_URI_MALFORMED;
        return target;
      }
      // else
      target.m_host = string(authority.substr(0, colon_pos));
      port_str = authority.substr(colon_pos + 1);
      has_port = true;
    }
  }

  if (target.m_host.empty())
  {
    FLOW_LOG_WARNING("Dial URI [" << uri << "] has an empty host.");
    *err_code = error::Code::S_URI_MALFORMED;
    return target;
  }
  // else

  if (has_port)
  {
    const string port_string(port_str);
    unsigned int port = 0;
    // Up to 5 digits cannot overflow; so lexical_cast<> cannot throw.
    if ((!port_string.empty()) && (port_string.size() <= 5) && all(port_string, is_digit()))
    {
      port = lexical_cast<unsigned int>(port_string);
    }
    if ((port == 0) || (port > 65535))
    {
      FLOW_LOG_WARNING("Dial URI [" << uri << "] has port [" << port_string << "] which is not a number in "
                       "[1, 65535].");
      *err_code = error::Code::S_URI_MALFORMED;
      return target;
    }
    // else
    target.m_port = static_cast<uint16_t>(port);
  }

  // Query.  The first `compress` parameter counts.

  if (!query.empty())
  {
    const string query_str(query);
    vector<string> params;
    split(params, query_str, [](char ch) -> bool { return ch == '&'; });
    for (const auto& param : params)
    {
      const auto eq_pos = param.find('=');
      if (param.substr(0, eq_pos) != "compress")
      {
        continue;
      }
      // else

      const auto value = (eq_pos == string::npos) ? string() : param.substr(eq_pos + 1);
      if (value == "none")
      {
        target.m_compression = Compression::S_NONE;
      }
      else if (value == "zlib")
      {
        target.m_compression = Compression::S_ZLIB;
      }
      else if (value == "gzip")
      {
        target.m_compression = Compression::S_GZIP;
      }
      else
      {
        FLOW_LOG_WARNING("Dial URI [" << uri << "] has compress=[" << value << "] which is not one of "
                         "none, zlib, gzip; ignoring it: configured compression stays in effect.");
      }
      break;
    } // for (param : params)
  } // if (!query.empty())

  FLOW_LOG_TRACE("Dial URI [" << uri << "] parsed: [" << target << "].");
  err_code->clear();
  return target;
} // parse_dial_uri()

std::ostream& operator<<(std::ostream& os, Protocol val)
{
  switch (val)
  {
  case Protocol::S_UDP:
    return os << "udp";
  case Protocol::S_TCP:
    return os << "tcp";
  case Protocol::S_END_SENTINEL:
    break;
  }
  return os << "END_SENTINEL";
}

std::ostream& operator<<(std::ostream& os, const Dial_target& val)
{
  os << val.m_protocol << "://";
  if (val.m_host.find(':') == std::string::npos)
  {
    os << val.m_host;
  }
  else
  {
    os << '[' << val.m_host << ']';
  }
  os << ':' << val.m_port;
  if (val.m_compression)
  {
    os << "?compress=" << *val.m_compression;
  }
  return os;
}

} // namespace gelf::transport
