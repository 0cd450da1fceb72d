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
#include <optional>

namespace gelf::transport
{

// Types.

/**
 * The result of parsing a dial URI of the form `scheme://host[:port][?compress=<kind>]`: where and how to connect,
 * plus the optional compression override.
 */
struct Dial_target
{
  // Constants.

  /// Port used when the URI specifies none: the standard GELF port.
  static constexpr uint16_t S_DEFAULT_PORT = 12201;

  // Data.

  /// From the scheme: `udp` or `tcp`.
  Protocol m_protocol;

  /// Host name or IP address literal (an IPv6 literal is stored without its surrounding brackets).
  std::string m_host;

  /// Port; #S_DEFAULT_PORT if the URI had none.
  uint16_t m_port;

  /**
   * The `compress` query parameter if present and recognized (`none`, `zlib`, `gzip`); else empty, meaning
   * keep the configured compression.
   */
  std::optional<Compression> m_compression;
}; // struct Dial_target

// Free functions.

/**
 * Parses a dial URI.  Rules:
 *   - The scheme (case-insensitive) must be `udp` or `tcp`; else error::Code::S_URI_UNSUPPORTED_SCHEME.
 *   - The host must be non-empty.  An IPv6 literal must be bracketed: `udp://[::1]:12201`.
 *   - The port, if present, must be decimal in [1, 65535]; if absent it is Dial_target::S_DEFAULT_PORT.
 *   - User-info (`user@`), path and fragment are ignored.
 *   - In the query, the first `compress` parameter counts; `none`, `zlib`, `gzip` are recognized.  Any other
 *     value is ignored with a WARNING logged, so the configured compression stays in effect.  Other parameters
 *     are ignored.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param uri
 *        The URI.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        error::Code::S_URI_MALFORMED, error::Code::S_URI_UNSUPPORTED_SCHEME.
 * @return The parsed target; meaningless on error.
 */
Dial_target parse_dial_uri(flow::log::Logger* logger_ptr, util::String_view uri, Error_code* err_code = 0);

} // namespace gelf::transport
