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

namespace gelf
{

// Types.

/**
 * Configuration of a Client, given to its ctor.  Default-constructed it has the standard values shown on each member.
 * There is no global configuration anywhere in Flow-GELF.
 *
 * The members are plain data, so it can be filled from a config file by the user's preferred means.  (The enum
 * member supports `istream>>` and hence `boost::lexical_cast`.)
 */
struct Client_config
{
  // Constants.

  /// Default for #m_frame_size: fits within a typical 1500-byte Ethernet MTU after IP/UDP headers.
  static constexpr size_t S_DEFAULT_FRAME_SIZE = 1420;

  /// Default for #m_intake_capacity.
  static constexpr size_t S_DEFAULT_INTAKE_CAPACITY = 500;

  /// Default for #m_idle_interval.
  static const util::Fine_duration S_DEFAULT_IDLE_INTERVAL;

  // Constructors/destructor.

  /// Constructs config with all default values.
  Client_config();

  // Data.

  /**
   * Max size of each frame sent, chunk header (if any) included.  Must exceed the 12-byte GELF chunk header.
   * A message (after compression) can be at most 128 x (frame size - 12) bytes.
   */
  size_t m_frame_size;

  /// Compression of each message.  Dial URI's `compress` parameter, if any, overrides it.  Default: gzip.
  transport::Compression m_compression;

  /// How many messages Client::queue_msg() can accept before it blocks, pending intake by the background worker.
  size_t m_intake_capacity;

  /**
   * Longest the dispatcher waits, when it has nothing to send, before it checks for a stop request.  It also wakes
   * up early as soon as a message is queued, or a stop is requested; so this only bounds latency in unusual cases.
   * Must be positive.
   */
  util::Fine_duration m_idle_interval;

  /// Whether to add GELF 1.1 mandatory fields `version` and `host` to messages lacking them.  Default: `true`.
  bool m_fill_gelf_defaults;
}; // struct Client_config

// Free functions.

/**
 * Prints string representation of the given Client_config to the given `ostream`.
 *
 * @relatesalso Client_config
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Client_config& val);

} // namespace gelf
