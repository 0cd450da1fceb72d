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
#include "gelf/client_config.hpp"
#include <boost/chrono/chrono_io.hpp>

namespace gelf
{

// Static initializations.

const util::Fine_duration Client_config::S_DEFAULT_IDLE_INTERVAL = boost::chrono::seconds(1);

// Implementations.

Client_config::Client_config() :
  m_frame_size(S_DEFAULT_FRAME_SIZE),
  m_compression(transport::Compression::S_GZIP),
  m_intake_capacity(S_DEFAULT_INTAKE_CAPACITY),
  m_idle_interval(S_DEFAULT_IDLE_INTERVAL),
  m_fill_gelf_defaults(true)
{
  // That's it.
}

std::ostream& operator<<(std::ostream& os, const Client_config& val)
{
  using boost::chrono::milliseconds;
  using boost::chrono::duration_cast;

  return os << "frame_size[" << val.m_frame_size << "] compression[" << val.m_compression << "] "
               "intake_capacity[" << val.m_intake_capacity << "] "
               "idle_interval[" << duration_cast<milliseconds>(val.m_idle_interval) << "] "
               "fill_gelf_defaults[" << val.m_fill_gelf_defaults << ']';
}

} // namespace gelf
