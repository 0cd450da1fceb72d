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
#include "gelf/util/util_fwd.hpp"
#include "gelf/error.hpp"
#include <flow/error/error.hpp>
#include <flow/common.hpp>

namespace gelf::util
{

// Initializations.

const std::string EMPTY_STRING;

// Implementations.

Blob_const to_blob(const std::string& str)
{
  return Blob_const(static_cast<const void*>(str.data()), str.size());
}

std::string local_host_name(flow::log::Logger* logger_ptr, Error_code* err_code)
{
  using boost::asio::ip::host_name;
  using std::string;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(string, local_host_name, logger_ptr, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_UTIL);

  Error_code sys_err_code;
  auto name = host_name(sys_err_code); // This is ::gethostname() with errno translated into sys_err_code.
  if (sys_err_code)
  {
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    FLOW_LOG_WARNING("Could not obtain local host name; see above system error.");
    *err_code = error::Code::S_HOSTNAME_UNAVAILABLE;
    return EMPTY_STRING;
  }
  // else

  if (name.empty())
  {
    FLOW_LOG_WARNING("Local host name as reported by the OS is empty; cannot use it as the GELF host field.");
    *err_code = error::Code::S_HOSTNAME_UNAVAILABLE;
    return EMPTY_STRING;
  }
  // else

  FLOW_LOG_TRACE("Local host name is [" << name << "].");
  err_code->clear();
  return name;
} // local_host_name()

} // namespace gelf::util
