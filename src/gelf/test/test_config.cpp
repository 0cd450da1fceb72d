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
#include "gelf/test/test_config.hpp"
#include <boost/lexical_cast.hpp>
#include <cstdlib>
#include <iostream>

namespace gelf::test
{

// Static initializations.

const std::string Test_config::S_LOG_SEVERITY_ENV_VAR = "GELF_TEST_LOG_SEVERITY";

// Implementations.

Test_config::Test_config() :
  m_sev(flow::log::Sev::S_WARNING)
{
  using flow::log::Sev;
  using boost::lexical_cast;
  using boost::bad_lexical_cast;

  const char* const sev_str = std::getenv(S_LOG_SEVERITY_ENV_VAR.c_str());
  if (!sev_str)
  {
    return;
  }
  // else

  try
  {
    m_sev = lexical_cast<Sev>(sev_str);
  }
  catch (const bad_lexical_cast&)
  {
    std::cerr << "Ignoring [" << S_LOG_SEVERITY_ENV_VAR << "] value [" << sev_str << "]: not a severity name.\n";
  }
}

Test_config& Test_config::get_singleton()
{
  static Test_config s_singleton;
  return s_singleton;
}

} // namespace gelf::test
