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

#include <flow/log/log.hpp>

namespace gelf::test
{

/**
 * Settings shared by all tests in a test program, set up once in `main()` (e.g., from the command line) before
 * tests run, and read by the test support code.
 */
class Test_config
{
public:
  // Constants.

  /// Environment variable which, if set to a `flow::log::Sev` name (e.g., `TRACE`), overrides #m_sev.
  static const std::string S_LOG_SEVERITY_ENV_VAR;

  // Methods.

  /**
   * Returns the singleton.
   *
   * @return See above.
   */
  static Test_config& get_singleton();

  // Data.

  /// Lowest severity that Test_logger passes through.  Default: WARNING (or per #S_LOG_SEVERITY_ENV_VAR).
  flow::log::Sev m_sev;

private:
  // Constructors/destructor.

  /// Constructs the singleton.
  Test_config();
}; // class Test_config

} // namespace gelf::test
