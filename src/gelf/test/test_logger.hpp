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

#include "gelf/common.hpp"
#include "gelf/test/test_config.hpp"
#include <flow/log/simple_ostream_logger.hpp>
#include <atomic>

namespace gelf::test
{

/**
 * Console logger for tests: knows our log components and Flow's, and filters per Test_config.  Additionally counts
 * the WARNING-or-worse messages it receives, whatever the console filter, so that tests can check a failure was
 * reported in the log and not only via its return value.
 */
class Test_logger :
  public flow::log::Logger
{
public:
  /**
   * Sets up the component mappings (ours under `gelf-`, Flow's under `flow-`) and the console sink.
   *
   * @param min_severity
   *        Messages less severe than this are filtered out.  By default comes from `GELF_TEST_LOG_SEVERITY`.
   */
  Test_logger(const flow::log::Sev& min_severity = Test_config::get_singleton().m_sev) :
    m_config(min_severity),
    m_logger(&m_config),
    m_n_warnings(0)
  {
    // m_logger merely stored &m_config so far, so it is not too late to fill it in.
    m_config.init_component_to_union_idx_mapping<Log_component>
      (100, flow::log::Config::standard_component_payload_enum_sparse_length<Log_component>());
    m_config.init_component_names<Log_component>(gelf::S_GELF_LOG_COMPONENT_NAME_MAP, false, "gelf-");
    m_config.init_component_to_union_idx_mapping<flow::Flow_log_component>
      (100, flow::log::Config::standard_component_payload_enum_sparse_length<flow::Flow_log_component>());
    m_config.init_component_names<flow::Flow_log_component>(flow::S_FLOW_LOG_COMPONENT_NAME_MAP, false, "flow-");
  }

  /// Per Test_config severity; but WARNING and worse always pass, so that warning_count() sees them.
  bool should_log(flow::log::Sev sev, const flow::log::Component& component) const override
  {
    return is_warning(sev) || m_logger.should_log(sev, component);
  }

  /// `false`: console logging is synchronous, so test output interleaves sensibly with gtest's.
  bool logs_asynchronously() const override
  {
    return m_logger.logs_asynchronously();
  }

  /// Counts warnings; writes to the console if the console filter allows.
  void do_log(flow::log::Msg_metadata* metadata, flow::util::String_view msg) override
  {
    if (is_warning(metadata->m_msg_sev))
    {
      ++m_n_warnings;
    }
    if (m_logger.should_log(metadata->m_msg_sev, metadata->m_msg_component))
    {
      m_logger.do_log(metadata, msg);
    }
  }

  /**
   * Number of WARNING (or more severe) messages logged so far, from any thread.
   *
   * @return See above.
   */
  size_t warning_count() const
  {
    return m_n_warnings;
  }

private:
  /**
   * Whether `sev` is WARNING or more severe.
   *
   * @param sev
   *        Severity.
   * @return See above.
   */
  static bool is_warning(flow::log::Sev sev)
  {
    return (sev != flow::log::Sev::S_NONE) && (sev <= flow::log::Sev::S_WARNING);
  }

  /// Severity filter and component names; referenced by #m_logger.
  flow::log::Config m_config;

  /// Console logger doing the actual work.
  flow::log::Simple_ostream_logger m_logger;

  /// See warning_count().
  std::atomic<size_t> m_n_warnings;
}; // class Test_logger

} // namespace gelf::test
