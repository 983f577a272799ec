/* Flow-Relay
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

#pragma once

#include "relay/common.hpp"
#include "relay/test/test_config.hpp"
#include <flow/log/config.hpp>
#include <flow/log/simple_ostream_logger.hpp>

namespace relay::test
{

/// Holds the Config of a Test_logger, so that it is constructed before the Logger that points to it.
class Test_log_config
{
protected:
  /**
   * Sets up the Flow and relay components (`flow-X` and `relay-X` names), verbosity `default_sev` for all of them,
   * and then the per-component overrides in Test_config::m_component_sevs.
   *
   * @param default_sev
   *        See above.
   */
  explicit Test_log_config(flow::log::Sev default_sev);

  /// The configuration.
  flow::log::Config m_log_config;
};

/**
 * Console Logger for tests.  Verbosity is set process-wide via Test_config, typically from the test program's command
 * line: a default severity, plus optional per-component ones (`relay-session=TRACE`), so that one can trace the layer
 * being debugged without drowning in the rest.
 */
class Test_logger :
  private Test_log_config,
  public flow::log::Simple_ostream_logger
{
public:
  /**
   * Constructor.
   *
   * @param default_sev
   *        Lowest severity that will pass through, in components without an override.
   */
  explicit Test_logger(flow::log::Sev default_sev = Test_config::get_singleton().m_sev);
}; // class Test_logger

} // namespace relay::test
