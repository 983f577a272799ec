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

#include <flow/log/log.hpp>
#include <map>
#include <string>

namespace relay::test
{

/**
 * Process-wide test settings, set once (by the test program's `main()`) before any test runs.
 */
struct Test_config
{
  // Constructors/destructor.

  /// Defaults: see each member.
  Test_config();

  // Methods.

  /**
   * Returns the singleton.
   *
   * @return See above.
   */
  static Test_config& get_singleton();

  // Data.

  /// Lowest severity Test_logger lets through, in components not in #m_component_sevs; default `S_WARNING`.
  flow::log::Sev m_sev;

  /// Per-component severity overrides, keyed by component name (`relay-session`, `flow-async`, ...); default none.
  std::map<std::string, flow::log::Sev> m_component_sevs;
}; // struct Test_config

} // namespace relay::test
