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

#include "relay/test/test_config.hpp"

namespace relay::test
{

Test_config::Test_config() :
  m_sev(flow::log::Sev::S_WARNING)
{
  // Nope.
}

Test_config& Test_config::get_singleton()
{
  static Test_config s_config;
  return s_config;
}

} // namespace relay::test
