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

/// @file
#include "relay/util/util_fwd.hpp"
#include "relay/util/native_handle.hpp"
#include <flow/error/error.hpp>
#include <flow/common.hpp>
#include <unistd.h>

namespace relay::util
{

// Initializations.

const std::string EMPTY_STRING;
const Fine_duration NO_TIMEOUT = Fine_duration::zero();

// Implementations.

bool timeout_enabled(Fine_duration timeout)
{
  return timeout > Fine_duration::zero();
}

void close_native_handle(flow::log::Logger* logger_ptr, Native_handle* hndl)
{
  using boost::system::system_category;
  using ::close;
  // using ::errno; // It's a macro apparently.

  assert(hndl);
  if (hndl->null())
  {
    return;
  }
  // else

  if (close(hndl->m_native_handle) == -1)
  {
    FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_UTIL);

    const Error_code sys_err_code(errno, system_category());
    FLOW_LOG_WARNING("Tried to close handle [" << *hndl << "] but that failed; ignoring (closing is "
                     "best-effort).  Details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
  }

  *hndl = Native_handle();
} // close_native_handle()

} // namespace relay::util
