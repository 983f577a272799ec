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

/// @cond
// -^- Doxygen, please ignore the following.  This is wacky macro magic and not a regular `#pragma once` header.

/* This is modeled off the similarly-named such file in Flow.  See that for docs.
 * Add new components at the end; never renumber. */

// Rarely used component corresponding to log call sites outside namespace `relay::X`, for all X in ::relay.
FLOW_LOG_CFG_COMPONENT_DEFINE(UNCAT, 0)
// Logging from namespace relay::session.
FLOW_LOG_CFG_COMPONENT_DEFINE(SESSION, 1)
// Logging from namespace relay::transport.
FLOW_LOG_CFG_COMPONENT_DEFINE(TRANSPORT, 2)
// Logging from namespace relay::util.
FLOW_LOG_CFG_COMPONENT_DEFINE(UTIL, 3)
// Logging from namespace relay::test and test programs.
FLOW_LOG_CFG_COMPONENT_DEFINE(TEST, 4)

// -v- Doxygen, please stop ignoring.
/// @endcond
