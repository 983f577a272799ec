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
#pragma once

#include "relay/transport/transport_fwd.hpp"
#include <ostream>

/**
 * Flow-Relay module providing the coordination protocol between the relay and its daemons: registration of a named
 * service over a daemon's control channel, the public listener for that service, and the per-client-request
 * handshake that yields a matched (client, daemon) socket pair.  See namespace ::relay doc header for an overview.
 *
 * The main class is Service.  Relay_server is the bootstrap: it accepts daemons' control connections and makes a
 * Service for each.
 *
 * ### Control-channel protocol ###
 * All messages are `\n`-terminated text lines:
 *   - Daemon => relay, once: the service name (non-empty).
 *   - Relay => daemon, once, in reply: `<host>:<port>`, the service's public address for clients.
 *   - Relay => daemon, per client request: `<host>:<port>`, a single-use address to connect back to.
 *   - Daemon => relay, per client request, in reply: any line (the acknowledgment); the daemon then connects
 *     to the single-use address.
 */
namespace relay::session
{

// Types.

// Find doc headers near the bodies of these compound types.

class Service;
class Relay_server;

// Free functions.

/**
 * Prints string representation of the given Service to the given `ostream`.
 *
 * @relatesalso Service
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Service& val);

/**
 * Prints string representation of the given Relay_server to the given `ostream`.
 *
 * @relatesalso Relay_server
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Relay_server& val);

} // namespace relay::session
