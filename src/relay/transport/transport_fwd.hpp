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

#include "relay/util/native_handle.hpp"
#include <ostream>

/**
 * Flow-Relay module providing the wire level of the relay: TCP socket helpers, the line-oriented control channel
 * between the relay and a daemon, and the data relay that pipes bytes between a client socket and its matched
 * daemon socket.  See namespace ::relay doc header for an overview of Flow-Relay modules including how
 * relay::transport relates to the others.
 *
 * relay::transport knows nothing about services, registration or per-request handshakes; that is relay::session.
 * What it does know:
 *   - Control_channel: read one `\n`-terminated line (optionally with a deadline); write one line.  Never more than
 *     one read and one write outstanding at a time.
 *   - Data_relay: given two connected sockets, pump bytes between them until both directions are finished (or
 *     something breaks), then close both.
 *   - Data_relay_engine: a thread running any number of `Data_relay`s.
 */
namespace relay::transport
{

// Types.

// Find doc headers near the bodies of these compound types.

class Control_channel;
class Data_relay;
class Data_relay_engine;
struct Data_connection_pair;

// Free functions.

/**
 * Prints string representation of the given Control_channel to the given `ostream`.
 *
 * @relatesalso Control_channel
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Control_channel& val);

/**
 * Prints string representation of the given Data_relay to the given `ostream`.
 *
 * @relatesalso Data_relay
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Data_relay& val);

/**
 * Prints string representation of the given Data_relay_engine to the given `ostream`.
 *
 * @relatesalso Data_relay_engine
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Data_relay_engine& val);

/**
 * Prints string representation of the given Data_connection_pair to the given `ostream`.
 *
 * @relatesalso Data_connection_pair
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Data_connection_pair& val);

} // namespace relay::transport
