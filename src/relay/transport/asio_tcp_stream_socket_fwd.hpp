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
#include "relay/util/util_fwd.hpp"
#include "relay/util/native_handle.hpp"
#include <flow/log/log.hpp>
#include <boost/asio.hpp>

/**
 * Additional (versus boost.asio) APIs for advanced work with TCP stream sockets, including handing an open socket
 * from one boost.asio `io_context` to another and the `host:port` text form used on the control channel.
 */
namespace relay::transport::asio_tcp_stream_socket
{

// Types.

/// Short-hand for boost.asio TCP stream-socket protocol.
using Protocol = boost::asio::ip::tcp;

/// Short-hand for boost.asio TCP acceptor (listening guy) socket.
using Acceptor = Protocol::acceptor;

/// Short-hand for boost.asio TCP peer stream-socket (usually-connected-or-empty guy).
using Peer_socket = Protocol::socket;

/// Short-hand for boost.asio TCP peer stream-socket endpoint.
using Endpoint = Protocol::endpoint;

/// Short-hand for boost.asio IP (v4 or v6) address.
using Address = boost::asio::ip::address;

// Free functions.

/**
 * Returns the numeric text form of the given IP address, as advertised to daemons and clients in `host:port` lines.
 * An IPv4 address is dotted-decimal; an IPv4-mapped IPv6 address is shown as the IPv4 address it maps; any other
 * IPv6 address is shown in brackets (e.g., `"[::1]"`) so that the port separator that follows is unambiguous.
 *
 * @param addr
 *        Address.
 * @return See above.
 */
std::string host_str(const Address& addr);

/**
 * Returns `"<host>:<port>"`.  `host` is used as-is; so it should come from host_str() (or be a host name).
 *
 * @param host
 *        Host.
 * @param port
 *        Port.
 * @return See above.
 */
std::string host_port_str(util::String_view host, uint16_t port);

/**
 * Parses a `"<host>:<port>"` line, as written by host_port_str(), into its host and port.  Brackets around the
 * host (IPv6 form) are removed.  The port must be a decimal number in [1, 65535]; the host must be non-empty.
 *
 * @param host_port
 *        The text.
 * @param host
 *        On success set to the host (sans brackets).  On failure untouched.
 * @param port
 *        On success set to the port.  On failure untouched.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        error::Code::S_INVALID_ARGUMENT (the text is not of the above form).
 */
void parse_host_port(util::String_view host_port, std::string* host, uint16_t* port, Error_code* err_code = 0);

/**
 * Opens, binds and starts listening on the given not-yet-open acceptor, at the wildcard address of the given
 * protocol (IPv4 or IPv6) and an OS-assigned ephemeral port.  Use `acceptor->local_endpoint()` to learn the port.
 * On failure `*acceptor` is left closed, and a WARNING is logged.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param acceptor
 *        A constructed but not open acceptor.
 * @param protocol
 *        `Protocol::v4()` or `Protocol::v6()`.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        whatever boost.asio reports for open/bind/listen.
 */
void open_ephemeral_acceptor(flow::log::Logger* logger_ptr, Acceptor* acceptor, const Protocol& protocol,
                             Error_code* err_code = 0);

/**
 * Takes over the given open TCP socket handle, making `*peer_socket` (not open, constructed on the `io_context`
 * that shall run all of its async operations) own it.  The protocol (IPv4 or IPv6) is determined from the socket
 * itself.  On success `native_peer_socket` becomes `null()`; on failure the handle is closed and nullified just the
 * same, so either way the caller no longer owns it.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param peer_socket
 *        A constructed but not open peer socket.
 * @param native_peer_socket
 *        An open TCP socket handle, typically from `Peer_socket::release()` on another `io_context`.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        error::Code::S_INVALID_ARGUMENT (handle is `null()`), whatever `getsockname()` or boost.asio
 *        `assign()` reports.
 */
void adopt_native_handle(flow::log::Logger* logger_ptr, Peer_socket* peer_socket,
                         util::Native_handle&& native_peer_socket, Error_code* err_code = 0);

} // namespace relay::transport::asio_tcp_stream_socket
