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
#include "relay/transport/asio_tcp_stream_socket_fwd.hpp"
#include "relay/transport/error.hpp"
#include <flow/error/error.hpp>
#include <flow/common.hpp>
#include <sys/socket.h>
#include <netinet/in.h>

namespace relay::transport::asio_tcp_stream_socket
{

// Implementations.

std::string host_str(const Address& addr)
{
  using boost::asio::ip::make_address_v4;
  using boost::asio::ip::v4_mapped;
  using flow::util::ostream_op_string;

  if (addr.is_v6())
  {
    const auto addr_v6 = addr.to_v6();
    if (addr_v6.is_v4_mapped())
    {
      return make_address_v4(v4_mapped, addr_v6).to_string();
    }
    // else
    return ostream_op_string('[', addr_v6.to_string(), ']');
  }
  // else
  return addr.to_string();
}

std::string host_port_str(util::String_view host, uint16_t port)
{
  return flow::util::ostream_op_string(host, ':', port);
}

void parse_host_port(util::String_view host_port, std::string* host, uint16_t* port, Error_code* err_code)
{
  using util::String_view;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code)
           { parse_host_port(host_port, host, port, actual_err_code); },
         err_code, "asio_tcp_stream_socket::parse_host_port()"))
  {
    return;
  }
  // else

  assert(host && port);

  const auto sep_pos = host_port.rfind(':');
  if ((sep_pos == String_view::npos) || (sep_pos == 0))
  {
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return;
  }
  // else

  auto host_part = host_port.substr(0, sep_pos);
  const auto port_part = host_port.substr(sep_pos + 1);

  if ((host_part.front() == '[') || (host_part.back() == ']'))
  {
    if ((host_part.size() < 3) || (host_part.front() != '[') || (host_part.back() != ']'))
    {
      *err_code = error::Code::S_INVALID_ARGUMENT;
      return;
    }
    // else
    host_part = host_part.substr(1, host_part.size() - 2);
  }

  // At most 5 digits; no sign, no white space.
  if (port_part.empty() || (port_part.size() > 5))
  {
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return;
  }
  // else
  unsigned int port_val = 0;
  for (const char digit : port_part)
  {
    if ((digit < '0') || (digit > '9'))
    {
      *err_code = error::Code::S_INVALID_ARGUMENT;
      return;
    }
    // else
    port_val = (port_val * 10) + (digit - '0');
  }
  if ((port_val == 0) || (port_val > 65535))
  {
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return;
  }
  // else

  host->assign(host_part.data(), host_part.size());
  *port = uint16_t(port_val);
  err_code->clear();
} // parse_host_port()

void open_ephemeral_acceptor(flow::log::Logger* logger_ptr, Acceptor* acceptor, const Protocol& protocol,
                             Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code)
           { open_ephemeral_acceptor(logger_ptr, acceptor, protocol, actual_err_code); },
         err_code, "asio_tcp_stream_socket::open_ephemeral_acceptor()"))
  {
    return;
  }
  // else

  assert(acceptor && (!acceptor->is_open()));

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_TRANSPORT);

  // Port 0 => OS picks; wildcard address => reachable however the peer reached us.
  const Endpoint local_endpoint(protocol, 0);
  Error_code sys_err_code;

  acceptor->open(protocol, sys_err_code);
  if (!sys_err_code)
  {
    acceptor->bind(local_endpoint, sys_err_code);
    if (!sys_err_code)
    {
      acceptor->listen(Acceptor::max_listen_connections, sys_err_code);
    }
  }

  if (sys_err_code)
  {
    FLOW_LOG_WARNING("Unable to open/bind/listen TCP acceptor at [" << local_endpoint << "]; details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();

    Error_code dummy; // It may be half-open; it's not of use to anyone anyway.
    acceptor->close(dummy);
    *err_code = sys_err_code;
    return;
  }
  // else

  FLOW_LOG_TRACE("Opened TCP acceptor [" << acceptor->local_endpoint(sys_err_code) << "]; listening.");
  err_code->clear();
} // open_ephemeral_acceptor()

void adopt_native_handle(flow::log::Logger* logger_ptr, Peer_socket* peer_socket,
                         util::Native_handle&& native_peer_socket, Error_code* err_code)
{
  using boost::system::system_category;
  using ::getsockname;
  // using ::errno; // It's a macro apparently.

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code)
           { adopt_native_handle(logger_ptr, peer_socket, std::move(native_peer_socket), actual_err_code); },
         err_code, "asio_tcp_stream_socket::adopt_native_handle()"))
  {
    return;
  }
  // else

  assert(peer_socket && (!peer_socket->is_open()));

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_TRANSPORT);

  if (native_peer_socket.null())
  {
    FLOW_LOG_WARNING("Asked to adopt a null native handle into a TCP socket.  Ignoring.");
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return;
  }
  // else

  /* assign() needs the protocol, and a v4 socket assigned as v6 (or vice versa) would report bogus endpoints;
   * so ask the kernel what it is. */
  sockaddr_storage local_addr;
  socklen_t local_addr_len = sizeof(local_addr);
  Error_code sys_err_code;

  if (getsockname(native_peer_socket.m_native_handle, reinterpret_cast<sockaddr*>(&local_addr), &local_addr_len)
        == -1)
  {
    sys_err_code = Error_code(errno, system_category());
  }
  else
  {
    peer_socket->assign((local_addr.ss_family == AF_INET6) ? Protocol::v6() : Protocol::v4(),
                        native_peer_socket.m_native_handle, sys_err_code);
  }

  if (sys_err_code)
  {
    FLOW_LOG_WARNING("Unable to adopt native handle [" << native_peer_socket << "] into a TCP socket; "
                     "closing it; details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    util::close_native_handle(logger_ptr, &native_peer_socket);
    *err_code = sys_err_code;
    return;
  }
  // else

  FLOW_LOG_TRACE("Adopted native handle [" << native_peer_socket << "] into a TCP socket.");
  native_peer_socket = util::Native_handle(); // *peer_socket owns it now.
  err_code->clear();
} // adopt_native_handle()

} // namespace relay::transport::asio_tcp_stream_socket
