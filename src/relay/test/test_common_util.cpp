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

#include "relay/test/test_common_util.hpp"
#include "relay/transport/error.hpp"
#include <gtest/gtest.h>
#include <flow/util/util.hpp>
#include <boost/chrono.hpp>
#include <boost/thread/thread.hpp>
#include <algorithm>
#include <chrono>
#include <sys/socket.h>
#include <netinet/in.h>
#include <unistd.h>

namespace relay::test
{

using transport::asio_tcp_stream_socket::Acceptor;
using transport::asio_tcp_stream_socket::Endpoint;
using transport::asio_tcp_stream_socket::Peer_socket;
using std::string;

// Blocking_peer implementations.

const util::Fine_duration Blocking_peer::S_DEFAULT_TIMEOUT = boost::chrono::seconds(5);

Blocking_peer::Blocking_peer(flow::log::Logger* logger_ptr) :
  flow::log::Log_context(logger_ptr, Log_component::S_TEST),
  m_socket(m_task_engine)
{
  // Nope.
}

Error_code Blocking_peer::connect(util::String_view host, uint16_t port)
{
  Error_code sys_err_code;
  const auto address = boost::asio::ip::make_address(string(host), sys_err_code);
  if (!sys_err_code)
  {
    m_socket.connect(Endpoint(address, port), sys_err_code);
  }
  FLOW_LOG_TRACE("Test peer: Connect to [" << host << ':' << port << "] result: [" << sys_err_code << "].");
  return sys_err_code;
}

Error_code Blocking_peer::connect(util::String_view host_port)
{
  string host;
  uint16_t port;
  Error_code err_code;
  transport::asio_tcp_stream_socket::parse_host_port(host_port, &host, &port, &err_code);
  if (err_code)
  {
    return err_code;
  }
  // else
  return connect(host, port);
}

Error_code Blocking_peer::write_line(util::String_view line)
{
  return write(string(line) + '\n');
}

Error_code Blocking_peer::write(util::String_view bytes)
{
  Error_code sys_err_code;
  boost::asio::write(m_socket, boost::asio::buffer(bytes.data(), bytes.size()), sys_err_code);
  return sys_err_code;
}

Error_code Blocking_peer::read_line(string* line, util::Fine_duration timeout)
{
  bool done = false;
  Error_code result;
  size_t n_line = 0;
  boost::asio::async_read_until(m_socket, m_in_buf, '\n',
                                [&](const Error_code& async_err_code, size_t n)
  {
    done = true;
    result = async_err_code;
    n_line = n;
  });

  const auto err_code = run_until(&done, timeout);
  if (err_code)
  {
    return err_code;
  }
  // else
  if (result)
  {
    return result;
  }
  // else

  // n_line includes the '\n'.
  const auto data = m_in_buf.data();
  line->assign(boost::asio::buffers_begin(data), boost::asio::buffers_begin(data) + (n_line - 1));
  m_in_buf.consume(n_line);
  return Error_code();
} // Blocking_peer::read_line()

Error_code Blocking_peer::read_exactly(size_t n, string* bytes, util::Fine_duration timeout)
{
  if (m_in_buf.size() < n)
  {
    bool done = false;
    Error_code result;
    boost::asio::async_read(m_socket, m_in_buf, boost::asio::transfer_at_least(n - m_in_buf.size()),
                            [&](const Error_code& async_err_code, size_t)
    {
      done = true;
      result = async_err_code;
    });

    const auto err_code = run_until(&done, timeout);
    if (err_code)
    {
      return err_code;
    }
    // else
    if (result)
    {
      return result;
    }
  }
  // else

  const auto data = m_in_buf.data();
  bytes->assign(boost::asio::buffers_begin(data), boost::asio::buffers_begin(data) + n);
  m_in_buf.consume(n);
  return Error_code();
} // Blocking_peer::read_exactly()

Error_code Blocking_peer::await_close(util::Fine_duration timeout)
{
  if (m_in_buf.size() != 0)
  {
    return transport::error::Code::S_INVALID_STATE;
  }
  // else

  bool done = false;
  Error_code result;
  size_t n_rcvd = 0;
  m_socket.async_read_some(m_in_buf.prepare(1024), [&](const Error_code& async_err_code, size_t n)
  {
    done = true;
    result = async_err_code;
    n_rcvd = n;
  });

  const auto err_code = run_until(&done, timeout);
  if (err_code)
  {
    return err_code;
  }
  // else

  if (n_rcvd != 0)
  {
    m_in_buf.commit(n_rcvd);
    return transport::error::Code::S_INVALID_STATE;
  }
  // else

  // EOF; or reset etc.: either way it's gone.
  FLOW_LOG_TRACE("Test peer: Connection ended: [" << result << "].");
  return Error_code();
} // Blocking_peer::await_close()

void Blocking_peer::shutdown_send()
{
  Error_code dummy;
  m_socket.shutdown(Peer_socket::shutdown_send, dummy);
}

void Blocking_peer::close()
{
  Error_code dummy;
  m_socket.close(dummy);
}

Peer_socket& Blocking_peer::socket()
{
  return m_socket;
}

Error_code Blocking_peer::run_until(const bool* done, util::Fine_duration timeout)
{
  using boost::chrono::duration_cast;
  using boost::chrono::nanoseconds;

  m_task_engine.restart();
  m_task_engine.run_for(std::chrono::nanoseconds(duration_cast<nanoseconds>(timeout).count()));
  if (*done)
  {
    return Error_code();
  }
  // else

  FLOW_LOG_TRACE("Test peer: Deadline [" << timeout << "] reached; canceling.");
  Error_code dummy;
  m_socket.cancel(dummy);
  m_task_engine.restart();
  m_task_engine.run(); // The canceled op completes with operation_aborted.
  return transport::error::Code::S_TIMEOUT;
}

// Test_echo_daemon implementations.

Test_echo_daemon::Test_echo_daemon(flow::log::Logger* logger_ptr, util::String_view service_name) :
  flow::log::Log_context(logger_ptr, Log_component::S_TEST),
  m_service_name(service_name),
  m_ctl(logger_ptr),
  m_stop(false),
  m_n_requests(0)
{
  // Nope.
}

Test_echo_daemon::~Test_echo_daemon()
{
  m_stop = true;
  if (m_control_thread.joinable())
  {
    m_control_thread.join();
  }
  m_echo_threads.join_all();
  m_ctl.close();
}

Error_code Test_echo_daemon::start(util::String_view relay_host, uint16_t relay_port, string* advertised_address)
{
  auto err_code = m_ctl.connect(relay_host, relay_port);
  if (!err_code)
  {
    err_code = m_ctl.write_line(m_service_name);
  }
  if (!err_code)
  {
    err_code = m_ctl.read_line(advertised_address);
  }
  if (err_code)
  {
    FLOW_LOG_WARNING("Test daemon [" << m_service_name << "]: Registration failed: [" << err_code << "].");
    return err_code;
  }
  // else

  FLOW_LOG_INFO("Test daemon [" << m_service_name << "]: Registered; relay address [" << *advertised_address << "].");
  m_control_thread = boost::thread([this]() { control_loop(); });
  return Error_code();
}

void Test_echo_daemon::control_loop()
{
  const util::Fine_duration poll_period = boost::chrono::milliseconds(50);

  while (!m_stop)
  {
    string callback_address;
    const auto err_code = m_ctl.read_line(&callback_address, poll_period);
    if (err_code == transport::error::Code::S_TIMEOUT)
    {
      continue;
    }
    // else
    if (err_code)
    {
      FLOW_LOG_INFO("Test daemon [" << m_service_name << "]: Control channel done: [" << err_code << "].");
      return;
    }
    // else

    if (m_ctl.write_line("ack"))
    {
      return;
    }
    // else

    ++m_n_requests;
    m_echo_threads.create_thread([this, callback_address]() { echo_loop(callback_address); });
  }
} // Test_echo_daemon::control_loop()

void Test_echo_daemon::echo_loop(string callback_address)
{
  const util::Fine_duration poll_period = boost::chrono::milliseconds(50);

  Blocking_peer data_peer(get_logger());
  if (data_peer.connect(callback_address))
  {
    FLOW_LOG_WARNING("Test daemon [" << m_service_name << "]: Could not connect back to [" << callback_address << "].");
    return;
  }
  // else

  while (!m_stop)
  {
    string line;
    const auto err_code = data_peer.read_line(&line, poll_period);
    if (err_code == transport::error::Code::S_TIMEOUT)
    {
      continue;
    }
    // else
    if (err_code || data_peer.write_line(line))
    {
      return;
    }
  }
} // Test_echo_daemon::echo_loop()

size_t Test_echo_daemon::n_requests() const
{
  return m_n_requests;
}

// Free function implementations.

util::Native_handle make_loopback_connection(Blocking_peer* connector)
{
  util::Task_engine task_engine;
  Acceptor acceptor(task_engine);
  Peer_socket accepted(task_engine);

  Error_code sys_err_code;
  const Endpoint loopback(boost::asio::ip::address_v4::loopback(), 0);
  acceptor.open(loopback.protocol(), sys_err_code);
  if (!sys_err_code)
  {
    acceptor.bind(loopback, sys_err_code);
  }
  if (!sys_err_code)
  {
    acceptor.listen(Acceptor::max_listen_connections, sys_err_code);
  }
  uint16_t port = 0;
  if (!sys_err_code)
  {
    port = acceptor.local_endpoint(sys_err_code).port();
  }
  if (!sys_err_code)
  {
    // Loopback connect completes against the listen backlog; no need to accept concurrently.
    sys_err_code = connector->connect("127.0.0.1", port);
  }
  if (!sys_err_code)
  {
    acceptor.accept(accepted, sys_err_code);
  }
  EXPECT_FALSE(sys_err_code) << sys_err_code.message();
  if (sys_err_code)
  {
    return util::Native_handle();
  }
  // else

  return util::Native_handle(accepted.release(sys_err_code));
} // make_loopback_connection()

bool break_listener(uint16_t port)
{
  const long max_fd = std::min(::sysconf(_SC_OPEN_MAX), 65536L);
  for (int fd = 0; fd < max_fd; ++fd)
  {
    int accepting = 0;
    socklen_t opt_size = sizeof(accepting);
    if ((::getsockopt(fd, SOL_SOCKET, SO_ACCEPTCONN, &accepting, &opt_size) != 0) || (accepting == 0))
    {
      continue; // Not open, not a socket, or not listening.  (Accepted sockets share the port; skip them.)
    }
    // else

    sockaddr_storage addr;
    socklen_t addr_size = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &addr_size) != 0)
    {
      continue;
    }
    // else

    uint16_t fd_port = 0;
    if (addr.ss_family == AF_INET)
    {
      fd_port = ntohs(reinterpret_cast<const sockaddr_in*>(&addr)->sin_port);
    }
    else if (addr.ss_family == AF_INET6)
    {
      fd_port = ntohs(reinterpret_cast<const sockaddr_in6*>(&addr)->sin6_port);
    }
    if (fd_port != port)
    {
      continue;
    }
    // else

    return ::shutdown(fd, SHUT_RDWR) == 0;
  } // for (fd)

  return false;
} // break_listener()

bool wait_until(const std::function<bool ()>& condition, util::Fine_duration timeout)
{
  const auto deadline = flow::Fine_clock::now() + timeout;
  while (!condition())
  {
    if (flow::Fine_clock::now() >= deadline)
    {
      return false;
    }
    // else
    flow::util::this_thread::sleep_for(boost::chrono::milliseconds(5));
  }
  return true;
}

} // namespace relay::test
