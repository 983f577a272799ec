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
#include "relay/session/service.hpp"
#include "relay/transport/error.hpp"
#include <flow/error/error.hpp>
#include <flow/common.hpp>
#include <boost/move/make_unique.hpp>

namespace relay::session
{

// Service::Options implementations.

Service::Options::Options() :
  m_registration_timeout(util::NO_TIMEOUT),
  m_ack_timeout(util::NO_TIMEOUT),
  m_daemon_connect_timeout(util::NO_TIMEOUT),
  m_max_concurrent_requests(0),
  m_max_line_size(transport::Control_channel::S_DEFAULT_MAX_LINE_SIZE)
{
  // That's it.
}

// Service::Pending_request implementations.

Service::Pending_request::Pending_request(util::Task_engine* task_engine, uint64_t id) :
  m_id(id),
  m_client_socket(*task_engine),
  m_callback_acceptor(*task_engine),
  m_daemon_socket(*task_engine),
  m_connect_timer(*task_engine),
  m_connect_timed_out(false)
{
  // Nothing else.
}

// Service implementations.

Service::Service(flow::log::Logger* logger_ptr, util::Native_handle&& native_ctl_socket, const Options& opts,
                 Data_relay_launcher&& relay_launcher, On_closed_func&& on_closed_func,
                 On_daemon_lost_func&& on_daemon_lost_func) :
  flow::log::Log_context(logger_ptr, Log_component::S_SESSION),
  m_nickname(flow::util::ostream_op_string("ctl", native_ctl_socket)),
  m_opts(opts),
  m_relay_launcher(std::move(relay_launcher)),
  m_on_closed_func(std::move(on_closed_func)),
  m_on_daemon_lost_func(std::move(on_daemon_lost_func)),
  m_state(State::S_CREATED),
  m_worker_started(false),
  m_worker_stopped(false),
  m_native_ctl_socket(std::move(native_ctl_socket)),
  m_worker(get_logger(), flow::util::ostream_op_string("Svc-", m_nickname)),
  m_next_client_socket(*(m_worker.task_engine())),
  m_registration_promise(0),
  m_public_port(0),
  m_accept_paused(false),
  m_n_requests_accepted(0),
  m_n_requests_served(0),
  m_n_requests_dropped(0),
  m_n_relays_in_flight(0),
  m_relay_tracker(std::make_shared<Relay_tracker>())
{
  m_relay_tracker->m_service = this;

  FLOW_LOG_INFO("Service [" << *this << "]: Created around daemon control socket.  Registration timeout "
                "[" << m_opts.m_registration_timeout << "], ack timeout [" << m_opts.m_ack_timeout << "], "
                "daemon-connect timeout [" << m_opts.m_daemon_connect_timeout << "] (0 = none); max concurrent "
                "requests [" << m_opts.m_max_concurrent_requests << "] (0 = unlimited); advertised host override "
                "[" << m_opts.m_advertised_host << "].");
}

Service::~Service()
{
  FLOW_LOG_INFO("Service [" << *this << "]: Destroying.");
  shutdown();
}

bool Service::start(Error_code* err_code)
{
  using std::promise;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(bool, Service::start, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  /* Registration is async in thread W (which alone touches the control channel); we just wait for it.  shutdown()
   * (from another thread) will cut it short if need be. */
  promise<Error_code> registered_promise;
  auto registered_future = registered_promise.get_future();

  {
    Lock_guard lock(m_mutex);
    if (m_worker_started || (m_state != State::S_CREATED))
    {
      FLOW_LOG_WARNING("Service [" << *this << "]: start() called in state [" << m_state.load() << "] or "
                       "a second time; refusing.");
      *err_code = transport::error::Code::S_INVALID_STATE;
      return false;
    }
    // else

    FLOW_LOG_INFO("Service [" << *this << "]: Starting; awaiting registration from daemon.");

    m_worker_started = true;
    m_worker.start();
    // Posted under the lock: any teardown()'s close_all() is then queued behind it and will answer the promise.
    m_worker.post([this, &registered_promise]()
    {
      begin_registration(&registered_promise);
    });
  } // Lock_guard lock(m_mutex);

  const auto result = registered_future.get();

  Lock_guard lock(m_mutex);

  if (result)
  {
    FLOW_LOG_WARNING("Service [" << *this << "]: Registration failed; the service cannot operate and is "
                     "being closed.  Error: [" << result << "] [" << result.message() << "].");
    if (!m_worker_stopped)
    {
      m_state = State::S_SHUTTING_DOWN;
      teardown();
    }
    m_state = State::S_CLOSED;
    *err_code = result;
    return false;
  }
  // else

  if (m_state != State::S_CREATED)
  {
    // shutdown() got in between the registration and here.  It's closed now.
    FLOW_LOG_INFO("Service [" << *this << "]: Registration succeeded, but shutdown was requested meanwhile.");
    *err_code = transport::error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER;
    return false;
  }
  // else

  m_state = State::S_STARTED;
  FLOW_LOG_INFO("Service [" << *this << "]: Service [" << m_service_name << "] started: clients may connect "
                "to [" << advertised_address() << "].");

  m_worker.post([this]()
  {
    m_ctl_chan->watch_for_close([this](const Error_code& async_err_code)
    {
      on_daemon_lost(async_err_code);
    });
    accept_next_client();
  });

  err_code->clear();
  return true;
} // Service::start()

void Service::begin_registration(std::promise<Error_code>* registered_promise)
{
  using transport::asio_tcp_stream_socket::adopt_native_handle;
  using transport::asio_tcp_stream_socket::open_ephemeral_acceptor;
  using transport::asio_tcp_stream_socket::host_str;
  using boost::movelib::make_unique;

  // We are in thread W.

  m_registration_promise = registered_promise;

  const auto task_engine = m_worker.task_engine();
  Error_code err_code;

  Peer_socket ctl_socket(*task_engine);
  adopt_native_handle(get_logger(), &ctl_socket, std::move(m_native_ctl_socket), &err_code);
  if (err_code)
  {
    finish_registration(err_code); // It logged.
    return;
  }
  // else

  m_ctl_chan = make_unique<transport::Control_channel>(get_logger(), m_nickname, std::move(ctl_socket),
                                                       m_opts.m_max_line_size);

  // The address by which the daemon reached us; the protocol of the listeners follows it.
  const auto local_endpoint = m_ctl_chan->local_endpoint(&err_code);
  if (err_code)
  {
    FLOW_LOG_WARNING("Service [" << *this << "]: Could not get the control connection's local address.  "
                     "Error: [" << err_code << "] [" << err_code.message() << "].");
    finish_registration(err_code);
    return;
  }
  // else

  m_protocol = local_endpoint.protocol();
  m_advertised_host = m_opts.m_advertised_host.empty() ? host_str(local_endpoint.address())
                                                       : m_opts.m_advertised_host;

  // Open (and listen on) the public listener now, so its port can be advertised.  Accepting begins after start().
  m_acceptor = make_unique<Acceptor>(*task_engine);
  open_ephemeral_acceptor(get_logger(), m_acceptor.get(), m_protocol, &err_code);
  if (!err_code)
  {
    m_public_port = m_acceptor->local_endpoint(err_code).port();
  }
  if (err_code)
  {
    FLOW_LOG_WARNING("Service [" << *this << "]: Could not open the public listener.  "
                     "Error: [" << err_code << "] [" << err_code.message() << "].");
    finish_registration(err_code);
    return;
  }
  // else

  FLOW_LOG_INFO("Service [" << *this << "]: Public listener open on port [" << m_public_port << "]; daemon at "
                "[" << m_ctl_chan->remote_endpoint(&err_code) << "]; awaiting service name from it.");

  m_ctl_chan->async_read_line(m_opts.m_registration_timeout,
                              [this](const Error_code& async_err_code, const std::string& line)
  {
    on_registration_line(async_err_code, line);
  });
} // Service::begin_registration()

void Service::on_registration_line(const Error_code& err_code, const std::string& line)
{
  using transport::asio_tcp_stream_socket::host_port_str;

  // We are in thread W.

  if (!m_registration_promise)
  {
    return; // close_all() has reported the outcome already.
  }
  // else

  if (err_code)
  {
    FLOW_LOG_WARNING("Service [" << *this << "]: Service name not read from daemon.  "
                     "Error: [" << err_code << "] [" << err_code.message() << "].");
    finish_registration((err_code == transport::error::Code::S_CONTROL_CHANNEL_CLOSED)
                          ? Error_code(transport::error::Code::S_REGISTRATION_NO_SERVICE_NAME)
                          : err_code);
    return;
  }
  // else

  if (line.empty())
  {
    FLOW_LOG_WARNING("Service [" << *this << "]: Daemon sent an empty service name.");
    finish_registration(transport::error::Code::S_REGISTRATION_NO_SERVICE_NAME);
    return;
  }
  // else

  m_service_name = line;

  const auto reply = host_port_str(m_advertised_host, m_public_port);
  FLOW_LOG_INFO("Service [" << *this << "]: Daemon registered service name [" << m_service_name << "]; "
                "advertising [" << reply << "] to it.");

  m_ctl_chan->async_write_line(reply, [this](const Error_code& async_err_code)
  {
    on_registration_reply_sent(async_err_code);
  });
} // Service::on_registration_line()

void Service::on_registration_reply_sent(const Error_code& err_code)
{
  // We are in thread W.

  if (!m_registration_promise)
  {
    return;
  }
  // else

  if (err_code)
  {
    FLOW_LOG_WARNING("Service [" << *this << "]: Could not send the advertisement to the daemon.  "
                     "Error: [" << err_code << "] [" << err_code.message() << "].");
    finish_registration(err_code);
    return;
  }
  // else

  FLOW_LOG_INFO("Service [" << *this << "]: Service [" << m_service_name << "] has established relay address "
                "[" << advertised_address() << "].");
  finish_registration(Error_code());
}

void Service::finish_registration(const Error_code& err_code)
{
  // We are in thread W.

  if (!m_registration_promise)
  {
    return;
  }
  // else

  auto registered_promise = m_registration_promise;
  m_registration_promise = 0;
  registered_promise->set_value(err_code);
}

void Service::accept_next_client()
{
  // We are in thread W.

  if (m_state != State::S_STARTED)
  {
    return;
  }
  // else

  assert((!m_pending) && "Accepting the next client while a request is in progress breaks serialization.");

  if ((m_opts.m_max_concurrent_requests != 0) && (m_n_relays_in_flight >= m_opts.m_max_concurrent_requests))
  {
    if (!m_accept_paused)
    {
      m_accept_paused = true;
      FLOW_LOG_INFO("Service [" << *this << "]: [" << m_n_relays_in_flight.load() << "] relays in flight; "
                    "limit reached.  Not accepting clients until one finishes.");
    }
    return;
  }
  // else

  FLOW_LOG_TRACE("Service [" << *this << "]: Accepting next client on port [" << m_public_port << "].");
  m_acceptor->async_accept(m_next_client_socket, [this](const Error_code& async_err_code)
  {
    on_client_accepted(async_err_code);
  });
}

void Service::on_client_accepted(const Error_code& sys_err_code)
{
  using boost::movelib::make_unique;

  // We are in thread W.

  if (sys_err_code == boost::asio::error::operation_aborted)
  {
    return; // Stuff is shutting down.  GTFO.
  }
  // else

  Error_code dummy;
  if (m_state != State::S_STARTED)
  {
    m_next_client_socket.close(dummy); // Client got in just before shutdown.
    return;
  }
  // else

  if (sys_err_code)
  {
    m_next_client_socket.close(dummy);

    if (sys_err_code == boost::asio::error::connection_aborted)
    {
      FLOW_LOG_WARNING("Service [" << *this << "]: Incoming connection aborted halfway during connection; this "
                       "is quite weird but should not be fatal.  Ignoring.  Still listening.");
      accept_next_client();
      return;
    }
    // else

    FLOW_LOG_WARNING("Service [" << *this << "]: The public listener failed fatally; the service must close.  "
                     "Error: [" << sys_err_code << "] [" << sys_err_code.message() << "].");
    on_fatal_error(sys_err_code);
    return;
  }
  // else

  m_pending = make_unique<Pending_request>(m_worker.task_engine().get(), ++m_n_requests_accepted);
  m_pending->m_client_socket = std::move(m_next_client_socket);

  FLOW_LOG_INFO("Service [" << *this << "]: Accepted client [" << m_pending->m_client_socket.remote_endpoint(dummy)
                << "] as request [" << m_pending->m_id << "] of service [" << m_service_name << "].");
  begin_request();
} // Service::on_client_accepted()

void Service::begin_request()
{
  using transport::asio_tcp_stream_socket::open_ephemeral_acceptor;
  using transport::asio_tcp_stream_socket::host_port_str;

  // We are in thread W.

  assert(m_pending);
  const auto id = m_pending->m_id;

  if (m_ctl_chan->hosed())
  {
    FLOW_LOG_WARNING("Service [" << *this << "]: Request [" << id << "]: The control channel to the daemon of "
                     "service [" << m_service_name << "] is unusable; cannot ask it to serve the client.");
    drop_request(transport::error::Code::S_CONTROL_CHANNEL_CLOSED);
    return;
  }
  // else

  // Step 1: single-use listener.
  Error_code err_code;
  open_ephemeral_acceptor(get_logger(), &m_pending->m_callback_acceptor, m_protocol, &err_code);
  uint16_t callback_port = 0;
  if (!err_code)
  {
    callback_port = m_pending->m_callback_acceptor.local_endpoint(err_code).port();
  }
  if (err_code)
  {
    drop_request(err_code); // It logged.
    return;
  }
  // else

  // Step 2: tell the daemon where to connect.
  const auto signal_line = host_port_str(m_advertised_host, callback_port);
  FLOW_LOG_TRACE("Service [" << *this << "]: Request [" << id << "]: Signaling daemon to connect back to "
                 "[" << signal_line << "].");

  m_ctl_chan->async_write_line(signal_line, [this, id](const Error_code& async_err_code)
  {
    on_request_signal_sent(id, async_err_code);
  });
} // Service::begin_request()

void Service::on_request_signal_sent(uint64_t id, const Error_code& err_code)
{
  // We are in thread W.

  if (!request_is_current(id))
  {
    return;
  }
  // else

  if (err_code)
  {
    FLOW_LOG_WARNING("Service [" << *this << "]: Request [" << id << "]: Could not signal the daemon of service "
                     "[" << m_service_name << "].  Error: [" << err_code << "] [" << err_code.message() << "].");
    drop_request(err_code);
    return;
  }
  // else

  // Step 3: the daemon's acknowledgment.  Nothing else touches the channel until it's in (or not).
  m_ctl_chan->async_read_line(m_opts.m_ack_timeout,
                              [this, id](const Error_code& async_err_code, const std::string& line)
  {
    on_request_ack(id, async_err_code, line);
  });
}

void Service::on_request_ack(uint64_t id, const Error_code& err_code, const std::string& line)
{
  // We are in thread W.

  if (!request_is_current(id))
  {
    return;
  }
  // else

  if (err_code)
  {
    FLOW_LOG_WARNING("Service [" << *this << "]: Request [" << id << "]: ACK for client request not read from "
                     "daemon of service [" << m_service_name << "].  Error: [" << err_code << "] "
                     "[" << err_code.message() << "].");
    drop_request((err_code == transport::error::Code::S_CONTROL_CHANNEL_CLOSED)
                   ? Error_code(transport::error::Code::S_REQUEST_NOT_ACKNOWLEDGED)
                   : err_code);
    return;
  }
  // else

  FLOW_LOG_TRACE("Service [" << *this << "]: Request [" << id << "]: Read ACK [" << line << "]; awaiting the "
                 "daemon's connection.");

  // Step 4: the daemon connects back.
  m_pending->m_callback_acceptor.async_accept(m_pending->m_daemon_socket,
                                              [this, id](const Error_code& async_err_code)
  {
    on_daemon_connected(id, async_err_code);
  });

  if (util::timeout_enabled(m_opts.m_daemon_connect_timeout))
  {
    m_pending->m_connect_timer.expires_after(m_opts.m_daemon_connect_timeout);
    m_pending->m_connect_timer.async_wait([this, id](const Error_code& async_err_code)
    {
      if ((async_err_code == boost::asio::error::operation_aborted) || (!request_is_current(id)))
      {
        return;
      }
      // else

      FLOW_LOG_TRACE("Service [" << *this << "]: Request [" << id << "]: Daemon-connect deadline reached.");
      m_pending->m_connect_timed_out = true;
      Error_code dummy;
      m_pending->m_callback_acceptor.cancel(dummy);
    });
  }
} // Service::on_request_ack()

void Service::on_daemon_connected(uint64_t id, const Error_code& sys_err_code)
{
  using transport::Data_connection_pair;

  // We are in thread W.

  if (!request_is_current(id))
  {
    return; // Including the operation_aborted due to close_all().
  }
  // else

  m_pending->m_connect_timer.cancel();

  if (sys_err_code)
  {
    const auto reason = m_pending->m_connect_timed_out ? Error_code(transport::error::Code::S_TIMEOUT)
                                                       : sys_err_code;
    FLOW_LOG_WARNING("Service [" << *this << "]: Request [" << id << "]: Daemon of service "
                     "[" << m_service_name << "] acknowledged but did not connect back.  "
                     "Error: [" << reason << "] [" << reason.message() << "].");
    drop_request(reason);
    return;
  }
  // else: Success, even if the timer fired meanwhile: the connection is here.

  Error_code err_code;
  Data_connection_pair pair;
  pair.m_client = util::Native_handle(m_pending->m_client_socket.release(err_code));
  if (!err_code)
  {
    pair.m_daemon = util::Native_handle(m_pending->m_daemon_socket.release(err_code));
  }
  if (err_code)
  {
    FLOW_LOG_WARNING("Service [" << *this << "]: Request [" << id << "]: Could not eject the connected sockets.  "
                     "Error: [" << err_code << "] [" << err_code.message() << "].");
    util::close_native_handle(get_logger(), &pair.m_client);
    drop_request(err_code);
    return;
  }
  // else

  FLOW_LOG_INFO("Service [" << *this << "]: Request [" << id << "]: Daemon of service [" << m_service_name << "] "
                "connected back; handing pair [" << pair << "] to the data-relay worker.");

  // Step 5.  The single-use listener goes first.
  release_request();
  ++m_n_requests_served;
  ++m_n_relays_in_flight;

  m_relay_launcher(std::move(pair), [relay_tracker = m_relay_tracker]()
  {
    // We are in some relay worker thread (or any thread really).
    Lock_guard lock(relay_tracker->m_mutex);
    const auto service = relay_tracker->m_service;
    if (service)
    {
      service->m_worker.post([service]()
      {
        service->on_relay_done();
      });
    }
  });

  accept_next_client();
} // Service::on_daemon_connected()

bool Service::request_is_current(uint64_t id) const
{
  return (m_state == State::S_STARTED) && m_pending && (m_pending->m_id == id);
}

void Service::drop_request(const Error_code& err_code)
{
  // We are in thread W.

  assert(m_pending);
  FLOW_LOG_WARNING("Service [" << *this << "]: Request [" << m_pending->m_id << "]: Dropping client request "
                   "(client will be disconnected unserved).  Reason: [" << err_code << "] "
                   "[" << err_code.message() << "].");

  release_request();
  ++m_n_requests_dropped;
  accept_next_client();
}

void Service::release_request()
{
  // We are in thread W.

  assert(m_pending);

  m_pending->m_connect_timer.cancel();

  Error_code sys_err_code;
  if (m_pending->m_callback_acceptor.is_open())
  {
    m_pending->m_callback_acceptor.close(sys_err_code);
    if (sys_err_code)
    {
      FLOW_LOG_WARNING("Service [" << *this << "]: Request [" << m_pending->m_id << "]: Closing the single-use "
                       "listener failed; ignoring (closing is best-effort).  Details follow.");
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    }
  }

  for (auto peer_socket : { &m_pending->m_client_socket, &m_pending->m_daemon_socket })
  {
    if (peer_socket->is_open())
    {
      peer_socket->close(sys_err_code);
      if (sys_err_code)
      {
        FLOW_LOG_WARNING("Service [" << *this << "]: Request [" << m_pending->m_id << "]: Closing a request "
                         "socket failed; ignoring (closing is best-effort).  Details follow.");
        FLOW_ERROR_SYS_ERROR_LOG_WARNING();
      }
    }
  }

  m_pending.reset();
} // Service::release_request()

void Service::on_relay_done()
{
  // We are in thread W.

  assert(m_n_relays_in_flight != 0);
  --m_n_relays_in_flight;

  FLOW_LOG_TRACE("Service [" << *this << "]: A relay finished; [" << m_n_relays_in_flight.load() << "] remain.");

  if (m_accept_paused && (m_state == State::S_STARTED))
  {
    m_accept_paused = false;
    FLOW_LOG_INFO("Service [" << *this << "]: Below the concurrent-request limit again; resuming accepting.");
    accept_next_client();
  }
}

void Service::on_fatal_error(const Error_code& err_code)
{
  // We are in thread W.

  auto expected = State::S_STARTED;
  if (!m_state.compare_exchange_strong(expected, State::S_SHUTTING_DOWN))
  {
    return; // shutdown() is on it.
  }
  // else

  FLOW_LOG_WARNING("Service [" << *this << "]: Service [" << m_service_name << "] closing due to fatal error "
                   "[" << err_code << "] [" << err_code.message() << "].");
  close_all();
  m_state = State::S_CLOSED;

  if (!m_on_closed_func.empty())
  {
    m_on_closed_func(err_code);
  }
}

void Service::on_daemon_lost(const Error_code& err_code)
{
  // We are in thread W.

  if (m_state != State::S_STARTED)
  {
    return;
  }
  // else

  FLOW_LOG_WARNING("Service [" << *this << "]: Lost the control channel to the daemon of service "
                   "[" << m_service_name << "]; every client from now on will be dropped.  "
                   "Error: [" << err_code << "] [" << err_code.message() << "].");
  if (!m_on_daemon_lost_func.empty())
  {
    m_on_daemon_lost_func(err_code);
  }
}

void Service::close_all()
{
  // We are in thread W.

  FLOW_LOG_TRACE("Service [" << *this << "]: Closing all sockets.");

  finish_registration(transport::error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER);

  {
    Lock_guard lock(m_relay_tracker->m_mutex);
    m_relay_tracker->m_service = 0;
  }

  Error_code sys_err_code;
  if (m_acceptor && m_acceptor->is_open())
  {
    m_acceptor->close(sys_err_code);
    if (sys_err_code)
    {
      FLOW_LOG_WARNING("Service [" << *this << "]: Closing the public listener failed; ignoring (closing is "
                       "best-effort).  Details follow.");
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    }
  }

  Error_code dummy;
  m_next_client_socket.close(dummy);

  /* Close (not destroy) the request in progress: async ops on its sockets may be outstanding and will complete with
   * operation_aborted, which the handlers ignore.  Likewise the control channel. */
  if (m_pending)
  {
    m_pending->m_connect_timer.cancel();
    m_pending->m_callback_acceptor.close(dummy);
    m_pending->m_client_socket.close(dummy);
    m_pending->m_daemon_socket.close(dummy);
  }

  if (m_ctl_chan)
  {
    m_ctl_chan->close();
  }
} // Service::close_all()

void Service::teardown()
{
  using flow::async::Synchronicity;

  // We are in thread U; m_mutex is locked.

  assert(m_worker_started && (!m_worker_stopped));

  m_worker.post([this]()
  {
    close_all();
  }, Synchronicity::S_ASYNC_AND_AWAIT_CONCURRENT_COMPLETION);

  m_worker.stop();
  m_worker_stopped = true;
  // Thread W is (synchronously!) no more.  Outstanding handlers won't run.
}

void Service::shutdown()
{
  Lock_guard lock(m_mutex);

  if (m_worker_stopped || ((!m_worker_started) && (m_state == State::S_CLOSED)))
  {
    return;
  }
  // else

  FLOW_LOG_INFO("Service [" << *this << "]: Shutting down service [" << m_service_name << "] "
                "(state [" << m_state.load() << "]).");

  if (m_state != State::S_CLOSED)
  {
    m_state = State::S_SHUTTING_DOWN;
  }

  if (m_worker_started)
  {
    teardown();
  }
  else
  {
    util::close_native_handle(get_logger(), &m_native_ctl_socket);
  }

  m_state = State::S_CLOSED;
  FLOW_LOG_INFO("Service [" << *this << "]: Closed.");
} // Service::shutdown()

Service::State Service::state() const
{
  return m_state;
}

const std::string& Service::service_name() const
{
  return m_service_name;
}

const std::string& Service::advertised_host() const
{
  return m_advertised_host;
}

uint16_t Service::public_port() const
{
  return m_public_port;
}

std::string Service::advertised_address() const
{
  return transport::asio_tcp_stream_socket::host_port_str(m_advertised_host, m_public_port);
}

uint64_t Service::n_requests_accepted() const
{
  return m_n_requests_accepted;
}

uint64_t Service::n_requests_served() const
{
  return m_n_requests_served;
}

uint64_t Service::n_requests_dropped() const
{
  return m_n_requests_dropped;
}

size_t Service::n_relays_in_flight() const
{
  return m_n_relays_in_flight;
}

const std::string& Service::nickname() const
{
  return m_nickname;
}

std::ostream& operator<<(std::ostream& os, const Service& val)
{
  return os << '[' << val.nickname() << "]@" << static_cast<const void*>(&val);
}

std::ostream& operator<<(std::ostream& os, Service::State val)
{
  switch (val)
  {
  case Service::State::S_CREATED:
    return os << "CREATED";
  case Service::State::S_STARTED:
    return os << "STARTED";
  case Service::State::S_SHUTTING_DOWN:
    return os << "SHUTTING_DOWN";
  case Service::State::S_CLOSED:
    return os << "CLOSED";
  }
  assert(false);
  return os;
}

} // namespace relay::session
