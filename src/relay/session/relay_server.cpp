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
#include "relay/session/relay_server.hpp"
#include "relay/transport/error.hpp"
#include <flow/error/error.hpp>
#include <flow/common.hpp>
#include <boost/move/make_unique.hpp>

namespace relay::session
{

// Relay_server::Options implementations.

Relay_server::Options::Options() :
  m_listen_host("0.0.0.0"),
  m_listen_port(0)
{
  // That's it.
}

// Relay_server implementations.

Relay_server::Relay_server(flow::log::Logger* logger_ptr, const Options& opts, Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_SESSION),
  m_nickname(transport::asio_tcp_stream_socket::host_port_str(opts.m_listen_host, opts.m_listen_port)),
  m_relay_engine(get_logger(), m_nickname),
  m_worker(get_logger(), flow::util::ostream_op_string("RlySrv-", opts.m_listen_port)),
  m_next_daemon_socket(*(m_worker.task_engine())),
  m_local_port(0),
  m_service_opts(opts.m_service_opts),
  m_last_id(0),
  m_stopping(false)
{
  using transport::asio_tcp_stream_socket::Address;
  using transport::asio_tcp_stream_socket::Endpoint;
  using flow::error::Runtime_error;
  using boost::asio::ip::make_address;
  using boost::movelib::make_unique;

  Error_code sys_err_code;

  FLOW_LOG_TRACE("Relay_server [" << *this << "]: Awaiting initial setup/listening in worker thread.");
  m_worker.start([&]() // Execute all this synchronously in the thread.
  {
    const Address address = make_address(opts.m_listen_host, sys_err_code);
    if (sys_err_code)
    {
      FLOW_LOG_WARNING("Relay_server [" << *this << "]: Listen host [" << opts.m_listen_host << "] is not a "
                       "numeric IP address.");
      sys_err_code = transport::error::Code::S_INVALID_ARGUMENT;
      return; // Escape the start() callback, that is.
    }
    // else

    const Endpoint local_endpoint(address, opts.m_listen_port);
    m_acceptor = make_unique<Acceptor>(*(m_worker.task_engine()));

    m_acceptor->open(local_endpoint.protocol(), sys_err_code);
    if (!sys_err_code)
    {
      // Restarting the relay should not have to wait out TIME_WAIT on a fixed port.
      m_acceptor->set_option(Acceptor::reuse_address(true), sys_err_code);
    }
    if (!sys_err_code)
    {
      m_acceptor->bind(local_endpoint, sys_err_code);
    }
    if (!sys_err_code)
    {
      m_acceptor->listen(Acceptor::max_listen_connections, sys_err_code);
    }
    if (!sys_err_code)
    {
      m_local_port = m_acceptor->local_endpoint(sys_err_code).port();
    }
    if (sys_err_code)
    {
      FLOW_LOG_WARNING("Relay_server [" << *this << "]: Unable to open/bind/listen for daemons at "
                       "[" << local_endpoint << "]; could be due to address clash; details logged below.");
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
      Error_code dummy;
      m_acceptor->close(dummy);
      m_acceptor.reset();
      return;
    }
    // else

    FLOW_LOG_INFO("Relay_server [" << *this << "]: Listening for daemons on port [" << m_local_port << "].");
    accept_next_daemon();
  }); // m_worker.start()

  if (sys_err_code)
  {
    if (err_code)
    {
      *err_code = sys_err_code;
      return;
    }
    // else
    throw Runtime_error(sys_err_code, FLOW_UTIL_WHERE_AM_I_STR());
  }
  // else

  if (err_code)
  {
    err_code->clear();
  }
} // Relay_server::Relay_server()

Relay_server::~Relay_server()
{
  using flow::async::Synchronicity;

  // We are in thread U.

  FLOW_LOG_INFO("Relay_server [" << *this << "]: Shutting down.  Listener will close; then each service, "
                "registered or registering; then every relay.");

  {
    Lock_guard lock(m_mutex);
    m_stopping = true;
  }

  m_worker.post([this]()
  {
    Error_code dummy;
    if (m_acceptor)
    {
      m_acceptor->close(dummy);
    }
    m_next_daemon_socket.close(dummy);
  }, Synchronicity::S_ASYNC_AND_AWAIT_CONCURRENT_COMPLETION);

  m_worker.stop();
  // Thread W is (synchronously!) no more.  m_registrations is ours now.

  for (auto& id_and_registration : m_registrations)
  {
    auto& registration = id_and_registration.second;
    registration.m_service->shutdown(); // Cuts start() short, if it is still blocking.
    registration.m_thread.join();
  }
  m_registrations.clear();

  std::map<uint64_t, std::shared_ptr<Service>> services;
  {
    Lock_guard lock(m_mutex);
    services.swap(m_services);
  }
  FLOW_LOG_INFO("Relay_server [" << *this << "]: Shutting down [" << services.size() << "] registered services.");
  services.clear();

  FLOW_LOG_INFO("Relay_server [" << *this << "]: Services closed; [" << m_relay_engine.n_active() << "] relays "
                "remain; they will be closed next.");
  // m_relay_engine dtor closes those.
} // Relay_server::~Relay_server()

void Relay_server::accept_next_daemon()
{
  // We are in thread W.

  FLOW_LOG_TRACE("Relay_server [" << *this << "]: Starting the next background accept.");
  m_acceptor->async_accept(m_next_daemon_socket, [this](const Error_code& async_err_code)
  {
    on_daemon_accepted(async_err_code);
  });
}

void Relay_server::on_daemon_accepted(const Error_code& sys_err_code)
{
  using transport::Data_connection_pair;
  using std::make_shared;

  // We are in thread W.

  if (sys_err_code == boost::asio::error::operation_aborted)
  {
    return; // Stuff is shutting down.  GTFO.
  }
  // else

  Error_code dummy;
  if (sys_err_code)
  {
    m_next_daemon_socket.close(dummy);

    if (sys_err_code == boost::asio::error::connection_aborted)
    {
      FLOW_LOG_WARNING("Relay_server [" << *this << "]: Incoming connection aborted halfway during connection; "
                       "this is quite weird but should not be fatal.  Ignoring.  Still listening.");
      accept_next_daemon();
      return;
    }
    // else

    FLOW_LOG_WARNING("Relay_server [" << *this << "]: The background accept failed fatally.  "
                     "Closing listener; no longer accepting daemons.  Details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    m_acceptor->close(dummy);
    return;
  }
  // else

  const auto daemon_endpoint = m_next_daemon_socket.remote_endpoint(dummy);
  Error_code err_code;
  util::Native_handle native_ctl_socket(m_next_daemon_socket.release(err_code));
  if (err_code)
  {
    FLOW_LOG_WARNING("Relay_server [" << *this << "]: Could not eject daemon socket; dropping the daemon.  "
                     "Error: [" << err_code << "] [" << err_code.message() << "].");
    m_next_daemon_socket.close(dummy);
    accept_next_daemon();
    return;
  }
  // else

  const auto id = ++m_last_id;
  FLOW_LOG_INFO("Relay_server [" << *this << "]: Daemon connected from [" << daemon_endpoint << "] "
                "([" << native_ctl_socket << "]); making service [" << id << "] and awaiting its registration.");

  auto service = make_shared<Service>
                   (get_logger(), std::move(native_ctl_socket), m_service_opts,
                    [this](Data_connection_pair&& pair, Function<void ()>&& on_relay_done_func)
  {
    // We are in some Service's thread.
    m_relay_engine.launch(std::move(pair), [on_relay_done_func](const Error_code&)
    {
      on_relay_done_func(); // The relay logged any error.
    });
  },
                    [this, id](const Error_code&)
  {
    // We are in that Service's thread.  It logged the reason.
    post_unless_stopping([this, id]() { reap(id); });
  },
                    [this, id](const Error_code&)
  {
    // Ditto.  It won't serve anyone again.
    post_unless_stopping([this, id]() { reap(id); });
  });

  auto& registration = m_registrations[id];
  registration.m_service = service;
  registration.m_thread = boost::thread([this, id, service]()
  {
    Error_code start_err_code;
    service->start(&start_err_code);
    post_unless_stopping([this, id, start_err_code]() { on_registered(id, start_err_code); });
  });

  accept_next_daemon();
} // Relay_server::on_daemon_accepted()

void Relay_server::on_registered(uint64_t id, const Error_code& err_code)
{
  // We are in thread W.

  const auto it = m_registrations.find(id);
  assert(it != m_registrations.end());
  it->second.m_thread.join(); // It's exiting right after posting us.
  auto service = std::move(it->second.m_service);
  m_registrations.erase(it);
  const bool reaped = m_reap_on_registered.erase(id) != 0;

  if (err_code)
  {
    FLOW_LOG_WARNING("Relay_server [" << *this << "]: Service [" << id << "] failed to register; "
                     "discarding it.  Error: [" << err_code << "] [" << err_code.message() << "].");
    return; // service dtor cleans up.
  }
  // else

  if (reaped || (service->state() != Service::State::S_STARTED))
  {
    // Closed, or lost its daemon, already; its reap() found nothing (or is about to).
    FLOW_LOG_INFO("Relay_server [" << *this << "]: Service [" << id << "] closed right after registering; "
                  "discarding it.");
    return;
  }
  // else

  FLOW_LOG_INFO("Relay_server [" << *this << "]: Service [" << id << "] registered as "
                "[" << service->service_name() << "]; clients at [" << service->advertised_address() << "].");

  Lock_guard lock(m_mutex);
  m_services.emplace(id, std::move(service));
}

void Relay_server::reap(uint64_t id)
{
  // We are in thread W.

  std::shared_ptr<Service> service;
  {
    Lock_guard lock(m_mutex);
    const auto it = m_services.find(id);
    if (it == m_services.end())
    {
      if (m_registrations.count(id) != 0)
      {
        m_reap_on_registered.insert(id); // Not registered yet; on_registered() will discard it.
      }
      return;
    }
    // else
    service = std::move(it->second);
    m_services.erase(it);
  }

  FLOW_LOG_INFO("Relay_server [" << *this << "]: Reaping closed service [" << id << "] "
                "[" << service->service_name() << "].");
} // Relay_server::reap()

void Relay_server::post_unless_stopping(util::Task&& task)
{
  Lock_guard lock(m_mutex);
  if (!m_stopping)
  {
    m_worker.post(std::move(task));
  }
}

uint16_t Relay_server::local_port() const
{
  return m_local_port;
}

std::vector<std::string> Relay_server::service_names() const
{
  std::vector<std::string> names;

  Lock_guard lock(m_mutex);
  names.reserve(m_services.size());
  for (const auto& id_and_service : m_services)
  {
    names.push_back(id_and_service.second->service_name());
  }
  return names;
}

size_t Relay_server::n_services() const
{
  Lock_guard lock(m_mutex);
  return m_services.size();
}

size_t Relay_server::n_relays_active() const
{
  return m_relay_engine.n_active();
}

const std::string& Relay_server::nickname() const
{
  return m_nickname;
}

std::ostream& operator<<(std::ostream& os, const Relay_server& val)
{
  return os << '[' << val.nickname() << "]@" << static_cast<const void*>(&val);
}

} // namespace relay::session
