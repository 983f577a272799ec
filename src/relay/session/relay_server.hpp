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

#include "relay/session/service.hpp"
#include "relay/transport/data_relay.hpp"
#include "relay/transport/asio_tcp_stream_socket_fwd.hpp"
#include <flow/log/log.hpp>
#include <flow/async/single_thread_task_loop.hpp>
#include <flow/util/util.hpp>
#include <boost/move/unique_ptr.hpp>
#include <boost/thread/thread.hpp>
#include <map>
#include <set>
#include <memory>
#include <vector>

namespace relay::session
{

// Types.

/**
 * The relay process proper: listens for daemons' control connections; makes and starts a Service for each; and
 * keeps the registered ones around until destroyed.  All Services share one transport::Data_relay_engine, so the
 * relays of every service are pumped in one thread distinct from all the accept threads.
 *
 * ### Threads ###
 *   - Thread U: the user's.  Ctor, dtor, accessors.
 *   - Thread W: ours; runs the control-connection listener, and bookkeeping.
 *   - One registration thread per daemon connection while its Service::start() blocks (so a slow or silent daemon
 *     holds up nobody but itself).
 *   - Each Service's own thread; and the Data_relay_engine's thread.
 *
 * A Service whose start() fails is logged and destroyed.  A started Service that closes due to a fatal error (see
 * Service::On_closed_func), or whose daemon goes away (see Service::On_daemon_lost_func), is reaped (destroyed)
 * soon after; so its public listener closes, and it disappears from service_names().  The dtor shuts everything
 * down, including Services still registering (their start() fails with
 * transport::error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER).
 *
 * The listener binds `Options::m_listen_host:Options::m_listen_port`; port 0 means an ephemeral port; in any case
 * local_port() tells which.
 */
class Relay_server :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// Configurable knobs.
  struct Options
  {
    // Constructors/destructor.

    /// Listens on `0.0.0.0`, ephemeral port; default Service::Options.
    Options();

    // Data.

    /// Numeric IP address on which to listen for daemons' control connections.
    std::string m_listen_host;

    /// Port on which to listen for daemons' control connections; 0 means ephemeral.
    uint16_t m_listen_port;

    /// Options given to each Service.
    Service::Options m_service_opts;
  }; // struct Options

  // Constructors/destructor.

  /**
   * Begins listening for daemons; returns once listening (or failed to).
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently (here and in every Service and relay).
   * @param opts
   *        See Options.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        transport::error::Code::S_INVALID_ARGUMENT (`m_listen_host` is not a numeric IP address);
   *        any system error from opening, binding or listening.
   *        If an error is emitted, the object is useless except for destruction.
   */
  explicit Relay_server(flow::log::Logger* logger_ptr, const Options& opts, Error_code* err_code = 0);

  /// Stops listening; shuts down and destroys every Service (registered or registering); then every relay.
  ~Relay_server();

  // Methods.

  /**
   * The port on which daemons may connect; or 0 if the ctor failed.
   * @return See above.
   */
  uint16_t local_port() const;

  /**
   * Names of the currently registered services (duplicates possible: names are not arbitrated).
   * @return See above.
   */
  std::vector<std::string> service_names() const;

  /**
   * Number of currently registered services.
   * @return See above.
   */
  size_t n_services() const;

  /**
   * Number of data relays now in progress across all services.
   * @return See above.
   */
  size_t n_relays_active() const;

  /**
   * Nickname for logging.
   * @return See above.
   */
  const std::string& nickname() const;

private:
  // Types.

  /// Short-hand for the acceptor type.
  using Acceptor = transport::asio_tcp_stream_socket::Acceptor;

  /// Short-hand for the peer socket type.
  using Peer_socket = transport::asio_tcp_stream_socket::Peer_socket;

  /// Short-hand for our mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for lock of #Mutex.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  /// A Service being registered.
  struct Registration
  {
    /// The Service.
    std::shared_ptr<Service> m_service;

    /// Thread blocking in `m_service->start()`.
    boost::thread m_thread;
  };

  // Methods.

  /// Thread W: begins async-accept of the next daemon control connection.
  void accept_next_daemon();

  /**
   * Thread W: handler for accept_next_daemon().
   * @param sys_err_code
   *        Result of the accept.
   */
  void on_daemon_accepted(const Error_code& sys_err_code);

  /**
   * Thread W: a registration thread has finished `start()`; keep or discard the Service.
   * @param id
   *        Key in #m_registrations.
   * @param err_code
   *        Result of `start()`.
   */
  void on_registered(uint64_t id, const Error_code& err_code);

  /**
   * Thread W: destroys the given registered Service, which has closed or lost its daemon.  If it is still in
   * #m_registrations, it is marked for on_registered() to discard instead.
   * @param id
   *        Key in #m_services or #m_registrations.
   */
  void reap(uint64_t id);

  /**
   * Any thread: posts `task` onto thread W unless the dtor has begun.
   * @param task
   *        Task.
   */
  void post_unless_stopping(util::Task&& task);

  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// The relay worker shared by all Services.  Declared first, so that it outlives them.
  transport::Data_relay_engine m_relay_engine;

  /// Thread W.
  flow::async::Single_thread_task_loop m_worker;

  /// The daemon listener; null if ctor failed.  Thread W only.
  boost::movelib::unique_ptr<Acceptor> m_acceptor;

  /// The target of the current async-accept.  Thread W only.
  Peer_socket m_next_daemon_socket;

  /// See local_port().
  uint16_t m_local_port;

  /// Service::Options given to each Service.
  const Service::Options m_service_opts;

  /// Source of Service IDs: 1, 2, ....  Thread W only.
  uint64_t m_last_id;

  /// Services being registered.  Thread W only (and dtor after W is stopped).
  std::map<uint64_t, Registration> m_registrations;

  /// IDs in #m_registrations already to be reaped; see reap().  Thread W only.
  std::set<uint64_t> m_reap_on_registered;

  /// Protects #m_services and #m_stopping.
  mutable Mutex m_mutex;

  /// Registered Services.  Protected by #m_mutex.
  std::map<uint64_t, std::shared_ptr<Service>> m_services;

  /// Set when the dtor begins: no more tasks may be posted onto thread W.  Protected by #m_mutex.
  bool m_stopping;
}; // class Relay_server

} // namespace relay::session
