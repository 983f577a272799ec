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

#include "relay/session/session_fwd.hpp"
#include "relay/transport/control_channel.hpp"
#include "relay/transport/data_relay.hpp"
#include "relay/transport/asio_tcp_stream_socket_fwd.hpp"
#include "relay/util/util_fwd.hpp"
#include <flow/log/log.hpp>
#include <flow/async/single_thread_task_loop.hpp>
#include <flow/util/util.hpp>
#include <boost/move/unique_ptr.hpp>
#include <atomic>
#include <future>
#include <memory>

namespace relay::session
{

// Types.

/**
 * One registered service: the relay side of a daemon's control channel together with the service's public listener.
 * Constructed around the (connected) control socket of a newly connected daemon; start() performs the registration
 * handshake; from then on clients connecting to the advertised address are served, each by a fresh
 * (client, daemon) socket pair handed to the data-relay worker via the user-supplied #Data_relay_launcher.
 *
 * ### Registration ###
 * start() opens the public listener (wildcard address, ephemeral port), then waits for one line from the daemon: the
 * service name.  It then writes `<host>:<port>` -- the public address -- back, and only then returns.  `host` is
 * Options::m_advertised_host if set; else the relay's own address on the control connection (i.e., the address
 * the daemon used to reach the relay).  Clients are not accepted until registration has completed, though they
 * may already be queued by the kernel.  Note that this is neither the daemon's address nor a host name: behind NAT,
 * or on a multi-homed relay, set Options::m_advertised_host to what clients can actually reach.
 *
 * ### Per-request handshake ###
 * For each accepted client C:
 *   -# Open a single-use listener A (wildcard address, ephemeral port).
 *   -# Write `<host>:<A's port>` to the control channel.
 *   -# Read one line (any content) from the control channel: the daemon's acknowledgment.
 *   -# Accept exactly one connection D on A: the daemon connecting back.
 *   -# Close A; hand (C, D) to the data-relay worker; forget about them.
 *
 * Steps 2-4 of one request never interleave with those of another: the next client is not even accepted until the
 * current request is finished one way or another.  All of it (and registration) runs in one worker thread W,
 * which is also the only thread that ever touches the control channel.  A request that fails anywhere in steps 1-4
 * (e.g., the daemon closes the control channel instead of acknowledging; or a deadline expires) is *dropped*: C and
 * A are closed, a WARNING is logged, and the loop goes on to the next client.  A is closed on every path.
 *
 * ### Deadlines ###
 * By default nothing times out.  Options::m_ack_timeout bounds step 3; Options::m_daemon_connect_timeout
 * bounds step 4; on expiry the request is dropped as if not acknowledged.  A late acknowledgment is recognized as such
 * and skipped (see transport::Control_channel), so it does not get mistaken for the next request's.
 *
 * ### Admission control ###
 * If Options::m_max_concurrent_requests is non-zero, then once that many relays are running (launched and
 * not yet reported done via the launcher's completion callback), accepting is paused; it resumes as soon as one
 * finishes.
 *
 * ### Lifecycle ###
 * state() goes: State::S_CREATED; State::S_STARTED (registration succeeded); State::S_SHUTTING_DOWN (shutdown()
 * or a fatal error in progress); State::S_CLOSED.  A failed start() goes straight to State::S_CLOSED.  A fatal
 * error on the public listener itself (as opposed to a single request) closes everything too, in which case the
 * on-closed handler (if any) is invoked from thread W.  shutdown() or the destructor close the public listener
 * (so subsequent client connection attempts are refused), the control channel, and any request in progress; relays
 * already handed off are unaffected.
 *
 * ### Losing the daemon ###
 * Once started, the control channel is watched even between requests (transport::Control_channel::watch_for_close()).
 * If the daemon closes it (or it fails otherwise), the Service stays State::S_STARTED, and every client from then on
 * is dropped as in any per-request failure; but the on-daemon-lost handler (if any) is invoked from thread W, once,
 * so the owner can shut down the now-useless Service.
 *
 * ### Thread safety ###
 * start(), shutdown() and the destructor may be called from any thread but not concurrently with the destructor,
 * and not from within a handler invoked by `*this`.  Accessors are safe to call concurrently with anything.
 */
class Service :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// Configurable knobs.  The defaults reproduce the classic behavior: wait as long as it takes; never limit.
  struct Options
  {
    // Constructors/destructor.

    /// Sets every knob to its default (documented on each member).
    Options();

    // Data.

    /// Max wait for the daemon's service-name line in start(); default util::NO_TIMEOUT.
    util::Fine_duration m_registration_timeout;

    /// Max wait for the daemon's per-request acknowledgment line; default util::NO_TIMEOUT.
    util::Fine_duration m_ack_timeout;

    /// Max wait for the daemon to connect back to the single-use listener; default util::NO_TIMEOUT.
    util::Fine_duration m_daemon_connect_timeout;

    /// Max relays in flight before accepting pauses; 0 (default) means unlimited.
    size_t m_max_concurrent_requests;

    /// Max length of a control-channel line; default transport::Control_channel::S_DEFAULT_MAX_LINE_SIZE.
    size_t m_max_line_size;

    /// Host to advertise in `host:port` lines; empty (default) means the relay's address on the control connection.
    std::string m_advertised_host;
  }; // struct Options

  /// Lifecycle state.  See class doc header.
  enum class State
  {
    /// Not yet started (or start() in progress).
    S_CREATED,
    /// Registered; serving clients.
    S_STARTED,
    /// Closing down.
    S_SHUTTING_DOWN,
    /// Closed.  Terminal.
    S_CLOSED
  };

  /**
   * Hands a ready (client, daemon) socket pair to the data-relay worker.  Invoked from thread W; must not block.
   * The worker must eventually close both sockets and then invoke the second arg (from any thread), exactly once.
   */
  using Data_relay_launcher = Function<void (transport::Data_connection_pair&& pair,
                                             Function<void ()>&& on_relay_done_func)>;

  /// Invoked (from thread W) when a fatal error closes an already-started Service.
  using On_closed_func = Function<void (const Error_code& err_code)>;

  /// Invoked (from thread W) when the control channel of a started Service is lost; see class doc header.
  using On_daemon_lost_func = Function<void (const Error_code& err_code)>;

  // Constructors/destructor.

  /**
   * Takes over the daemon's control socket.  Does not start a thread or do any I/O; see start().
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param native_ctl_socket
   *        Connected TCP socket to the daemon; becomes `null()`.
   * @param opts
   *        Knobs.
   * @param relay_launcher
   *        See #Data_relay_launcher.
   * @param on_closed_func
   *        See #On_closed_func.  May be empty.
   * @param on_daemon_lost_func
   *        See #On_daemon_lost_func.  May be empty.
   */
  explicit Service(flow::log::Logger* logger_ptr, util::Native_handle&& native_ctl_socket, const Options& opts,
                   Data_relay_launcher&& relay_launcher, On_closed_func&& on_closed_func = On_closed_func(),
                   On_daemon_lost_func&& on_daemon_lost_func = On_daemon_lost_func());

  /// Equivalent to shutdown(); then frees resources.
  ~Service();

  // Methods.

  /**
   * Starts the worker thread; opens the public listener; performs registration (blocking until it completes,
   * fails or, if configured, times out); and begins serving clients.  On failure everything is closed, and state()
   * is State::S_CLOSED.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        transport::error::Code::S_INVALID_STATE (not State::S_CREATED, or start() already called),
   *        transport::error::Code::S_REGISTRATION_NO_SERVICE_NAME (daemon closed the channel or sent an empty line),
   *        transport::error::Code::S_TIMEOUT (Options::m_registration_timeout elapsed),
   *        transport::error::Code::S_CONTROL_LINE_TOO_LONG,
   *        transport::error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER (shutdown() called concurrently),
   *        system errors from opening the listener or from the control socket.
   * @return `true` on success; `false` on failure.
   */
  bool start(Error_code* err_code = 0);

  /// Closes everything (idempotent); see class doc header.  Joins thread W.
  void shutdown();

  /**
   * Current state.
   * @return See above.
   */
  State state() const;

  /**
   * The registered service name; empty until start() succeeds.
   * @return See above.
   */
  const std::string& service_name() const;

  /**
   * The host advertised in `host:port` lines; empty until start() has got that far.
   * @return See above.
   */
  const std::string& advertised_host() const;

  /**
   * The public listener's port; 0 until start() has opened it.
   * @return See above.
   */
  uint16_t public_port() const;

  /**
   * `advertised_host():public_port()`, as sent to the daemon at registration.
   * @return See above.
   */
  std::string advertised_address() const;

  /**
   * Number of client connections accepted so far.
   * @return See above.
   */
  uint64_t n_requests_accepted() const;

  /**
   * Number of requests fully handshaken and handed to the data-relay worker so far.
   * @return See above.
   */
  uint64_t n_requests_served() const;

  /**
   * Number of requests dropped (per-request failure) so far.
   * @return See above.
   */
  uint64_t n_requests_dropped() const;

  /**
   * Number of relays handed off and not yet reported done.
   * @return See above.
   */
  size_t n_relays_in_flight() const;

  /**
   * Returns nickname, a brief string suitable for logging.
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

  /// The one client request being handshaken.  All sockets are on thread W's `io_context`.
  struct Pending_request
  {
    /**
     * Constructs with all sockets not-open.
     * @param task_engine
     *        Thread W's `io_context`.
     * @param id
     *        See #m_id.
     */
    explicit Pending_request(util::Task_engine* task_engine, uint64_t id);

    /// 1, 2, ...; for logging; and for late handlers to recognize that their request is gone.
    const uint64_t m_id;

    /// The accepted client.
    Peer_socket m_client_socket;

    /// The single-use listener for the daemon's callback connection.
    Acceptor m_callback_acceptor;

    /// The daemon's callback connection (once accepted).
    Peer_socket m_daemon_socket;

    /// Deadline for #m_daemon_socket to be accepted.
    flow::util::Timer m_connect_timer;

    /// Whether #m_connect_timer fired (and we canceled the accept in response).
    bool m_connect_timed_out;
  }; // struct Pending_request

  /**
   * The part of `*this` that relay completion callbacks, which may run in any thread at any time, may reach.  Once
   * `*this` is closing, #m_service is null, and completions are ignored.
   */
  struct Relay_tracker
  {
    /// Protects #m_service.
    Mutex m_mutex;

    /// The Service; or null once closing.
    Service* m_service;
  };

  // Methods.

  /**
   * Thread W: adopts the control socket; opens the public listener; starts reading the service name.
   * @param registered_promise
   *        Fulfilled (by finish_registration()) with the outcome.
   */
  void begin_registration(std::promise<Error_code>* registered_promise);

  /**
   * Thread W: handles the service-name line (or failure to get it).
   * @param err_code
   *        Result.
   * @param line
   *        The line.
   */
  void on_registration_line(const Error_code& err_code, const std::string& line);

  /**
   * Thread W: handles completion of writing the advertisement.
   * @param err_code
   *        Result.
   */
  void on_registration_reply_sent(const Error_code& err_code);

  /**
   * Thread W: fulfills the start() promise, if not yet done.
   * @param err_code
   *        Result.
   */
  void finish_registration(const Error_code& err_code);

  /// Thread W: begins async-accept of the next client (unless closing, or admission control says wait).
  void accept_next_client();

  /**
   * Thread W: handles a new client (or error on the public listener).
   * @param sys_err_code
   *        Result.
   */
  void on_client_accepted(const Error_code& sys_err_code);

  /// Thread W: steps 1-2 of the per-request handshake for #m_pending.
  void begin_request();

  /**
   * Thread W: handles completion of step 2; begins step 3.
   * @param id
   *        Pending_request::m_id of the request that started it.
   * @param err_code
   *        Result.
   */
  void on_request_signal_sent(uint64_t id, const Error_code& err_code);

  /**
   * Thread W: handles completion of step 3; begins step 4.
   * @param id
   *        Pending_request::m_id of the request that started it.
   * @param err_code
   *        Result.
   * @param line
   *        The acknowledgment line (content unused).
   */
  void on_request_ack(uint64_t id, const Error_code& err_code, const std::string& line);

  /**
   * Thread W: handles completion of step 4; does step 5.
   * @param id
   *        Pending_request::m_id of the request that started it.
   * @param sys_err_code
   *        Result.
   */
  void on_daemon_connected(uint64_t id, const Error_code& sys_err_code);

  /**
   * Thread W: whether `id` identifies the request in progress, and we are not closing.
   * @param id
   *        Pending_request::m_id.
   * @return See above.
   */
  bool request_is_current(uint64_t id) const;

  /**
   * Thread W: logs; closes everything of #m_pending; counts the drop; accepts the next client.
   * @param err_code
   *        Reason.
   */
  void drop_request(const Error_code& err_code);

  /// Thread W: closes whatever is still open in #m_pending; destroys it.
  void release_request();

  /// Thread W: a relay has finished; maybe resume accepting.
  void on_relay_done();

  /**
   * Thread W: the public listener failed; close everything; inform on-closed handler.
   * @param err_code
   *        Reason.
   */
  void on_fatal_error(const Error_code& err_code);

  /**
   * Thread W: the watched control channel got hosed; inform on-daemon-lost handler.
   * @param err_code
   *        Reason.
   */
  void on_daemon_lost(const Error_code& err_code);

  /// Thread W: closes every socket; aborts registration if pending; detaches #m_relay_tracker.  Idempotent.
  void close_all();

  /// Thread U, with #m_mutex locked, thread W running: close_all() in W; then stop W.
  void teardown();

  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// See ctor.
  const Options m_opts;

  /// See ctor.
  Data_relay_launcher m_relay_launcher;

  /// See ctor.
  On_closed_func m_on_closed_func;

  /// See ctor.
  On_daemon_lost_func m_on_daemon_lost_func;

  /// See state().
  std::atomic<State> m_state;

  /// Protects #m_worker_started and #m_worker_stopped; serializes start() and shutdown().
  mutable Mutex m_mutex;

  /// Whether start() has started #m_worker.
  bool m_worker_started;

  /// Whether teardown() has stopped #m_worker.
  bool m_worker_stopped;

  /// Control socket until begin_registration() adopts it into #m_ctl_chan; then `null()`.
  util::Native_handle m_native_ctl_socket;

  /**
   * Thread W.  Everything below this (other than the atomic counters) is accessed only from W.  It is declared
   * before them, so they are destroyed before its `io_context` is.
   */
  flow::async::Single_thread_task_loop m_worker;

  /// The control channel.  Null until begin_registration().
  boost::movelib::unique_ptr<transport::Control_channel> m_ctl_chan;

  /// The public listener.  Null until begin_registration().
  boost::movelib::unique_ptr<Acceptor> m_acceptor;

  /// Target of the async-accept in progress on #m_acceptor.  Not-open otherwise.
  Peer_socket m_next_client_socket;

  /// The request in progress; null if none.
  boost::movelib::unique_ptr<Pending_request> m_pending;

  /// Protocol (v4 or v6) of the control connection; the listeners use the same.
  transport::asio_tcp_stream_socket::Protocol m_protocol;

  /// While start() awaits registration: its promise.  Else null.
  std::promise<Error_code>* m_registration_promise;

  /// See service_name().  Written in W during start(); read anywhere after.
  std::string m_service_name;

  /// See advertised_host().  Written in W during start(); read anywhere after.
  std::string m_advertised_host;

  /// See public_port().
  std::atomic<uint16_t> m_public_port;

  /// Whether accepting is paused by admission control.
  bool m_accept_paused;

  /// See n_requests_accepted().
  std::atomic<uint64_t> m_n_requests_accepted;

  /// See n_requests_served().
  std::atomic<uint64_t> m_n_requests_served;

  /// See n_requests_dropped().
  std::atomic<uint64_t> m_n_requests_dropped;

  /// See n_relays_in_flight().
  std::atomic<size_t> m_n_relays_in_flight;

  /// See Relay_tracker.
  const std::shared_ptr<Relay_tracker> m_relay_tracker;
}; // class Service

// Free functions: in *_fwd.hpp.

/**
 * Prints string representation of the given Service::State to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Service::State val);

} // namespace relay::session
