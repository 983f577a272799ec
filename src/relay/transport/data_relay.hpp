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

#include "relay/transport/asio_tcp_stream_socket_fwd.hpp"
#include "relay/util/util_fwd.hpp"
#include "relay/util/native_handle.hpp"
#include <flow/log/log.hpp>
#include <flow/async/single_thread_task_loop.hpp>
#include <boost/asio.hpp>
#include <array>
#include <atomic>
#include <memory>
#include <map>

namespace relay::transport
{

// Types.

/**
 * The two connected sockets of one served client request: the client's (accepted on a service's public listener)
 * and the daemon's (accepted on that request's single-use callback listener).  Whoever holds the object owns both
 * handles; move it to transfer ownership.
 */
struct Data_connection_pair
{
  // Data.

  /// Connected socket to the client.
  util::Native_handle m_client;

  /// Connected socket to the daemon.
  util::Native_handle m_daemon;
};

/**
 * Pipes bytes between two connected TCP sockets (client and daemon) in both directions until both directions have
 * reached end-of-stream, or until either socket fails; then closes both sockets and invokes the completion handler
 * exactly once.
 *
 * ### Half-close ###
 * When one side reaches end-of-stream (it has shut down its sending direction), and the bytes before it have been
 * forwarded, the opposite socket's sending direction is shut down in turn.  So a client that sends a request and
 * then half-closes still gets the whole reply.
 *
 * ### Threads; lifetime ###
 * All work is done by async operations on the `io_context` with which the two sockets are associated; all APIs must
 * be invoked from the thread running it.  Outstanding async operations keep `*this` alive (via
 * `shared_from_this()`), so a Data_relay needs no owner while it runs.
 */
class Data_relay :
  public flow::log::Log_context,
  public std::enable_shared_from_this<Data_relay>,
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for the socket type we pump.
  using Peer_socket = asio_tcp_stream_socket::Peer_socket;

  /// Short-hand for ref-counted pointer to this.
  using Ptr = std::shared_ptr<Data_relay>;

  /// Signature of the completion handler: falsy if both directions ended gracefully; else the first error.
  using On_done_func = Function<void (const Error_code& err_code)>;

  // Constants.

  /// Size of the buffer used in each direction.
  static constexpr size_t S_BUF_SIZE = 16 * 1024;

  // Constructors/destructor.

  /**
   * Takes over the two sockets; does not start pumping (see start()).
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname_str
   *        Human-readable nickname of the new object, as of this writing for use in `operator<<(ostream)` and
   *        logging only.
   * @param client_socket
   *        Connected socket to the client; becomes not-open.
   * @param daemon_socket
   *        Connected socket to the daemon; becomes not-open.  Same `io_context` as `client_socket`.
   * @param on_done_func
   *        Invoked exactly once, after both sockets are closed, unless `*this` is destroyed before start().
   */
  explicit Data_relay(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                      Peer_socket&& client_socket, Peer_socket&& daemon_socket, On_done_func&& on_done_func);

  /// Closes both sockets if not yet closed.
  ~Data_relay();

  // Methods.

  /// Starts pumping in both directions.  Call at most once.
  void start();

  /**
   * Aborts the relay: closes both sockets and, if not yet invoked, invokes the completion handler with
   * error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER.  No-op if already finished.
   */
  void close();

  /**
   * Returns `true` if and only if the relay is finished (both sockets closed; completion handler invoked).
   * @return See above.
   */
  bool finished() const;

  /**
   * Returns total bytes forwarded so far from client to daemon.
   * @return See above.
   */
  uint64_t n_bytes_to_daemon() const;

  /**
   * Returns total bytes forwarded so far from daemon to client.
   * @return See above.
   */
  uint64_t n_bytes_to_client() const;

  /**
   * Returns nickname, a brief string suitable for logging.
   * @return See above.
   */
  const std::string& nickname() const;

private:
  // Types.

  /// One of the two directions of a relay.
  struct Direction
  {
    /// Name for logging.
    const char* m_name;

    /// We read from this socket...
    Peer_socket* m_from;

    /// ...and write what we read into this one.
    Peer_socket* m_to;

    /// Buffer holding bytes read but not yet written.
    std::array<uint8_t, S_BUF_SIZE> m_buf;

    /// Total bytes forwarded.
    uint64_t m_n_bytes;

    /// `true` once end-of-stream on #m_from has been forwarded as shutdown-send on #m_to.
    bool m_done;
  };

  // Methods.

  /**
   * Reads some bytes in the given direction.
   * @param dir
   *        Direction.
   */
  void pump(Direction* dir);

  /**
   * Handles async-read completion in the given direction: forwards bytes, or forwards end-of-stream, or finishes
   * on error.
   *
   * @param dir
   *        Direction.
   * @param sys_err_code
   *        Result.
   * @param n_rcvd
   *        Bytes read.
   */
  void on_read_some(Direction* dir, const Error_code& sys_err_code, size_t n_rcvd);

  /**
   * Closes both sockets and invokes the completion handler, if not yet done.
   * @param err_code
   *        Result to report.
   */
  void finish(const Error_code& err_code);

  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// Socket to the client.
  Peer_socket m_client_socket;

  /// Socket to the daemon.
  Peer_socket m_daemon_socket;

  /// Client => daemon.
  Direction m_to_daemon;

  /// Daemon => client.
  Direction m_to_client;

  /// Completion handler; empty once invoked.
  On_done_func m_on_done_func;

  /// See finished().
  bool m_finished;
}; // class Data_relay

/**
 * Runs any number of `Data_relay`s in one worker thread of its own.  This is the data-relay worker of every
 * session::Service of a session::Relay_server: once a Service has a Data_connection_pair, it launch()es it here and
 * forgets about it.
 *
 * ### Thread safety ###
 * launch() and n_active() may be invoked concurrently from any threads.  Completion handlers are invoked from the
 * worker thread (or, for relays still active at destruction, from the destructor's thread).
 *
 * ### Destruction ###
 * Closes every still-active relay (completion handlers are invoked with
 * error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER) and joins the worker thread.
 */
class Data_relay_engine :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// Signature of launch() completion handler.
  using On_done_func = Data_relay::On_done_func;

  // Constructors/destructor.

  /**
   * Starts the worker thread.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname_str
   *        Human-readable nickname of the new object, as of this writing for use in `operator<<(ostream)`,
   *        thread naming and logging only.
   */
  explicit Data_relay_engine(flow::log::Logger* logger_ptr, util::String_view nickname_str);

  /// See class doc header.
  ~Data_relay_engine();

  // Methods.

  /**
   * Takes over the two sockets and starts relaying between them, asynchronously.  If either socket cannot be
   * adopted, both are closed, and `on_done_func()` is invoked with the error.  Either way `on_done_func()` is invoked
   * exactly once.
   *
   * @param pair
   *        The two connected sockets; becomes both-`null()`.
   * @param on_done_func
   *        Completion handler.
   */
  void launch(Data_connection_pair&& pair, On_done_func&& on_done_func);

  /**
   * Returns number of relays launched and not yet finished.
   * @return See above.
   */
  size_t n_active() const;

  /**
   * Returns total number of relays launched so far.
   * @return See above.
   */
  uint64_t n_launched() const;

  /**
   * Returns nickname, a brief string suitable for logging.
   * @return See above.
   */
  const std::string& nickname() const;

private:
  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// The worker thread W.  All relays' sockets are on its `io_context`.
  flow::async::Single_thread_task_loop m_worker;

  /// Relays running now, keyed by launch ID.  Accessed in thread W only (and in dtor after W is stopped).
  std::map<uint64_t, Data_relay::Ptr> m_relays;

  /// Set in thread W when the dtor begins; launches arriving after that are refused.
  bool m_stopping;

  /// See n_active().
  std::atomic<size_t> m_n_active;

  /// See n_launched().
  std::atomic<uint64_t> m_n_launched;
}; // class Data_relay_engine

} // namespace relay::transport
