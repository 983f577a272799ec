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
#include <flow/log/log.hpp>
#include <flow/util/util_fwd.hpp>
#include <boost/asio.hpp>

namespace relay::transport
{

// Types.

/**
 * The relay's end of the long-lived control connection to a daemon: exchanges `\n`-terminated text lines, one
 * read and one write at a time, over a connected TCP socket.  It is never used for payload data.
 *
 * ### Thread safety; threads ###
 * Control_channel does not start threads.  It is constructed around a Peer_socket already associated with
 * some boost.asio `io_context` (a/k/a `Task_engine`) E, and all of its APIs, as well as its destructor, must be
 * invoked from the one thread running E.  All completion handlers are invoked from that thread too, never
 * synchronously from within the initiating API.  This is the mechanism that confines every use of the channel to a
 * single thread: whoever owns E owns the channel.
 *
 * ### Framing ###
 * A line is everything up to (not including) the next `\n`; a trailing `\r` is stripped too.  Bytes that arrive
 * past the `\n` are retained for the next async_read_line().  A line longer than the configured maximum is an
 * error (error::Code::S_CONTROL_LINE_TOO_LONG) after which the channel is hosed: it is not known where the next
 * line starts.
 *
 * ### Deadlines and stale lines ###
 * async_read_line() optionally takes a timeout.  If it elapses, the read completes with error::Code::S_TIMEOUT.
 * The channel is *not* hosed, and the low-level read is not canceled: the opposing side may yet send the line it
 * owes, partially received or not.  Since that late line answers a question the caller has abandoned, it is recorded
 * as *stale*: it is silently skipped when it arrives, one line per earlier timeout, before any later async_read_line()
 * is given a line.  This is what keeps a request/response exchange on the channel in step when a response merely
 * arrives too late.
 *
 * ### Errors ###
 * End-of-stream before a complete line yields error::Code::S_CONTROL_CHANNEL_CLOSED.  That, any system error
 * from boost.asio, and S_CONTROL_LINE_TOO_LONG are *fatal* to the channel: hosed() becomes `true`, and every
 * subsequent read or write completes with the same error right away.  Attempting a 2nd read (or 2nd write) while
 * one is in progress yields error::Code::S_CONTROL_CHANNEL_BUSY and does not affect the one in progress.
 * close() makes any outstanding operation complete with error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER.
 *
 * ### Watching between exchanges ###
 * Without a read in progress nobody is reading the socket, so the opposing side closing the connection goes unnoticed
 * until the next exchange.  After watch_for_close(), a low-level read is kept outstanding at all times, and the
 * first error that hoses the channel (other than close()) is reported to the given handler, whether or not an
 * exchange was in progress.  A line that arrives with no async_read_line() to take it (and that is not stale) stays
 * buffered for the next async_read_line(); watching pauses until then.
 */
class Control_channel :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for the socket type we wrap.
  using Peer_socket = asio_tcp_stream_socket::Peer_socket;

  /// Short-hand for the socket endpoint type.
  using Endpoint = asio_tcp_stream_socket::Endpoint;

  /// Signature of async_read_line() completion handler: error code and (on success only) the line, sans `\n`.
  using On_line_func = Function<void (const Error_code& err_code, const std::string& line)>;

  /// Signature of async_write_line() completion handler.
  using On_written_func = Function<void (const Error_code& err_code)>;

  /// Signature of the watch_for_close() handler: the error that hosed the channel.
  using On_hosed_func = Function<void (const Error_code& err_code)>;

  // Constants.

  /// Default for the max line size ctor arg.
  static constexpr size_t S_DEFAULT_MAX_LINE_SIZE = 4096;

  // Constructors/destructor.

  /**
   * Takes over the given connected socket.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname_str
   *        Human-readable nickname of the new object, as of this writing for use in `operator<<(ostream)` and
   *        logging only.
   * @param peer_socket
   *        Connected TCP socket; becomes not-open.  Its `io_context` determines the one thread in which `*this`
   *        may be used.
   * @param max_line_size
   *        Max length (in bytes, not counting `\r\n`) of a line accepted by async_read_line().  Must be positive.
   */
  explicit Control_channel(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                           Peer_socket&& peer_socket, size_t max_line_size = S_DEFAULT_MAX_LINE_SIZE);

  /**
   * Closes the socket, if not yet closed.  Outstanding handlers will *not* be invoked after this returns, as long
   * as the `io_context` is not run again, which is the owner's responsibility; or they will be invoked with
   * error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER, if it is.  In any case a handler shall not touch
   * `*this` after that.
   */
  ~Control_channel();

  // Methods.

  /**
   * Reads the next (non-stale) line and reports it to `on_done_func()`.  See class doc header.
   *
   * @param timeout
   *        Deadline measured from now, or util::NO_TIMEOUT to wait indefinitely.
   * @param on_done_func
   *        Completion handler.
   */
  void async_read_line(util::Fine_duration timeout, On_line_func&& on_done_func);

  /**
   * Writes the given line followed by `\n`; completes when all of it has been handed to the kernel (i.e., it is
   * flushed: nothing of it remains buffered on our side).  See class doc header.
   *
   * @param line
   *        The line sans `\n`.  It must not contain `\n`.
   * @param on_done_func
   *        Completion handler.
   */
  void async_write_line(util::String_view line, On_written_func&& on_done_func);

  /**
   * Closes the socket (idempotent).  Any outstanding read or write shall complete with
   * error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER; subsequent ones likewise.
   */
  void close();

  /**
   * Begins watching the channel for closure by the opposing side (or any other fatal error) even between exchanges;
   * see class doc header.  `on_hosed_func()` is invoked at most once, never synchronously, and not at all if the
   * channel is hosed by close().  If the channel is already hosed by an error, it is invoked soon.  Call at most once.
   *
   * @param on_hosed_func
   *        Handler.
   */
  void watch_for_close(On_hosed_func&& on_hosed_func);

  /**
   * Returns `true` if and only if a fatal error has occurred (or close() was called), so that every further
   * operation shall fail immediately.
   *
   * @return See above.
   */
  bool hosed() const;

  /**
   * Local endpoint of the underlying socket (i.e., the relay's address as seen by the daemon).
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        whatever boost.asio reports.
   * @return See above; or default-cted `Endpoint` on error.
   */
  Endpoint local_endpoint(Error_code* err_code = 0) const;

  /**
   * Remote endpoint of the underlying socket (i.e., the daemon's address as seen by the relay).
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        whatever boost.asio reports.
   * @return See above; or default-cted `Endpoint` on error.
   */
  Endpoint remote_endpoint(Error_code* err_code = 0) const;

  /**
   * Returns number of lines owed to us by earlier timed-out reads that will be skipped; see class doc header.
   * @return See above.
   */
  size_t n_stale_lines() const;

  /**
   * Returns nickname, a brief string suitable for logging.
   * @return See above.
   */
  const std::string& nickname() const;

private:
  // Methods.

  /// Starts the low-level async-read of the next `\n` into #m_in_buf, unless one is already outstanding.
  void read_until_newline();

  /**
   * Handles completion of `async_read_until()`: extracts a line; skips it if stale (and reads again); else reports it.
   *
   * @param sys_err_code
   *        Result from boost.asio.
   * @param n_through_newline
   *        Number of bytes in #m_in_buf up to and including the `\n`, on success.
   */
  void on_read_until(const Error_code& sys_err_code, size_t n_through_newline);

  /**
   * Finishes the read in progress: cancels the deadline, resets state, and invokes the user handler.
   *
   * @param err_code
   *        Result.
   * @param line
   *        Line (meaningful on success only).
   */
  void finish_read(const Error_code& err_code, const std::string& line);

  /**
   * Marks the channel hosed with the given error, if not already hosed.  Logs WARNING.  Schedules #m_on_hosed_func
   * if set.
   *
   * @param err_code
   *        Truthy error.
   */
  void hose(const Error_code& err_code);

  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// See ctor.
  const size_t m_max_line_size;

  /// The connected socket; the channel.
  Peer_socket m_peer_socket;

  /// Bytes read but not yet consumed; bounded by #m_max_line_size plus line terminator.
  boost::asio::streambuf m_in_buf;

  /// Bytes of the line being written (including `\n`).  Must stay alive until the write completes.
  std::string m_out_buf;

  /// Handler of the read in progress; empty if none in progress.
  On_line_func m_on_read_func;

  /// Handler of the write in progress; empty if none in progress.
  On_written_func m_on_written_func;

  /// Incremented at each async_read_line(); lets a late deadline firing recognize that its read is long gone.
  uint64_t m_read_id;

  /// Deadline of the read in progress if any.
  flow::util::Timer m_read_timer;

  /// Whether a low-level `async_read_until()` is outstanding.  It can outlive the user read that started it.
  bool m_reading;

  /// Whether watch_for_close() was called.
  bool m_watching;

  /// See watch_for_close(); empty if not watching or already invoked.
  On_hosed_func m_on_hosed_func;

  /// See n_stale_lines().
  size_t m_n_stale_lines;

  /// Falsy until hosed(); then the error to report from every subsequent operation.
  Error_code m_hosed_err_code;
}; // class Control_channel

} // namespace relay::transport
