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
#include "relay/transport/control_channel.hpp"
#include "relay/transport/error.hpp"
#include <flow/error/error.hpp>
#include <flow/common.hpp>

namespace relay::transport
{

// Implementations.

Control_channel::Control_channel(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                                 Peer_socket&& peer_socket, size_t max_line_size) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_nickname(nickname_str),
  m_max_line_size(max_line_size),
  m_peer_socket(std::move(peer_socket)),
  // +2: room for the "\r\n" after a max-length line.  Beyond that async_read_until() fails with not_found.
  m_in_buf(m_max_line_size + 2),
  m_read_id(0),
  m_read_timer(m_peer_socket.get_executor()),
  m_reading(false),
  m_watching(false),
  m_n_stale_lines(0)
{
  assert((m_max_line_size != 0) && "Max line size must be positive.");

  const auto local_endpt = local_endpoint(&m_hosed_err_code);
  FLOW_LOG_INFO("Control_channel [" << *this << "]: Created around socket with local endpoint "
                "[" << local_endpt << "].");
  if (m_hosed_err_code)
  {
    // Probably not open/connected.  Every operation will just fail.  (Kept so nickname/logging still work.)
    FLOW_LOG_WARNING("Control_channel [" << *this << "]: Socket seems unusable from the start; the channel is "
                     "hosed.  Error: [" << m_hosed_err_code << "] [" << m_hosed_err_code.message() << "].");
  }
}

Control_channel::~Control_channel()
{
  FLOW_LOG_INFO("Control_channel [" << *this << "]: Shutting down.");
  close();
}

void Control_channel::async_read_line(util::Fine_duration timeout, On_line_func&& on_done_func)
{
  using boost::asio::post;

  if (!m_on_read_func.empty())
  {
    FLOW_LOG_WARNING("Control_channel [" << *this << "]: async_read_line() while another is in progress.  "
                     "Refusing; the one in progress is unaffected.");
    post(m_peer_socket.get_executor(), [on_done_func = std::move(on_done_func)]()
    {
      on_done_func(error::Code::S_CONTROL_CHANNEL_BUSY, util::EMPTY_STRING);
    });
    return;
  }
  // else

  if (m_hosed_err_code)
  {
    FLOW_LOG_TRACE("Control_channel [" << *this << "]: async_read_line() on hosed channel.  Will report "
                   "[" << m_hosed_err_code << "] [" << m_hosed_err_code.message() << "].");
    post(m_peer_socket.get_executor(), [on_done_func = std::move(on_done_func), err_code = m_hosed_err_code]()
    {
      on_done_func(err_code, util::EMPTY_STRING);
    });
    return;
  }
  // else

  const auto read_id = ++m_read_id;
  m_on_read_func = std::move(on_done_func);

  FLOW_LOG_TRACE("Control_channel [" << *this << "]: Read [" << read_id << "] of next line starting; "
                 "timeout [" << timeout << "] (0 = none); stale lines to skip first [" << m_n_stale_lines << "].");

  if (util::timeout_enabled(timeout))
  {
    m_read_timer.expires_after(timeout);
    m_read_timer.async_wait([this, read_id](const Error_code& async_err_code)
    {
      if (async_err_code == boost::asio::error::operation_aborted)
      {
        return; // Line arrived in time; or another read superseded us; or shutting down.
      }
      // else
      if (async_err_code)
      {
        FLOW_LOG_WARNING("Control_channel [" << *this << "]: Timer system error [" << async_err_code << "] "
                         "[" << async_err_code.message() << "]; pretending it fired normally.");
      }

      if ((read_id != m_read_id) || m_on_read_func.empty())
      {
        return; // The read finished in the meantime; its completion was queued ahead of ours.  Not a timeout.
      }
      // else

      // Whatever line the daemon sends next is the answer to the question the caller is now giving up on.
      ++m_n_stale_lines;
      FLOW_LOG_TRACE("Control_channel [" << *this << "]: Read [" << read_id << "] timed out.  Stale lines to "
                     "skip is now [" << m_n_stale_lines << "]; low-level read (if any) continues.");
      finish_read(error::Code::S_TIMEOUT, util::EMPTY_STRING);
    });
  } // if (util::timeout_enabled(timeout))

  read_until_newline();
} // Control_channel::async_read_line()

void Control_channel::read_until_newline()
{
  if (m_reading)
  {
    return; // A low-level read started earlier (by a since-timed-out read) is outstanding; it'll serve us.
  }
  // else

  m_reading = true;
  boost::asio::async_read_until(m_peer_socket, m_in_buf, '\n',
                                [this](const Error_code& async_err_code, size_t n_through_newline)
  {
    on_read_until(async_err_code, n_through_newline);
  });
}

void Control_channel::on_read_until(const Error_code& sys_err_code, size_t n_through_newline)
{
  using boost::asio::buffers_begin;
  using std::string;

  m_reading = false;

  if (sys_err_code)
  {
    if (sys_err_code == boost::asio::error::operation_aborted)
    {
      // close() is the only canceler; it has set m_hosed_err_code.
      FLOW_LOG_TRACE("Control_channel [" << *this << "]: Low-level read aborted (closing).");
    }
    else if (sys_err_code == boost::asio::error::eof)
    {
      FLOW_LOG_INFO("Control_channel [" << *this << "]: Opposing side closed the channel; [" << m_in_buf.size() << "] "
                    "bytes of incomplete line dropped.");
      hose(error::Code::S_CONTROL_CHANNEL_CLOSED);
    }
    else if (sys_err_code == boost::asio::error::not_found)
    {
      hose(error::Code::S_CONTROL_LINE_TOO_LONG);
    }
    else
    {
      hose(sys_err_code);
    }

    assert(m_hosed_err_code);
    if (!m_on_read_func.empty())
    {
      finish_read(m_hosed_err_code, util::EMPTY_STRING);
    }
    return;
  }
  // else

  assert(n_through_newline != 0);

  if (m_on_read_func.empty() && (m_n_stale_lines == 0))
  {
    // Watching only.  Nobody has asked for this line yet: leave it in m_in_buf for the next async_read_line().
    FLOW_LOG_INFO("Control_channel [" << *this << "]: Received an unsolicited line while watching; keeping it for "
                  "the next read.  Watching paused until then.");
    return;
  }
  // else

  const auto data = m_in_buf.data();
  string line(buffers_begin(data), buffers_begin(data) + (n_through_newline - 1)); // Sans '\n'.
  m_in_buf.consume(n_through_newline);
  if ((!line.empty()) && (line.back() == '\r'))
  {
    line.pop_back();
  }

  if (line.size() > m_max_line_size)
  {
    hose(error::Code::S_CONTROL_LINE_TOO_LONG);
    if (!m_on_read_func.empty())
    {
      finish_read(m_hosed_err_code, util::EMPTY_STRING);
    }
    return;
  }
  // else

  if (m_n_stale_lines != 0)
  {
    --m_n_stale_lines;
    FLOW_LOG_INFO("Control_channel [" << *this << "]: Received line [" << line << "] answering an earlier "
                  "timed-out read; skipping it.  Stale lines remaining [" << m_n_stale_lines << "].");
    if ((!m_on_read_func.empty()) || m_watching)
    {
      read_until_newline();
    }
    return;
  }
  // else

  assert(!m_on_read_func.empty());

  FLOW_LOG_TRACE("Control_channel [" << *this << "]: Read [" << m_read_id << "] got line [" << line << "].");
  finish_read(Error_code(), line);
} // Control_channel::on_read_until()

void Control_channel::finish_read(const Error_code& err_code, const std::string& line)
{
  m_read_timer.cancel();

  // Clear state first: the handler may well start the next read.
  auto on_done_func = std::move(m_on_read_func);
  m_on_read_func = On_line_func();
  on_done_func(err_code, line);

  if (m_watching && (!m_reading) && (!m_hosed_err_code))
  {
    read_until_newline(); // The handler didn't start another read; keep watching.
  }
}

void Control_channel::async_write_line(util::String_view line, On_written_func&& on_done_func)
{
  using boost::asio::post;
  using boost::asio::async_write;
  using boost::asio::buffer;
  using flow::util::ostream_op_string;

  assert((line.find('\n') == util::String_view::npos) && "A line cannot contain a newline.");

  if (!m_on_written_func.empty())
  {
    FLOW_LOG_WARNING("Control_channel [" << *this << "]: async_write_line() while another is in progress.  "
                     "Refusing; the one in progress is unaffected.");
    post(m_peer_socket.get_executor(), [on_done_func = std::move(on_done_func)]()
    {
      on_done_func(error::Code::S_CONTROL_CHANNEL_BUSY);
    });
    return;
  }
  // else

  if (m_hosed_err_code)
  {
    FLOW_LOG_TRACE("Control_channel [" << *this << "]: async_write_line() on hosed channel.  Will report "
                   "[" << m_hosed_err_code << "] [" << m_hosed_err_code.message() << "].");
    post(m_peer_socket.get_executor(), [on_done_func = std::move(on_done_func), err_code = m_hosed_err_code]()
    {
      on_done_func(err_code);
    });
    return;
  }
  // else

  FLOW_LOG_TRACE("Control_channel [" << *this << "]: Writing line [" << line << "].");

  m_out_buf = ostream_op_string(line, '\n');
  m_on_written_func = std::move(on_done_func);

  // async_write() (unlike async_write_some()) completes only once every byte is out or there's an error.
  async_write(m_peer_socket, buffer(m_out_buf), [this](const Error_code& async_err_code, size_t)
  {
    auto sys_err_code = async_err_code;
    if (sys_err_code)
    {
      if (sys_err_code != boost::asio::error::operation_aborted)
      {
        hose(sys_err_code);
      }
      sys_err_code = m_hosed_err_code; // operation_aborted => close() which has set it.
      assert(sys_err_code);
    }
    else
    {
      FLOW_LOG_TRACE("Control_channel [" << *this << "]: Line written and flushed.");
    }

    auto on_done_func = std::move(m_on_written_func);
    m_on_written_func = On_written_func();
    on_done_func(sys_err_code);
  });
} // Control_channel::async_write_line()

void Control_channel::watch_for_close(On_hosed_func&& on_hosed_func)
{
  using boost::asio::post;

  assert((!m_watching) && "watch_for_close() may be called once.");
  m_watching = true;

  if (m_hosed_err_code)
  {
    if (m_peer_socket.is_open()) // Else close() did it; that's not reported.
    {
      post(m_peer_socket.get_executor(), [on_hosed_func = std::move(on_hosed_func), err_code = m_hosed_err_code]()
      {
        on_hosed_func(err_code);
      });
    }
    return;
  }
  // else

  FLOW_LOG_TRACE("Control_channel [" << *this << "]: Watching for closure between exchanges.");
  m_on_hosed_func = std::move(on_hosed_func);
  read_until_newline();
}

void Control_channel::close()
{
  if (!m_peer_socket.is_open())
  {
    return;
  }
  // else

  FLOW_LOG_TRACE("Control_channel [" << *this << "]: Closing socket; outstanding operations (if any) will be "
                 "aborted.");
  if (!m_hosed_err_code)
  {
    m_hosed_err_code = error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER;
  }

  m_read_timer.cancel();

  Error_code sys_err_code;
  m_peer_socket.close(sys_err_code);
  if (sys_err_code)
  {
    FLOW_LOG_WARNING("Control_channel [" << *this << "]: Closing socket failed; ignoring (closing is best-effort).  "
                     "Details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
  }
} // Control_channel::close()

void Control_channel::hose(const Error_code& err_code)
{
  assert(err_code);

  if (m_hosed_err_code)
  {
    return;
  }
  // else

  m_hosed_err_code = err_code;
  FLOW_LOG_WARNING("Control_channel [" << *this << "]: Channel is now hosed; all further operations shall fail.  "
                   "Error: [" << m_hosed_err_code << "] [" << m_hosed_err_code.message() << "].");

  if (!m_on_hosed_func.empty())
  {
    // Posted: we may be deep inside some other handler.
    boost::asio::post(m_peer_socket.get_executor(),
                      [on_hosed_func = std::move(m_on_hosed_func), err_code = m_hosed_err_code]()
    {
      on_hosed_func(err_code);
    });
    m_on_hosed_func = On_hosed_func();
  }
}

bool Control_channel::hosed() const
{
  return bool(m_hosed_err_code);
}

Control_channel::Endpoint Control_channel::local_endpoint(Error_code* err_code) const
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Endpoint, Control_channel::local_endpoint, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  return m_peer_socket.local_endpoint(*err_code);
}

Control_channel::Endpoint Control_channel::remote_endpoint(Error_code* err_code) const
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Endpoint, Control_channel::remote_endpoint, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  return m_peer_socket.remote_endpoint(*err_code);
}

size_t Control_channel::n_stale_lines() const
{
  return m_n_stale_lines;
}

const std::string& Control_channel::nickname() const
{
  return m_nickname;
}

std::ostream& operator<<(std::ostream& os, const Control_channel& val)
{
  return os << '[' << val.nickname() << "]@" << static_cast<const void*>(&val);
}

} // namespace relay::transport
