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
#include "relay/transport/data_relay.hpp"
#include "relay/transport/error.hpp"
#include <flow/error/error.hpp>
#include <flow/common.hpp>

namespace relay::transport
{

// Data_relay implementations.

Data_relay::Data_relay(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                       Peer_socket&& client_socket, Peer_socket&& daemon_socket, On_done_func&& on_done_func) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_nickname(nickname_str),
  m_client_socket(std::move(client_socket)),
  m_daemon_socket(std::move(daemon_socket)),
  m_to_daemon{ "client=>daemon", &m_client_socket, &m_daemon_socket, {}, 0, false },
  m_to_client{ "daemon=>client", &m_daemon_socket, &m_client_socket, {}, 0, false },
  m_on_done_func(std::move(on_done_func)),
  m_finished(false)
{
  FLOW_LOG_TRACE("Data_relay [" << *this << "]: Created.");
}

Data_relay::~Data_relay()
{
  Error_code dummy; // finish() normally closed them; if not, it's too late to report anything.
  m_client_socket.close(dummy);
  m_daemon_socket.close(dummy);
  FLOW_LOG_TRACE("Data_relay [" << *this << "]: Destroyed.");
}

void Data_relay::start()
{
  FLOW_LOG_INFO("Data_relay [" << *this << "]: Relaying bytes in both directions.");
  pump(&m_to_daemon);
  pump(&m_to_client);
}

void Data_relay::pump(Direction* dir)
{
  using boost::asio::buffer;

  dir->m_from->async_read_some(buffer(dir->m_buf),
                               [this, self = shared_from_this(), dir](const Error_code& async_err_code, size_t n_rcvd)
  {
    on_read_some(dir, async_err_code, n_rcvd);
  });
}

void Data_relay::on_read_some(Direction* dir, const Error_code& sys_err_code, size_t n_rcvd)
{
  using boost::asio::async_write;
  using boost::asio::buffer;

  if (m_finished)
  {
    return; // Closed (and reported) already; probably this is the resulting operation_aborted.
  }
  // else

  if (sys_err_code == boost::asio::error::eof)
  {
    FLOW_LOG_TRACE("Data_relay [" << *this << "]: [" << dir->m_name << "]: End-of-stream after "
                   "[" << dir->m_n_bytes << "] bytes; forwarding it as shutdown-send.");

    Error_code shutdown_err_code;
    dir->m_to->shutdown(Peer_socket::shutdown_send, shutdown_err_code);
    if (shutdown_err_code)
    {
      finish(shutdown_err_code);
      return;
    }
    // else

    dir->m_done = true;
    if (m_to_daemon.m_done && m_to_client.m_done)
    {
      finish(Error_code());
    }
    return;
  }
  // else

  if (sys_err_code)
  {
    finish(sys_err_code);
    return;
  }
  // else

  async_write(*dir->m_to, buffer(dir->m_buf.data(), n_rcvd),
              [this, self = shared_from_this(), dir](const Error_code& async_err_code, size_t n_sent)
  {
    if (m_finished)
    {
      return;
    }
    // else

    if (async_err_code)
    {
      finish(async_err_code);
      return;
    }
    // else

    dir->m_n_bytes += n_sent;
    pump(dir);
  });
} // Data_relay::on_read_some()

void Data_relay::close()
{
  if (m_finished)
  {
    return;
  }
  // else

  FLOW_LOG_INFO("Data_relay [" << *this << "]: Closing by request.");
  finish(error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER);
}

void Data_relay::finish(const Error_code& err_code)
{
  if (m_finished)
  {
    return;
  }
  // else
  m_finished = true;

  if (err_code)
  {
    // A client or daemon going away abruptly is business as usual for a relay; hence not WARNING.
    FLOW_LOG_INFO("Data_relay [" << *this << "]: Finished with error [" << err_code << "] "
                  "[" << err_code.message() << "]; bytes relayed client=>daemon [" << m_to_daemon.m_n_bytes << "], "
                  "daemon=>client [" << m_to_client.m_n_bytes << "].");
  }
  else
  {
    FLOW_LOG_INFO("Data_relay [" << *this << "]: Finished gracefully; bytes relayed "
                  "client=>daemon [" << m_to_daemon.m_n_bytes << "], "
                  "daemon=>client [" << m_to_client.m_n_bytes << "].");
  }

  for (auto peer_socket : { &m_client_socket, &m_daemon_socket })
  {
    Error_code sys_err_code;
    peer_socket->close(sys_err_code);
    if (sys_err_code)
    {
      FLOW_LOG_WARNING("Data_relay [" << *this << "]: Closing a socket failed; ignoring (closing is best-effort).  "
                       "Details follow.");
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    }
  }

  auto on_done_func = std::move(m_on_done_func);
  m_on_done_func = On_done_func();
  if (!on_done_func.empty())
  {
    on_done_func(err_code);
  }
} // Data_relay::finish()

bool Data_relay::finished() const
{
  return m_finished;
}

uint64_t Data_relay::n_bytes_to_daemon() const
{
  return m_to_daemon.m_n_bytes;
}

uint64_t Data_relay::n_bytes_to_client() const
{
  return m_to_client.m_n_bytes;
}

const std::string& Data_relay::nickname() const
{
  return m_nickname;
}

std::ostream& operator<<(std::ostream& os, const Data_relay& val)
{
  return os << '[' << val.nickname() << "]@" << static_cast<const void*>(&val);
}

// Data_relay_engine implementations.

Data_relay_engine::Data_relay_engine(flow::log::Logger* logger_ptr, util::String_view nickname_str) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_nickname(nickname_str),
  m_worker(get_logger(), flow::util::ostream_op_string("DRE-", m_nickname)),
  m_stopping(false),
  m_n_active(0),
  m_n_launched(0)
{
  m_worker.start();
  FLOW_LOG_INFO("Data_relay_engine [" << *this << "]: Worker thread started; ready for relays.");
}

Data_relay_engine::~Data_relay_engine()
{
  using flow::async::Single_thread_task_loop;
  using flow::async::Synchronicity;
  using flow::util::ostream_op_string;

  FLOW_LOG_INFO("Data_relay_engine [" << *this << "]: Shutting down.  "
                "Closing [" << m_n_active.load() << "] active relays; then worker thread will be joined.");

  m_worker.post([this]()
  {
    // We are in thread W.
    m_stopping = true;

    // close() => completion handler => erases from m_relays; so iterate over a copy (which also keeps them alive).
    const auto relays = m_relays;
    for (const auto& id_and_relay : relays)
    {
      id_and_relay.second->close();
    }
    assert(m_relays.empty());
  }, Synchronicity::S_ASYNC_AND_AWAIT_CONCURRENT_COMPLETION);

  m_worker.stop();
  // Thread W is (synchronously!) no more.

  /* Queued handlers (the aborted reads/writes of the relays just closed; any launches that came too late) still hold
   * ref-counted pointers to the relays.  Run them from another thread so all of that is released before the
   * Task_engine is.  They will find m_finished or m_stopping and do nothing else of consequence. */
  Single_thread_task_loop one_thread(get_logger(), ostream_op_string("DREDeinit-", m_nickname));
  one_thread.start([&]()
  {
    const auto task_engine = m_worker.task_engine();
    task_engine->restart();
    const auto count = task_engine->poll();
    if (count != 0)
    {
      FLOW_LOG_TRACE("Data_relay_engine [" << *this << "]: "
                     "In transient finisher thread: Ran [" << count << "] internal handlers after all.");
    }
    task_engine->stop();
  });
  // Here thread exits/joins synchronously.
} // Data_relay_engine::~Data_relay_engine()

void Data_relay_engine::launch(Data_connection_pair&& pair, On_done_func&& on_done_func)
{
  using asio_tcp_stream_socket::Peer_socket;
  using asio_tcp_stream_socket::adopt_native_handle;
  using flow::util::ostream_op_string;

  // We are in thread U (any).

  const uint64_t id = ++m_n_launched;

  FLOW_LOG_TRACE("Data_relay_engine [" << *this << "]: Launch [" << id << "] of relay for pair [" << pair << "] "
                 "requested; posting to worker thread.");

  m_worker.post([this, id, pair = std::move(pair), on_done_func = std::move(on_done_func)]() mutable
  {
    // We are in thread W.

    if (m_stopping)
    {
      FLOW_LOG_INFO("Data_relay_engine [" << *this << "]: Launch [" << id << "] arrived while shutting down; "
                    "closing pair [" << pair << "] instead.");
      util::close_native_handle(get_logger(), &pair.m_client);
      util::close_native_handle(get_logger(), &pair.m_daemon);
      on_done_func(error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER);
      return;
    }
    // else

    const auto task_engine = m_worker.task_engine();
    Peer_socket client_socket(*task_engine);
    Peer_socket daemon_socket(*task_engine);

    // adopt_native_handle() closes the handle on failure; so the pair is all-closed after any failure below.
    Error_code err_code;
    adopt_native_handle(get_logger(), &client_socket, std::move(pair.m_client), &err_code);
    if (err_code)
    {
      util::close_native_handle(get_logger(), &pair.m_daemon);
    }
    else
    {
      adopt_native_handle(get_logger(), &daemon_socket, std::move(pair.m_daemon), &err_code);
    }

    if (err_code)
    {
      FLOW_LOG_WARNING("Data_relay_engine [" << *this << "]: Launch [" << id << "] failed: could not take over "
                       "the sockets; they are closed.  Error: [" << err_code << "] [" << err_code.message() << "].");
      Error_code dummy;
      client_socket.close(dummy);
      daemon_socket.close(dummy);
      on_done_func(err_code);
      return;
    }
    // else

    ++m_n_active;
    auto relay = std::make_shared<Data_relay>
                   (get_logger(), ostream_op_string(m_nickname, '#', id),
                    std::move(client_socket), std::move(daemon_socket),
                    [this, id, on_done_func = std::move(on_done_func)](const Error_code& relay_err_code)
    {
      // We are in thread W (or dtor's transient thread, with W stopped).
      --m_n_active;
      on_done_func(relay_err_code);
      /* The relay is inside its own finish() right now, but our caller always holds a ref to it (async handler's
       * `self`, or dtor's copy of m_relays); so this does not destroy it under our feet. */
      m_relays.erase(id);
    });

    m_relays.emplace(id, relay);
    relay->start();
  }); // m_worker.post()
} // Data_relay_engine::launch()

size_t Data_relay_engine::n_active() const
{
  return m_n_active;
}

uint64_t Data_relay_engine::n_launched() const
{
  return m_n_launched;
}

const std::string& Data_relay_engine::nickname() const
{
  return m_nickname;
}

std::ostream& operator<<(std::ostream& os, const Data_relay_engine& val)
{
  return os << '[' << val.nickname() << "]@" << static_cast<const void*>(&val);
}

std::ostream& operator<<(std::ostream& os, const Data_connection_pair& val)
{
  return os << "client" << val.m_client << "/daemon" << val.m_daemon;
}

} // namespace relay::transport
