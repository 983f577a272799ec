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

#include <relay/transport/asio_tcp_stream_socket_fwd.hpp>
#include <relay/common.hpp>
#include <flow/log/simple_ostream_logger.hpp>
#include <boost/program_options.hpp>
#include <boost/asio.hpp>
#include <boost/thread/thread.hpp>
#include <iostream>
#include <sstream>

namespace
{

using relay::transport::asio_tcp_stream_socket::Peer_socket;
using relay::Error_code;
using std::string;

/* Sample backend.  It is never reached directly: it registers with the relay over a control connection; and for
 * every client the relay signals, it connects back and echoes each line the client sends. */

/// Connects `sock` to `host:port`, resolving `host` if needed.
void connect_to(Peer_socket* sock, const string& host, const string& port)
{
  boost::asio::ip::tcp::resolver resolver(sock->get_executor());
  boost::asio::connect(*sock, resolver.resolve(host, port)); // Throws on error.
}

/// Reads through `\n` into `*line` (sans `\n` and any `\r`); false on end-of-stream or error.
bool read_line(Peer_socket* sock, boost::asio::streambuf* buf, string* line, Error_code* sys_err_code)
{
  boost::asio::read_until(*sock, *buf, '\n', *sys_err_code);
  if (*sys_err_code)
  {
    return false;
  }
  // else

  std::istream is(buf);
  std::getline(is, *line);
  if ((!line->empty()) && (line->back() == '\r'))
  {
    line->pop_back();
  }
  return true;
}

/// Thread body: serves one relayed client.
void echo_loop(flow::log::Logger* logger_ptr, string callback_address)
{
  FLOW_LOG_SET_CONTEXT(logger_ptr, relay::Log_component::S_UNCAT);

  try
  {
    string host;
    uint16_t port;
    relay::transport::asio_tcp_stream_socket::parse_host_port(callback_address, &host, &port); // Throws on error.

    boost::asio::io_context task_engine;
    Peer_socket sock(task_engine);
    connect_to(&sock, host, std::to_string(port));
    FLOW_LOG_INFO("Connected back to [" << callback_address << "]; echoing.");

    boost::asio::streambuf buf;
    string line;
    Error_code sys_err_code;
    size_t n_lines = 0;
    while (read_line(&sock, &buf, &line, &sys_err_code))
    {
      boost::asio::write(sock, boost::asio::buffer(line + '\n')); // Throws on error.
      ++n_lines;
    }
    FLOW_LOG_INFO("Client at [" << callback_address << "] done after [" << n_lines << "] lines: "
                  "[" << sys_err_code << "] [" << sys_err_code.message() << "].");
  }
  catch (const std::exception& exc)
  {
    FLOW_LOG_WARNING("Serving [" << callback_address << "] failed: [" << exc.what() << "].");
  }
} // echo_loop()

} // namespace (anon)

int main(int argc, char const * const * argv)
{
  using relay::Log_component;
  using flow::log::Simple_ostream_logger;
  using flow::log::Config;
  using flow::log::Sev;
  using flow::Flow_log_component;
  namespace po = boost::program_options;

  using std::exception;

  const int BAD_EXIT = 1;

  string relay_host;
  string relay_port;
  string service_name;
  string log_level;

  po::options_description cmd_line_opts("echo_daemon options");
  cmd_line_opts.add_options()
    ("help,h", "Print this help and exit.")
    ("relay-host", po::value<string>(&relay_host)->default_value("127.0.0.1"), "Relay host.")
    ("relay-port", po::value<string>(&relay_port)->required(), "Relay port for daemons.")
    ("service", po::value<string>(&service_name)->default_value("echo"), "Service name to register.")
    ("log-level", po::value<string>(&log_level)->default_value("INFO"), "Log verbosity.");

  try
  {
    po::variables_map vars;
    po::store(po::parse_command_line(argc, argv, cmd_line_opts), vars);
    if (vars.count("help") != 0)
    {
      std::cout << cmd_line_opts << '\n';
      return 0;
    }
    // else
    po::notify(vars);
  }
  catch (const po::error& exc)
  {
    std::cerr << exc.what() << "\n\n" << cmd_line_opts << '\n';
    return BAD_EXIT;
  }

  Sev sev = Sev::S_INFO;
  std::istringstream sev_is(log_level);
  sev_is >> sev;
  if (!sev_is)
  {
    std::cerr << "Unknown log level [" << log_level << "].\n";
    return BAD_EXIT;
  }
  // else

  Config log_config;
  log_config.init_component_to_union_idx_mapping<Flow_log_component>(1000, 999);
  log_config.init_component_names<Flow_log_component>(flow::S_FLOW_LOG_COMPONENT_NAME_MAP, false, "flow-");
  log_config.init_component_to_union_idx_mapping<Log_component>
    (2000, Config::standard_component_payload_enum_sparse_length<Log_component>());
  log_config.init_component_names<Log_component>(relay::S_RELAY_LOG_COMPONENT_NAME_MAP, false, "echo_daemon-");
  log_config.configure_default_verbosity(sev, true);

  Simple_ostream_logger std_logger(&log_config);
  FLOW_LOG_SET_CONTEXT(&std_logger, Log_component::S_UNCAT);

  boost::thread_group echo_threads; // They log via std_logger; so they are joined before it goes away.
  int exit_code = 0;
  try
  {
    boost::asio::io_context task_engine;
    Peer_socket ctl_sock(task_engine);
    connect_to(&ctl_sock, relay_host, relay_port);

    boost::asio::write(ctl_sock, boost::asio::buffer(service_name + '\n'));

    boost::asio::streambuf buf;
    string line;
    Error_code sys_err_code;
    if (!read_line(&ctl_sock, &buf, &line, &sys_err_code))
    {
      FLOW_LOG_WARNING("Relay closed the control connection before advertising our address: "
                       "[" << sys_err_code << "] [" << sys_err_code.message() << "].");
      return BAD_EXIT; // No echo threads yet.
    }
    // else

    FLOW_LOG_INFO("Service [" << service_name << "] is reachable by clients at [" << line << "].");
    std::cout << line << std::endl;

    // Each line from now on: a client awaits; ack; connect back there.
    while (read_line(&ctl_sock, &buf, &line, &sys_err_code))
    {
      FLOW_LOG_INFO("Relay signals a client; will connect back to [" << line << "].");
      boost::asio::write(ctl_sock, boost::asio::buffer(string("ack\n")));
      echo_threads.create_thread([&std_logger, line]() { echo_loop(&std_logger, line); });
    }

    FLOW_LOG_INFO("Relay closed the control connection: [" << sys_err_code << "] [" << sys_err_code.message() << "].  "
                  "Exiting once current clients are done.");
  } // try
  catch (const exception& exc)
  {
    FLOW_LOG_WARNING("Caught exception: [" << exc.what() << "].  Exiting once current clients are done.");
    exit_code = BAD_EXIT;
  }

  echo_threads.join_all();
  return exit_code;
} // main()
