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

#include <relay/session/relay_server.hpp>
#include <flow/log/simple_ostream_logger.hpp>
#include <flow/log/async_file_logger.hpp>
#include <boost/program_options.hpp>
#include <boost/asio.hpp>
#include <boost/move/make_unique.hpp>
#include <iostream>
#include <sstream>

/* The relay process: listens for daemons; registers a service for each; relays their clients.  Runs until SIGINT or
 * SIGTERM. */
int main(int argc, char const * const * argv)
{
  using relay::session::Relay_server;
  using relay::Log_component;
  using flow::log::Simple_ostream_logger;
  using flow::log::Async_file_logger;
  using flow::log::Config;
  using flow::log::Logger;
  using flow::log::Sev;
  using flow::Flow_log_component;
  using boost::movelib::unique_ptr;
  using boost::movelib::make_unique;
  using boost::chrono::milliseconds;
  namespace po = boost::program_options;

  using std::string;
  using std::exception;

  const int BAD_EXIT = 1;

  Relay_server::Options opts;
  unsigned int registration_timeout_ms = 0;
  unsigned int ack_timeout_ms = 0;
  unsigned int connect_timeout_ms = 0;
  string log_level;
  string log_file;

  po::options_description cmd_line_opts("relay_server options");
  cmd_line_opts.add_options()
    ("help,h", "Print this help and exit.")
    ("listen-host", po::value<string>(&opts.m_listen_host)->default_value(opts.m_listen_host),
     "Numeric IP address on which to listen for daemons.")
    ("port,p", po::value<uint16_t>(&opts.m_listen_port)->default_value(opts.m_listen_port),
     "Port on which to listen for daemons (0 = ephemeral; it is logged).")
    ("advertised-host", po::value<string>(&opts.m_service_opts.m_advertised_host),
     "Host to advertise to daemons in `host:port` lines (default: the relay's address on each daemon's connection).")
    ("registration-timeout-ms", po::value<unsigned int>(&registration_timeout_ms)->default_value(0),
     "Max wait for a daemon's service name (0 = forever).")
    ("ack-timeout-ms", po::value<unsigned int>(&ack_timeout_ms)->default_value(0),
     "Max wait for a daemon's per-request acknowledgment (0 = forever).")
    ("connect-timeout-ms", po::value<unsigned int>(&connect_timeout_ms)->default_value(0),
     "Max wait for a daemon to connect back after acknowledging (0 = forever).")
    ("max-concurrent", po::value<size_t>(&opts.m_service_opts.m_max_concurrent_requests)->default_value(0),
     "Max relays in flight per service before accepting pauses (0 = unlimited).")
    ("log-level", po::value<string>(&log_level)->default_value("INFO"),
     "Log verbosity: NONE, FATAL, ERROR, WARNING, INFO, DEBUG, TRACE, DATA.")
    ("log-file", po::value<string>(&log_file),
     "Log to this file instead of the console.");

  try
  {
    po::variables_map vars;
    po::store(po::parse_command_line(argc, argv, cmd_line_opts), vars);
    po::notify(vars);
    if (vars.count("help") != 0)
    {
      std::cout << cmd_line_opts << '\n';
      return 0;
    }
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
  log_config.init_component_names<Log_component>(relay::S_RELAY_LOG_COMPONENT_NAME_MAP, false, "relay-");
  log_config.configure_default_verbosity(sev, true);

  Simple_ostream_logger std_logger(&log_config);
  unique_ptr<Async_file_logger> file_logger;
  if (!log_file.empty())
  {
    file_logger = make_unique<Async_file_logger>(&std_logger, &log_config, log_file,
                                                 false /* No rotation. */);
  }
  Logger* const logger_ptr = file_logger ? static_cast<Logger*>(file_logger.get()) : &std_logger;
  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_UNCAT);

  opts.m_service_opts.m_registration_timeout = milliseconds(registration_timeout_ms);
  opts.m_service_opts.m_ack_timeout = milliseconds(ack_timeout_ms);
  opts.m_service_opts.m_daemon_connect_timeout = milliseconds(connect_timeout_ms);

  try
  {
    Relay_server server(logger_ptr, opts); // Throws on error.

    FLOW_LOG_INFO("Relay ready: daemons may connect to port [" << server.local_port() << "].  "
                  "SIGINT or SIGTERM to exit.");

    // Block until asked to exit; the server runs in its own threads meanwhile.
    boost::asio::io_context signal_engine;
    boost::asio::signal_set signals(signal_engine, SIGINT, SIGTERM);
    signals.async_wait([&](const relay::Error_code& err_code, int sig_number)
    {
      if (!err_code)
      {
        FLOW_LOG_INFO("Caught signal [" << sig_number << "]; [" << server.n_services() << "] services are "
                      "registered.  Exiting.");
      }
    });
    signal_engine.run();
  } // try
  catch (const exception& exc)
  {
    FLOW_LOG_WARNING("Caught exception: [" << exc.what() << "].");
    return BAD_EXIT;
  }

  return 0;
} // main()
