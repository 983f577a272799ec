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

#include <relay/common.hpp>
#include <flow/log/simple_ostream_logger.hpp>
#include <boost/program_options.hpp>
#include <boost/asio.hpp>
#include <iostream>

/* Interactive client for echo_daemon, through the relay: each line typed is sent; the echo is printed.  EOF on
 * stdin exits. */
int main(int argc, char const * const * argv)
{
  using relay::Log_component;
  using relay::Error_code;
  using flow::log::Simple_ostream_logger;
  using flow::log::Config;
  using flow::log::Sev;
  using flow::Flow_log_component;
  using boost::asio::ip::tcp;
  namespace po = boost::program_options;

  using std::string;
  using std::exception;

  const int BAD_EXIT = 1;

  string host;
  string port;

  po::options_description cmd_line_opts("echo_client options");
  cmd_line_opts.add_options()
    ("help,h", "Print this help and exit.")
    ("host", po::value<string>(&host)->required(), "Host (the service's advertised address).")
    ("port", po::value<string>(&port)->required(), "Port (the service's advertised address).");
  po::positional_options_description positional_opts;
  positional_opts.add("host", 1).add("port", 1);

  try
  {
    po::variables_map vars;
    po::store(po::command_line_parser(argc, argv).options(cmd_line_opts).positional(positional_opts).run(), vars);
    if (vars.count("help") != 0)
    {
      std::cout << "usage: echo_client HOST PORT\n" << cmd_line_opts << '\n';
      return 0;
    }
    // else
    po::notify(vars);
  }
  catch (const po::error& exc)
  {
    std::cerr << exc.what() << "\n\nusage: echo_client HOST PORT\n" << cmd_line_opts << '\n';
    return BAD_EXIT;
  }

  // Only trouble goes to the console; the conversation is on stdout.
  Config log_config(Sev::S_WARNING);
  log_config.init_component_to_union_idx_mapping<Flow_log_component>(1000, 999);
  log_config.init_component_names<Flow_log_component>(flow::S_FLOW_LOG_COMPONENT_NAME_MAP, false, "flow-");
  log_config.init_component_to_union_idx_mapping<Log_component>
    (2000, Config::standard_component_payload_enum_sparse_length<Log_component>());
  log_config.init_component_names<Log_component>(relay::S_RELAY_LOG_COMPONENT_NAME_MAP, false, "echo_client-");

  Simple_ostream_logger std_logger(&log_config, std::cerr, std::cerr);
  FLOW_LOG_SET_CONTEXT(&std_logger, Log_component::S_UNCAT);

  try
  {
    boost::asio::io_context task_engine;
    tcp::socket sock(task_engine);
    tcp::resolver resolver(task_engine);
    boost::asio::connect(sock, resolver.resolve(host, port)); // Throws on error.
    std::cout << "Connected to [" << sock.remote_endpoint() << "].\n";

    boost::asio::streambuf buf;
    std::istream echo_is(&buf);
    string line;
    while (true)
    {
      std::cout << "Enter an expression: " << std::flush;
      if (!std::getline(std::cin, line))
      {
        break;
      }
      // else

      boost::asio::write(sock, boost::asio::buffer(line + '\n'));

      Error_code sys_err_code;
      boost::asio::read_until(sock, buf, '\n', sys_err_code);
      if (sys_err_code)
      {
        FLOW_LOG_WARNING("Connection ended before the echo arrived: [" << sys_err_code << "] "
                         "[" << sys_err_code.message() << "].");
        return BAD_EXIT;
      }
      // else

      std::getline(echo_is, line);
      std::cout << line << '\n';
    }
  } // try
  catch (const exception& exc)
  {
    FLOW_LOG_WARNING("Caught exception: [" << exc.what() << "].");
    return BAD_EXIT;
  }

  return 0;
} // main()
