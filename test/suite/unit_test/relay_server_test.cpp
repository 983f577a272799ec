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

#include "relay/session/relay_server.hpp"
#include "relay/transport/error.hpp"
#include "relay/test/test_common_util.hpp"
#include "relay/test/test_logger.hpp"
#include <gtest/gtest.h>
#include <flow/error/error.hpp>
#include <boost/move/make_unique.hpp>
#include <boost/thread/thread.hpp>
#include <algorithm>

namespace relay::session::test
{

using relay::test::Test_logger;
using relay::test::Blocking_peer;
using relay::test::Test_echo_daemon;
using relay::test::wait_until;
using relay::test::break_listener;
using transport::asio_tcp_stream_socket::parse_host_port;
namespace error = transport::error;
using boost::chrono::milliseconds;
using std::string;
using std::vector;

namespace
{

Relay_server::Options loopback_opts()
{
  Relay_server::Options opts;
  opts.m_listen_host = "127.0.0.1";
  return opts;
}

} // namespace (anon)

TEST(Relay_server, End_to_end)
{
  Test_logger logger;
  Error_code err_code;
  Relay_server server(&logger, loopback_opts(), &err_code);
  ASSERT_FALSE(err_code);
  ASSERT_NE(server.local_port(), 0);

  Test_echo_daemon alpha(&logger, "alpha");
  Test_echo_daemon beta(&logger, "beta");
  string alpha_address;
  string beta_address;
  ASSERT_FALSE(alpha.start("127.0.0.1", server.local_port(), &alpha_address));
  ASSERT_FALSE(beta.start("127.0.0.1", server.local_port(), &beta_address));
  EXPECT_NE(alpha_address, beta_address);

  ASSERT_TRUE(wait_until([&]() { return server.n_services() == 2; }));
  auto names = server.service_names();
  std::sort(names.begin(), names.end());
  EXPECT_EQ(names, (vector<string>{ "alpha", "beta" }));

  // Two clients of alpha at once; one of beta.
  Blocking_peer client1(&logger);
  Blocking_peer client2(&logger);
  Blocking_peer client3(&logger);
  ASSERT_FALSE(client1.connect(alpha_address));
  ASSERT_FALSE(client2.connect(alpha_address));
  ASSERT_FALSE(client3.connect(beta_address));

  string line;
  ASSERT_FALSE(client2.write_line("2 + 2"));
  ASSERT_FALSE(client1.write_line("1 + 1"));
  ASSERT_FALSE(client3.write_line("3 + 3"));
  EXPECT_FALSE(client1.read_line(&line));
  EXPECT_EQ(line, "1 + 1");
  EXPECT_FALSE(client2.read_line(&line));
  EXPECT_EQ(line, "2 + 2");
  EXPECT_FALSE(client3.read_line(&line));
  EXPECT_EQ(line, "3 + 3");

  // And again on the same connection.
  ASSERT_FALSE(client1.write_line("again"));
  EXPECT_FALSE(client1.read_line(&line));
  EXPECT_EQ(line, "again");

  EXPECT_EQ(alpha.n_requests(), 2u);
  EXPECT_EQ(beta.n_requests(), 1u);
  EXPECT_EQ(server.n_relays_active(), 3u);

  client1.close();
  client2.close();
  client3.close();
  EXPECT_TRUE(wait_until([&]() { return server.n_relays_active() == 0; }));
  EXPECT_EQ(server.n_services(), 2u);
}

TEST(Relay_server, Failed_registrations_discarded)
{
  Test_logger logger;
  auto opts = loopback_opts();
  opts.m_service_opts.m_registration_timeout = milliseconds(300);
  Relay_server server(&logger, opts);

  // One daemon says nothing; one sends an empty name; meanwhile a good one registers.
  Blocking_peer silent(&logger);
  Blocking_peer nameless(&logger);
  ASSERT_FALSE(silent.connect("127.0.0.1", server.local_port()));
  ASSERT_FALSE(nameless.connect("127.0.0.1", server.local_port()));
  ASSERT_FALSE(nameless.write_line(""));

  Test_echo_daemon gamma(&logger, "gamma");
  string gamma_address;
  ASSERT_FALSE(gamma.start("127.0.0.1", server.local_port(), &gamma_address));

  EXPECT_FALSE(nameless.await_close()); // Closed without an advertised address.
  EXPECT_FALSE(silent.await_close());

  ASSERT_TRUE(wait_until([&]() { return server.n_services() == 1; }));
  EXPECT_EQ(server.service_names(), vector<string>{ "gamma" });

  // Still serving.
  Blocking_peer client(&logger);
  ASSERT_FALSE(client.connect(gamma_address));
  string line;
  ASSERT_FALSE(client.write_line("hi"));
  EXPECT_FALSE(client.read_line(&line));
  EXPECT_EQ(line, "hi");
}

TEST(Relay_server, Invalid_listen_host)
{
  Test_logger logger;
  auto opts = loopback_opts();
  opts.m_listen_host = "not an address";

  Error_code err_code;
  Relay_server server(&logger, opts, &err_code);
  EXPECT_EQ(err_code, error::Code::S_INVALID_ARGUMENT);

  EXPECT_THROW({ Relay_server throwing_server(&logger, opts); }, flow::error::Runtime_error);
}

TEST(Relay_server, Port_in_use)
{
  Test_logger logger;
  Relay_server server1(&logger, loopback_opts());

  auto opts = loopback_opts();
  opts.m_listen_port = server1.local_port();
  Error_code err_code;
  Relay_server server2(&logger, opts, &err_code);
  EXPECT_EQ(err_code, boost::asio::error::address_in_use);
}

TEST(Relay_server, Destruction_while_daemon_registering)
{
  Test_logger logger;
  auto server = boost::movelib::make_unique<Relay_server>(&logger, loopback_opts());

  Blocking_peer silent(&logger);
  ASSERT_FALSE(silent.connect("127.0.0.1", server->local_port()));
  boost::this_thread::sleep_for(boost::chrono::milliseconds(100));

  server.reset(); // Must not wait for a name that never comes.
  EXPECT_FALSE(silent.await_close());
}

TEST(Relay_server, Destruction_with_relays_active)
{
  Test_logger logger;
  auto server = boost::movelib::make_unique<Relay_server>(&logger, loopback_opts());

  Test_echo_daemon daemon(&logger, "delta");
  string address;
  ASSERT_FALSE(daemon.start("127.0.0.1", server->local_port(), &address));

  Blocking_peer client(&logger);
  ASSERT_FALSE(client.connect(address));
  string line;
  ASSERT_FALSE(client.write_line("x"));
  EXPECT_FALSE(client.read_line(&line));
  EXPECT_EQ(server->n_relays_active(), 1u);

  server.reset();
  EXPECT_FALSE(client.await_close());
}

TEST(Relay_server, Advertises_address_daemon_used)
{
  Test_logger logger;
  auto opts = loopback_opts();
  opts.m_listen_host = "0.0.0.0";
  Relay_server server(&logger, opts);

  // The daemon's own end is 127.0.0.1; the relay's end (what it advertises) is what the daemon dialed.
  Test_echo_daemon daemon(&logger, "lambda");
  string address;
  ASSERT_FALSE(daemon.start("127.0.0.2", server.local_port(), &address));

  string host;
  uint16_t public_port = 0;
  parse_host_port(address, &host, &public_port);
  EXPECT_EQ(host, "127.0.0.2"); // An IP address, never a host name.
  EXPECT_NE(public_port, 0);

  Blocking_peer client(&logger);
  ASSERT_FALSE(client.connect(address));
  string line;
  ASSERT_FALSE(client.write_line("over there"));
  EXPECT_FALSE(client.read_line(&line));
  EXPECT_EQ(line, "over there");
}

TEST(Relay_server, Daemon_disconnect_reaps_service)
{
  Test_logger logger;
  Relay_server server(&logger, loopback_opts());

  auto daemon = boost::movelib::make_unique<Test_echo_daemon>(&logger, "epsilon");
  Test_echo_daemon other(&logger, "zeta");
  string address;
  string other_address;
  ASSERT_FALSE(daemon->start("127.0.0.1", server.local_port(), &address));
  ASSERT_FALSE(other.start("127.0.0.1", server.local_port(), &other_address));
  ASSERT_TRUE(wait_until([&]() { return server.n_services() == 2; }));

  daemon.reset(); // Hangs up its control channel; nothing else is going on.
  ASSERT_TRUE(wait_until([&]() { return server.n_services() == 1; }));
  EXPECT_EQ(server.service_names(), vector<string>{ "zeta" });

  Blocking_peer client(&logger);
  EXPECT_TRUE(client.connect(address)); // Public port closed along with it.

  // The other one is unaffected.
  Blocking_peer other_client(&logger);
  ASSERT_FALSE(other_client.connect(other_address));
  string line;
  ASSERT_FALSE(other_client.write_line("still here"));
  EXPECT_FALSE(other_client.read_line(&line));
  EXPECT_EQ(line, "still here");
}

TEST(Relay_server, Daemon_disconnect_while_registering)
{
  Test_logger logger;
  Relay_server server(&logger, loopback_opts());

  // Registers, then hangs up before reading the advertised address.
  Blocking_peer daemon(&logger);
  ASSERT_FALSE(daemon.connect("127.0.0.1", server.local_port()));
  ASSERT_FALSE(daemon.write_line("eta"));
  daemon.close();

  // Whichever way that races with registration, nothing stays behind.
  boost::this_thread::sleep_for(milliseconds(300));
  EXPECT_TRUE(wait_until([&]() { return server.n_services() == 0; }));

  Test_echo_daemon theta(&logger, "theta");
  string address;
  ASSERT_FALSE(theta.start("127.0.0.1", server.local_port(), &address));
  ASSERT_TRUE(wait_until([&]() { return server.n_services() == 1; }));
  EXPECT_EQ(server.service_names(), vector<string>{ "theta" });
}

TEST(Relay_server, Service_reaped_after_listener_failure)
{
  Test_logger logger;
  Relay_server server(&logger, loopback_opts());

  Test_echo_daemon daemon(&logger, "iota");
  string address;
  ASSERT_FALSE(daemon.start("127.0.0.1", server.local_port(), &address));
  ASSERT_TRUE(wait_until([&]() { return server.n_services() == 1; }));

  string host;
  uint16_t public_port = 0;
  Error_code err_code;
  parse_host_port(address, &host, &public_port, &err_code);
  ASSERT_FALSE(err_code);

  ASSERT_TRUE(break_listener(public_port));
  ASSERT_TRUE(wait_until([&]() { return server.n_services() == 0; }));

  // The daemon listener is a different socket; it is fine.
  Test_echo_daemon kappa(&logger, "kappa");
  ASSERT_FALSE(kappa.start("127.0.0.1", server.local_port(), &address));
  EXPECT_TRUE(wait_until([&]() { return server.n_services() == 1; }));
}

} // namespace relay::session::test
