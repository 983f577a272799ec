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

#include "relay/transport/data_relay.hpp"
#include "relay/transport/error.hpp"
#include "relay/test/test_common_util.hpp"
#include "relay/test/test_logger.hpp"
#include <gtest/gtest.h>
#include <memory>

namespace relay::transport::test
{

using relay::test::Test_logger;
using relay::test::Blocking_peer;
using relay::test::make_loopback_connection;
using relay::test::await_result;
using relay::test::wait_until;
using boost::chrono::milliseconds;
using std::string;
using std::promise;
using std::make_shared;

namespace
{

/// Makes a client/daemon pair of connections; the relay-side ends go into `*pair`.
void make_pair(Blocking_peer* client, Blocking_peer* daemon, Data_connection_pair* pair)
{
  pair->m_client = make_loopback_connection(client);
  pair->m_daemon = make_loopback_connection(daemon);
}

} // namespace (anon)

TEST(Data_relay, Bidirectional_and_half_close)
{
  Test_logger logger;
  Data_relay_engine engine(&logger, "relay_test");
  Blocking_peer client(&logger);
  Blocking_peer daemon(&logger);

  Data_connection_pair pair;
  make_pair(&client, &daemon, &pair);
  ASSERT_FALSE(pair.m_client.null() || pair.m_daemon.null());

  const auto done = make_shared<promise<Error_code>>();
  auto done_result = done->get_future();
  engine.launch(std::move(pair), [done](const Error_code& err_code) { done->set_value(err_code); });
  EXPECT_TRUE(pair.m_client.null());
  EXPECT_TRUE(pair.m_daemon.null());

  EXPECT_TRUE(wait_until([&]() { return engine.n_active() == 1; }));
  EXPECT_EQ(engine.n_launched(), 1u);

  string line;
  ASSERT_FALSE(client.write_line("to the daemon"));
  EXPECT_FALSE(daemon.read_line(&line));
  EXPECT_EQ(line, "to the daemon");

  // More than one buffer's worth, while the client isn't reading yet.
  string big(Data_relay::S_BUF_SIZE * 4 + 17, 'x');
  for (size_t idx = 0; idx != big.size(); ++idx)
  {
    big[idx] = char('a' + (idx % 26));
  }
  ASSERT_FALSE(daemon.write(big));
  string received;
  EXPECT_FALSE(client.read_exactly(big.size(), &received));
  EXPECT_EQ(received, big);

  // Client is done sending: the daemon sees end-of-stream but can still answer.
  client.shutdown_send();
  EXPECT_FALSE(daemon.await_close());
  ASSERT_FALSE(daemon.write_line("parting words"));
  EXPECT_FALSE(client.read_line(&line));
  EXPECT_EQ(line, "parting words");
  EXPECT_EQ(done_result.wait_for(std::chrono::milliseconds(100)), std::future_status::timeout);

  // Now both directions are finished.
  daemon.shutdown_send();
  EXPECT_FALSE(client.await_close());
  EXPECT_FALSE(await_result(&done_result));
  EXPECT_TRUE(wait_until([&]() { return engine.n_active() == 0; }));
}

TEST(Data_relay, Reset_closes_both)
{
  Test_logger logger;
  Data_relay_engine engine(&logger, "relay_test");
  Blocking_peer client(&logger);
  Blocking_peer daemon(&logger);

  Data_connection_pair pair;
  make_pair(&client, &daemon, &pair);

  const auto done = make_shared<promise<Error_code>>();
  auto done_result = done->get_future();
  engine.launch(std::move(pair), [done](const Error_code& err_code) { done->set_value(err_code); });

  // Abortive close (RST) by the daemon.
  daemon.socket().set_option(boost::asio::socket_base::linger(true, 0));
  daemon.close();

  EXPECT_FALSE(client.await_close()); // Reset or end-of-stream; either way the client's connection ends.
  client.close();
  await_result(&done_result); // Reported either way.
  EXPECT_TRUE(wait_until([&]() { return engine.n_active() == 0; }));
}

TEST(Data_relay, Engine_destruction_closes_relays)
{
  Test_logger logger;
  Blocking_peer client1(&logger);
  Blocking_peer daemon1(&logger);
  Blocking_peer client2(&logger);
  Blocking_peer daemon2(&logger);

  const auto done1 = make_shared<promise<Error_code>>();
  const auto done2 = make_shared<promise<Error_code>>();
  auto done1_result = done1->get_future();
  auto done2_result = done2->get_future();

  {
    Data_relay_engine engine(&logger, "relay_test");

    Data_connection_pair pair1;
    make_pair(&client1, &daemon1, &pair1);
    Data_connection_pair pair2;
    make_pair(&client2, &daemon2, &pair2);
    engine.launch(std::move(pair1), [done1](const Error_code& err_code) { done1->set_value(err_code); });
    engine.launch(std::move(pair2), [done2](const Error_code& err_code) { done2->set_value(err_code); });

    EXPECT_TRUE(wait_until([&]() { return engine.n_active() == 2; }));
  } // Destroy it.

  EXPECT_EQ(await_result(&done1_result), error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER);
  EXPECT_EQ(await_result(&done2_result), error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER);
  EXPECT_FALSE(client1.await_close());
  EXPECT_FALSE(daemon1.await_close());
  EXPECT_FALSE(client2.await_close());
  EXPECT_FALSE(daemon2.await_close());
}

} // namespace relay::transport::test
