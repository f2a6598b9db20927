/* Coordinator client: Sessions
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

#include "test_coordinator.hpp"
#include "coord/client/error.hpp"
#include <flow/error/error.hpp>
#include <gtest/gtest.h>
#include <boost/thread/thread.hpp>
#include <boost/uuid/uuid.hpp>
#include <set>
#include <vector>

namespace coord::client::test
{

namespace
{

/// Client_config with identifiers in [`first`, `end`).
Client_config make_config(Connection_id first, Connection_id end)
{
  Client_config config;
  config.m_conn_id_first = first;
  config.m_conn_id_end = end;
  return config;
}

} // namespace (anon)

TEST(Client, Scenario_range_of_four)
{
  Test_coordinator coord(nullptr);
  Handle handle(nullptr, make_config(1, 5), [&](Command_rx& cmd_rx) { coord.serve(cmd_rx); });
  const auto client = handle.client();

  std::vector<Conn_client> conns;
  std::set<Connection_id> ids;
  for (size_t idx = 0; idx != 3; ++idx)
  {
    conns.emplace_back(client.new_conn());
    ids.insert(conns.back().conn_id());
  }
  EXPECT_EQ(ids.size(), size_t(3));
  for (const auto id : ids)
  {
    EXPECT_GE(id, Connection_id(1));
    EXPECT_LT(id, Connection_id(5));
  }

  conns.emplace_back(client.new_conn());
  EXPECT_FALSE(conns.back().null());
  EXPECT_EQ(ids.count(conns.back().conn_id()), size_t(0));
  EXPECT_EQ(client.n_live_conns(), size_t(4));

  Error_code err_code;
  const auto fifth = client.new_conn(&err_code);
  EXPECT_EQ(err_code, error::Code::S_CONN_ID_EXHAUSTED);
  EXPECT_TRUE(fifth.null());

  EXPECT_THROW(client.new_conn(), flow::error::Runtime_error);
}

TEST(Client, Dropped_conn_id_is_reusable)
{
  Test_coordinator coord(nullptr);
  Handle handle(nullptr, make_config(1, 3), [&](Command_rx& cmd_rx) { coord.serve(cmd_rx); });
  const auto client = handle.client();

  auto conn1 = client.new_conn();
  std::optional<Conn_client> conn2(client.new_conn());
  const auto id2 = conn2->conn_id();

  Error_code err_code;
  client.new_conn(&err_code);
  EXPECT_TRUE(err_code);

  conn2.reset();
  EXPECT_EQ(client.n_live_conns(), size_t(1));
  const auto conn3 = client.new_conn();
  EXPECT_EQ(conn3.conn_id(), id2);
  EXPECT_NE(conn3.conn_id(), conn1.conn_id());
}

TEST(Client, Moved_conn_releases_once)
{
  Test_coordinator coord(nullptr);
  Handle handle(nullptr, make_config(1, 3), [&](Command_rx& cmd_rx) { coord.serve(cmd_rx); });
  const auto client = handle.client();

  {
    auto conn1 = client.new_conn();
    auto conn2 = std::move(conn1);
    EXPECT_TRUE(conn1.null());
    EXPECT_FALSE(conn2.null());
    EXPECT_EQ(client.n_live_conns(), size_t(1));

    auto conn3 = client.new_conn();
    conn3 = std::move(conn2); // conn3's own ID released here.
    EXPECT_EQ(client.n_live_conns(), size_t(1));
  }
  EXPECT_EQ(client.n_live_conns(), size_t(0));
}

TEST(Client, Copies_share_allocator)
{
  Test_coordinator coord(nullptr);
  Handle handle(nullptr, make_config(1, 2), [&](Command_rx& cmd_rx) { coord.serve(cmd_rx); });
  const auto client1 = handle.client();
  const auto client2 = client1;

  const auto conn = client1.new_conn();
  Error_code err_code;
  client2.new_conn(&err_code);
  EXPECT_EQ(err_code, error::Code::S_CONN_ID_EXHAUSTED);
}

TEST(Client, Concurrent_new_conn_and_drop)
{
  constexpr size_t N_THREADS = 8;
  constexpr size_t N_ITERS = 500;

  Test_coordinator coord(nullptr);
  Handle handle(nullptr, make_config(1, 1 + 64), [&](Command_rx& cmd_rx) { coord.serve(cmd_rx); });

  flow::util::Mutex_non_recursive mutex;
  boost::unordered_set<Connection_id> live;
  bool dup = false;

  boost::thread_group threads;
  for (size_t thread_idx = 0; thread_idx != N_THREADS; ++thread_idx)
  {
    const auto client = handle.client();
    threads.create_thread([&, client]()
    {
      for (size_t iter = 0; iter != N_ITERS; ++iter)
      {
        std::vector<Conn_client> conns;
        for (size_t idx = 0; idx != 3; ++idx)
        {
          conns.emplace_back(client.new_conn());
          flow::util::Lock_guard<flow::util::Mutex_non_recursive> lock(mutex);
          dup = dup || (!live.insert(conns.back().conn_id()).second);
        }

        flow::util::Lock_guard<flow::util::Mutex_non_recursive> lock(mutex);
        for (const auto& conn : conns)
        {
          live.erase(conn.conn_id());
        }
        // `conns` destroyed after `lock`: IDs are released after being unmarked.
      }
    });
  }
  threads.join_all();

  EXPECT_FALSE(dup);
  EXPECT_EQ(handle.client().n_live_conns(), size_t(0));
}

TEST(Client, Empty_range_rejected)
{
  auto channel = make_command_channel();
  EXPECT_THROW(Client(nullptr, make_config(3, 3), channel.first), flow::error::Runtime_error);
}

TEST(Handle, Cluster_id_and_shutdown)
{
  Test_coordinator coord(nullptr);
  boost::uuids::uuid cluster_id;
  {
    Handle handle(nullptr, Client_config(), [&](Command_rx& cmd_rx) { coord.serve(cmd_rx); });
    cluster_id = handle.cluster_id();
    EXPECT_FALSE(cluster_id.is_nil());

    Handle handle2(nullptr, Client_config(), [&](Command_rx&) {});
    EXPECT_NE(handle2.cluster_id(), cluster_id);

    auto conn = handle.client().new_conn();
    conn.cancel_request(12345, 1); // No such connection: ignored.
  } // Handle waits for the serve function, which has processed everything by then.

  EXPECT_EQ(coord.n_cancels_ignored(), size_t(1));
  EXPECT_EQ(coord.n_cancels_honored(), size_t(0));
}

TEST(Handle, Shutdown_right_after_creation_serves_queued_commands)
{
  /* Each Handle is torn down immediately after a fire-and-forget command is queued.  The coordinator must still
   * get to serve, and see the command, every time. */
  constexpr size_t N_ROUNDS = 200;

  Test_coordinator coord(nullptr);
  for (size_t idx = 0; idx != N_ROUNDS; ++idx)
  {
    Handle handle(nullptr, Client_config(), [&](Command_rx& cmd_rx) { coord.serve(cmd_rx); });
    handle.client().new_conn().cancel_request(12345, 1);
  }

  EXPECT_EQ(coord.n_cancels_ignored(), N_ROUNDS);
}

} // namespace coord::client::test
