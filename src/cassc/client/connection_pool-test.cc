// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing,
// software distributed under the License is distributed on an
// "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, either express or implied.  See the License for the
// specific language governing permissions and limitations
// under the License.

#include "cassc/client/connection_pool.h"

#include <memory>
#include <string>

#include <gflags/gflags.h>
#include <glog/logging.h>
#include <gtest/gtest.h>

#include "cassc/client/client-test-util.h"
#include "cassc/rpc/constants.h"
#include "cassc/util/random.h"
#include "cassc/util/test_macros.h"
#include "cassc/util/test_util.h"

DECLARE_int32(pool_attempts_per_server);

using std::shared_ptr;
using std::string;

namespace cassc {
namespace client {

using rpc::NodeDescriptor;

class ConnectionPoolTest : public CasscTest {
 public:
  ConnectionPoolTest()
      : factory_(&cluster_) {
  }

  void SetUp() override {
    KsDefPB ks_def;
    ks_def.set_name("Keyspace1");
    ks_def.set_strategy_class("org.apache.cassandra.locator.SimpleStrategy");
    ASSERT_OK(cluster_.CreateKeyspace(ks_def));
  }

 protected:
  static NodeDescriptor Node(int i) {
    return NodeDescriptor("10.0.0." + std::to_string(i), 9160);
  }

  FakeCluster cluster_;
  FakeTransportFactory factory_;
};

TEST_F(ConnectionPoolTest, TestEmptyPool) {
  ConnectionPool pool(&factory_, SeedRandom());
  shared_ptr<Connection> conn;
  Status s = pool.GetConnection(&conn);
  ASSERT_TRUE(s.IsConnectionFailed()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "the cluster server pool is empty");
  ASSERT_EQ(0, factory_.num_created());
}

// Every node being down costs exactly two attempts per node.
TEST_F(ConnectionPoolTest, TestBoundedAttemptsWhenAllNodesDown) {
  const int kNumServers = 3;
  ConnectionPool pool(&factory_, SeedRandom());
  for (int i = 1; i <= kNumServers; i++) {
    pool.RegisterServer(Node(i));
    cluster_.SetNodeDown(Node(i).ToString(), true);
  }

  shared_ptr<Connection> conn;
  Status s = pool.GetConnection(&conn);
  ASSERT_TRUE(s.IsConnectionFailed()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "Connecting to any of the 3 nodes failed");
  ASSERT_STR_CONTAINS(s.ToString(), "Connection refused");

  int total_opens = 0;
  for (int i = 1; i <= kNumServers; i++) {
    total_opens += cluster_.num_opens(Node(i).ToString());
  }
  ASSERT_EQ(2 * kNumServers, total_opens);
  ASSERT_EQ(2 * kNumServers, factory_.num_created());
  ASSERT_EQ(0U, pool.num_connections());
}

TEST_F(ConnectionPoolTest, TestAttemptsPerServerFlag) {
  FLAGS_pool_attempts_per_server = 5;
  ConnectionPool pool(&factory_, SeedRandom());
  pool.RegisterServer(Node(1));
  pool.RegisterServer(Node(2));
  cluster_.SetNodeDown(Node(1).ToString(), true);
  cluster_.SetNodeDown(Node(2).ToString(), true);

  shared_ptr<Connection> conn;
  ASSERT_TRUE(pool.GetConnection(&conn).IsConnectionFailed());
  ASSERT_EQ(10, factory_.num_created());
}

TEST_F(ConnectionPoolTest, TestConnectionIsReused) {
  ConnectionPool pool(&factory_, SeedRandom());
  pool.RegisterServer(Node(1));

  shared_ptr<Connection> first;
  ASSERT_OK(pool.GetConnection(&first));
  shared_ptr<Connection> second;
  ASSERT_OK(pool.GetConnection(&second));
  ASSERT_EQ(first.get(), second.get());
  ASSERT_EQ(1, cluster_.num_opens(Node(1).ToString()));
  ASSERT_EQ(1U, pool.num_connections());
}

TEST_F(ConnectionPoolTest, TestClosedConnectionIsReplaced) {
  ConnectionPool pool(&factory_, SeedRandom());
  pool.RegisterServer(Node(1));

  shared_ptr<Connection> first;
  ASSERT_OK(pool.GetConnection(&first));
  cluster_.DropConnections();
  ASSERT_FALSE(first->IsOpen());

  shared_ptr<Connection> second;
  ASSERT_OK(pool.GetConnection(&second));
  ASSERT_NE(first.get(), second.get());
  ASSERT_TRUE(second->IsOpen());
  ASSERT_EQ(2, cluster_.num_opens(Node(1).ToString()));
  ASSERT_EQ(1U, pool.num_connections());
}

// Evicting a closed connection uses up the attempt; the next attempt picks
// a server afresh.
TEST_F(ConnectionPoolTest, TestEvictionUsesAnAttempt) {
  FLAGS_pool_attempts_per_server = 1;
  ConnectionPool pool(&factory_, SeedRandom());
  pool.RegisterServer(Node(1));

  shared_ptr<Connection> conn;
  ASSERT_OK(pool.GetConnection(&conn));
  cluster_.DropConnections();

  Status s = pool.GetConnection(&conn);
  ASSERT_TRUE(s.IsConnectionFailed()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "Connection to 10.0.0.1:9160 was closed");
  ASSERT_EQ(1, cluster_.num_opens(Node(1).ToString()));
  ASSERT_EQ(0U, pool.num_connections());

  ASSERT_OK(pool.GetConnection(&conn));
  ASSERT_EQ(2, cluster_.num_opens(Node(1).ToString()));
}

TEST_F(ConnectionPoolTest, TestUseKeyspace) {
  ConnectionPool pool(&factory_, SeedRandom());
  pool.RegisterServer(Node(1));
  ASSERT_FALSE(pool.keyspace_context());

  KeyspaceContext context;
  context.keyspace = "Keyspace1";
  ASSERT_OK(pool.UseKeyspace(context));
  ASSERT_TRUE(pool.keyspace_context());
  ASSERT_EQ("Keyspace1", pool.keyspace_context()->keyspace);

  // The fresh connection selects the keyspace when opened and once more
  // when the pool applies it to every open connection.
  ASSERT_EQ(2, cluster_.num_calls(rpc::kSetKeyspaceMethod));

  // Connections opened later select the keyspace themselves.
  cluster_.DropConnections();
  shared_ptr<Connection> conn;
  ASSERT_OK(pool.GetConnection(&conn));
  ASSERT_EQ(3, cluster_.num_calls(rpc::kSetKeyspaceMethod));
}

TEST_F(ConnectionPoolTest, TestKeyspaceSelectionFailureIsNotRetried) {
  ConnectionPool pool(&factory_, SeedRandom());
  pool.RegisterServer(Node(1));
  pool.RegisterServer(Node(2));

  KeyspaceContext context;
  context.keyspace = "NoSuchKeyspace";
  Status s = pool.UseKeyspace(context);
  ASSERT_TRUE(s.IsKeyspaceSelectionFailed()) << s.ToString();
  ASSERT_EQ(1, factory_.num_created());
}

// A node that drops while the keyspace is being selected is skipped like a
// node that cannot be reached.
TEST_F(ConnectionPoolTest, TestTransportFailureWhileSelectingKeyspace) {
  ConnectionPool pool(&factory_, SeedRandom());
  pool.RegisterServer(Node(1));
  pool.RegisterServer(Node(2));
  KeyspaceContext context;
  context.keyspace = "Keyspace1";
  ASSERT_OK(pool.UseKeyspace(context));
  pool.CloseConnections();
  cluster_.ResetCallCounts();
  const int created = factory_.num_created();

  cluster_.InjectFailures(rpc::kSetKeyspaceMethod, 3,
                          Status::NetworkError("connection reset by peer"));
  shared_ptr<Connection> conn;
  ASSERT_OK(pool.GetConnection(&conn));
  ASSERT_TRUE(conn->IsOpen());
  ASSERT_EQ(4, cluster_.num_calls(rpc::kSetKeyspaceMethod));
  ASSERT_EQ(created + 4, factory_.num_created());
  ASSERT_EQ(1U, pool.num_connections());

  // Once every attempt is used up the pool reports the last transport error.
  pool.CloseConnections();
  cluster_.InjectFailures(rpc::kSetKeyspaceMethod, 4,
                          Status::NetworkError("connection reset by peer"));
  Status s = pool.GetConnection(&conn);
  ASSERT_TRUE(s.IsConnectionFailed()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "connection reset by peer");
}

TEST_F(ConnectionPoolTest, TestCloseConnections) {
  ConnectionPool pool(&factory_, SeedRandom());
  pool.RegisterServer(Node(1));
  pool.RegisterServer(Node(2));
  shared_ptr<Connection> conn;
  ASSERT_OK(pool.GetConnection(&conn));
  ASSERT_EQ(1, cluster_.num_open_transports());

  pool.CloseConnections();
  ASSERT_EQ(0U, pool.num_connections());
  ASSERT_EQ(0, cluster_.num_open_transports());
  ASSERT_FALSE(conn->IsOpen());
}

// With one node down and one up, random selection must reach both nodes
// instead of getting stuck on either of them.
TEST_F(ConnectionPoolTest, TestRandomSelectionReachesEveryNode) {
  const int kNumTrials = 1000;
  const int kCallsPerTrial = 10;
  cluster_.SetNodeDown(Node(1).ToString(), true);

  Random seeds(SeedRandom());
  int num_ok = 0;
  for (int trial = 0; trial < kNumTrials; trial++) {
    ConnectionPool pool(&factory_, seeds.Next());
    pool.RegisterServer(Node(1));
    pool.RegisterServer(Node(2));
    for (int i = 0; i < kCallsPerTrial; i++) {
      shared_ptr<Connection> conn;
      Status s = pool.GetConnection(&conn);
      if (s.ok()) {
        num_ok++;
      } else {
        ASSERT_TRUE(s.IsConnectionFailed()) << s.ToString();
      }
    }
  }

  const int down_opens = cluster_.num_opens(Node(1).ToString());
  const int up_opens = cluster_.num_opens(Node(2).ToString());
  LOG(INFO) << "Opens of the down node: " << down_opens
            << ", of the up node: " << up_opens
            << ", successful calls: " << num_ok;
  ASSERT_GT(down_opens, 0);
  ASSERT_GT(up_opens, 0);
  // A call only fails if all four picks land on the down node.
  ASSERT_GT(num_ok, kNumTrials * kCallsPerTrial * 8 / 10);
}

} // namespace client
} // namespace cassc
