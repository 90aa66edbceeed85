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

#include "cassc/client/connection.h"

#include <memory>
#include <string>

#include <gflags/gflags.h>
#include <gtest/gtest.h>

#include "cassc/client/client-test-util.h"
#include "cassc/rpc/constants.h"
#include "cassc/util/test_macros.h"
#include "cassc/util/test_util.h"

DECLARE_int32(keyspace_select_attempts);

using std::string;
using std::unique_ptr;

namespace cassc {
namespace client {

using rpc::NodeDescriptor;
using rpc::RpcStub;

class ConnectionTest : public CasscTest {
 public:
  ConnectionTest()
      : factory_(&cluster_),
        node_("10.0.0.1", 9160) {
  }

  void SetUp() override {
    KsDefPB ks_def;
    ks_def.set_name("Keyspace1");
    ks_def.set_strategy_class("org.apache.cassandra.locator.SimpleStrategy");
    ks_def.set_replication_factor(1);
    ASSERT_OK(cluster_.CreateKeyspace(ks_def));
  }

 protected:
  KeyspaceContext Context(const string& username = "", const string& password = "") {
    KeyspaceContext context;
    context.keyspace = "Keyspace1";
    context.username = username;
    context.password = password;
    return context;
  }

  FakeCluster cluster_;
  FakeTransportFactory factory_;
  NodeDescriptor node_;
};

TEST_F(ConnectionTest, TestOpenAndClose) {
  unique_ptr<Connection> conn;
  ASSERT_OK(Connection::Open(&factory_, node_, &conn));
  ASSERT_TRUE(conn->IsOpen());
  ASSERT_EQ("10.0.0.1:9160", conn->node().ToString());
  ASSERT_EQ(1, cluster_.num_opens("10.0.0.1:9160"));
  ASSERT_EQ(1, cluster_.num_open_transports());

  RpcStub* stub;
  ASSERT_OK(conn->GetStub(&stub));
  ASSERT_TRUE(stub != nullptr);

  conn->Close();
  ASSERT_FALSE(conn->IsOpen());
  ASSERT_EQ(0, cluster_.num_open_transports());
  Status s = conn->GetStub(&stub);
  ASSERT_TRUE(s.IsConnectionClosed()) << s.ToString();

  // Closing twice is harmless.
  conn->Close();
  ASSERT_FALSE(conn->IsOpen());
}

TEST_F(ConnectionTest, TestOpenUnreachableNode) {
  cluster_.SetNodeDown("10.0.0.1:9160", true);
  unique_ptr<Connection> conn;
  Status s = Connection::Open(&factory_, node_, &conn);
  ASSERT_TRUE(s.IsNetworkError()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "Unable to open transport to 10.0.0.1:9160");
  ASSERT_FALSE(conn);
}

TEST_F(ConnectionTest, TestConnectionDroppedByServer) {
  unique_ptr<Connection> conn;
  ASSERT_OK(Connection::Open(&factory_, node_, &conn));
  cluster_.DropConnections();
  ASSERT_FALSE(conn->IsOpen());
  RpcStub* stub;
  ASSERT_TRUE(conn->GetStub(&stub).IsConnectionClosed());
}

TEST_F(ConnectionTest, TestUseKeyspace) {
  unique_ptr<Connection> conn;
  ASSERT_OK(Connection::Open(&factory_, node_, &conn));
  ASSERT_OK(conn->UseKeyspace(Context()));
  ASSERT_EQ(1, cluster_.num_calls(rpc::kSetKeyspaceMethod));
  ASSERT_EQ(0, cluster_.num_calls(rpc::kLoginMethod));
}

TEST_F(ConnectionTest, TestUseKeyspaceRetriesSpuriousRejections) {
  cluster_.InjectFailures(rpc::kSetKeyspaceMethod, 2,
                          Status::RemoteError("spurious", "",
                                              CassandraErrorPB::INVALID_REQUEST));
  unique_ptr<Connection> conn;
  ASSERT_OK(Connection::Open(&factory_, node_, &conn));
  ASSERT_OK(conn->UseKeyspace(Context()));
  ASSERT_EQ(3, cluster_.num_calls(rpc::kSetKeyspaceMethod));
}

// A transport failure is not a rejection of the keyspace: it is returned
// after the first attempt and keeps its code.
TEST_F(ConnectionTest, TestUseKeyspaceTransportFailure) {
  cluster_.InjectFailures(rpc::kSetKeyspaceMethod, 3,
                          Status::NetworkError("connection reset by peer"));
  unique_ptr<Connection> conn;
  ASSERT_OK(Connection::Open(&factory_, node_, &conn));
  Status s = conn->UseKeyspace(Context());
  ASSERT_TRUE(s.IsNetworkError()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(),
                      "Selecting the keyspace \"Keyspace1\" on 10.0.0.1:9160 failed");
  ASSERT_STR_CONTAINS(s.ToString(), "connection reset by peer");
  ASSERT_EQ(1, cluster_.num_calls(rpc::kSetKeyspaceMethod));

  cluster_.InjectFailures(rpc::kSetKeyspaceMethod, 1, Status::TimedOut("slow"));
  s = conn->UseKeyspace(Context());
  ASSERT_TRUE(s.IsTimedOut()) << s.ToString();
}

TEST_F(ConnectionTest, TestUseKeyspaceFailsAfterAllAttempts) {
  cluster_.InjectFailures(rpc::kSetKeyspaceMethod, 5,
                          Status::RemoteError("unavailable", "",
                                              CassandraErrorPB::UNAVAILABLE));
  unique_ptr<Connection> conn;
  ASSERT_OK(Connection::Open(&factory_, node_, &conn));
  Status s = conn->UseKeyspace(Context());
  ASSERT_TRUE(s.IsKeyspaceSelectionFailed()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(),
                      "Selecting the keyspace \"Keyspace1\" on 10.0.0.1:9160 failed 3 times");
  ASSERT_STR_CONTAINS(s.ToString(), "unavailable");
  ASSERT_EQ(CassandraErrorPB::UNAVAILABLE, s.error_code());
  ASSERT_EQ(3, cluster_.num_calls(rpc::kSetKeyspaceMethod));
}

TEST_F(ConnectionTest, TestUseKeyspaceAttemptsFlag) {
  FLAGS_keyspace_select_attempts = 1;
  unique_ptr<Connection> conn;
  ASSERT_OK(Connection::Open(&factory_, node_, &conn));
  KeyspaceContext context = Context();
  context.keyspace = "NoSuchKeyspace";
  Status s = conn->UseKeyspace(context);
  ASSERT_TRUE(s.IsKeyspaceSelectionFailed()) << s.ToString();
  ASSERT_EQ(1, cluster_.num_calls(rpc::kSetKeyspaceMethod));
}

TEST_F(ConnectionTest, TestUseKeyspaceLogsIn) {
  cluster_.AddUser("jsmith", "havebadpass");
  unique_ptr<Connection> conn;
  ASSERT_OK(Connection::Open(&factory_, node_, &conn));
  ASSERT_OK(conn->UseKeyspace(Context("jsmith", "havebadpass")));
  ASSERT_EQ(1, cluster_.num_calls(rpc::kLoginMethod));

  Status s = conn->UseKeyspace(Context("jsmith", "wrong"));
  ASSERT_TRUE(s.IsRemoteError()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "Logging in as jsmith on 10.0.0.1:9160 failed");
  ASSERT_EQ(CassandraErrorPB::AUTHENTICATION, s.error_code());
}

TEST_F(ConnectionTest, TestUseKeyspaceOnClosedConnection) {
  unique_ptr<Connection> conn;
  ASSERT_OK(Connection::Open(&factory_, node_, &conn));
  conn->Close();
  Status s = conn->UseKeyspace(Context());
  ASSERT_TRUE(s.IsConnectionClosed()) << s.ToString();
  ASSERT_EQ(0, cluster_.num_calls(rpc::kSetKeyspaceMethod));
}

} // namespace client
} // namespace cassc
