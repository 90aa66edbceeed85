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

#include "cassc/client/call_dispatcher.h"

#include <memory>
#include <string>

#include <gflags/gflags.h>
#include <gtest/gtest.h>

#include "cassc/client/client-test-util.h"
#include "cassc/client/connection_pool.h"
#include "cassc/common/cassandra.pb.h"
#include "cassc/rpc/constants.h"
#include "cassc/util/monotime.h"
#include "cassc/util/test_macros.h"
#include "cassc/util/test_util.h"

DECLARE_int32(call_retry_backoff_base_ms);

using std::string;

namespace cassc {
namespace client {

class CallDispatcherTest : public CasscTest {
 public:
  CallDispatcherTest()
      : factory_(&cluster_),
        pool_(&factory_, SeedRandom()),
        dispatcher_(&pool_, kMaxCallRetries) {
  }

  void SetUp() override {
    FLAGS_call_retry_backoff_base_ms = 0;

    KsDefPB ks_def;
    ks_def.set_name("Keyspace1");
    ks_def.set_strategy_class("org.apache.cassandra.locator.SimpleStrategy");
    CfDefPB* cf_def = ks_def.add_cf_defs();
    cf_def->set_keyspace("Keyspace1");
    cf_def->set_name("Standard1");
    ASSERT_OK(cluster_.CreateKeyspace(ks_def));

    pool_.RegisterServer(rpc::NodeDescriptor("10.0.0.1", 9160));
  }

 protected:
  static const int kMaxCallRetries = 4;

  void UseKeyspace() {
    KeyspaceContext context;
    context.keyspace = "Keyspace1";
    ASSERT_OK(pool_.UseKeyspace(context));
  }

  static GetSliceRequestPB SliceRequest() {
    GetSliceRequestPB req;
    req.set_key("jsmith");
    req.mutable_column_parent()->set_column_family("Standard1");
    req.mutable_predicate()->mutable_slice_range()->set_start("");
    req.mutable_predicate()->mutable_slice_range()->set_finish("");
    return req;
  }

  FakeCluster cluster_;
  FakeTransportFactory factory_;
  ConnectionPool pool_;
  CallDispatcher dispatcher_;
};

TEST(CallStatusTest, TestClassification) {
  ASSERT_EQ(CallStatus::OK, CallStatus::FromStatus(Status::OK()).result);
  ASSERT_EQ(CallStatus::FATAL_ERROR,
            CallStatus::FromStatus(Status::InvalidArgument("bad")).result);
  ASSERT_EQ(CallStatus::FATAL_ERROR,
            CallStatus::FromStatus(Status::IllegalState("bad")).result);
  ASSERT_EQ(CallStatus::TRANSIENT_ERROR,
            CallStatus::FromStatus(Status::TimedOut("slow")).result);
  ASSERT_EQ(CallStatus::TRANSIENT_ERROR,
            CallStatus::FromStatus(Status::NetworkError("reset")).result);
  ASSERT_EQ(CallStatus::TRANSIENT_ERROR,
            CallStatus::FromStatus(Status::RemoteError("unavailable")).result);
  ASSERT_EQ(CallStatus::TRANSIENT_ERROR,
            CallStatus::FromStatus(Status::ConnectionClosed("closed")).result);

  CallStatus cs = CallStatus::FromStatus(Status::TimedOut("slow"));
  ASSERT_TRUE(cs.status.IsTimedOut());
}

// Operations needing a keyspace are rejected before any connection is made.
TEST_F(CallDispatcherTest, TestKeyspaceRequired) {
  GetSliceResponsePB resp;
  Status s = dispatcher_.Call(rpc::kGetSliceMethod, SliceRequest(), &resp);
  ASSERT_TRUE(s.IsInvalidRequest()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(),
                      "Unable to call \"get_slice\", no keyspace has been set");
  ASSERT_EQ(0, cluster_.num_calls(rpc::kGetSliceMethod));
  ASSERT_EQ(0, factory_.num_created());
}

TEST_F(CallDispatcherTest, TestCallWithoutKeyspace) {
  DescribeVersionRequestPB req;
  DescribeVersionResponsePB resp;
  ASSERT_OK(dispatcher_.Call(rpc::kDescribeVersionMethod, req, &resp));
  ASSERT_EQ(cluster_.version(), resp.version());
}

TEST_F(CallDispatcherTest, TestRetriesUpToTheLimit) {
  NO_FATALS(UseKeyspace());
  cluster_.InjectFailures(rpc::kGetSliceMethod, 100,
                          Status::TimedOut("request timed out", "",
                                           CassandraErrorPB::TIMED_OUT));
  GetSliceResponsePB resp;
  Status s = dispatcher_.Call(rpc::kGetSliceMethod, SliceRequest(), &resp);
  ASSERT_TRUE(s.IsMaxRetriesExceeded()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "Failed calling \"get_slice\" the maximum of 4 times");
  ASSERT_STR_CONTAINS(s.ToString(), "request timed out");
  ASSERT_EQ(CassandraErrorPB::TIMED_OUT, s.error_code());
  ASSERT_EQ(4, cluster_.num_calls(rpc::kGetSliceMethod));
  ASSERT_TRUE(dispatcher_.last_error().IsTimedOut());
}

TEST_F(CallDispatcherTest, TestTransientErrorsAreRetried) {
  NO_FATALS(UseKeyspace());
  cluster_.InjectFailures(rpc::kGetSliceMethod, 2, Status::RemoteError("unavailable"));
  GetSliceResponsePB resp;
  ASSERT_OK(dispatcher_.Call(rpc::kGetSliceMethod, SliceRequest(), &resp));
  ASSERT_EQ(3, cluster_.num_calls(rpc::kGetSliceMethod));
}

TEST_F(CallDispatcherTest, TestFatalErrorsAreNotRetried) {
  NO_FATALS(UseKeyspace());
  cluster_.InjectFailures(rpc::kGetSliceMethod, 1,
                          Status::InvalidArgument("Unable to encode request"));
  GetSliceResponsePB resp;
  Status s = dispatcher_.Call(rpc::kGetSliceMethod, SliceRequest(), &resp);
  ASSERT_TRUE(s.IsInvalidArgument()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "Unable to encode request");
  ASSERT_EQ(1, cluster_.num_calls(rpc::kGetSliceMethod));
}

// The server rejecting a request is not final: every attempt is used.
TEST_F(CallDispatcherTest, TestServerRejectionsAreRetried) {
  NO_FATALS(UseKeyspace());
  GetSliceRequestPB req = SliceRequest();
  req.mutable_column_parent()->set_column_family("NoSuchFamily");
  GetSliceResponsePB resp;
  Status s = dispatcher_.Call(rpc::kGetSliceMethod, req, &resp);
  ASSERT_TRUE(s.IsMaxRetriesExceeded()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "unconfigured columnfamily NoSuchFamily");
  ASSERT_EQ(CassandraErrorPB::INVALID_REQUEST, s.error_code());
  ASSERT_EQ(4, cluster_.num_calls(rpc::kGetSliceMethod));
  ASSERT_TRUE(dispatcher_.last_error().IsRemoteError());
  ASSERT_EQ(CassandraErrorPB::INVALID_REQUEST, dispatcher_.last_error().error_code());
}

TEST_F(CallDispatcherTest, TestResponseIsClearedBetweenAttempts) {
  NO_FATALS(UseKeyspace());
  GetSliceResponsePB resp;
  ColumnPB* stale = resp.add_columns()->mutable_column();
  stale->set_name("stale");
  ASSERT_OK(dispatcher_.Call(rpc::kGetSliceMethod, SliceRequest(), &resp));
  ASSERT_EQ(0, resp.columns_size());
}

TEST_F(CallDispatcherTest, TestConnectionFailureIsReturned) {
  cluster_.SetNodeDown("10.0.0.1:9160", true);
  DescribeVersionRequestPB req;
  DescribeVersionResponsePB resp;
  Status s = dispatcher_.Call(rpc::kDescribeVersionMethod, req, &resp);
  ASSERT_TRUE(s.IsConnectionFailed()) << s.ToString();
  ASSERT_EQ(0, cluster_.num_calls(rpc::kDescribeVersionMethod));
}

TEST_F(CallDispatcherTest, TestReconnectsAfterDrop) {
  NO_FATALS(UseKeyspace());
  GetSliceResponsePB resp;
  ASSERT_OK(dispatcher_.Call(rpc::kGetSliceMethod, SliceRequest(), &resp));
  cluster_.DropConnections();
  ASSERT_OK(dispatcher_.Call(rpc::kGetSliceMethod, SliceRequest(), &resp));
  ASSERT_EQ(2, factory_.num_created());
}

// Attempt n is followed by a pause of base * 2^n, except for the last one.
TEST_F(CallDispatcherTest, TestBackoffBetweenAttempts) {
  FLAGS_call_retry_backoff_base_ms = 5;
  dispatcher_.set_max_call_retries(3);
  cluster_.InjectFailures(rpc::kDescribeVersionMethod, 3, Status::TimedOut("slow"));

  DescribeVersionRequestPB req;
  DescribeVersionResponsePB resp;
  MonoTime start = MonoTime::Now();
  Status s = dispatcher_.Call(rpc::kDescribeVersionMethod, req, &resp);
  MonoDelta elapsed = MonoTime::Now().GetDeltaSince(start);
  ASSERT_TRUE(s.IsMaxRetriesExceeded()) << s.ToString();
  ASSERT_EQ(3, cluster_.num_calls(rpc::kDescribeVersionMethod));
  ASSERT_GE(elapsed.ToMilliseconds(), 30);
}

} // namespace client
} // namespace cassc
