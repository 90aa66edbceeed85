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

#include "cassc/rpc/constants.h"

#include <gtest/gtest.h>

#include "cassc/rpc/transport.h"

namespace cassc {
namespace rpc {

TEST(RpcConstantsTest, TestDataOperationsRequireKeyspace) {
  ASSERT_TRUE(RequiresKeyspace(kGetSliceMethod));
  ASSERT_TRUE(RequiresKeyspace(kMultigetSliceMethod));
  ASSERT_TRUE(RequiresKeyspace(kGetIndexedSlicesMethod));
  ASSERT_TRUE(RequiresKeyspace(kBatchMutateMethod));
  ASSERT_TRUE(RequiresKeyspace(kRemoveMethod));
  ASSERT_TRUE(RequiresKeyspace(kLoginMethod));
}

TEST(RpcConstantsTest, TestSchemaOperationsDoNotRequireKeyspace) {
  ASSERT_FALSE(RequiresKeyspace(kSetKeyspaceMethod));
  ASSERT_FALSE(RequiresKeyspace(kDescribeKeyspaceMethod));
  ASSERT_FALSE(RequiresKeyspace(kDescribeVersionMethod));
  ASSERT_FALSE(RequiresKeyspace(kSystemAddKeyspaceMethod));
  ASSERT_FALSE(RequiresKeyspace(kSystemDropKeyspaceMethod));
  ASSERT_FALSE(RequiresKeyspace(kSystemAddColumnFamilyMethod));
  ASSERT_FALSE(RequiresKeyspace("no_such_method"));
}

// Range scans are served without a keyspace check on the client.
TEST(RpcConstantsTest, TestRangeSlicesNotInKeyspaceSet) {
  ASSERT_FALSE(RequiresKeyspace(kGetRangeSlicesMethod));
}

TEST(NodeDescriptorTest, TestDefaults) {
  NodeDescriptor node;
  ASSERT_EQ("127.0.0.1", node.host);
  ASSERT_EQ(9160, node.port);
  ASSERT_TRUE(node.use_framed_transport);
  ASSERT_FALSE(node.send_timeout_ms);
  ASSERT_FALSE(node.receive_timeout_ms);
  ASSERT_EQ("127.0.0.1:9160", node.ToString());

  NodeDescriptor other("db1.example.com", 9161);
  ASSERT_EQ("db1.example.com:9161", other.ToString());
  ASSERT_TRUE(other.use_framed_transport);
}

} // namespace rpc
} // namespace cassc
