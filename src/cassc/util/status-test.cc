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

#include "cassc/util/status.h"

#include <string>
#include <utility>

#include <gtest/gtest.h>

#include "cassc/util/test_macros.h"

using std::string;

namespace cassc {

TEST(StatusTest, TestErrorCode) {
  Status ok = Status::OK();
  ASSERT_EQ(0, ok.error_code());
  Status remote = Status::RemoteError("unavailable", "", 2);
  ASSERT_EQ(2, remote.error_code());
  ASSERT_EQ(-1, Status::NetworkError("reset").error_code());
}

TEST(StatusTest, TestToString) {
  Status remote = Status::RemoteError("unavailable", "", 2);
  ASSERT_EQ(string("Remote error: unavailable (error 2)"), remote.ToString());
  ASSERT_EQ(string("OK"), Status::OK().ToString());
  ASSERT_EQ(string("Connection failed: no nodes"),
            Status::ConnectionFailed("no nodes").ToString());
}

TEST(StatusTest, TestClonePrepend) {
  Status remote = Status::RemoteError("unavailable", "msg2", 2);
  Status prepended = remote.CloneAndPrepend("Heading");
  ASSERT_EQ(string("Remote error: Heading: unavailable: msg2 (error 2)"),
            prepended.ToString());
  ASSERT_TRUE(prepended.IsRemoteError());
}

TEST(StatusTest, TestCloneAppend) {
  Status remote = Status::RemoteError("unavailable", "msg2", 2);
  Status appended = remote.CloneAndAppend("Trailer");
  ASSERT_EQ(string("Remote error: unavailable: msg2: Trailer (error 2)"),
            appended.ToString());
}

TEST(StatusTest, TestMessage) {
  Status s = Status::InvalidPattern("bad request", "cf.key|x");
  ASSERT_EQ(string("bad request: cf.key|x"), s.message());
  ASSERT_EQ(string("Invalid pattern"), s.CodeAsString());
  ASSERT_EQ(string(), Status::OK().message());
}

TEST(StatusTest, TestCodePredicates) {
  ASSERT_TRUE(Status::ConnectionClosed("x").IsConnectionClosed());
  ASSERT_TRUE(Status::KeyspaceSelectionFailed("x").IsKeyspaceSelectionFailed());
  ASSERT_TRUE(Status::InvalidRequest("x").IsInvalidRequest());
  ASSERT_TRUE(Status::MaxRetriesExceeded("x").IsMaxRetriesExceeded());
  ASSERT_FALSE(Status::MaxRetriesExceeded("x").IsInvalidRequest());
  ASSERT_FALSE(Status::OK().IsNotFound());
}

TEST(StatusTest, TestMoveAndCopy) {
  Status orig = Status::TimedOut("slow", "", 5);
  Status copy(orig);
  ASSERT_EQ(orig.ToString(), copy.ToString());

  Status moved(std::move(copy));
  ASSERT_TRUE(moved.IsTimedOut());
  ASSERT_EQ(5, moved.error_code());

  Status assigned;
  assigned = moved;
  ASSERT_EQ(moved.ToString(), assigned.ToString());
  assigned = Status::OK();
  ASSERT_OK(assigned);
}

} // namespace cassc
