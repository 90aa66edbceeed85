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

#include "cassc/util/monotime.h"

#include <gtest/gtest.h>

namespace cassc {

TEST(TestMonoTime, TestMonotonicity) {
  MonoTime prev = MonoTime::Now();
  for (int i = 0; i < 1000; i++) {
    MonoTime next = MonoTime::Now();
    ASSERT_FALSE(next.ComesBefore(prev));
    prev = next;
  }
}

TEST(TestMonoTime, TestDeltaConversions) {
  MonoDelta d = MonoDelta::FromMilliseconds(1500);
  ASSERT_EQ(1500, d.ToMilliseconds());
  ASSERT_EQ(1500000, d.ToMicroseconds());
  ASSERT_DOUBLE_EQ(1.5, d.ToSeconds());
  ASSERT_EQ("1.500s", d.ToString());
  ASSERT_TRUE(MonoDelta::FromSeconds(1).LessThan(d));
  ASSERT_TRUE(d.MoreThan(MonoDelta::FromMicroseconds(10)));
  ASSERT_TRUE(d.Equals(MonoDelta::FromNanoseconds(1500000000L)));
  ASSERT_FALSE(MonoDelta().Initialized());
}

TEST(TestMonoTime, TestSleepFor) {
  MonoTime start = MonoTime::Now();
  SleepFor(MonoDelta::FromMilliseconds(20));
  MonoDelta elapsed = MonoTime::Now().GetDeltaSince(start);
  ASSERT_GE(elapsed.ToMilliseconds(), 20);

  // Non-positive deltas return immediately.
  SleepFor(MonoDelta::FromMilliseconds(-5));
  SleepFor(MonoDelta());
}

TEST(TestMonoTime, TestAddDelta) {
  MonoTime now = MonoTime::Now();
  MonoTime later = now + MonoDelta::FromSeconds(10);
  ASSERT_TRUE(now < later);
  ASSERT_DOUBLE_EQ(10.0, later.GetDeltaSince(now).ToSeconds());
}

} // namespace cassc
