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

#include "cassc/util/test_util.h"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include "cassc/util/random.h"

DEFINE_int32(test_random_seed, 0, "Random seed to use for randomized tests");

namespace cassc {

CasscTest::CasscTest() {
}

CasscTest::~CasscTest() {
}

uint32_t CasscTest::SeedRandom() {
  uint32_t seed;
  if (FLAGS_test_random_seed == 0) {
    // Not specified by user
    seed = GetRandomSeed32();
  } else {
    seed = static_cast<uint32_t>(FLAGS_test_random_seed);
  }
  LOG(INFO) << "Using random seed: " << seed;
  return seed;
}

} // namespace cassc
