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
//
// Base test class, with various utility functions.
#pragma once

#include <cstdint>

#include <gflags/gflags.h>
#include <gtest/gtest.h>

#include "cassc/util/macros.h"
#include "cassc/util/test_macros.h"

namespace cassc {

class CasscTest : public ::testing::Test {
 public:
  CasscTest();
  ~CasscTest() override;

 protected:
  // Returns the seed for randomized tests: the value of --test_random_seed
  // when it is set, otherwise one derived from the clock. The chosen seed is
  // logged so that failures can be reproduced.
  static uint32_t SeedRandom();

  // Flag changes made by a test are reverted when the fixture is destroyed.
  google::FlagSaver flag_saver_;

 private:
  DISALLOW_COPY_AND_ASSIGN(CasscTest);
};

} // namespace cassc
