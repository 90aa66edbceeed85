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
#pragma once

#include <string>

#include <gtest/gtest.h>

#include "cassc/util/status.h"

// ASSERT_NO_FATAL_FAILURE is just too long to type.
#define NO_FATALS(expr) \
  ASSERT_NO_FATAL_FAILURE(expr)

#define ASSERT_OK(status) do { \
    const ::cassc::Status& _s = (status); \
    if (_s.ok()) { \
      SUCCEED(); \
    } else { \
      FAIL() << "Bad status: " << _s.ToString();  \
    } \
  } while (0)

#define EXPECT_OK(status) do { \
    const ::cassc::Status& _s = (status); \
    if (_s.ok()) { \
      SUCCEED(); \
    } else { \
      ADD_FAILURE() << "Bad status: " << _s.ToString();  \
    } \
  } while (0)

// Like the above, but doesn't record successful
// tests.
#define ASSERT_OK_FAST(status) do { \
    const ::cassc::Status& _s = (status); \
    if (!_s.ok()) { \
      FAIL() << "Bad status: " << _s.ToString();  \
    } \
  } while (0)

#define ASSERT_STR_CONTAINS(str, substr) do { \
    const std::string& _s = (str); \
    if (_s.find((substr)) == std::string::npos) { \
      FAIL() << "Expected to find substring '" << (substr) \
             << "'. Got: '" << _s << "'"; \
    } \
  } while (0)

#define ASSERT_STR_NOT_CONTAINS(str, substr) do { \
    const std::string& _s = (str); \
    if (_s.find((substr)) != std::string::npos) { \
      FAIL() << "Expected not to find substring '" << (substr) \
             << "'. Got: '" << _s << "'"; \
    } \
  } while (0)
