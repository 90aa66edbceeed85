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

#include <unordered_set>

namespace cassc {
namespace rpc {

const char* const kLoginMethod = "login";
const char* const kSetKeyspaceMethod = "set_keyspace";
const char* const kGetMethod = "get";
const char* const kGetSliceMethod = "get_slice";
const char* const kGetCountMethod = "get_count";
const char* const kMultigetSliceMethod = "multiget_slice";
const char* const kMultigetCountMethod = "multiget_count";
const char* const kGetIndexedSlicesMethod = "get_indexed_slices";
const char* const kGetRangeSlicesMethod = "get_range_slices";
const char* const kInsertMethod = "insert";
const char* const kRemoveMethod = "remove";
const char* const kBatchMutateMethod = "batch_mutate";
const char* const kTruncateMethod = "truncate";
const char* const kDescribeSplitsMethod = "describe_splits";
const char* const kDescribeKeyspaceMethod = "describe_keyspace";
const char* const kDescribeVersionMethod = "describe_version";
const char* const kSystemAddKeyspaceMethod = "system_add_keyspace";
const char* const kSystemUpdateKeyspaceMethod = "system_update_keyspace";
const char* const kSystemDropKeyspaceMethod = "system_drop_keyspace";
const char* const kSystemAddColumnFamilyMethod = "system_add_column_family";

bool RequiresKeyspace(const std::string& method) {
  static const std::unordered_set<std::string> kKeyspaceRequired = {
    kLoginMethod,
    kGetMethod,
    kGetSliceMethod,
    kGetCountMethod,
    kMultigetSliceMethod,
    kMultigetCountMethod,
    kGetIndexedSlicesMethod,
    kInsertMethod,
    kRemoveMethod,
    kBatchMutateMethod,
    kTruncateMethod,
    kDescribeSplitsMethod,
  };
  return kKeyspaceRequired.count(method) > 0;
}

} // namespace rpc
} // namespace cassc
