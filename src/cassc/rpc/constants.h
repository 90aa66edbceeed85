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
// Names of the remote operations invoked by the client.
#pragma once

#include <string>

namespace cassc {
namespace rpc {

extern const char* const kLoginMethod;
extern const char* const kSetKeyspaceMethod;
extern const char* const kGetMethod;
extern const char* const kGetSliceMethod;
extern const char* const kGetCountMethod;
extern const char* const kMultigetSliceMethod;
extern const char* const kMultigetCountMethod;
extern const char* const kGetIndexedSlicesMethod;
extern const char* const kGetRangeSlicesMethod;
extern const char* const kInsertMethod;
extern const char* const kRemoveMethod;
extern const char* const kBatchMutateMethod;
extern const char* const kTruncateMethod;
extern const char* const kDescribeSplitsMethod;
extern const char* const kDescribeKeyspaceMethod;
extern const char* const kDescribeVersionMethod;
extern const char* const kSystemAddKeyspaceMethod;
extern const char* const kSystemUpdateKeyspaceMethod;
extern const char* const kSystemDropKeyspaceMethod;
extern const char* const kSystemAddColumnFamilyMethod;

// Whether 'method' may only be called once a keyspace has been selected.
bool RequiresKeyspace(const std::string& method);

} // namespace rpc
} // namespace cassc
