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

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "cassc/client/call_dispatcher.h"
#include "cassc/client/client.h"
#include "cassc/client/column_family.h"
#include "cassc/client/connection.h"
#include "cassc/client/connection_pool.h"
#include "cassc/client/schema_cache.h"
#include "cassc/util/macros.h"

namespace cassc {
namespace client {

class ClientBuilder::Data {
 public:
  Data();
  ~Data();

  std::vector<rpc::NodeDescriptor> servers_;
  int max_call_retries_;
  int default_column_count_;
  bool autopack_;
  std::shared_ptr<rpc::TransportFactory> transport_factory_;
  boost::optional<uint32_t> random_seed_;

  DISALLOW_COPY_AND_ASSIGN(Data);
};

class Client::Data {
 public:
  Data(std::shared_ptr<rpc::TransportFactory> transport_factory,
       uint32_t random_seed,
       int max_call_retries,
       int default_column_count,
       bool autopack);
  ~Data();

  // Resolves an empty keyspace name to the current keyspace. Returns
  // InvalidRequest if there is none.
  Status ResolveKeyspace(const std::string& keyspace, std::string* resolved) const;

  // Declared before the pool, which uses it.
  const std::shared_ptr<rpc::TransportFactory> transport_factory_;
  ConnectionPool pool_;
  CallDispatcher dispatcher_;
  SchemaCache schema_cache_;

  int default_column_count_;
  const bool autopack_;

  // Keyspace name -> credentials registered for it.
  std::map<std::string, KeyspaceContext> keyspace_credentials_;

  // Column family name -> column family of the current keyspace.
  std::map<std::string, std::unique_ptr<ColumnFamily>> column_families_;

  DISALLOW_COPY_AND_ASSIGN(Data);
};

} // namespace client
} // namespace cassc
