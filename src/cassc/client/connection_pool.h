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

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <vector>

#include <boost/optional/optional.hpp>

#include "cassc/client/connection.h"
#include "cassc/rpc/transport.h"
#include "cassc/util/macros.h"
#include "cassc/util/random.h"
#include "cassc/util/status.h"

namespace cassc {
namespace client {

// Keeps at most one live connection per registered node and hands them out.
//
// Nodes are picked uniformly at random. A connection found closed is evicted
// and a new one is opened in its place the next time its node is picked.
// When a keyspace has been selected, every connection the pool opens selects
// it before being handed out.
//
// This class is not thread-safe.
class ConnectionPool {
 public:
  // 'factory' must outlive the pool.
  ConnectionPool(rpc::TransportFactory* factory, uint32_t random_seed);
  ~ConnectionPool();

  // Appends 'node' to the list of servers.
  void RegisterServer(const rpc::NodeDescriptor& node);

  // Returns a live connection to one of the servers.
  //
  // At most --pool_attempts_per_server times the number of servers are tried.
  // Servers that cannot be reached are skipped. Returns ConnectionFailed if
  // no server could be reached, and KeyspaceSelectionFailed if a newly
  // opened connection could not select the active keyspace.
  Status GetConnection(std::shared_ptr<Connection>* conn) WARN_UNUSED_RESULT;

  // Remembers 'context' for connections opened from now on, opens one
  // connection right away and selects the keyspace on every open connection.
  Status UseKeyspace(const KeyspaceContext& context) WARN_UNUSED_RESULT;

  // Closes and forgets every connection. Servers stay registered.
  void CloseConnections();

  const std::vector<rpc::NodeDescriptor>& servers() const { return servers_; }

  // The keyspace most recently passed to UseKeyspace(), if any.
  const boost::optional<KeyspaceContext>& keyspace_context() const {
    return keyspace_context_;
  }

  // Number of tracked connections, open or not yet found closed.
  size_t num_connections() const { return connections_.size(); }

 private:
  // Opens a connection to the server at 'idx' and selects the active keyspace
  // on it.
  Status OpenConnection(size_t idx, std::shared_ptr<Connection>* conn);

  rpc::TransportFactory* const factory_;
  Random rng_;

  std::vector<rpc::NodeDescriptor> servers_;

  // Server index -> connection.
  std::map<size_t, std::shared_ptr<Connection>> connections_;

  boost::optional<KeyspaceContext> keyspace_context_;

  DISALLOW_COPY_AND_ASSIGN(ConnectionPool);
};

} // namespace client
} // namespace cassc
