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

#include "cassc/client/connection_pool.h"

#include <string>
#include <utility>

#include <gflags/gflags.h>
#include <glog/logging.h>

DEFINE_int32(pool_attempts_per_server, 2,
             "How many connection attempts the pool makes per registered "
             "server before giving up on finding a reachable one.");

using std::shared_ptr;
using std::string;
using std::unique_ptr;

namespace cassc {
namespace client {

using rpc::NodeDescriptor;
using rpc::TransportFactory;

ConnectionPool::ConnectionPool(TransportFactory* factory, uint32_t random_seed)
    : factory_(factory),
      rng_(random_seed) {
  DCHECK(factory_);
}

ConnectionPool::~ConnectionPool() {
  CloseConnections();
}

void ConnectionPool::RegisterServer(const NodeDescriptor& node) {
  VLOG(1) << "Registered server " << node.ToString();
  servers_.push_back(node);
}

Status ConnectionPool::OpenConnection(size_t idx, shared_ptr<Connection>* conn) {
  unique_ptr<Connection> new_conn;
  RETURN_NOT_OK(Connection::Open(factory_, servers_[idx], &new_conn));
  if (keyspace_context_) {
    RETURN_NOT_OK(new_conn->UseKeyspace(*keyspace_context_));
  }
  conn->reset(new_conn.release());
  return Status::OK();
}

Status ConnectionPool::GetConnection(shared_ptr<Connection>* conn) {
  if (servers_.empty()) {
    return Status::ConnectionFailed(
        "Unable to create connection, the cluster server pool is empty");
  }

  const int num_attempts =
      FLAGS_pool_attempts_per_server * static_cast<int>(servers_.size());
  Status last_error;
  for (int attempt = 0; attempt < num_attempts; attempt++) {
    size_t idx = rng_.Uniform(servers_.size());

    auto it = connections_.find(idx);
    if (it != connections_.end()) {
      if (it->second->IsOpen()) {
        *conn = it->second;
        return Status::OK();
      }
      VLOG(1) << "Evicting closed connection to " << servers_[idx].ToString();
      connections_.erase(it);
      last_error = Status::ConnectionClosed("Connection to " + servers_[idx].ToString() +
                                            " was closed");
      continue;
    }

    shared_ptr<Connection> new_conn;
    Status s = OpenConnection(idx, &new_conn);
    if (s.ok()) {
      connections_.emplace(idx, new_conn);
      *conn = std::move(new_conn);
      return Status::OK();
    }
    if (s.IsKeyspaceSelectionFailed()) {
      return s;
    }
    VLOG(1) << "Connecting to " << servers_[idx].ToString() << " failed: "
            << s.ToString();
    last_error = std::move(s);
  }

  LOG(WARNING) << "Unable to connect to any of the " << servers_.size()
               << " servers: " << last_error.ToString();
  return Status::ConnectionFailed(
      "Connecting to any of the " + std::to_string(servers_.size()) +
      " nodes failed", last_error.ToString(), last_error.error_code());
}

Status ConnectionPool::UseKeyspace(const KeyspaceContext& context) {
  keyspace_context_ = context;

  // Any connection opened here selects the keyspace itself.
  shared_ptr<Connection> conn;
  RETURN_NOT_OK(GetConnection(&conn));

  for (const auto& entry : connections_) {
    if (entry.second->IsOpen()) {
      RETURN_NOT_OK(entry.second->UseKeyspace(context));
    }
  }
  return Status::OK();
}

void ConnectionPool::CloseConnections() {
  for (const auto& entry : connections_) {
    entry.second->Close();
  }
  connections_.clear();
}

} // namespace client
} // namespace cassc
