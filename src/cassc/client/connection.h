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

#include <memory>
#include <string>

#include "cassc/rpc/transport.h"
#include "cassc/util/macros.h"
#include "cassc/util/status.h"

namespace cassc {
namespace client {

// The keyspace selected by a client and the credentials to log into it with.
// An empty username means no login is performed.
struct KeyspaceContext {
  std::string keyspace;
  std::string username;
  std::string password;
};

// One transport session to one node.
//
// A connection is opened when it is created and stays open until Close() is
// called or the transport drops. A closed connection is never reopened; the
// pool replaces it with a new one instead.
//
// This class is not thread-safe.
class Connection {
 public:
  ~Connection();

  // Creates a transport for 'node' using 'factory' and opens it. Fails if the
  // node cannot be reached right now.
  static Status Open(rpc::TransportFactory* factory,
                     const rpc::NodeDescriptor& node,
                     std::unique_ptr<Connection>* conn) WARN_UNUSED_RESULT;

  // Whether the connection was not closed and its transport is still open.
  bool IsOpen() const;

  // Returns the stub used to issue calls, or ConnectionClosed.
  Status GetStub(rpc::RpcStub** stub) const WARN_UNUSED_RESULT;

  // Selects 'context.keyspace' on this session. Server rejections are retried
  // up to --keyspace_select_attempts times and then reported as
  // KeyspaceSelectionFailed; any other failure is returned at once. Logs in
  // afterwards when a username is given; the login is not retried.
  Status UseKeyspace(const KeyspaceContext& context) WARN_UNUSED_RESULT;

  // Flushes and closes the transport. Safe to call more than once.
  void Close();

  const rpc::NodeDescriptor& node() const { return node_; }

 private:
  Connection(rpc::NodeDescriptor node, std::unique_ptr<rpc::Transport> transport);

  Status Login(const std::string& username, const std::string& password);

  const rpc::NodeDescriptor node_;
  std::unique_ptr<rpc::Transport> transport_;
  bool open_;

  DISALLOW_COPY_AND_ASSIGN(Connection);
};

} // namespace client
} // namespace cassc
