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

#include "cassc/client/connection.h"

#include <utility>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include "cassc/common/cassandra.pb.h"
#include "cassc/rpc/constants.h"

DEFINE_int32(keyspace_select_attempts, 3,
             "Number of times set_keyspace is attempted on a connection "
             "before keyspace selection is considered failed. Some servers "
             "spuriously reject the first selection after a connect.");

using std::string;
using std::unique_ptr;

namespace cassc {
namespace client {

using rpc::NodeDescriptor;
using rpc::RpcStub;
using rpc::Transport;
using rpc::TransportFactory;

Connection::Connection(NodeDescriptor node, unique_ptr<Transport> transport)
    : node_(std::move(node)),
      transport_(std::move(transport)),
      open_(true) {
}

Connection::~Connection() {
  Close();
}

Status Connection::Open(TransportFactory* factory,
                        const NodeDescriptor& node,
                        unique_ptr<Connection>* conn) {
  DCHECK(factory);
  unique_ptr<Transport> transport;
  RETURN_NOT_OK_PREPEND(factory->Create(node, &transport),
                        "Unable to create transport to " + node.ToString());
  RETURN_NOT_OK_PREPEND(transport->Open(),
                        "Unable to open transport to " + node.ToString());
  VLOG(1) << "Opened connection to " << node.ToString()
          << (node.use_framed_transport ? " (framed)" : " (buffered)");
  conn->reset(new Connection(node, std::move(transport)));
  return Status::OK();
}

bool Connection::IsOpen() const {
  return open_ && transport_->IsOpen();
}

Status Connection::GetStub(RpcStub** stub) const {
  if (!IsOpen()) {
    return Status::ConnectionClosed("Connection to " + node_.ToString() +
                                    " has been closed");
  }
  *stub = transport_->stub();
  return Status::OK();
}

Status Connection::UseKeyspace(const KeyspaceContext& context) {
  RpcStub* stub;
  RETURN_NOT_OK(GetStub(&stub));

  SetKeyspaceRequestPB req;
  req.set_keyspace(context.keyspace);
  Status last_error;
  bool selected = false;
  for (int attempt = 1; attempt <= FLAGS_keyspace_select_attempts; attempt++) {
    SetKeyspaceResponsePB resp;
    last_error = stub->Call(rpc::kSetKeyspaceMethod, req, &resp);
    if (last_error.ok()) {
      selected = true;
      break;
    }
    // Only a rejection by the server is worth repeating here. Transport
    // failures are returned as is so the pool can try another node.
    if (!last_error.IsRemoteError()) {
      return last_error.CloneAndPrepend("Selecting the keyspace \"" + context.keyspace +
                                        "\" on " + node_.ToString() + " failed");
    }
    VLOG(1) << "Selecting keyspace " << context.keyspace << " on "
            << node_.ToString() << " failed (attempt " << attempt << "): "
            << last_error.ToString();
  }
  if (!selected) {
    return Status::KeyspaceSelectionFailed(
        "Selecting the keyspace \"" + context.keyspace + "\" on " +
        node_.ToString() + " failed " +
        std::to_string(FLAGS_keyspace_select_attempts) + " times",
        last_error.ToString(), last_error.error_code());
  }

  if (!context.username.empty()) {
    RETURN_NOT_OK(Login(context.username, context.password));
  }
  return Status::OK();
}

Status Connection::Login(const string& username, const string& password) {
  RpcStub* stub;
  RETURN_NOT_OK(GetStub(&stub));

  LoginRequestPB req;
  auto* credentials = req.mutable_auth_request()->mutable_credentials();
  (*credentials)["username"] = username;
  (*credentials)["password"] = password;
  LoginResponsePB resp;
  RETURN_NOT_OK_PREPEND(stub->Call(rpc::kLoginMethod, req, &resp),
                        "Logging in as " + username + " on " + node_.ToString() + " failed");
  return Status::OK();
}

void Connection::Close() {
  if (!open_) {
    return;
  }
  open_ = false;
  if (transport_->IsOpen()) {
    WARN_NOT_OK(transport_->Flush(), "Unable to flush transport to " + node_.ToString());
    WARN_NOT_OK(transport_->Close(), "Unable to close transport to " + node_.ToString());
  }
  VLOG(1) << "Closed connection to " << node_.ToString();
}

} // namespace client
} // namespace cassc
