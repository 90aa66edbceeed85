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
#ifndef CASSC_RPC_TRANSPORT_H
#define CASSC_RPC_TRANSPORT_H

#include <cstdint>
#include <memory>
#include <string>

#include <boost/optional/optional.hpp>

#include "cassc/util/status.h"

namespace google {
namespace protobuf {
class Message;
} // namespace protobuf
} // namespace google

namespace cassc {
namespace rpc {

// Identifies one backend endpoint along with the options used to reach it.
struct NodeDescriptor {
  NodeDescriptor();
  NodeDescriptor(std::string host, uint16_t port);

  std::string host;
  uint16_t port;
  bool use_framed_transport;

  // Unset means no explicit timeout.
  boost::optional<int> send_timeout_ms;
  boost::optional<int> receive_timeout_ms;

  // Returns "host:port".
  std::string ToString() const;
};

// Client side of the remote procedure interface. Operations are addressed by
// name so that callers can wrap any of them in generic retry logic.
class RpcStub {
 public:
  virtual ~RpcStub() {}

  // Invoke 'method' with 'req'. On success 'resp' holds the server's answer.
  // Server-side failures are reported as RemoteError statuses carrying a
  // CassandraErrorPB::Code; transport failures as NetworkError or TimedOut.
  virtual Status Call(const std::string& method,
                      const google::protobuf::Message& req,
                      google::protobuf::Message* resp) = 0;
};

// One session with one node. A transport is used by a single Connection.
class Transport {
 public:
  virtual ~Transport() {}

  virtual Status Open() = 0;
  virtual Status Flush() = 0;
  virtual Status Close() = 0;
  virtual bool IsOpen() const = 0;

  // The stub issuing calls over this transport. Owned by the transport.
  virtual RpcStub* stub() = 0;
};

// Creates (unopened) transports for nodes.
class TransportFactory {
 public:
  virtual ~TransportFactory() {}

  virtual Status Create(const NodeDescriptor& node,
                        std::unique_ptr<Transport>* transport) = 0;
};

} // namespace rpc
} // namespace cassc

#endif // CASSC_RPC_TRANSPORT_H
