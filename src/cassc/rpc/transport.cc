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

#include "cassc/rpc/transport.h"

#include <utility>

namespace cassc {
namespace rpc {

NodeDescriptor::NodeDescriptor()
    : host("127.0.0.1"),
      port(9160),
      use_framed_transport(true) {
}

NodeDescriptor::NodeDescriptor(std::string host, uint16_t port)
    : host(std::move(host)),
      port(port),
      use_framed_transport(true) {
}

std::string NodeDescriptor::ToString() const {
  return host + ":" + std::to_string(port);
}

} // namespace rpc
} // namespace cassc
