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

#include "cassc/client/client_registry.h"

#include <utility>

#include <glog/logging.h>

#include "cassc/client/client.h"

using std::shared_ptr;
using std::string;

namespace cassc {
namespace client {

const char* const ClientRegistry::kDefaultName = "main";

ClientRegistry::ClientRegistry() {
}

ClientRegistry::~ClientRegistry() {
}

void ClientRegistry::Register(const string& name, shared_ptr<Client> client) {
  DCHECK(client);
  VLOG(1) << "Registering client instance " << name;
  clients_[name] = std::move(client);
}

Status ClientRegistry::Get(const string& name, shared_ptr<Client>* client) const {
  auto it = clients_.find(name);
  if (it == clients_.end()) {
    return Status::InvalidRequest("Instance called \"" + name + "\" does not exist");
  }
  *client = it->second;
  return Status::OK();
}

bool ClientRegistry::Remove(const string& name) {
  return clients_.erase(name) > 0;
}

void ClientRegistry::Reset() {
  clients_.clear();
}

} // namespace client
} // namespace cassc
