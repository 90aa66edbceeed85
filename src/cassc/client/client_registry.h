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
#ifndef CASSC_CLIENT_CLIENT_REGISTRY_H
#define CASSC_CLIENT_CLIENT_REGISTRY_H

#include <cstddef>
#include <map>
#include <memory>
#include <string>

#include "cassc/util/macros.h"
#include "cassc/util/status.h"

namespace cassc {
namespace client {

class Client;

// Named clients shared by the parts of an application. The registry is a
// plain object owned by the application; there is no process-wide instance.
//
// This class is not thread-safe.
class ClientRegistry {
 public:
  // Name used when callers do not pick one.
  static const char* const kDefaultName;

  ClientRegistry();
  ~ClientRegistry();

  // Registers 'client' under 'name', replacing any client registered under
  // it before.
  void Register(const std::string& name, std::shared_ptr<Client> client);

  // Looks up the client registered under 'name'. Returns InvalidRequest if
  // there is none.
  Status Get(const std::string& name, std::shared_ptr<Client>* client) const WARN_UNUSED_RESULT;

  // Returns whether a client was registered under 'name'.
  bool Remove(const std::string& name);

  // Forgets every registered client.
  void Reset();

  size_t size() const { return clients_.size(); }

 private:
  std::map<std::string, std::shared_ptr<Client>> clients_;

  DISALLOW_COPY_AND_ASSIGN(ClientRegistry);
};

} // namespace client
} // namespace cassc

#endif // CASSC_CLIENT_CLIENT_REGISTRY_H
