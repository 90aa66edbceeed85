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

#include <memory>
#include <string>

#include <gtest/gtest.h>

#include "cassc/client/client-test-util.h"
#include "cassc/client/client.h"
#include "cassc/util/test_macros.h"
#include "cassc/util/test_util.h"

using std::shared_ptr;

namespace cassc {
namespace client {

class ClientRegistryTest : public CasscTest {
 public:
  ClientRegistryTest()
      : factory_(new FakeTransportFactory(&cluster_)) {
  }

 protected:
  shared_ptr<Client> NewClient() {
    shared_ptr<Client> client;
    CHECK_OK(ClientBuilder()
             .add_server("10.0.0.1", 9160)
             .transport_factory(factory_)
             .random_seed(SeedRandom())
             .Build(&client));
    return client;
  }

  FakeCluster cluster_;
  shared_ptr<FakeTransportFactory> factory_;
  ClientRegistry registry_;
};

TEST_F(ClientRegistryTest, TestRegisterAndGet) {
  shared_ptr<Client> main = NewClient();
  shared_ptr<Client> reports = NewClient();
  registry_.Register(ClientRegistry::kDefaultName, main);
  registry_.Register("reports", reports);
  ASSERT_EQ(2U, registry_.size());

  shared_ptr<Client> client;
  ASSERT_OK(registry_.Get("main", &client));
  ASSERT_EQ(main, client);
  ASSERT_OK(registry_.Get("reports", &client));
  ASSERT_EQ(reports, client);

  // Registering again replaces the client.
  registry_.Register("reports", main);
  ASSERT_OK(registry_.Get("reports", &client));
  ASSERT_EQ(main, client);
  ASSERT_EQ(2U, registry_.size());
}

TEST_F(ClientRegistryTest, TestMissingClient) {
  shared_ptr<Client> client;
  Status s = registry_.Get("nope", &client);
  ASSERT_TRUE(s.IsInvalidRequest()) << s.ToString();
  ASSERT_STR_CONTAINS(s.ToString(), "Instance called \"nope\" does not exist");
  ASSERT_FALSE(client);
}

TEST_F(ClientRegistryTest, TestRemoveAndReset) {
  registry_.Register("a", NewClient());
  registry_.Register("b", NewClient());
  ASSERT_TRUE(registry_.Remove("a"));
  ASSERT_FALSE(registry_.Remove("a"));
  ASSERT_EQ(1U, registry_.size());

  registry_.Reset();
  ASSERT_EQ(0U, registry_.size());
  shared_ptr<Client> client;
  ASSERT_FALSE(registry_.Get("b", &client).ok());
}

} // namespace client
} // namespace cassc
